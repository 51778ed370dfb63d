#include "../include/hardware.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <thread>

// OpenCV
#include <opencv2/opencv.hpp>

// Tesseract OCR
#include <tesseract/baseapi.h>
#include <leptonica/allheaders.h>

namespace fs = std::filesystem;

namespace {

void writeFile(const std::string& path, const std::string& value) {
    std::ofstream file(path);
    if (!file) {
        throw HardwareError("cannot open " + path);
    }
    file << value;
    file.flush();
    if (!file.good()) {
        throw HardwareError("cannot write " + path);
    }
}

}

GpioLine::GpioLine(int number, Direction direction, const std::string& sysfsRoot)
    : line(number), root(sysfsRoot) {
    if (number < 0) {
        throw HardwareError("GPIO line not configured");
    }
    fs::path dir = fs::path(root) / ("gpio" + std::to_string(line));
    if (!fs::exists(dir)) {
        writeFile((fs::path(root) / "export").string(), std::to_string(line));
        exportedHere = true;
    }
    writeFile((dir / "direction").string(), direction == Direction::Out ? "out" : "in");
    valuePath = (dir / "value").string();
}

GpioLine::~GpioLine() {
    if (!exportedHere) return;
    std::ofstream file((fs::path(root) / "unexport").string());
    if (file) {
        file << line;
    }
}

bool GpioLine::read() const {
    std::ifstream file(valuePath);
    char value = '0';
    if (!(file >> value)) {
        throw HardwareError("cannot read " + valuePath);
    }
    return value == '1';
}

void GpioLine::write(bool value) {
    writeFile(valuePath, value ? "1" : "0");
}

HardwareGate::HardwareGate(const std::string& name, int relayLine, int passageLine,
                           std::chrono::milliseconds travel, const std::string& sysfsRoot)
    : name(name),
      relay(relayLine, GpioLine::Direction::Out, sysfsRoot),
      passage(passageLine, GpioLine::Direction::In, sysfsRoot),
      travel(travel) {}

HardwareGate::~HardwareGate() {
    // 释放前确保继电器断开
    try {
        relay.write(false);
    } catch (const HardwareError& e) {
        Logger::logSystem(Logger::Level::Error, name, std::string("Failed to release relay: ") + e.what());
    }
}

bool HardwareGate::open() {
    Logger::logSystem(Logger::Level::Info, name, "Opening gate");
    relay.write(true);
    std::this_thread::sleep_for(travel);
    return true;
}

bool HardwareGate::close() {
    Logger::logSystem(Logger::Level::Info, name, "Closing gate");
    relay.write(false);
    std::this_thread::sleep_for(travel);
    return true;
}

bool HardwareGate::sensePassage(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (passage.read()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

HardwarePresenceSensor::HardwarePresenceSensor(const std::string& name, int line, const std::string& sysfsRoot)
    : name(name), input(line, GpioLine::Direction::In, sysfsRoot) {}

bool HardwarePresenceSensor::detect() {
    return input.read();
}

HardwarePlateCapture::HardwarePlateCapture(const CameraSettings& settings)
    : settings(settings),
      camera(std::make_unique<cv::VideoCapture>()),
      plateCascade(std::make_unique<cv::CascadeClassifier>()),
      ocr(std::make_unique<tesseract::TessBaseAPI>()) {
    if (!camera->open(settings.device)) {
        throw HardwareError("cannot open camera " + std::to_string(settings.device));
    }
    camera->set(cv::CAP_PROP_FRAME_WIDTH, settings.frameWidth);
    camera->set(cv::CAP_PROP_FRAME_HEIGHT, settings.frameHeight);

    if (!plateCascade->load(settings.cascadePath)) {
        throw HardwareError("cannot load plate cascade " + settings.cascadePath);
    }
    if (ocr->Init(nullptr, settings.ocrLanguage.c_str(), tesseract::OEM_LSTM_ONLY)) {
        throw HardwareError("cannot initialize tesseract OCR");
    }
    ocr->SetPageSegMode(tesseract::PSM_SINGLE_LINE);
    ocr->SetVariable("tessedit_char_whitelist", "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789");
}

HardwarePlateCapture::~HardwarePlateCapture() {
    ocr->End();
    camera->release();
}

PlateReading HardwarePlateCapture::capture() {
    PlateReading reading;

    cv::Mat frame;
    if (!camera->read(frame) || frame.empty()) {
        throw HardwareError("failed to read camera frame");
    }

    cv::Mat gray;
    cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    cv::equalizeHist(gray, gray);

    std::vector<cv::Rect> plates;
    plateCascade->detectMultiScale(gray, plates, 1.1, 10, 0, cv::Size(30, 30));
    if (plates.empty()) {
        return reading;
    }

    // 取面积最大的候选区域
    auto best = std::max_element(plates.begin(), plates.end(),
                                 [](const cv::Rect& a, const cv::Rect& b) { return a.area() < b.area(); });
    cv::Mat plateROI = gray(*best);
    cv::Mat thresh;
    cv::threshold(plateROI, thresh, 0, 255, cv::THRESH_BINARY + cv::THRESH_OTSU);

    ocr->SetImage(thresh.data, thresh.cols, thresh.rows, 1, static_cast<int>(thresh.step));
    std::unique_ptr<char[]> text(ocr->GetUTF8Text());
    if (!text) {
        return reading;
    }

    std::string plate;
    for (const char* p = text.get(); *p; ++p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (std::isalnum(c)) plate += static_cast<char>(std::toupper(c));
    }
    if (plate.empty()) {
        return reading;
    }

    reading.plate = plate;
    reading.confidence = std::clamp(ocr->MeanTextConf() / 100.0, 0.0, 1.0);
    Logger::logVehicle(plate, "capture", "Plate captured, confidence " + std::to_string(reading.confidence));
    return reading;
}
