#pragma once
#include "devices.hpp"
#include <memory>
#include <string>

namespace cv {
class VideoCapture;
class CascadeClassifier;
}
namespace tesseract {
class TessBaseAPI;
}

/**
 * sysfs GPIO 线路：构造时导出并设置方向，析构时释放。
 * 读写失败抛出 HardwareError。
 */
class GpioLine {
public:
    enum class Direction { In, Out };

    GpioLine(int number, Direction direction, const std::string& sysfsRoot = "/sys/class/gpio");
    ~GpioLine();

    GpioLine(const GpioLine&) = delete;
    GpioLine& operator=(const GpioLine&) = delete;

    bool read() const;
    void write(bool value);
    int number() const { return line; }

private:
    int line;
    std::string root;
    std::string valuePath;
    bool exportedHere = false;
};

// 继电器控制闸门，光电开关检测通过
class HardwareGate : public GateDriver {
public:
    HardwareGate(const std::string& name, int relayLine, int passageLine,
                 std::chrono::milliseconds travel, const std::string& sysfsRoot = "/sys/class/gpio");
    ~HardwareGate() override;

    bool open() override;
    bool close() override;
    bool sensePassage(std::chrono::milliseconds timeout) override;

private:
    std::string name;
    GpioLine relay;
    GpioLine passage;
    std::chrono::milliseconds travel;
};

class HardwarePresenceSensor : public PresenceSensor {
public:
    HardwarePresenceSensor(const std::string& name, int line, const std::string& sysfsRoot = "/sys/class/gpio");
    bool detect() override;

private:
    std::string name;
    GpioLine input;
};

struct CameraSettings {
    int device = 0;
    std::string cascadePath = "haarcascade_russian_plate_number.xml";
    std::string ocrLanguage = "eng";
    int frameWidth = 640;
    int frameHeight = 480;
};

// OpenCV 取帧 + 级联分类器定位车牌 + Tesseract 识别
class HardwarePlateCapture : public PlateCapture {
public:
    explicit HardwarePlateCapture(const CameraSettings& settings);
    ~HardwarePlateCapture() override;

    PlateReading capture() override;

private:
    CameraSettings settings;
    std::unique_ptr<cv::VideoCapture> camera;
    std::unique_ptr<cv::CascadeClassifier> plateCascade;
    std::unique_ptr<tesseract::TessBaseAPI> ocr;
};
