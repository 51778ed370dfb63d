#pragma once
#include <stdexcept>
#include <string>

// 配置文件缺失或格式错误
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// 连接失败、超时、报文格式错误
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

// 数据文件读写失败
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {}
};

// GPIO / 摄像头 / OCR 初始化或读写失败
class HardwareError : public std::runtime_error {
public:
    explicit HardwareError(const std::string& msg) : std::runtime_error(msg) {}
};

// 车牌格式不符或识别置信度过低
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};
