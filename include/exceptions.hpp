#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_DEVICE_NOT_FOUND,
    ERR_UNSUPPORTED_DEVICE,
    ERR_TRANSPORT,
    ERR_TRANSPORT_TIMEOUT,
    ERR_PROTOCOL,
    ERR_DELIVERY,
    ERR_CONFIG,
    ERR_UNKNOWN
};

class ElemacException : public std::exception {
public:
    ElemacException(const std::string& msg, ErrorCode code = ERR_UNKNOWN) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~ElemacException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

// No matching USB device present.
class DeviceNotFoundException : public ElemacException {
public:
    DeviceNotFoundException(const std::string& msg) : ElemacException(msg, ERR_DEVICE_NOT_FOUND) {}
};

// Manufacturer string does not identify an ELEMAC controller.
class UnsupportedDeviceException : public ElemacException {
public:
    UnsupportedDeviceException(const std::string& msg) : ElemacException(msg, ERR_UNSUPPORTED_DEVICE) {}
};

// I/O failure or timeout on the byte channel.
class TransportException : public ElemacException {
public:
    TransportException(const std::string& msg, ErrorCode code = ERR_TRANSPORT) : ElemacException(msg, code) {}
    bool isTimeout() const { return code() == ERR_TRANSPORT_TIMEOUT; }
};

// Malformed response payload.
class ProtocolException : public ElemacException {
public:
    ProtocolException(const std::string& msg) : ElemacException(msg, ERR_PROTOCOL) {}
};

// Email or SMS delivery failed.
class DeliveryException : public ElemacException {
public:
    DeliveryException(const std::string& msg) : ElemacException(msg, ERR_DELIVERY) {}
};

class ConfigException : public ElemacException {
public:
    ConfigException(const std::string& msg) : ElemacException(msg, ERR_CONFIG) {}
};
