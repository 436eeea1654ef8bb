#include "../include/command_codec.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <stdexcept>
#include <stdio.h>

static int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

CommandCodec::CommandCodec(Transport* transport, size_t max_packet_size, uint32_t timeout_ms)
    : transport_(transport), max_packet_size_(max_packet_size), timeout_ms_(timeout_ms) {}

std::string CommandCodec::encodeReadRequest(MemoryAddress address, ReadSize size) {
    if (size < 1 || size > 4) {
        throw std::invalid_argument("read size must be 1..4, got " + std::to_string((int)size));
    }
    // Address is at least three hex digits, wider addresses are not truncated
    char buf[16];
    snprintf(buf, sizeof(buf), "r%x%03x", (unsigned)(size - 1), (unsigned)address);
    return std::string(buf);
}

RawValue CommandCodec::decodeLittleEndianHex(const std::string& payload) {
    size_t len = payload.size();
    if (len == 0 || len % 2 != 0) {
        throw ProtocolException("Malformed payload length " + std::to_string(len) + ": '" + payload + "'");
    }
    if (len > 8) {
        throw ProtocolException("Payload too long for a 32-bit read: '" + payload + "'");
    }
    RawValue value = 0;
    // Groups are least significant byte first
    for (size_t group = len / 2; group-- > 0;) {
        int hi = hexDigitValue(payload[group * 2]);
        int lo = hexDigitValue(payload[group * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw ProtocolException("Non-hex character in payload '" + payload + "'");
        }
        value = (value << 8) | (RawValue)((hi << 4) | lo);
    }
    return value;
}

std::string CommandCodec::sendCommand(const std::string& command) {
    std::vector<uint8_t> request(command.begin(), command.end());
    request.push_back('\0');
    transport_->write(request);

    std::vector<uint8_t> response = transport_->read(max_packet_size_, timeout_ms_);
    size_t end = 0;
    while (end < response.size() && response[end] != '\0') end++;
    std::string payload(response.begin(), response.begin() + end);
    Logger::debug("[Codec] '%s' -> '%s'", command.c_str(), payload.c_str());
    return payload;
}

RawValue CommandCodec::readMemory(MemoryAddress address, ReadSize size) {
    std::string request = encodeReadRequest(address, size);
    std::string payload = sendCommand(request);
    return decodeLittleEndianHex(payload);
}

std::string CommandCodec::queryVersion() {
    return sendCommand("v");
}
