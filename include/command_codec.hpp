#pragma once
#include "transport.hpp"
#include "types.hpp"
#include <stdint.h>
#include <string>

/**
 * Text command/response protocol of the controller.
 *
 * Requests are ASCII strings terminated by a single NUL byte. A memory
 * read is "r<size-1><address>", e.g. "r1748" reads two bytes at 0x748.
 * The reply payload carries the bytes as little-endian hex groups.
 */
class CommandCodec {
public:
    CommandCodec(Transport* transport, size_t max_packet_size = 64, uint32_t timeout_ms = 1000);
    ~CommandCodec() = default;

    // Read 1-4 bytes of device memory. Throws std::invalid_argument for a bad size.
    RawValue readMemory(MemoryAddress address, ReadSize size);

    // One raw request/response round trip; returns the payload text.
    std::string sendCommand(const std::string& command);

    // Firmware identification string ("v" request).
    std::string queryVersion();

    static std::string encodeReadRequest(MemoryAddress address, ReadSize size);
    static RawValue decodeLittleEndianHex(const std::string& payload);

private:
    Transport* transport_;
    size_t max_packet_size_;
    uint32_t timeout_ms_;
};
