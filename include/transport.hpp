#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * Duplex byte channel to the controller.
 *
 * Implementations throw TransportException on I/O failure and on timeout
 * (code ERR_TRANSPORT_TIMEOUT). One request may be in flight at a time.
 */
class Transport {
public:
    virtual ~Transport() {}
    virtual void write(const std::vector<uint8_t>& data) = 0;
    virtual std::vector<uint8_t> read(size_t max_len, uint32_t timeout_ms) = 0;
};
