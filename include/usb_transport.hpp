#pragma once
#include "config_manager.hpp"
#include "device_identity.hpp"
#include "transport.hpp"
#include <stdint.h>

struct libusb_context;
struct libusb_device_handle;

/**
 * USB link to the controller.
 *
 * The constructor finds the device by vendor/product id, resets it,
 * detaches any kernel driver, claims interface 0, picks the IN and OUT
 * endpoints from their direction bits and verifies the descriptor
 * strings. Every acquired resource is released by the destructor, also
 * when the constructor throws part way.
 */
class UsbTransport : public Transport {
public:
    explicit UsbTransport(const DeviceConfig& config);
    ~UsbTransport() override;

    UsbTransport(const UsbTransport&) = delete;
    UsbTransport& operator=(const UsbTransport&) = delete;

    void write(const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> read(size_t max_len, uint32_t timeout_ms) override;

    const DeviceIdentity& identity() const { return identity_; }
    uint16_t inPacketSize() const { return in_packet_size_; }

private:
    DeviceConfig config_;
    DeviceIdentity identity_;
    libusb_context* ctx_ = nullptr;
    libusb_device_handle* handle_ = nullptr;
    bool interface_claimed_ = false;
    bool kernel_driver_detached_ = false;
    uint8_t endpoint_in_ = 0;
    uint8_t endpoint_out_ = 0;
    bool in_interrupt_ = false;
    bool out_interrupt_ = false;
    uint16_t in_packet_size_ = 0;

    void open();
    void claim();
    void findEndpoints();
    void readIdentity();
    std::string readStringDescriptor(uint8_t index);
    void release();
};
