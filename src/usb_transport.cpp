#include "../include/usb_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <libusb.h>
#include <stdio.h>

static const int INTERFACE_NUMBER = 0;

static std::string usbError(int rc) {
    return std::string(libusb_error_name(rc));
}

UsbTransport::UsbTransport(const DeviceConfig& config) : config_(config) {
    try {
        open();
        claim();
        findEndpoints();
        readIdentity();
        verifyIdentity(identity_);
    } catch (...) {
        release();
        throw;
    }
}

UsbTransport::~UsbTransport() {
    release();
}

void UsbTransport::open() {
    int rc = libusb_init(&ctx_);
    if (rc != LIBUSB_SUCCESS) {
        ctx_ = nullptr;
        throw TransportException("libusb_init failed: " + usbError(rc));
    }

    handle_ = libusb_open_device_with_vid_pid(ctx_, config_.vendor_id, config_.product_id);
    if (!handle_) {
        char buf[96];
        snprintf(buf, sizeof(buf), "No ELEMAC found in the system (%04x:%04x)",
                 config_.vendor_id, config_.product_id);
        throw DeviceNotFoundException(buf);
    }

    rc = libusb_reset_device(handle_);
    if (rc == LIBUSB_ERROR_NOT_FOUND) {
        // Device re-enumerated after the reset, the old handle is gone
        libusb_close(handle_);
        handle_ = libusb_open_device_with_vid_pid(ctx_, config_.vendor_id, config_.product_id);
        if (!handle_) throw DeviceNotFoundException("ELEMAC disappeared after reset");
    } else if (rc != LIBUSB_SUCCESS) {
        Logger::warn("[USB] Device reset failed: %s", usbError(rc).c_str());
    }
}

void UsbTransport::claim() {
    int rc = libusb_kernel_driver_active(handle_, INTERFACE_NUMBER);
    if (rc == 1) {
        rc = libusb_detach_kernel_driver(handle_, INTERFACE_NUMBER);
        if (rc != LIBUSB_SUCCESS) {
            throw TransportException("Kernel driver won't give up control over device: " + usbError(rc));
        }
        kernel_driver_detached_ = true;
    }

    libusb_config_descriptor* cfg = nullptr;
    rc = libusb_get_config_descriptor(libusb_get_device(handle_), 0, &cfg);
    if (rc != LIBUSB_SUCCESS) {
        throw TransportException("Cannot read configuration descriptor: " + usbError(rc));
    }
    int value = cfg->bConfigurationValue;
    libusb_free_config_descriptor(cfg);

    rc = libusb_set_configuration(handle_, value);
    if (rc != LIBUSB_SUCCESS) {
        Logger::warn("[USB] set_configuration(%d) failed: %s", value, usbError(rc).c_str());
    }

    rc = libusb_claim_interface(handle_, INTERFACE_NUMBER);
    if (rc != LIBUSB_SUCCESS) {
        throw TransportException("Cannot claim interface: " + usbError(rc));
    }
    interface_claimed_ = true;
}

void UsbTransport::findEndpoints() {
    libusb_config_descriptor* cfg = nullptr;
    int rc = libusb_get_active_config_descriptor(libusb_get_device(handle_), &cfg);
    if (rc != LIBUSB_SUCCESS) {
        throw TransportException("Cannot read active configuration: " + usbError(rc));
    }

    bool have_in = false;
    bool have_out = false;
    if (cfg->bNumInterfaces > INTERFACE_NUMBER && cfg->interface[INTERFACE_NUMBER].num_altsetting > 0) {
        const libusb_interface_descriptor& alt = cfg->interface[INTERFACE_NUMBER].altsetting[0];
        for (int i = 0; i < alt.bNumEndpoints; ++i) {
            const libusb_endpoint_descriptor& ep = alt.endpoint[i];
            bool interrupt = (ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) == LIBUSB_TRANSFER_TYPE_INTERRUPT;
            // Direction comes from bit 7 of the address, never from descriptor order
            if ((ep.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN) {
                if (!have_in) {
                    endpoint_in_ = ep.bEndpointAddress;
                    in_interrupt_ = interrupt;
                    in_packet_size_ = ep.wMaxPacketSize;
                    have_in = true;
                }
            } else if (!have_out) {
                endpoint_out_ = ep.bEndpointAddress;
                out_interrupt_ = interrupt;
                have_out = true;
            }
        }
    }
    libusb_free_config_descriptor(cfg);

    if (!have_in || !have_out) {
        throw TransportException("Interface 0 lacks an IN or OUT endpoint");
    }
    Logger::debug("[USB] Endpoint IN 0x%02x (%u bytes), OUT 0x%02x",
                  endpoint_in_, (unsigned)in_packet_size_, endpoint_out_);
}

std::string UsbTransport::readStringDescriptor(uint8_t index) {
    if (index == 0) return "";
    unsigned char buf[256];
    int n = libusb_get_string_descriptor_ascii(handle_, index, buf, sizeof(buf));
    if (n < 0) {
        Logger::warn("[USB] Cannot read string descriptor %u: %s", (unsigned)index, usbError(n).c_str());
        return "";
    }
    return std::string(reinterpret_cast<char*>(buf), (size_t)n);
}

void UsbTransport::readIdentity() {
    libusb_device_descriptor desc;
    int rc = libusb_get_device_descriptor(libusb_get_device(handle_), &desc);
    if (rc != LIBUSB_SUCCESS) {
        throw TransportException("Cannot read device descriptor: " + usbError(rc));
    }
    identity_.manufacturer = readStringDescriptor(desc.iManufacturer);
    identity_.product = readStringDescriptor(desc.iProduct);
    identity_.serial = readStringDescriptor(desc.iSerialNumber);
}

void UsbTransport::write(const std::vector<uint8_t>& data) {
    int transferred = 0;
    unsigned char* buf = const_cast<unsigned char*>(data.data());
    int rc = out_interrupt_
        ? libusb_interrupt_transfer(handle_, endpoint_out_, buf, (int)data.size(), &transferred, config_.timeout_ms)
        : libusb_bulk_transfer(handle_, endpoint_out_, buf, (int)data.size(), &transferred, config_.timeout_ms);
    if (rc == LIBUSB_ERROR_TIMEOUT) {
        throw TransportException("USB write timed out", ERR_TRANSPORT_TIMEOUT);
    }
    if (rc != LIBUSB_SUCCESS) {
        throw TransportException("USB write failed: " + usbError(rc));
    }
    if (transferred != (int)data.size()) {
        throw TransportException("Short USB write: " + std::to_string(transferred) + " of " + std::to_string(data.size()));
    }
}

std::vector<uint8_t> UsbTransport::read(size_t max_len, uint32_t timeout_ms) {
    std::vector<uint8_t> buf(max_len);
    int transferred = 0;
    int rc = in_interrupt_
        ? libusb_interrupt_transfer(handle_, endpoint_in_, buf.data(), (int)max_len, &transferred, timeout_ms)
        : libusb_bulk_transfer(handle_, endpoint_in_, buf.data(), (int)max_len, &transferred, timeout_ms);
    if (rc == LIBUSB_ERROR_TIMEOUT) {
        throw TransportException("USB read timed out after " + std::to_string(timeout_ms) + " ms", ERR_TRANSPORT_TIMEOUT);
    }
    if (rc != LIBUSB_SUCCESS) {
        throw TransportException("USB read failed: " + usbError(rc));
    }
    buf.resize((size_t)transferred);
    return buf;
}

void UsbTransport::release() {
    if (handle_) {
        if (interface_claimed_) {
            libusb_release_interface(handle_, INTERFACE_NUMBER);
            interface_claimed_ = false;
        }
        if (kernel_driver_detached_) {
            libusb_attach_kernel_driver(handle_, INTERFACE_NUMBER);
            kernel_driver_detached_ = false;
        }
        libusb_close(handle_);
        handle_ = nullptr;
    }
    if (ctx_) {
        libusb_exit(ctx_);
        ctx_ = nullptr;
    }
}
