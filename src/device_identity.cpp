#include "../include/device_identity.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"

static const char* const SUPPORTED_PRODUCTS[] = {"SAT2", "SAT+"};

bool isSupportedProduct(const std::string& product) {
    for (const char* p : SUPPORTED_PRODUCTS) {
        if (product == p) return true;
    }
    return false;
}

void verifyIdentity(const DeviceIdentity& identity) {
    Logger::info("[USB] Manufacturer '%s', product '%s', serial '%s'",
                 identity.manufacturer.c_str(), identity.product.c_str(), identity.serial.c_str());
    if (identity.manufacturer != SUPPORTED_MANUFACTURER) {
        throw UnsupportedDeviceException("Unsupported manufacturer '" + identity.manufacturer +
                                         "', expected '" + SUPPORTED_MANUFACTURER + "'");
    }
    if (!isSupportedProduct(identity.product)) {
        Logger::warn("[USB] Product '%s' is not in the supported list, continuing anyway", identity.product.c_str());
    }
}
