#pragma once
#include <string>

struct DeviceIdentity {
    std::string manufacturer;
    std::string product;
    std::string serial;
};

static const char* const SUPPORTED_MANUFACTURER = "ELEMAC";

bool isSupportedProduct(const std::string& product);

/**
 * Throws UnsupportedDeviceException unless the manufacturer is ELEMAC.
 * An unknown product only logs a warning.
 */
void verifyIdentity(const DeviceIdentity& identity);
