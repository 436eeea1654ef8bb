#pragma once
#include <stdint.h>
#include <vector>
#include <string>

struct LoggingConfig {
    std::string log_level;
    std::string log_file;
    bool flush_on_write;
};

struct DeviceConfig {
    uint16_t vendor_id;
    uint16_t product_id;
    uint32_t timeout_ms;
    size_t max_packet_size;
};

struct EmailConfig {
    std::string host;
    uint16_t port;
    std::string user;
    std::string password;
    std::string from;
    std::vector<std::string> to;

    // Fills `missing` with the first absent required option.
    bool isComplete(std::string& missing) const;
};

struct SmsConfig {
    std::string url;
    std::string api_key;
    std::vector<std::string> to;

    bool isComplete(std::string& missing) const;
};

struct AlertConfig {
    bool has_suppression_window;
    double suppression_hours;
};

struct StorageConfig {
    std::string alert_state_dir;
    std::string chart_data_file;
};

struct AcquisitionConfig {
    uint32_t poll_interval_s;
};

class ConfigManager {
public:
    ConfigManager();
    ConfigManager(const char* config_file);
    ~ConfigManager();

    // Replace current settings with those in a JSON document; unknown keys are ignored.
    bool loadFromString(const std::string& json);
    bool loadFromFile(const char* config_file);

    DeviceConfig getDeviceConfig() const;
    EmailConfig getEmailConfig() const;
    SmsConfig getSmsConfig() const;
    AlertConfig getAlertConfig() const;
    StorageConfig getStorageConfig() const;
    AcquisitionConfig getAcquisitionConfig() const;
    LoggingConfig getLoggingConfig() const;

    static const char* defaultConfigPath();

private:
    DeviceConfig device_config_;
    EmailConfig email_config_;
    SmsConfig sms_config_;
    AlertConfig alert_config_;
    StorageConfig storage_config_;
    AcquisitionConfig acquisition_config_;
    LoggingConfig logging_config_;

    void initializeDefaults();
    static std::vector<std::string> splitList(const std::string& list);
};
