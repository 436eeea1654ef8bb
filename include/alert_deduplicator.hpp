#pragma once
#include "config_manager.hpp"
#include "time_format.hpp"
#include <string>

/**
 * Persistent last-alert timestamps, one value per channel.
 */
class TimestampStore {
public:
    virtual ~TimestampStore() {}
    // False when nothing is stored for the channel.
    virtual bool load(const std::string& channel, std::string& value) = 0;
    // Overwrites any previous value.
    virtual void save(const std::string& channel, const std::string& value) = 0;
};

/**
 * One file per channel under a state directory, world read/writable so
 * invocations under different users share the window.
 *
 * Concurrent invocations writing the same channel are not serialized.
 */
class FileTimestampStore : public TimestampStore {
public:
    FileTimestampStore(const std::string& state_dir);
    bool load(const std::string& channel, std::string& value) override;
    void save(const std::string& channel, const std::string& value) override;

    std::string pathFor(const std::string& channel) const;

private:
    std::string state_dir_;
};

/**
 * Suppresses repeat alerts on a channel within the configured window.
 *
 * An empty channel or a missing window disables suppression.
 */
class AlertDeduplicator {
public:
    AlertDeduplicator(TimestampStore* store, const AlertConfig& config);

    bool shouldSuppress(const std::string& channel, TimePoint now) const;
    void recordAlertSent(const std::string& channel, TimePoint now);

    bool hasWindow() const { return config_.has_suppression_window; }
    double windowHours() const { return config_.suppression_hours; }

private:
    TimestampStore* store_;
    AlertConfig config_;
};
