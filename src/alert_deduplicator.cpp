#include "../include/alert_deduplicator.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <errno.h>
#include <fstream>
#include <string.h>
#include <sys/stat.h>

FileTimestampStore::FileTimestampStore(const std::string& state_dir) : state_dir_(state_dir) {}

std::string FileTimestampStore::pathFor(const std::string& channel) const {
    std::string safe;
    for (char c : channel) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        safe += ok ? c : '_';
    }
    std::string dir = state_dir_.empty() ? "." : state_dir_;
    if (dir[dir.size() - 1] != '/') dir += '/';
    return dir + "elemac_last_alert_" + safe;
}

bool FileTimestampStore::load(const std::string& channel, std::string& value) {
    std::ifstream in(pathFor(channel));
    if (!in) return false;
    std::string line;
    std::getline(in, line);
    value = line;
    return true;
}

void FileTimestampStore::save(const std::string& channel, const std::string& value) {
    std::string path = pathFor(channel);
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out) {
            throw ConfigException("Cannot write alert state file " + path + ": " + strerror(errno));
        }
        out << value;
        out.flush();
        if (!out) {
            throw ConfigException("Write to " + path + " failed");
        }
    }
    if (chmod(path.c_str(), 0666) != 0) {
        Logger::warn("[Dedup] chmod %s failed: %s", path.c_str(), strerror(errno));
    }
}

AlertDeduplicator::AlertDeduplicator(TimestampStore* store, const AlertConfig& config)
    : store_(store), config_(config) {}

bool AlertDeduplicator::shouldSuppress(const std::string& channel, TimePoint now) const {
    if (channel.empty()) return false;
    if (!config_.has_suppression_window) return false;

    std::string stored;
    if (!store_->load(channel, stored)) return false;

    TimePoint last;
    if (!parseIsoTimestamp(stored, last)) {
        Logger::warn("[Dedup] Unparsable timestamp for channel %s, treating as no prior alert", channel.c_str());
        return false;
    }

    std::chrono::duration<double, std::ratio<3600> > elapsed = now - last;
    if (elapsed.count() < config_.suppression_hours) {
        Logger::info("[Dedup] Suppressing alert on %s, last sent %s", channel.c_str(), stored.c_str());
        return true;
    }
    return false;
}

void AlertDeduplicator::recordAlertSent(const std::string& channel, TimePoint now) {
    if (channel.empty()) return;
    store_->save(channel, formatIsoTimestamp(now));
    Logger::debug("[Dedup] Recorded alert on %s", channel.c_str());
}
