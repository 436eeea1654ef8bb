#include "../include/data_storage.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <errno.h>
#include <fstream>
#include <map>
#include <string.h>

ChartDataStore::ChartDataStore(const std::string& filename) : filename_(filename) {}

std::string ChartDataStore::buildLine(const MeasurementMap& records, TimePoint now) {
    // ArduinoJson keeps insertion order, so insert in sorted key order
    std::map<std::string, double> measured;
    for (const auto& r : MeasurementDecoder::availableRecords(records)) {
        measured[r.code] = r.measured();
    }
    std::string timestamp = formatChartTimestamp(now);

    DynamicJsonDocument doc(1024);
    bool timestamp_written = false;
    for (const auto& entry : measured) {
        if (!timestamp_written && entry.first > "timestamp") {
            doc["timestamp"] = timestamp;
            timestamp_written = true;
        }
        doc[entry.first] = entry.second;
    }
    if (!timestamp_written) doc["timestamp"] = timestamp;

    std::string line;
    serializeJson(doc, line);
    return line;
}

void ChartDataStore::append(const MeasurementMap& records, TimePoint now) {
    std::string line = buildLine(records, now);
    std::ofstream out(filename_, std::ios::out | std::ios::app);
    if (!out) {
        throw ConfigException("Cannot open chart data file " + filename_ + ": " + strerror(errno));
    }
    out << line << '\n';
    if (!out) {
        throw ConfigException("Write to " + filename_ + " failed");
    }
    Logger::debug("[Chart] %s", line.c_str());
}
