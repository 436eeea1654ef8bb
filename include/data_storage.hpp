#pragma once
#include "measurement_decoder.hpp"
#include "time_format.hpp"
#include <string>

/**
 * Append-only time series of measured values, one JSON object per line.
 *
 * Keys are sorted: bank codes of the available banks plus "timestamp".
 */
class ChartDataStore {
public:
    ChartDataStore(const std::string& filename);

    // Appends one line; throws ConfigException when the file cannot be written.
    void append(const MeasurementMap& records, TimePoint now);

    static std::string buildLine(const MeasurementMap& records, TimePoint now);

    const std::string& filename() const { return filename_; }

private:
    std::string filename_;
};
