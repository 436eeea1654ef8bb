#pragma once
#include <cstdint>
#include <string>

using MemoryAddress = uint32_t;
using ReadSize = uint8_t;
using RawValue = uint32_t;

// Sub-values stored in every measurement bank, in memory order.
enum FieldId {
    FIELD_FLAGS = 0,
    FIELD_TYPE,
    FIELD_MEASURED,
    FIELD_ALARM_HIGH,
    FIELD_DAY_HIGH,
    FIELD_NIGHT_HIGH,
    FIELD_HYSTERESIS,
    FIELD_NIGHT_LOW,
    FIELD_DAY_LOW,
    FIELD_ALARM_LOW,
    FIELD_COUNT
};

struct FieldSpec {
    FieldId id;
    uint8_t offset;
    ReadSize size;
    bool scaled;
    const char* label;
};

struct BankSpec {
    uint8_t index;
    const char* code;
    const char* label;
    const char* unit;
    int divisor;
};

/**
 * Decoded snapshot of one measurement bank.
 *
 * Scaled fields hold raw / divisor, flags and type hold the raw integer.
 */
struct MeasurementRecord {
    std::string code;
    std::string label;
    std::string unit;
    int divisor = 1;
    bool available = false;
    double values[FIELD_COUNT] = {};

    double value(FieldId id) const { return values[id]; }
    // Lookup by field label ("measured", "alarm_high", ...); false if unknown.
    bool value(const std::string& field, double& out) const;

    double measured() const { return values[FIELD_MEASURED]; }
    double alarmHigh() const { return values[FIELD_ALARM_HIGH]; }
    double alarmLow() const { return values[FIELD_ALARM_LOW]; }
    uint32_t flags() const { return (uint32_t)values[FIELD_FLAGS]; }
};
