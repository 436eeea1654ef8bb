#include "../include/measurement_decoder.hpp"
#include "../include/logger.hpp"
#include <stdexcept>

// 17-byte bank layout
const FieldSpec FIELD_SPECS[FIELD_COUNT] = {
    {FIELD_FLAGS,       0, 1, false, "flags"},
    {FIELD_TYPE,        1, 1, false, "type"},
    {FIELD_MEASURED,    2, 2, true,  "measured"},
    {FIELD_ALARM_HIGH,  4, 2, true,  "alarm_high"},
    {FIELD_DAY_HIGH,    6, 2, true,  "day_high"},
    {FIELD_NIGHT_HIGH,  8, 2, true,  "night_high"},
    {FIELD_HYSTERESIS, 10, 1, true,  "hysteresis"},
    {FIELD_NIGHT_LOW,  11, 2, true,  "night_low"},
    {FIELD_DAY_LOW,    13, 2, true,  "day_low"},
    {FIELD_ALARM_LOW,  15, 2, true,  "alarm_low"},
};

const BankSpec BANK_SPECS[BANK_COUNT] = {
    {0, "temp1",    "Temperature 1", "\xC2\xB0" "C", 10},
    {1, "temp2",    "Temperature 2", "\xC2\xB0" "C", 10},
    {2, "temp3",    "Temperature 3", "\xC2\xB0" "C", 10},
    {3, "temp4",    "Temperature 4", "\xC2\xB0" "C", 10},
    {4, "ph1",      "pH 1",          "pH",           100},
    {5, "ph2",      "pH 2",          "pH",           100},
    {6, "humidity", "Humidity",      "%",            10},
    {7, "redox",    "Redox",         "mV",           1},
};

bool MeasurementRecord::value(const std::string& field, double& out) const {
    const FieldSpec* spec = MeasurementDecoder::findField(field);
    if (!spec) return false;
    out = values[spec->id];
    return true;
}

MeasurementDecoder::MeasurementDecoder(CommandCodec* codec) : codec_(codec) {}

MemoryAddress MeasurementDecoder::fieldAddress(uint8_t bank_index, const FieldSpec& field) {
    return MEAS_BASE + bank_index * MEAS_STRUCT_SIZE + field.offset;
}

const FieldSpec* MeasurementDecoder::findField(const std::string& label) {
    for (const auto& spec : FIELD_SPECS) {
        if (label == spec.label) return &spec;
    }
    return nullptr;
}

MeasurementRecord MeasurementDecoder::readBank(uint8_t bank_index, int divisor) {
    if (bank_index >= BANK_COUNT) {
        throw std::invalid_argument("bank index out of range: " + std::to_string((int)bank_index));
    }
    if (divisor == 0) {
        throw std::invalid_argument("divisor must be non-zero");
    }

    MeasurementRecord record;
    record.divisor = divisor;
    for (const auto& field : FIELD_SPECS) {
        RawValue raw = codec_->readMemory(fieldAddress(bank_index, field), field.size);
        if (field.scaled) {
            record.values[field.id] = (double)raw / (double)divisor;
        } else {
            record.values[field.id] = (double)raw;
        }
    }
    record.available = (record.flags() & 1) != 0;
    return record;
}

MeasurementMap MeasurementDecoder::readAllBanks() {
    MeasurementMap records;
    for (const auto& bank : BANK_SPECS) {
        MeasurementRecord record = readBank(bank.index, bank.divisor);
        record.code = bank.code;
        record.label = bank.label;
        record.unit = bank.unit;
        Logger::debug("[Decoder] %s: measured=%.2f available=%d", bank.code, record.measured(), record.available ? 1 : 0);
        records[bank.code] = record;
    }
    return records;
}

std::vector<MeasurementRecord> MeasurementDecoder::availableRecords(const MeasurementMap& records) {
    // std::map iterates in ascending key order
    std::vector<MeasurementRecord> out;
    for (const auto& entry : records) {
        if (entry.second.available) out.push_back(entry.second);
    }
    return out;
}
