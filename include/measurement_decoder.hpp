#pragma once
#include "command_codec.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

// Start of the measurement bank array in device memory
static const MemoryAddress MEAS_BASE = 1864;
static const MemoryAddress MEAS_STRUCT_SIZE = 17;
static const size_t BANK_COUNT = 8;

extern const FieldSpec FIELD_SPECS[FIELD_COUNT];
extern const BankSpec BANK_SPECS[BANK_COUNT];

using MeasurementMap = std::map<std::string, MeasurementRecord>;

class MeasurementDecoder {
public:
    MeasurementDecoder(CommandCodec* codec);
    ~MeasurementDecoder() = default;

    // Reads all ten fields of one bank. Bank metadata is left empty.
    MeasurementRecord readBank(uint8_t bank_index, int divisor);

    // Reads every bank; any failure aborts the whole cycle.
    MeasurementMap readAllBanks();

    static std::vector<MeasurementRecord> availableRecords(const MeasurementMap& records);
    static MemoryAddress fieldAddress(uint8_t bank_index, const FieldSpec& field);
    static const FieldSpec* findField(const std::string& label);

private:
    CommandCodec* codec_;
};
