#pragma once
#include "alert_dispatcher.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct Alarm {
    std::string channel;
    std::string summary;
    std::string details;
    std::string brief;
};

// Builds one alarm per crossed threshold of each available record.
std::vector<Alarm> evaluateAlarms(const std::vector<MeasurementRecord>& records);

// Raises every alarm through the dispatcher; returns the number delivered.
int raiseAlarms(const std::vector<Alarm>& alarms, AlertDispatcher* dispatcher);

std::string formatValue(double value, int divisor);
