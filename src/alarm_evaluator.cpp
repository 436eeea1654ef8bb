#include "../include/alarm_evaluator.hpp"
#include "../include/logger.hpp"
#include <stdio.h>

std::string formatValue(double value, int divisor) {
    int decimals = 0;
    for (int d = divisor; d >= 10 && decimals < 6; d /= 10) decimals++;
    char buf[48];
    snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::string(buf);
}

static Alarm makeAlarm(const MeasurementRecord& r, const char* direction, const char* relation, double limit) {
    std::string measured = formatValue(r.measured(), r.divisor) + " " + r.unit;
    std::string threshold = formatValue(limit, r.divisor) + " " + r.unit;

    Alarm alarm;
    alarm.channel = r.code;
    alarm.summary = "ELEMAC alarm: " + r.label + " too " + direction;
    alarm.details = r.label + " measured " + measured + ", " + relation +
                    " the alarm limit of " + threshold + ".";
    alarm.brief = r.label + " too " + direction + ": " + measured;
    return alarm;
}

std::vector<Alarm> evaluateAlarms(const std::vector<MeasurementRecord>& records) {
    std::vector<Alarm> alarms;
    for (const auto& r : records) {
        if (!r.available) continue;
        // High and low are checked independently
        if (r.measured() > r.alarmHigh()) {
            alarms.push_back(makeAlarm(r, "high", "above", r.alarmHigh()));
        }
        if (r.measured() < r.alarmLow()) {
            alarms.push_back(makeAlarm(r, "low", "below", r.alarmLow()));
        }
    }
    return alarms;
}

int raiseAlarms(const std::vector<Alarm>& alarms, AlertDispatcher* dispatcher) {
    int delivered = 0;
    for (const auto& alarm : alarms) {
        if (dispatcher->raise(alarm.summary, alarm.details, alarm.brief, alarm.channel)) delivered++;
    }
    if (alarms.empty()) Logger::info("[Alarm] All readings within limits");
    return delivered;
}
