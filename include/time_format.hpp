#pragma once
#include <chrono>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

TimePoint nowMicros();

// "2026-10-18T07:05:09.123456", UTC. Round-trips exactly through parseIsoTimestamp.
std::string formatIsoTimestamp(TimePoint tp);
bool parseIsoTimestamp(const std::string& text, TimePoint& out);

// "2026-10-18 09:05:09", local time, used for chart data lines.
std::string formatChartTimestamp(TimePoint tp);
