#include "../include/time_format.hpp"
#include <ctype.h>
#include <stdio.h>
#include <time.h>

TimePoint nowMicros() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

static void splitSeconds(TimePoint tp, time_t& secs, long& micros) {
    long long total = (long long)tp.time_since_epoch().count();
    long long s = total / 1000000;
    long long us = total % 1000000;
    if (us < 0) {
        us += 1000000;
        s -= 1;
    }
    secs = (time_t)s;
    micros = (long)us;
}

std::string formatIsoTimestamp(TimePoint tp) {
    time_t secs;
    long micros;
    splitSeconds(tp, secs, micros);
    struct tm utc;
    gmtime_r(&secs, &utc);
    char buf[40];
    size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buf + n, sizeof(buf) - n, ".%06ld", micros);
    return std::string(buf);
}

bool parseIsoTimestamp(const std::string& text, TimePoint& out) {
    struct tm utc = {};
    int consumed = 0;
    if (sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
               &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
               &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed) != 6) {
        return false;
    }
    if (utc.tm_mon < 1 || utc.tm_mon > 12 || utc.tm_mday < 1 || utc.tm_mday > 31 ||
        utc.tm_hour > 23 || utc.tm_min > 59 || utc.tm_sec > 60) {
        return false;
    }

    const char* p = text.c_str() + consumed;
    long micros = 0;
    if (*p == '.') {
        p++;
        int digits = 0;
        while (isdigit((unsigned char)*p) && digits < 6) {
            micros = micros * 10 + (*p - '0');
            p++;
            digits++;
        }
        if (digits == 0 || isdigit((unsigned char)*p)) return false;
        for (; digits < 6; digits++) micros *= 10;
    }
    while (*p == '\n' || *p == '\r' || *p == ' ') p++;
    if (*p != '\0') return false;

    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    time_t secs = timegm(&utc);
    out = TimePoint(std::chrono::microseconds((long long)secs * 1000000 + micros));
    return true;
}

std::string formatChartTimestamp(TimePoint tp) {
    time_t secs;
    long micros;
    splitSeconds(tp, secs, micros);
    struct tm local;
    localtime_r(&secs, &local);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf);
}
