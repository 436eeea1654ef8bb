#include "../include/command_line.hpp"
#include <stdlib.h>

static bool noExtraArgs(const std::vector<std::string>& args, size_t allowed, std::string& error) {
    if (args.size() <= allowed) return true;
    error = "unexpected argument '" + args[allowed] + "' after '" + args[0] + "'";
    return false;
}

bool parseCommand(const std::vector<std::string>& args, Command& cmd, std::string& error) {
    cmd = Command();
    if (args.empty()) return true;

    const std::string& name = args[0];
    if (name == "show") {
        std::string what = args.size() > 1 ? args[1] : "basic";
        if (what == "basic") {
            cmd.id = CMD_SHOW_BASIC;
        } else if (what == "all") {
            cmd.id = CMD_SHOW_ALL;
        } else {
            error = "unknown show mode '" + what + "'";
            return false;
        }
        return noExtraArgs(args, 2, error);
    }
    if (name == "monitor") {
        cmd.id = CMD_MONITOR;
        if (args.size() > 1) {
            const char* text = args[1].c_str();
            char* end = nullptr;
            unsigned long v = strtoul(text, &end, 10);
            if (end == text || *end != '\0' || text[0] == '-' || v == 0 || v > 86400) {
                error = "invalid interval '" + args[1] + "'";
                return false;
            }
            cmd.interval_s = (uint32_t)v;
        }
        return noExtraArgs(args, 2, error);
    }

    if (name == "check_alarms") cmd.id = CMD_CHECK_ALARMS;
    else if (name == "test_alerts") cmd.id = CMD_TEST_ALERTS;
    else if (name == "store_chart_data") cmd.id = CMD_STORE_CHART_DATA;
    else if (name == "version") cmd.id = CMD_VERSION;
    else {
        error = "unknown command '" + name + "'";
        return false;
    }
    return noExtraArgs(args, 1, error);
}
