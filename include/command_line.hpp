#pragma once
#include <stdint.h>
#include <string>
#include <vector>

enum CommandId {
    CMD_SHOW_BASIC,
    CMD_SHOW_ALL,
    CMD_CHECK_ALARMS,
    CMD_TEST_ALERTS,
    CMD_STORE_CHART_DATA,
    CMD_MONITOR,
    CMD_VERSION
};

struct Command {
    CommandId id = CMD_SHOW_BASIC;
    uint32_t interval_s = 0;  // monitor only, 0 means poll_interval_s from the config
};

/**
 * Parses the subcommand words left after global options.
 *
 * No arguments means "show basic". On failure `error` holds a one-line
 * diagnostic and `cmd` is unspecified.
 */
bool parseCommand(const std::vector<std::string>& args, Command& cmd, std::string& error);
