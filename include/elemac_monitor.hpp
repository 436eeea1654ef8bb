#pragma once
#include "alarm_evaluator.hpp"
#include "alert_dispatcher.hpp"
#include "command_codec.hpp"
#include "config_manager.hpp"
#include "data_storage.hpp"
#include "measurement_decoder.hpp"
#include "transport.hpp"
#include <ostream>
#include <string>

static const char* const TEST_ALERT_CHANNEL = "test_alerts";

/**
 * Operations behind the command line subcommands.
 *
 * Every operation polls the device live; a TransportException or
 * ProtocolException during a poll propagates and nothing is published.
 */
class ElemacMonitor {
public:
    ElemacMonitor(ConfigManager* config, Transport* transport,
                  AlertDispatcher* dispatcher, ChartDataStore* chart);
    ~ElemacMonitor() = default;

    MeasurementMap poll();

    void showBasic(std::ostream& out);
    void showAll(std::ostream& out);
    int checkAlarms();
    bool testAlerts();
    void storeChartData();
    std::string version();

    // One poll feeding both alarm checks and the chart log.
    int runCycle();

    static void printBasic(const MeasurementMap& records, std::ostream& out);
    static void printAll(const MeasurementMap& records, std::ostream& out);

private:
    CommandCodec codec_;
    MeasurementDecoder decoder_;
    AlertDispatcher* dispatcher_;
    ChartDataStore* chart_;
};
