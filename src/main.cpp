#include "../include/acquisition_scheduler.hpp"
#include "../include/alert_deduplicator.hpp"
#include "../include/alert_dispatcher.hpp"
#include "../include/alert_senders.hpp"
#include "../include/command_line.hpp"
#include "../include/config_manager.hpp"
#include "../include/data_storage.hpp"
#include "../include/elemac_monitor.hpp"
#include "../include/exceptions.hpp"
#include "../include/http_client.hpp"
#include "../include/logger.hpp"
#include "../include/usb_transport.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <stdint.h>
#include <iostream>
#include <string>
#include <vector>

static void printUsage() {
    std::cerr <<
        "usage: elemac [--config PATH] [command]\n"
        "\n"
        "commands:\n"
        "  show [basic|all]   print readings (default: show basic)\n"
        "  check_alarms       raise alerts for readings outside alarm limits\n"
        "  test_alerts        send a test alert through every configured channel\n"
        "  store_chart_data   append current readings to the chart data file\n"
        "  monitor [SECONDS]  check alarms and store chart data periodically\n"
        "  version            print the controller firmware version\n";
}

static void runCommand(const Command& cmd, ElemacMonitor& monitor, const ConfigManager& config) {
    switch (cmd.id) {
        case CMD_SHOW_BASIC:
            monitor.showBasic(std::cout);
            break;
        case CMD_SHOW_ALL:
            monitor.showAll(std::cout);
            break;
        case CMD_CHECK_ALARMS: {
            int raised = monitor.checkAlarms();
            Logger::info("%d alert(s) delivered", raised);
            break;
        }
        case CMD_TEST_ALERTS:
            if (!monitor.testAlerts()) {
                std::cout << "Test alert suppressed by the dedup window\n";
            }
            break;
        case CMD_STORE_CHART_DATA:
            monitor.storeChartData();
            break;
        case CMD_MONITOR: {
            uint32_t interval = cmd.interval_s ? cmd.interval_s : config.getAcquisitionConfig().poll_interval_s;
            AcquisitionScheduler scheduler(&monitor);
            AcquisitionScheduler::installSignalHandlers();
            scheduler.run(interval);
            break;
        }
        case CMD_VERSION:
            std::cout << monitor.version() << "\n";
            break;
    }
}

int main(int argc, char** argv) {
    std::string config_path = ConfigManager::defaultConfigPath();
    const char* env_config = getenv("ELEMAC_CONFIG");
    if (env_config && *env_config) config_path = env_config;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" || a == "-c") {
            if (i + 1 >= argc) {
                printUsage();
                return 2;
            }
            config_path = argv[++i];
        } else if (a == "--help" || a == "-h") {
            printUsage();
            return 0;
        } else {
            args.push_back(a);
        }
    }

    // Bad usage is reported before the device is touched
    Command cmd;
    std::string usage_error;
    if (!parseCommand(args, cmd, usage_error)) {
        std::cerr << "elemac: " << usage_error << "\n";
        printUsage();
        return 2;
    }

    ConfigManager config;
    config.loadFromFile(config_path.c_str());
    Logger::begin(config.getLoggingConfig());
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int rc = 0;
    try {
        UsbTransport usb(config.getDeviceConfig());

        StorageConfig storage = config.getStorageConfig();
        FileTimestampStore store(storage.alert_state_dir);
        AlertDeduplicator dedup(&store, config.getAlertConfig());
        HttpClient http;
        SmtpEmailSender email(config.getEmailConfig());
        SmsGatewaySender sms(config.getSmsConfig(), &http);
        AlertDispatcher dispatcher(&dedup, &email, &sms);
        ChartDataStore chart(storage.chart_data_file);

        ElemacMonitor monitor(&config, &usb, &dispatcher, &chart);
        runCommand(cmd, monitor, config);
    } catch (const ElemacException& e) {
        Logger::error("%s", e.what());
        rc = 1;
    } catch (const std::exception& e) {
        Logger::error("Unexpected error: %s", e.what());
        rc = 1;
    }

    curl_global_cleanup();
    Logger::shutdown();
    return rc;
}
