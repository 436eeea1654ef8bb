#include "../include/elemac_monitor.hpp"
#include "../include/logger.hpp"
#include <stdio.h>

ElemacMonitor::ElemacMonitor(ConfigManager* config, Transport* transport,
                             AlertDispatcher* dispatcher, ChartDataStore* chart)
    : codec_(transport, config->getDeviceConfig().max_packet_size, config->getDeviceConfig().timeout_ms),
      decoder_(&codec_),
      dispatcher_(dispatcher),
      chart_(chart) {}

MeasurementMap ElemacMonitor::poll() {
    MeasurementMap records = decoder_.readAllBanks();
    Logger::debug("[Monitor] Polled %u banks", (unsigned)records.size());
    return records;
}

void ElemacMonitor::printBasic(const MeasurementMap& records, std::ostream& out) {
    std::vector<MeasurementRecord> available = MeasurementDecoder::availableRecords(records);
    if (available.empty()) {
        out << "No probes connected\n";
        return;
    }
    char line[128];
    for (const auto& r : available) {
        snprintf(line, sizeof(line), "%-14s %8s %s\n", r.label.c_str(),
                 formatValue(r.measured(), r.divisor).c_str(), r.unit.c_str());
        out << line;
    }
}

void ElemacMonitor::printAll(const MeasurementMap& records, std::ostream& out) {
    char line[128];
    for (const auto& entry : records) {
        const MeasurementRecord& r = entry.second;
        snprintf(line, sizeof(line), "[%s] %s (%s)\n", r.code.c_str(), r.label.c_str(),
                 r.available ? "available" : "not available");
        out << line;
        for (const auto& field : FIELD_SPECS) {
            std::string text = field.scaled
                ? formatValue(r.value(field.id), r.divisor) + " " + r.unit
                : std::to_string((unsigned long)r.value(field.id));
            snprintf(line, sizeof(line), "  %-11s %s\n", field.label, text.c_str());
            out << line;
        }
    }
}

void ElemacMonitor::showBasic(std::ostream& out) {
    printBasic(poll(), out);
}

void ElemacMonitor::showAll(std::ostream& out) {
    printAll(poll(), out);
}

int ElemacMonitor::checkAlarms() {
    MeasurementMap records = poll();
    return raiseAlarms(evaluateAlarms(MeasurementDecoder::availableRecords(records)), dispatcher_);
}

bool ElemacMonitor::testAlerts() {
    return dispatcher_->raise("ELEMAC test alert",
                              "This is a test alert from the ELEMAC monitor. "
                              "If you can read it, alert delivery works.",
                              "ELEMAC test alert", TEST_ALERT_CHANNEL);
}

void ElemacMonitor::storeChartData() {
    MeasurementMap records = poll();
    chart_->append(records, nowMicros());
}

std::string ElemacMonitor::version() {
    return codec_.queryVersion();
}

int ElemacMonitor::runCycle() {
    MeasurementMap records = poll();
    int raised = raiseAlarms(evaluateAlarms(MeasurementDecoder::availableRecords(records)), dispatcher_);
    chart_->append(records, nowMicros());
    return raised;
}
