#include "../include/acquisition_scheduler.hpp"
#include "../include/elemac_monitor.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <chrono>
#include <stdio.h>
#include <thread>

volatile sig_atomic_t AcquisitionScheduler::stop_requested_ = 0;

AcquisitionScheduler::AcquisitionScheduler(ElemacMonitor* monitor) : monitor_(monitor) {}
AcquisitionScheduler::~AcquisitionScheduler() {}

void AcquisitionScheduler::onSignal(int sig) {
    (void)sig;
    stop_requested_ = 1;
}

void AcquisitionScheduler::installSignalHandlers() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
}

void AcquisitionScheduler::stop() { stop_requested_ = 1; }

bool AcquisitionScheduler::sleepInterval(uint32_t interval_s) {
    // Sleep in short slices so a stop request is honoured promptly
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(interval_s);
    while (!stop_requested_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !stop_requested_;
}

void AcquisitionScheduler::run(uint32_t interval_s, uint32_t max_cycles) {
    stop_requested_ = 0;
    Logger::info("[Scheduler] Polling every %u s", interval_s);
    while (!stop_requested_) {
        cycles_++;
        try {
            alerts_ += (uint32_t)monitor_->runCycle();
        } catch (const TransportException& e) {
            failures_++;
            Logger::error("[Scheduler] Cycle %u skipped, transport error: %s", cycles_, e.what());
        } catch (const ProtocolException& e) {
            failures_++;
            Logger::error("[Scheduler] Cycle %u skipped, protocol error: %s", cycles_, e.what());
        } catch (const ConfigException& e) {
            failures_++;
            Logger::error("[Scheduler] Cycle %u: %s", cycles_, e.what());
        }
        if (max_cycles && cycles_ >= max_cycles) break;
        if (!sleepInterval(interval_s)) break;
    }
    char stats[160];
    getStatistics(stats, sizeof(stats));
    Logger::info("[Scheduler] Stopped: %s", stats);
}

void AcquisitionScheduler::getStatistics(char* outBuf, size_t outBufSize) const {
    snprintf(outBuf, outBufSize, "cycles=%u failed=%u alerts=%u", cycles_, failures_, alerts_);
}
