#pragma once
#include <cstddef>
#include <cstdint>
#include <csignal>

class ElemacMonitor;

/**
 * Runs poll cycles back to back on the calling thread.
 *
 * A cycle that fails with a transport or protocol error is logged and
 * skipped; the next one starts at the following interval.
 */
class AcquisitionScheduler {
public:
    AcquisitionScheduler(ElemacMonitor* monitor);
    ~AcquisitionScheduler();

    // max_cycles == 0 runs until stop() or SIGINT/SIGTERM.
    void run(uint32_t interval_s, uint32_t max_cycles = 0);
    static void stop();
    static void installSignalHandlers();

    uint32_t cycleCount() const { return cycles_; }
    uint32_t failedCycles() const { return failures_; }
    uint32_t alertsRaised() const { return alerts_; }
    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    ElemacMonitor* monitor_ = nullptr;
    uint32_t cycles_ = 0;
    uint32_t failures_ = 0;
    uint32_t alerts_ = 0;
    static volatile sig_atomic_t stop_requested_;
    static void onSignal(int sig);
    bool sleepInterval(uint32_t interval_s);
};
