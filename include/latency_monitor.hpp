#ifndef KFE_LATENCY_MONITOR_HPP
#define KFE_LATENCY_MONITOR_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

struct LatencySummary {
    size_t samples = 0;
    double rtt_min = 0.0;     // seconds
    double rtt_avg = 0.0;
    double rtt_max = 0.0;
    uint64_t total_bytes = 0;
    double elapsed = 0.0;     // seconds
    double throughput = 0.0;  // bytes / second
};

class LatencyMonitor {
public:
    LatencyMonitor() = default;

    void record(double send_ts, double recv_ts, size_t bytes);
    void clear();

    const std::vector<double>& samples() const { return rtt_samples; }
    uint64_t total_bytes() const { return bytes_total; }

    // min/avg/max are 0.0 without samples, throughput is 0.0 when elapsed <= 0
    LatencySummary summary(double elapsed) const;

private:
    std::vector<double> rtt_samples;
    uint64_t bytes_total = 0;
};

#endif // KFE_LATENCY_MONITOR_HPP
