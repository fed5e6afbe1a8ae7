#include "latency_monitor.hpp"
#include <algorithm>
#include <numeric>

void LatencyMonitor::record(double send_ts, double recv_ts, size_t bytes) {
    rtt_samples.push_back(recv_ts - send_ts);
    bytes_total += bytes;
}

void LatencyMonitor::clear() {
    rtt_samples.clear();
    bytes_total = 0;
}

LatencySummary LatencyMonitor::summary(double elapsed) const {
    LatencySummary s;
    s.samples = rtt_samples.size();
    s.total_bytes = bytes_total;
    s.elapsed = elapsed;

    if (!rtt_samples.empty()) {
        auto [lo, hi] = std::minmax_element(rtt_samples.begin(), rtt_samples.end());
        s.rtt_min = *lo;
        s.rtt_max = *hi;
        s.rtt_avg = std::accumulate(rtt_samples.begin(), rtt_samples.end(), 0.0)
                    / static_cast<double>(rtt_samples.size());
    }

    s.throughput = elapsed > 0 ? static_cast<double>(bytes_total) / elapsed : 0.0;
    return s;
}
