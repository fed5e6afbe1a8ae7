#include "loopback.hpp"
#include "packet_framer.hpp"
#include "kfe_error.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace std;
typedef chrono::steady_clock Clock;

double steady_seconds() {
    return chrono::duration<double>(Clock::now().time_since_epoch()).count();
}

const char* loop_state_name(LoopState state) {
    switch (state) {
        case LoopState::Idle:      return "Idle";
        case LoopState::Running:   return "Running";
        case LoopState::Completed: return "Completed";
        case LoopState::Failed:    return "Failed";
    }
    return "Unknown";
}

namespace {

class TransportGuard {
public:
    TransportGuard(PacketTransport& t, const string& name) : t_(t) { t_.open(name); }
    ~TransportGuard() { t_.close(); }
    TransportGuard(const TransportGuard&) = delete;
    TransportGuard& operator=(const TransportGuard&) = delete;
private:
    PacketTransport& t_;
};

// Capture and display are acquired and released together.
class ChannelGuard {
public:
    ChannelGuard(FrameSource& src, FrameSink& sink, int device) : src_(src), sink_(sink) {
        src_.acquire(device);
    }
    ~ChannelGuard() {
        src_.release();
        sink_.close();
    }
    ChannelGuard(const ChannelGuard&) = delete;
    ChannelGuard& operator=(const ChannelGuard&) = delete;
private:
    FrameSource& src_;
    FrameSink& sink_;
};

} // namespace

LoopbackSession::LoopbackSession(const KfeConfig& cfg, const LoopbackOptions& options,
                                 PacketTransport& transport, FrameSource& source, FrameSink& sink,
                                 LoopClock clock)
    : cfg_(cfg), options_(options), transport_(transport), source_(source), sink_(sink),
      clock_(std::move(clock)) {}

LoopbackStats LoopbackSession::run() {
    state_ = LoopState::Running;
    LoopbackStats stats;
    LatencyMonitor monitor;

    try {
        TransportGuard transport_guard(transport_, options_.interface_name);
        ChannelGuard channel_guard(source_, sink_, options_.device_index);

        if (cfg_.verbose) {
            cout << "[loopback] " << options_.interface_name << " <-> device "
                 << options_.device_index << ", limit " << options_.packet_limit << " packets" << endl;
        }

        const double start_time = clock_();
        vector<uint8_t> captured;

        while (stats.packets_processed < options_.packet_limit) {
            vector<uint8_t> packet = transport_.read(options_.max_packet_bytes);
            const double send_ts = clock_();

            sink_.render(pack_packet(packet, cfg_));

            if (!source_.read(captured)) {
                stats.frames_missed++;
                if (cfg_.verbose) cout << "[loopback] No frame captured, skipping" << endl;
                continue;
            }

            vector<uint8_t> recovered = unpack_packet(captured, cfg_);
            const size_t written = transport_.write(recovered);
            if (written < recovered.size()) {
                throw KfeError(KfeErrc::IoError,
                               "Short transport write: " + to_string(written) + " of "
                               + to_string(recovered.size()) + " bytes");
            }
            const double recv_ts = clock_();

            monitor.record(send_ts, recv_ts, recovered.size());
            stats.packets_processed++;

            if (options_.report == ReportMode::EveryPacket) {
                stats.summary = monitor.summary(recv_ts - start_time);
                stats.latencies = monitor.samples();
                report(stats, recv_ts - start_time);
            }
        }

        const double elapsed = clock_() - start_time;
        stats.summary = monitor.summary(elapsed);
        stats.latencies = monitor.samples();
        report(stats, elapsed);
    } catch (const KfeError& e) {
        state_ = LoopState::Failed;
        cerr << "[loopback] " << loop_state_name(state_) << " after " << stats.packets_processed << " packets: "
             << kfe_errc_name(e.code()) << ": " << e.what() << endl;
        throw;
    } catch (const exception& e) {
        state_ = LoopState::Failed;
        cerr << "[loopback] " << loop_state_name(state_) << ": " << e.what() << endl;
        throw;
    }

    state_ = LoopState::Completed;
    if (cfg_.verbose) cout << "[loopback] " << loop_state_name(state_) << endl;
    return stats;
}

void LoopbackSession::report(const LoopbackStats& stats, double elapsed) const {
    const LatencySummary& s = stats.summary;
    ostringstream line;
    line << "[loopback] Processed: " << stats.packets_processed << " packets | "
         << fixed << setprecision(4)
         << "RTT min/avg/max: " << s.rtt_min << "/" << s.rtt_avg << "/" << s.rtt_max << " s | "
         << setprecision(2)
         << "Throughput: " << s.throughput << " B/s";
    if (stats.frames_missed > 0) line << " | Missed frames: " << stats.frames_missed;
    if (cfg_.verbose) line << " | Elapsed: " << elapsed << " s";
    cout << line.str() << endl;
}

LoopbackStats run_loopback(const KfeConfig& cfg, const LoopbackOptions& options,
                           PacketTransport& transport, FrameSource& source, FrameSink& sink,
                           LoopClock clock) {
    LoopbackSession session(cfg, options, transport, source, sink, std::move(clock));
    return session.run();
}
