#pragma once

#include "endpoints.hpp"
#include "frame_geometry.hpp"
#include "latency_monitor.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class ReportMode { Final, EveryPacket };

enum class LoopState { Idle, Running, Completed, Failed };

struct LoopbackOptions {
    std::string interface_name = "tun0";
    int device_index = 0;
    uint64_t packet_limit = 100;
    size_t max_packet_bytes = 65535;
    ReportMode report = ReportMode::Final;
};

struct LoopbackStats {
    uint64_t packets_processed = 0;
    uint64_t frames_missed = 0;
    std::vector<double> latencies;
    LatencySummary summary;
};

// Seconds on a monotonic clock.
using LoopClock = std::function<double()>;
double steady_seconds();

const char* loop_state_name(LoopState state);

// Relays packets: transport → frame → display ... capture → frame → transport.
// Endpoints are borrowed; run() acquires them and releases them on every exit path.
class LoopbackSession {
public:
    LoopbackSession(const KfeConfig& cfg, const LoopbackOptions& options,
                    PacketTransport& transport, FrameSource& source, FrameSink& sink,
                    LoopClock clock = steady_seconds);

    // Throws the first KfeError that aborts the loop (state becomes Failed).
    LoopbackStats run();

    LoopState state() const { return state_; }

private:
    void report(const LoopbackStats& stats, double elapsed) const;

    const KfeConfig& cfg_;
    LoopbackOptions options_;
    PacketTransport& transport_;
    FrameSource& source_;
    FrameSink& sink_;
    LoopClock clock_;
    LoopState state_ = LoopState::Idle;
};

// One-shot convenience wrapper around LoopbackSession.
LoopbackStats run_loopback(const KfeConfig& cfg, const LoopbackOptions& options,
                           PacketTransport& transport, FrameSource& source, FrameSink& sink,
                           LoopClock clock = steady_seconds);
