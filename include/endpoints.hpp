#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// close() and release() run from destructors during unwinding and must not throw.

// Network side of the loopback (a TUN interface in production).
class PacketTransport {
public:
    virtual ~PacketTransport() = default;

    // Throws KfeError(TransportUnavailable).
    virtual void open(const std::string& name) = 0;
    // Blocks until one packet is available.
    virtual std::vector<uint8_t> read(size_t max_len) = 0;
    virtual size_t write(const std::vector<uint8_t>& packet) = 0;
    virtual void close() = 0;
};

// Capture side: a grabber that hands back whole frames.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Throws KfeError(DeviceUnavailable).
    virtual void acquire(int device_id) = 0;
    // false = no frame this tick (not an error)
    virtual bool read(std::vector<uint8_t>& frame) = 0;
    virtual void release() = 0;
};

// Display side. Fire and forget.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void render(const std::vector<uint8_t>& frame) = 0;
    // End of a successful stream: push out anything buffered. May throw.
    virtual void finish() {}
    virtual void close() {}
};
