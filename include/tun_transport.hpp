#pragma once

#include "endpoints.hpp"
#include <string>
#include <vector>

// Attaches to an existing TUN interface (IFF_TUN | IFF_NO_PI).
// Requires CAP_NET_ADMIN, usually root.
class TunTransport : public PacketTransport {
public:
    explicit TunTransport(const std::string& device_path = "/dev/net/tun");
    ~TunTransport() override;

    void open(const std::string& name) override;
    std::vector<uint8_t> read(size_t max_len) override;
    size_t write(const std::vector<uint8_t>& packet) override;
    void close() override;

private:
    std::string device_path_;
    std::string name_;
    int fd_ = -1;
};
