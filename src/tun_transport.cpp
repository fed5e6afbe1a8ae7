#include "tun_transport.hpp"
#include "kfe_error.hpp"

#include <linux/if.h>
#include <linux/if_tun.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <iostream>

TunTransport::TunTransport(const std::string& device_path) : device_path_(device_path) {}

TunTransport::~TunTransport() {
    close();
}

void TunTransport::open(const std::string& name) {
    if (fd_ >= 0) close();

    if (name.empty() || name.size() >= IFNAMSIZ) {
        throw KfeError(KfeErrc::TransportUnavailable, "Invalid TUN interface name '" + name + "'");
    }

    int fd = ::open(device_path_.c_str(), O_RDWR);
    if (fd < 0) {
        throw KfeError(KfeErrc::TransportUnavailable,
                       "Cannot open " + device_path_ + ": " + std::strerror(errno));
    }

    ifreq ifr{};
    ifr.ifr_flags = IFF_TUN | IFF_NO_PI;
    std::strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);

    if (ioctl(fd, TUNSETIFF, &ifr) < 0) {
        int err = errno;
        ::close(fd);
        throw KfeError(KfeErrc::TransportUnavailable,
                       "TUNSETIFF " + name + " failed: " + std::strerror(err));
    }

    fd_ = fd;
    name_ = name;
    std::cout << "[tun] Attached to " << name_ << std::endl;
}

std::vector<uint8_t> TunTransport::read(size_t max_len) {
    if (fd_ < 0) throw KfeError(KfeErrc::TransportUnavailable, "TUN interface not open");

    std::vector<uint8_t> buf(max_len);
    ssize_t n;
    do {
        n = ::read(fd_, buf.data(), buf.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw KfeError(KfeErrc::IoError, "TUN read failed: " + std::string(std::strerror(errno)));
    }
    buf.resize(static_cast<size_t>(n));
    return buf;
}

size_t TunTransport::write(const std::vector<uint8_t>& packet) {
    if (fd_ < 0) throw KfeError(KfeErrc::TransportUnavailable, "TUN interface not open");

    ssize_t sent;
    do {
        sent = ::write(fd_, packet.data(), packet.size());
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        throw KfeError(KfeErrc::IoError, "TUN write failed: " + std::string(std::strerror(errno)));
    }
    return static_cast<size_t>(sent);
}

void TunTransport::close() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
    std::cout << "[tun] " << name_ << " closed." << std::endl;
}
