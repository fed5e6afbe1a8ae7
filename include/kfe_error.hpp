#pragma once

#include <stdexcept>
#include <string>

enum class KfeErrc {
    IncompleteHeader,
    InvalidContainer,
    IncompleteFrame,
    SizeMismatch,
    PacketTooLarge,
    InvalidFrameLength,
    CorruptedFrameHeader,
    DeviceUnavailable,
    TransportUnavailable,
    IoError
};

const char* kfe_errc_name(KfeErrc code);

// Every failure the codec, framer and loopback surface to the caller.
// None of them are retried internally.
class KfeError : public std::runtime_error {
public:
    KfeError(KfeErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    KfeErrc code() const { return code_; }

private:
    KfeErrc code_;
};
