#include "kfe_error.hpp"

const char* kfe_errc_name(KfeErrc code) {
    switch (code) {
        case KfeErrc::IncompleteHeader:     return "IncompleteHeader";
        case KfeErrc::InvalidContainer:     return "InvalidContainer";
        case KfeErrc::IncompleteFrame:      return "IncompleteFrame";
        case KfeErrc::SizeMismatch:         return "SizeMismatch";
        case KfeErrc::PacketTooLarge:       return "PacketTooLarge";
        case KfeErrc::InvalidFrameLength:   return "InvalidFrameLength";
        case KfeErrc::CorruptedFrameHeader: return "CorruptedFrameHeader";
        case KfeErrc::DeviceUnavailable:    return "DeviceUnavailable";
        case KfeErrc::TransportUnavailable: return "TransportUnavailable";
        case KfeErrc::IoError:              return "IoError";
    }
    return "Unknown";
}
