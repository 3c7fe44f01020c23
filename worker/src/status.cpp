
#include "status.hpp"

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Read: return "read";
        case ErrorKind::Probe: return "probe";
        case ErrorKind::Persistence: return "persistence";
        case ErrorKind::Delivery: return "delivery";
        case ErrorKind::Log: return "log";
        case ErrorKind::Rotation: return "rotation";
    }
    return "unknown";
}
