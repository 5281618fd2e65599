#include "waly/WalError.hpp"

namespace waly {

const char* toString(WalError::Kind kind) {
    switch (kind) {
        case WalError::Kind::Io: return "io";
        case WalError::Kind::Serialization: return "serialization";
        case WalError::Kind::InvalidEntry: return "invalid entry";
        case WalError::Kind::CapacityExceeded: return "capacity exceeded";
        case WalError::Kind::Closed: return "closed";
    }
    return "unknown";
}

} // namespace waly
