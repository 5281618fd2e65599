#pragma once

#include <stdexcept>
#include <string>

namespace waly {

class WalError : public std::runtime_error {
public:
    enum class Kind {
        Io,               // open/read/write/truncate/fsync/rename failure
        Serialization,    // record could not be encoded
        InvalidEntry,     // malformed line in strict mode
        CapacityExceeded, // append refused by Options::maxBytes
        Closed            // store was closed
    };

    WalError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* toString(WalError::Kind kind);

} // namespace waly
