#pragma once

#include <cstdint>

namespace waly {

// How a scan treats lines that do not decode into a record.
enum class ReadMode {
    Lenient, // skip and keep going
    Strict   // fail the whole scan with WalError(InvalidEntry)
};

const char* toString(ReadMode mode);

struct Options {
    // Applied both to recovery at open and to readAll().
    ReadMode readMode = ReadMode::Lenient;

    // Hard cap on the log file size in bytes; 0 means unlimited.
    // Only append checks it. An oversized file still opens and replays.
    uint64_t maxBytes = 0;

    // Defaults overridden by WALY_READ_MODE and WALY_MAX_BYTES.
    static Options fromEnvironment();
};

} // namespace waly
