#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waly {

// Reserved: a record with this id would leave no successor id.
constexpr uint64_t kMaxRecordId = std::numeric_limits<uint64_t>::max();

struct LogRecord {
    uint64_t id = 0;
    uint64_t timestamp = 0; // seconds since epoch
    std::vector<uint8_t> data;

    std::string dataAsString() const { return std::string(data.begin(), data.end()); }
};

inline bool operator==(const LogRecord& a, const LogRecord& b) {
    return a.id == b.id && a.timestamp == b.timestamp && a.data == b.data;
}

// One record per line: {"id":..,"timestamp":..,"data":[bytes]}.
// Throws WalError(Serialization) if the record cannot be encoded.
std::string encodeRecord(const LogRecord& record);

// Returns nullopt for anything that is not a well-formed record line,
// including a record carrying kMaxRecordId.
std::optional<LogRecord> decodeRecord(std::string_view line);

} // namespace waly
