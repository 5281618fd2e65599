#include "waly/LogRecord.hpp"
#include "waly/WalError.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace waly {

std::string encodeRecord(const LogRecord& record) {
    try {
        json rec = {
            {"id", record.id},
            {"timestamp", record.timestamp},
            {"data", record.data}
        };
        return rec.dump();
    } catch (const json::exception& e) {
        throw WalError(WalError::Kind::Serialization,
                       "failed to encode record " + std::to_string(record.id) + ": " + e.what());
    }
}

std::optional<LogRecord> decodeRecord(std::string_view line) {
    auto rec = json::parse(line.begin(), line.end(), nullptr, false);
    if (rec.is_discarded() || !rec.is_object()) return std::nullopt;

    auto id = rec.find("id");
    auto ts = rec.find("timestamp");
    auto data = rec.find("data");
    if (id == rec.end() || !id->is_number_unsigned()) return std::nullopt;
    if (ts == rec.end() || !ts->is_number_unsigned()) return std::nullopt;
    if (data == rec.end() || !data->is_array()) return std::nullopt;

    LogRecord record;
    record.id = id->get<uint64_t>();
    if (record.id == kMaxRecordId) return std::nullopt;
    record.timestamp = ts->get<uint64_t>();
    record.data.reserve(data->size());
    for (const auto& byte : *data) {
        if (!byte.is_number_unsigned()) return std::nullopt;
        auto v = byte.get<uint64_t>();
        if (v > 0xFFu) return std::nullopt;
        record.data.push_back(static_cast<uint8_t>(v));
    }
    return record;
}

} // namespace waly
