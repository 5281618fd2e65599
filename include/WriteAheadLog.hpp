//WriteAheadLog.hpp
#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "waly/File.hpp"
#include "waly/LogRecord.hpp"
#include "waly/Options.hpp"
#include "waly/WalError.hpp"

namespace waly {

// Durable append-only record store backed by a single file.
//
// Every operation holds the store mutex for its whole duration, so calls from
// several threads never interleave. There is no coordination between
// processes: two processes opening the same path will corrupt each other's
// writes and recover inconsistent ids.
class WriteAheadLog {
public:
    // Opens or creates `path` and recovers nextId from its content.
    // Throws WalError(Io), or WalError(InvalidEntry) in strict mode.
    explicit WriteAheadLog(const std::string& path, const Options& options = {});
    ~WriteAheadLog();

    WriteAheadLog(const WriteAheadLog&) = delete;
    WriteAheadLog& operator=(const WriteAheadLog&) = delete;

    // Persists and fsyncs a new record before returning it.
    LogRecord append(std::vector<uint8_t> data);
    LogRecord append(std::string_view data);

    // Snapshot of every stored record in storage order.
    std::vector<LogRecord> readAll() const;
    std::vector<LogRecord> readAll(ReadMode mode) const;

    // Rewrites the log without `id` through a temp file and rename.
    // Returns false (and leaves the file alone) if no record has that id.
    bool remove(uint64_t id);

    // Truncates the log. Ids keep counting from where they were.
    void clear();

    void close();
    bool isOpen() const;

    uint64_t nextId() const;
    uint64_t sizeBytes() const;
    const std::string& path() const { return path_; }
    const Options& options() const { return options_; }

private:
    std::string path_;
    std::string compactPath_;
    Options options_;
    uint64_t nextId_ = 0;
    File file_;
    mutable std::mutex mutex_;

    void recover();
    void ensureOpen() const;
    std::vector<LogRecord> scan(ReadMode mode) const;
};

} // namespace waly
