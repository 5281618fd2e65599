#include "WriteAheadLog.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace waly {

namespace {

uint64_t nowSeconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

std::string parentDir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

// Splits on '\n' and decodes every non-empty line.
std::vector<LogRecord> parseLines(const std::string& contents, ReadMode mode, const std::string& path) {
    std::vector<LogRecord> out;
    size_t lineNo = 0;
    size_t pos = 0;
    while (pos < contents.size()) {
        size_t end = contents.find('\n', pos);
        if (end == std::string::npos) end = contents.size();
        std::string_view line(contents.data() + pos, end - pos);
        pos = end + 1;
        ++lineNo;

        if (line.empty()) continue;
        auto rec = decodeRecord(line);
        if (!rec) {
            if (mode == ReadMode::Strict) {
                throw WalError(WalError::Kind::InvalidEntry,
                               "malformed record at line " + std::to_string(lineNo) + " of " + path);
            }
            std::cerr << "WriteAheadLog: skipping malformed line " << lineNo << " in " << path << "\n";
            continue;
        }
        out.push_back(std::move(*rec));
    }
    return out;
}

} // namespace

WriteAheadLog::WriteAheadLog(const std::string& path, const Options& options)
    : path_(path), compactPath_(path + ".compact"), options_(options) {
    recover();
}

WriteAheadLog::~WriteAheadLog() {
    try {
        close();
    } catch (const WalError& e) {
        std::cerr << "WriteAheadLog: " << e.what() << "\n";
    }
}

void WriteAheadLog::recover() {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw WalError(WalError::Kind::Io,
                           "failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    // A leftover compaction file means remove() died before its rename;
    // the log at path_ is still the complete old version.
    bool stale = fs::exists(compactPath_, ec);
    if (ec) {
        throw WalError(WalError::Kind::Io,
                       "failed to stat " + compactPath_ + ": " + ec.message());
    }
    if (stale) {
        fs::remove(compactPath_, ec);
        if (ec) {
            throw WalError(WalError::Kind::Io,
                           "failed to remove stale " + compactPath_ + ": " + ec.message());
        }
        std::cerr << "WriteAheadLog: discarded stale compaction file " << compactPath_ << "\n";
    }

    file_ = File::openReadAppend(path_);

    auto contents = file_.readAll();
    auto records = parseLines(contents, options_.readMode, path_);
    nextId_ = 0;
    for (const auto& rec : records) {
        nextId_ = std::max<uint64_t>(nextId_, rec.id + 1);
    }

    // Terminate a torn tail so the next record starts on its own line.
    if (!contents.empty() && contents.back() != '\n') {
        file_.append("\n");
        file_.sync();
        std::cerr << "WriteAheadLog: terminated torn last line in " << path_ << "\n";
    }

    std::cerr << "WriteAheadLog: opened " << path_ << " records=" << records.size()
              << " nextId=" << nextId_ << " mode=" << toString(options_.readMode) << "\n";
}

void WriteAheadLog::ensureOpen() const {
    if (!file_.isOpen()) {
        throw WalError(WalError::Kind::Closed, "log is closed: " + path_);
    }
}

LogRecord WriteAheadLog::append(std::vector<uint8_t> data) {
    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();

    if (nextId_ == kMaxRecordId) {
        throw WalError(WalError::Kind::CapacityExceeded, "id space exhausted for " + path_);
    }

    LogRecord record;
    record.id = nextId_;
    record.timestamp = nowSeconds();
    record.data = std::move(data);

    std::string line = encodeRecord(record);
    line.push_back('\n');

    uint64_t before = file_.size();
    if (options_.maxBytes != 0 && before + line.size() > options_.maxBytes) {
        throw WalError(WalError::Kind::CapacityExceeded,
                       "append of " + std::to_string(line.size()) + " bytes exceeds maxBytes="
                       + std::to_string(options_.maxBytes) + " for " + path_);
    }

    try {
        file_.append(line);
        file_.sync();
    } catch (const WalError&) {
        // Drop any partial line so it cannot merge with the next record.
        try {
            file_.truncate(before);
        } catch (const WalError& e) {
            std::cerr << "WriteAheadLog: rollback failed: " << e.what() << "\n";
        }
        throw;
    }

    ++nextId_;
    return record;
}

LogRecord WriteAheadLog::append(std::string_view data) {
    return append(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<LogRecord> WriteAheadLog::readAll() const {
    return readAll(options_.readMode);
}

std::vector<LogRecord> WriteAheadLog::readAll(ReadMode mode) const {
    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();
    return scan(mode);
}

std::vector<LogRecord> WriteAheadLog::scan(ReadMode mode) const {
    return parseLines(file_.readAll(), mode, path_);
}

bool WriteAheadLog::remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();

    // Strict stores refuse to compact over a malformed line; lenient ones drop it.
    auto records = scan(options_.readMode);
    auto it = std::find_if(records.begin(), records.end(),
                           [id](const LogRecord& r) { return r.id == id; });
    if (it == records.end()) return false;
    records.erase(it);

    std::string out;
    for (const auto& rec : records) {
        out += encodeRecord(rec);
        out.push_back('\n');
    }

    try {
        File tmp = File::createTruncate(compactPath_);
        tmp.append(out);
        tmp.sync();
        tmp.close();
    } catch (const WalError&) {
        std::error_code ec;
        std::filesystem::remove(compactPath_, ec);
        throw;
    }

    replaceFile(compactPath_, path_);

    // The old descriptor now points at the unlinked inode. Swap it before
    // anything else can fail; if the reopen fails the store is left closed.
    try {
        file_ = File::openReadAppend(path_);
    } catch (const WalError&) {
        File unlinked = std::move(file_);
        throw;
    }
    syncDirectory(parentDir(path_));

    std::cerr << "WriteAheadLog: removed id=" << id << " from " << path_
              << " remaining=" << records.size() << "\n";
    return true;
}

void WriteAheadLog::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();
    file_.truncate(0);
    file_.sync();
}

void WriteAheadLog::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    file_.close();
}

bool WriteAheadLog::isOpen() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return file_.isOpen();
}

uint64_t WriteAheadLog::nextId() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return nextId_;
}

uint64_t WriteAheadLog::sizeBytes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();
    return file_.size();
}

} // namespace waly
