#include "waly/Options.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace waly {

const char* toString(ReadMode mode) {
    return mode == ReadMode::Strict ? "strict" : "lenient";
}

Options Options::fromEnvironment() {
    Options opts;
    if (const char* envMode = std::getenv("WALY_READ_MODE")) {
        std::string v(envMode);
        if (v == "strict") opts.readMode = ReadMode::Strict;
        else if (v == "lenient") opts.readMode = ReadMode::Lenient;
        else std::cerr << "Options: ignoring WALY_READ_MODE=" << v << "\n";
    }
    if (const char* envMax = std::getenv("WALY_MAX_BYTES")) {
        try {
            std::string v(envMax);
            size_t used = 0;
            auto parsed = std::stoull(v, &used);
            if (used != v.size() || v.find('-') != std::string::npos) throw std::invalid_argument(v);
            opts.maxBytes = parsed;
        } catch (const std::exception&) {
            std::cerr << "Options: ignoring WALY_MAX_BYTES=" << envMax << "\n";
        }
    }
    return opts;
}

} // namespace waly
