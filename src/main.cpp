#include "WriteAheadLog.hpp"
#include <iostream>

// Persist each payload before processing it, drop it once processed, and
// replay whatever is left after a simulated failure.
int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "logs.wal";
    try {
        waly::WriteAheadLog wal(path, waly::Options::fromEnvironment());

        auto first = wal.append("Test persistent log 1");
        std::cout << "processing log: " << first.dataAsString() << "\n";
        bool processed = true;
        if (processed) {
            wal.remove(first.id);
        }

        auto second = wal.append("Test persistent log 2");
        std::cout << "processing log: " << second.dataAsString() << "\n";
        processed = false;

        if (!processed) {
            for (const auto& entry : wal.readAll()) {
                std::cout << "re-transmitting log id: " << entry.id
                          << " timestamp=" << entry.timestamp
                          << " data=" << entry.dataAsString() << "\n";
                wal.remove(entry.id);
                std::cout << "transmission successful\n";
            }
        }
    } catch (const waly::WalError& e) {
        std::cerr << "Fatal " << waly::toString(e.kind()) << " error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
