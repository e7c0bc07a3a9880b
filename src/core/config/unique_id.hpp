#pragma once
#include <chrono>
#include <cstddef>
#include <random>
#include <sstream>
#include <string>

namespace coderunner::core::config {

    // Hex string built from `bytes` bytes drawn straight from the OS entropy source
    inline std::string random_hex(std::size_t bytes) {
        std::random_device rd;
        std::uniform_int_distribution<int> dis(0, 255);

        static const char kDigits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes * 2);
        for (std::size_t i = 0; i < bytes; ++i) {
            const int value = dis(rd);
            out.push_back(kDigits[(value >> 4) & 0xf]);
            out.push_back(kDigits[value & 0xf]);
        }
        return out;
    }

    // "session-" followed by 8 hex characters
    inline std::string generate_session_id() {
        return "session-" + random_hex(4);
    }

    // tmp_<unix-ms>_<16 hex chars>, the stem of every scratch allocation
    inline std::string generate_scratch_stem() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count();

        std::stringstream ss;
        ss << "tmp_" << ms << "_" << random_hex(8);
        return ss.str();
    }

} // namespace coderunner::core::config
