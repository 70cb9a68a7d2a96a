#pragma once
#include <cstddef>
#include <random>
#include <sstream>
#include <string>

namespace sandrun::core::config {

    // `length` random lowercase hex digits.
    inline std::string random_hex(const std::size_t length) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (std::size_t i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Generates a 12-character hex ID prefixed with "run-"
    inline std::string generate_run_id() {
        return "run-" + random_hex(12);
    }

} // namespace sandrun::core::config
