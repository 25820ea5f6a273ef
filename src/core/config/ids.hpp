#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace turnloom::core::config {

    // Random lowercase hex token of `length` characters, prefixed.
    inline std::string generate_token(const std::string& prefix, int length = 8) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "turn-<unix micros hex>-<random hex>". Mixed into vendor item ids so that
    // raw ids reused by successive turns stay distinct in the log.
    inline std::string generate_turn_scope_id() {
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        std::random_device rd;
        std::mt19937_64 gen(static_cast<std::uint64_t>(rd()) << 32 | rd());

        std::stringstream ss;
        ss << "turn-" << std::hex << static_cast<std::uint64_t>(micros) << "-" << gen();
        return ss.str();
    }

    inline std::int64_t now_unix_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline std::int64_t now_unix_seconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

} // namespace turnloom::core::config
