#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

/**
 * \file IdGenerator.hpp
 * \brief Random RFC 4122 version-4 identifiers for tasks, messages and artifacts.
 */
class IdGenerator {
public:
    /** \brief Generate a lowercase "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx" string. */
    static std::string uuid4() {
        thread_local std::mt19937_64 gen{seed()};
        std::uniform_int_distribution<std::uint64_t> dist;

        std::array<std::uint8_t, 16> bytes{};
        std::uint64_t hi = dist(gen);
        std::uint64_t lo = dist(gen);
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
            bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
        }
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // variant 10xx

        static constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(hex[bytes[i] >> 4]);
            out.push_back(hex[bytes[i] & 0x0F]);
        }
        return out;
    }

private:
    static std::uint64_t seed() {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }
};
