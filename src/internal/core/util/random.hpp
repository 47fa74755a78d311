/**
 * @file random.hpp
 * @brief Random identifier helpers.
 *
 * Used for correlation-id prefixes, REST request ids and multipart boundaries.
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include "framectl/core/util/hex.hpp"

namespace framectl {

    /**
     * @brief Fill a byte array with random data from a thread-local engine.
     */
    template <std::size_t N>
    inline void randomFill(std::array<uint8_t, N>& tok)
    {
        static thread_local std::mt19937_64 rng{
            std::random_device{}() ^ (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count()
        };
        std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFFFF);

        for (size_t i = 0; i < N; i += 4) {
            uint32_t rnd = dist(rng);
            for (size_t k = 0; k < 4 && i + k < N; ++k)
                tok[i + k] = static_cast<uint8_t>((rnd >> (8 * k)) & 0xFF);
        }
    }

    inline std::string randomUuid()
    {
        std::array<uint8_t, 16> b{};
        randomFill(b);
        return toUuid(b);
    }

    inline std::string randomHex8()
    {
        std::array<uint8_t, 4> b{};
        randomFill(b);
        return toHex(b);
    }

}
