/**
 * @file hex.hpp
 * @brief Hex encoding for random identifiers.
 */
#pragma once
#include <array>
#include <string>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace framectl {

    /**
     * @brief Convert a byte array to a lowercase hexadecimal string.
     */
    template <std::size_t N>
    inline std::string toHex(const std::array<uint8_t, N>& buf)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (auto b : buf)
            oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

    /**
     * @brief Format 16 random bytes as an RFC 4122 version-4 UUID string.
     */
    inline std::string toUuid(std::array<uint8_t, 16> buf)
    {
        buf[6] = static_cast<uint8_t>((buf[6] & 0x0F) | 0x40);
        buf[8] = static_cast<uint8_t>((buf[8] & 0x3F) | 0x80);
        auto h = toHex(buf);
        return h.substr(0, 8) + '-' + h.substr(8, 4) + '-' + h.substr(12, 4) + '-'
             + h.substr(16, 4) + '-' + h.substr(20);
    }

}
