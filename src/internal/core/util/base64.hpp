/**
 * @file base64.hpp
 * @brief Base64 encoding through OpenSSL.
 */
#pragma once
#include <openssl/evp.h>
#include <string>
#include <string_view>
#include <vector>

namespace framectl {

    inline std::string base64Encode(std::string_view in)
    {
        std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
        int n = EVP_EncodeBlock(out.data(),
                                reinterpret_cast<const unsigned char*>(in.data()),
                                static_cast<int>(in.size()));
        return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
    }

}
