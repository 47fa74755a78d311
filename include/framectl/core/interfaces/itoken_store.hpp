/**
 * @file itoken_store.hpp
 * @brief Persistence boundary for authentication tokens.
 */
#pragma once
#include <optional>
#include "framectl/core/auth/authentication_token.hpp"

namespace framectl {

    /**
     * @class ITokenStore
     * @brief Load/save contract for one device's token.
     *
     * The concrete store (keychain, file, memory) is supplied by the caller.
     */
    class ITokenStore {
    public:
        virtual ~ITokenStore() = default;
        virtual std::optional<AuthenticationToken> load() = 0;
        virtual void save(const AuthenticationToken& token) = 0;
        /// Forget the stored token. Default: no-op.
        virtual void remove() {}
    };

}
