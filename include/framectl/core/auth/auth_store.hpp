/**
 * @file auth_store.hpp
 * @brief Token holder owned by a ConnectionSession.
 */
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "framectl/core/auth/authentication_token.hpp"
#include "framectl/core/interfaces/itoken_store.hpp"

namespace framectl {

    /**
     * @class AuthStore
     * @brief Holds the token for exactly one device.
     *
     * The token is lazily loaded from the optional ITokenStore and written back
     * whenever the device issues a new one. A token belonging to another device
     * is never accepted.
     */
    class AuthStore {
    public:
        explicit AuthStore(std::string deviceId, std::shared_ptr<ITokenStore> store = nullptr);

        const std::string& deviceId() const { return deviceId_; }

        /**
         * @brief The token to present on the next handshake.
         *
         * Expired or foreign tokens are discarded (and removed from the backing
         * store) so the device falls back to pairing.
         */
        std::optional<AuthenticationToken> presentable();

        /**
         * @brief Store a token issued for this device and persist it.
         * @throws AuthenticationError(Rejected) if the token belongs to another device
         */
        void accept(const AuthenticationToken& token);

        /**
         * @brief Convenience for a bare token value handed out by the device.
         */
        AuthenticationToken acceptIssued(const std::string& value);

        std::optional<AuthenticationToken> current() const;

        /**
         * @brief Check a scope against the held token.
         *
         * Without a token the device's own pairing state governs access, so the
         * check passes.
         * @throws AuthenticationError(ScopeInsufficient) / (Expired)
         */
        void requireScope(TokenScope scope) const;

        /**
         * @brief Forget the token here and in the backing store.
         */
        void clear();

    private:
        void loadOnce();

        std::string                         deviceId_;
        std::shared_ptr<ITokenStore>        store_;
        mutable std::mutex                  mx_;
        std::optional<AuthenticationToken>  token_;
        bool                                loaded_{ false };
    };

}
