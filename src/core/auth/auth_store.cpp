#include "framectl/core/auth/auth_store.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include <format>

namespace framectl {

    AuthStore::AuthStore(std::string deviceId, std::shared_ptr<ITokenStore> store)
        : deviceId_(std::move(deviceId)), store_(std::move(store)) {}

    void AuthStore::loadOnce() {
        if (loaded_) return;
        loaded_ = true;
        if (!store_) return;
        auto t = store_->load();
        if (!t) return;
        if (t->deviceId != deviceId_) {
            LOG_WARN(std::format("ignoring stored token for device '{}' (session device '{}')",
                                 t->deviceId, deviceId_));
            return;
        }
        token_ = std::move(t);
    }

    std::optional<AuthenticationToken> AuthStore::presentable() {
        std::lock_guard lk(mx_);
        loadOnce();
        if (!token_) return std::nullopt;
        if (!token_->isValid()) {
            LOG_INFO(std::format("token for '{}' is no longer valid, pairing again", deviceId_));
            token_.reset();
            if (store_) store_->remove();
            return std::nullopt;
        }
        return token_;
    }

    void AuthStore::accept(const AuthenticationToken& token) {
        if (token.deviceId != deviceId_)
            throw AuthenticationError(AuthenticationError::Kind::Rejected,
                std::format("token issued for '{}' cannot be used with '{}'", token.deviceId, deviceId_));
        if (!token.isValid())
            throw AuthenticationError(AuthenticationError::Kind::Expired,
                "refusing to store an invalid token");
        std::lock_guard lk(mx_);
        loaded_ = true;
        token_ = token;
        if (store_) store_->save(token);
    }

    AuthenticationToken AuthStore::acceptIssued(const std::string& value) {
        AuthenticationToken t;
        t.value = value;
        t.deviceId = deviceId_;
        accept(t);
        return t;
    }

    std::optional<AuthenticationToken> AuthStore::current() const {
        std::lock_guard lk(mx_);
        return token_;
    }

    void AuthStore::requireScope(TokenScope scope) const {
        std::lock_guard lk(mx_);
        if (!token_) return;
        if (token_->isExpired())
            throw AuthenticationError(AuthenticationError::Kind::Expired,
                std::format("token for '{}' expired", deviceId_));
        if (!token_->permits(scope))
            throw AuthenticationError(AuthenticationError::Kind::ScopeInsufficient,
                std::format("token does not permit {}", toString(scope)));
    }

    void AuthStore::clear() {
        std::lock_guard lk(mx_);
        token_.reset();
        loaded_ = true;
        if (store_) store_->remove();
    }

}
