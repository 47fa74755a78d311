/**
 * @file memory_token_store.hpp
 * @brief In-process ITokenStore.
 */
#pragma once
#include <mutex>
#include <optional>
#include "framectl/core/interfaces/itoken_store.hpp"

namespace framectl {

    class MemoryTokenStore : public ITokenStore {
    public:
        MemoryTokenStore() = default;
        explicit MemoryTokenStore(AuthenticationToken initial) : token_(std::move(initial)) {}

        std::optional<AuthenticationToken> load() override {
            std::lock_guard lk(mx_);
            return token_;
        }
        void save(const AuthenticationToken& token) override {
            std::lock_guard lk(mx_);
            token_ = token;
            ++saves_;
        }
        void remove() override {
            std::lock_guard lk(mx_);
            token_.reset();
        }

        int saveCount() const {
            std::lock_guard lk(mx_);
            return saves_;
        }

    private:
        mutable std::mutex                  mx_;
        std::optional<AuthenticationToken>  token_;
        int                                 saves_{ 0 };
    };

}
