#include "framectl/core/rpc/correlation_engine.hpp"
#include "framectl/core/util/logger.hpp"
#include "internal/core/util/random.hpp"
#include <format>
#include <shared_mutex>
#include <vector>

namespace framectl {

    CorrelationEngine::CorrelationEngine(std::shared_ptr<IProtocol> protocol)
        : protocol_(std::move(protocol)), prefix_(randomHex8())
    {
        timer_ = std::jthread([this](std::stop_token st) { timerLoop(st); });
    }

    CorrelationEngine::~CorrelationEngine() {
        timer_.request_stop();
        timerCv_.notify_all();
        if (timer_.joinable()) timer_.join();
        failAll(CallError::Kind::Cancelled, "correlation engine destroyed");
    }

    std::string CorrelationEngine::nextId() {
        return prefix_ + "-" + std::to_string(nextId_.fetch_add(1, std::memory_order_relaxed));
    }

    std::future<nlohmann::json> CorrelationEngine::submit(const std::string& method,
                                                          const ParamsFn& params,
                                                          std::chrono::milliseconds timeout,
                                                          const SendFn& send) {
        auto pc = std::make_shared<PendingCall>();
        pc->id = nextId();
        pc->method = method;
        pc->submitted = SteadyClock::now();
        pc->deadline = pc->submitted + timeout;
        auto fut = pc->slot.get_future();

        std::string frame = protocol_->serializeCall(method, params ? params(pc->id) : nlohmann::json::object(), pc->id);

        {
            std::unique_lock lk(pendMx_);
            pending_.emplace(pc->id, pc);
        }
        wakeTimer();
        LOG_DEBUG(std::format("call {} '{}' submitted, timeout {}ms", pc->id, method, timeout.count()));

        try {
            send(frame);
        } catch (const std::exception& e) {
            if (auto mine = take(pc->id))
                mine->slot.set_exception(std::current_exception());
            LOG_WARN(std::format("call {} '{}' could not be sent: {}", pc->id, method, e.what()));
        }
        return fut;
    }

    std::future<nlohmann::json> CorrelationEngine::submit(const std::string& method,
                                                          const nlohmann::json& params,
                                                          std::chrono::milliseconds timeout,
                                                          const SendFn& send) {
        return submit(method, [&params](const std::string&) { return params; }, timeout, send);
    }

    nlohmann::json CorrelationEngine::call(const std::string& method,
                                           const nlohmann::json& params,
                                           std::chrono::milliseconds timeout,
                                           const SendFn& send) {
        return submit(method, params, timeout, send).get();
    }

    std::string CorrelationEngine::post(const std::string& method, const nlohmann::json& params, const SendFn& send) {
        auto id = nextId();
        send(protocol_->serializeCall(method, params, id));
        return id;
    }

    CorrelationEngine::PendingPtr CorrelationEngine::take(const std::string& id) {
        std::unique_lock lk(pendMx_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return nullptr;
        auto pc = std::move(it->second);
        pending_.erase(it);
        return pc;
    }

    bool CorrelationEngine::resolve(const InboundFrame& frame) {
        if (frame.kind != FrameKind::Response || frame.id.empty()) return false;
        auto pc = take(frame.id);
        if (!pc) return false;

        auto took = elapsedSince(pc->submitted).count();
        if (frame.ok) {
            LOG_DEBUG(std::format("call {} '{}' resolved after {}ms", pc->id, pc->method, took));
            pc->slot.set_value(frame.payload);
        } else if (frame.isError) {
            LOG_DEBUG(std::format("call {} '{}' failed remotely: {} {}", pc->id, pc->method,
                                  frame.errorCode, frame.errorMessage));
            pc->slot.set_exception(std::make_exception_ptr(
                CallError(CallError::Kind::Remote, frame.errorMessage, frame.errorCode)));
        } else {
            LOG_WARN(std::format("call {} '{}': unusable response ({})", pc->id, pc->method, frame.parseError));
            pc->slot.set_exception(std::make_exception_ptr(
                CallError(CallError::Kind::Protocol, "malformed response: " + frame.parseError)));
        }
        wakeTimer();
        return true;
    }

    size_t CorrelationEngine::failAll(CallError::Kind kind, const std::string& reason) {
        std::vector<PendingPtr> victims;
        {
            std::unique_lock lk(pendMx_);
            victims.reserve(pending_.size());
            for (auto& [id, pc] : pending_) victims.push_back(std::move(pc));
            pending_.clear();
        }
        for (auto& pc : victims)
            pc->slot.set_exception(std::make_exception_ptr(
                CallError(kind, std::format("call '{}' {}: {}", pc->method,
                                            kind == CallError::Kind::Timeout ? "timed out" : "cancelled", reason))));
        if (!victims.empty())
            LOG_INFO(std::format("failed {} pending call(s): {}", victims.size(), reason));
        return victims.size();
    }

    size_t CorrelationEngine::pendingCount() const {
        std::shared_lock lk(pendMx_);
        return pending_.size();
    }

    bool CorrelationEngine::isPending(const std::string& id) const {
        std::shared_lock lk(pendMx_);
        return pending_.find(id) != pending_.end();
    }

    void CorrelationEngine::wakeTimer() {
        {
            std::lock_guard lk(timerMx_);
            timerDirty_ = true;
        }
        timerCv_.notify_one();
    }

    void CorrelationEngine::timerLoop(std::stop_token st) {
        std::unique_lock lk(timerMx_);
        while (!st.stop_requested()) {
            auto wakeAt = SteadyClock::now() + std::chrono::hours(1);
            {
                std::shared_lock pl(pendMx_);
                for (auto const& [id, pc] : pending_)
                    if (pc->deadline < wakeAt) wakeAt = pc->deadline;
            }
            timerDirty_ = false;
            timerCv_.wait_until(lk, st, wakeAt, [this] { return timerDirty_; });
            if (st.stop_requested()) break;

            auto now = SteadyClock::now();
            std::vector<PendingPtr> expired;
            {
                std::unique_lock pl(pendMx_);
                for (auto it = pending_.begin(); it != pending_.end();) {
                    if (it->second->deadline <= now) {
                        expired.push_back(std::move(it->second));
                        it = pending_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            lk.unlock();
            for (auto& pc : expired) {
                LOG_WARN(std::format("call {} '{}' timed out", pc->id, pc->method));
                pc->slot.set_exception(std::make_exception_ptr(
                    CallError(CallError::Kind::Timeout,
                              std::format("call '{}' timed out after {}ms", pc->method,
                                          std::chrono::duration_cast<std::chrono::milliseconds>(
                                              pc->deadline - pc->submitted).count()))));
            }
            lk.lock();
        }
    }

}
