#include "framectl/discovery/discovery_engine.hpp"
#include "framectl/core/rest/companion_client.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include "framectl/discovery/mdns_probe.hpp"
#include "framectl/discovery/ssdp_probe.hpp"
#include <ankerl/unordered_dense.h>
#include <condition_variable>
#include <deque>
#include <format>
#include <stdexcept>

namespace framectl {

    namespace detail {

        struct DiscoveryCycle {
            std::mutex                                  mx;
            std::condition_variable                     cv;
            std::deque<DiscoveryResult>                 ready;
            ankerl::unordered_dense::set<std::string>   seen;
            std::chrono::steady_clock::time_point       deadline;
            std::stop_source                            stop;
            size_t                                      running{ 0 };
            bool                                        cancelled{ false };
            bool                                        finished{ false };

            void offer(DiscoveryMethod m, Device d) {
                {
                    std::lock_guard lk(mx);
                    if (cancelled || finished || std::chrono::steady_clock::now() > deadline) return;
                    d.method = m;
                    if (!seen.insert(d.identity()).second) {
                        LOG_TRACE(std::format("discovery: {} already seen, {} result dropped", d.identity(), toString(m)));
                        return;
                    }
                    LOG_DEBUG(std::format("discovery: {} '{}' via {}", d.address, d.name, toString(m)));
                    ready.push_back(DiscoveryResult{ std::move(d), m });
                }
                cv.notify_all();
            }

            void probeDone() {
                {
                    std::lock_guard lk(mx);
                    --running;
                }
                cv.notify_all();
            }

            void cancel() {
                {
                    std::lock_guard lk(mx);
                    if (cancelled || finished) return;
                    cancelled = true;
                    ready.clear();
                }
                stop.request_stop();
                cv.notify_all();
            }

            bool active() {
                std::lock_guard lk(mx);
                return !cancelled && !finished;
            }

            std::optional<DiscoveryResult> next() {
                std::unique_lock lk(mx);
                cv.wait_until(lk, deadline, [this] {
                    return cancelled || finished || !ready.empty() || running == 0;
                });
                if (!ready.empty() && !cancelled) {
                    auto r = std::move(ready.front());
                    ready.pop_front();
                    return r;
                }
                if (!finished) {
                    finished = true;
                    lk.unlock();
                    stop.request_stop();
                }
                return std::nullopt;
            }
        };

    }

    DiscoveryStream::DiscoveryStream(std::shared_ptr<detail::DiscoveryCycle> cycle)
        : cycle_(std::move(cycle)) {}

    std::optional<DiscoveryResult> DiscoveryStream::next() { return cycle_->next(); }

    std::vector<DiscoveryResult> DiscoveryStream::collect() {
        std::vector<DiscoveryResult> out;
        while (auto r = next()) out.push_back(std::move(*r));
        return out;
    }

    void DiscoveryStream::cancel() { cycle_->cancel(); }

    DiscoveryEngine::DiscoveryEngine(DiscoveryOptions opts,
                                     std::vector<std::shared_ptr<IDiscoveryProbe>> probes,
                                     std::shared_ptr<IHttpExchange> exchange)
        : opts_(std::move(opts)),
          probes_(std::move(probes)),
          exchange_(std::move(exchange)),
          pool_(probes_.empty() ? 2 : probes_.size(), "discovery")
    {
        if (probes_.empty()) {
            probes_.push_back(std::make_shared<MdnsProbe>(opts_.mdnsServiceType));
            probes_.push_back(std::make_shared<SsdpProbe>(opts_.ssdpSearchTarget, opts_.mx));
        }
    }

    DiscoveryEngine::~DiscoveryEngine() {
        cancel();
        pool_.shutdown();
    }

    DiscoveryStream DiscoveryEngine::discover(std::chrono::milliseconds timeout) {
        std::lock_guard lk(mx_);
        if (active_ && active_->active())
            throw std::logic_error("discovery already in progress");

        auto cycle = std::make_shared<detail::DiscoveryCycle>();
        cycle->deadline = std::chrono::steady_clock::now() + timeout;
        cycle->running = probes_.size();

        for (auto const& probe : probes_) {
            pool_.post([cycle, probe] {
                try {
                    probe->run(cycle->deadline, cycle->stop.get_token(),
                               [&](Device d) { cycle->offer(probe->method(), std::move(d)); });
                } catch (const DiscoveryError& e) {
                    LOG_WARN(std::format("{} discovery unavailable: {}", toString(probe->method()), e.what()));
                } catch (const std::exception& e) {
                    LOG_ERROR(std::format("{} discovery failed: {}", toString(probe->method()), e.what()));
                }
                cycle->probeDone();
            });
        }
        LOG_INFO(std::format("discovery started with {} probe(s), {}ms", probes_.size(), timeout.count()));
        active_ = cycle;
        return DiscoveryStream(cycle);
    }

    void DiscoveryEngine::cancel() {
        std::shared_ptr<detail::DiscoveryCycle> c;
        {
            std::lock_guard lk(mx_);
            c = active_;
        }
        if (c) c->cancel();
    }

    DiscoveryResult DiscoveryEngine::find(const std::string& host, CompanionOptions companion) {
        CompanionAPIClient client(host, companion, exchange_);
        auto info = client.deviceInfo();

        Device d;
        d.id = host;
        d.address = host;
        d.name = info.name.empty() ? std::string{ "Samsung TV" } : info.name;
        d.modelName = info.modelName;
        d.method = DiscoveryMethod::Manual;
        return DiscoveryResult{ std::move(d), DiscoveryMethod::Manual };
    }

}
