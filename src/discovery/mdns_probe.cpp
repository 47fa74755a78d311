#include "framectl/discovery/mdns_probe.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include <format>

#ifdef FRAMECTL_HAVE_AVAHI
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>
#include <algorithm>
#include <memory>
#endif

namespace framectl {

#ifdef FRAMECTL_HAVE_AVAHI

    namespace {

        struct BrowseContext {
            const IDiscoveryProbe::Sink* sink;
        };

        void resolveCallback(AvahiServiceResolver* r,
                             AvahiIfIndex, AvahiProtocol,
                             AvahiResolverEvent event, const char* name,
                             const char*, const char*, const char* hostName,
                             const AvahiAddress* address, uint16_t port,
                             AvahiStringList*, AvahiLookupResultFlags, void* userdata)
        {
            auto* ctx = static_cast<BrowseContext*>(userdata);
            if (event == AVAHI_RESOLVER_FOUND && address) {
                char addr[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(addr, sizeof(addr), address);
                Device d;
                d.address = addr;
                d.id = d.address;
                d.name = name ? name : "Samsung TV";
                d.modelName = hostName ? hostName : "";
                d.port = port ? port : kTlsPort;
                d.method = DiscoveryMethod::Mdns;
                (*ctx->sink)(std::move(d));
            } else if (event == AVAHI_RESOLVER_FAILURE) {
                LOG_DEBUG(std::format("mdns: resolving '{}' failed: {}", name ? name : "?",
                    avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(r)))));
            }
            avahi_service_resolver_free(r);
        }

        void browseCallback(AvahiServiceBrowser* b,
                            AvahiIfIndex interface, AvahiProtocol protocol,
                            AvahiBrowserEvent event,
                            const char* name, const char* type, const char* domain,
                            AvahiLookupResultFlags, void* userdata)
        {
            if (event != AVAHI_BROWSER_NEW) return;
            if (!avahi_service_resolver_new(avahi_service_browser_get_client(b),
                                            interface, protocol, name, type, domain,
                                            AVAHI_PROTO_INET, (AvahiLookupFlags)0,
                                            resolveCallback, userdata)) {
                LOG_DEBUG(std::format("mdns: cannot resolve '{}'", name ? name : "?"));
            }
        }

    }

    bool MdnsProbe::available() { return true; }

    void MdnsProbe::run(std::chrono::steady_clock::time_point deadline,
                        std::stop_token stop,
                        const Sink& sink) {
        std::unique_ptr<AvahiSimplePoll, decltype(&avahi_simple_poll_free)>
            poll(avahi_simple_poll_new(), &avahi_simple_poll_free);
        if (!poll) throw DiscoveryError("avahi_simple_poll_new failed");

        int error = 0;
        std::unique_ptr<AvahiClient, decltype(&avahi_client_free)>
            client(avahi_client_new(avahi_simple_poll_get(poll.get()), (AvahiClientFlags)0,
                                    nullptr, nullptr, &error),
                   &avahi_client_free);
        if (!client) throw DiscoveryError(std::format("avahi client: {}", avahi_strerror(error)));

        BrowseContext ctx{ &sink };
        std::unique_ptr<AvahiServiceBrowser, decltype(&avahi_service_browser_free)>
            browser(avahi_service_browser_new(client.get(), AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC,
                                              serviceType_.c_str(), nullptr, (AvahiLookupFlags)0,
                                              browseCallback, &ctx),
                    &avahi_service_browser_free);
        if (!browser)
            throw DiscoveryError(std::format("avahi browser: {}", avahi_strerror(avahi_client_errno(client.get()))));

        while (!stop.stop_requested()) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) break;
            int slice = static_cast<int>(std::min<long long>(left.count(), 100));
            if (avahi_simple_poll_iterate(poll.get(), slice) != 0) break;
        }
    }

#else

    bool MdnsProbe::available() { return false; }

    void MdnsProbe::run(std::chrono::steady_clock::time_point, std::stop_token, const Sink&) {
        throw DiscoveryError("built without Avahi; mDNS browsing is not available");
    }

#endif

}
