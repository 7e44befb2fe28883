#include "network/mdns_resolver.hpp"

#ifdef LANTERN_HAS_AVAHI

#include "network/log.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/thread-watch.h>

#include <condition_variable>
#include <mutex>

namespace lantern::network {

/**
 * Reverse lookups through the Avahi daemon's address resolver.
 */
class AvahiMdnsResolver final : public NameResolver {
public:
    explicit AvahiMdnsResolver(std::chrono::milliseconds window) : window_(window) {}

    ~AvahiMdnsResolver() override {
        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        if (client_) {
            avahi_client_free(client_);
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
        }
    }

    bool start() {
        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) return false;

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );
        if (!client_) {
            qCInfo(lanternResolverLog) << "avahi: client failed:" << avahi_strerror(error);
            return false;
        }

        return avahi_threaded_poll_start(threaded_poll_) == 0;
    }

    [[nodiscard]] std::string name() const override { return "mdns"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return window_; }

    NameMap resolve(const std::vector<std::string>& ips) override {
        Batch batch;

        avahi_threaded_poll_lock(threaded_poll_);
        for (const auto& ip : ips) {
            AvahiAddress address;
            if (!avahi_address_parse(ip.c_str(), AVAHI_PROTO_INET, &address)) continue;

            auto* resolver = avahi_address_resolver_new(
                client_,
                AVAHI_IF_UNSPEC,
                AVAHI_PROTO_INET,
                &address,
                static_cast<AvahiLookupFlags>(0),
                address_callback,
                &batch
            );
            if (resolver) {
                batch.pending.push_back(resolver);
                ++batch.outstanding;
            }
        }
        avahi_threaded_poll_unlock(threaded_poll_);

        {
            std::unique_lock lock(batch.mu);
            batch.cv.wait_for(lock, window_, [&] { return batch.outstanding == 0; });
        }

        // Free under the poll lock so no callback can still reference `batch`.
        avahi_threaded_poll_lock(threaded_poll_);
        for (auto* resolver : batch.pending) {
            avahi_address_resolver_free(resolver);
        }
        avahi_threaded_poll_unlock(threaded_poll_);

        std::lock_guard lock(batch.mu);
        return batch.names;
    }

private:
    struct Batch {
        std::mutex mu;
        std::condition_variable cv;
        int outstanding = 0;
        NameMap names;
        std::vector<AvahiAddressResolver*> pending;
    };

    static void client_callback(AvahiClient*, AvahiClientState state, void*) {
        if (state == AVAHI_CLIENT_FAILURE) {
            qCWarning(lanternResolverLog) << "avahi: client failure";
        }
    }

    static void address_callback(AvahiAddressResolver*,
                                 AvahiIfIndex,
                                 AvahiProtocol,
                                 AvahiResolverEvent event,
                                 const AvahiAddress* address,
                                 const char* host_name,
                                 AvahiLookupResultFlags,
                                 void* userdata) {
        auto* batch = static_cast<Batch*>(userdata);
        std::lock_guard lock(batch->mu);

        if (event == AVAHI_RESOLVER_FOUND && address && host_name) {
            char text[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(text, sizeof(text), address);
            auto host = strip_mdns_suffix(host_name);
            if (!host.empty()) {
                batch->names.emplace(text, std::move(host));
            }
        }

        --batch->outstanding;
        batch->cv.notify_all();
    }

    std::chrono::milliseconds window_;
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
};

std::unique_ptr<NameResolver> create_avahi_mdns_resolver(std::chrono::milliseconds window) {
    auto resolver = std::make_unique<AvahiMdnsResolver>(window);
    if (!resolver->start()) {
        return nullptr;
    }
    return resolver;
}

} // namespace lantern::network

#endif // LANTERN_HAS_AVAHI
