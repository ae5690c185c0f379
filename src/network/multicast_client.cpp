#include "network/multicast_client.hpp"

#include "core/logging.hpp"

namespace lantern::network {
namespace {

// Fallback client for platforms (or configurations) without a native mDNS stack
class UnavailableMulticastClient : public MulticastClient {
public:
    Result<void, Error> open(const QHostAddress&) override {
        return Result<void, Error>::err(
            Error{"mDNS not available on this platform", ErrorCode::StartupError});
    }

    Result<BrowserId, Error> browse(const QString&, BrowseCallback) override {
        return Result<BrowserId, Error>::err(
            Error{"mDNS not available on this platform", ErrorCode::BrowserStartError});
    }

    void resolve(const QString&, const QString&, std::chrono::milliseconds,
                 ResolveCallback on_done) override {
        on_done(Result<RawServiceRecord, Error>::err(
            Error{"mDNS not available on this platform", ErrorCode::ResolutionError}));
    }

    void cancel(BrowserId) override {}
    void close() override {}
};

} // namespace

#ifdef LANTERN_HAS_AVAHI
// Implemented in platform/linux/avahi_client.cpp
std::unique_ptr<MulticastClient> createAvahiClient();
#endif

std::unique_ptr<MulticastClient> createMulticastClient(const QString& backend) {
    if (backend == QLatin1String("none")) {
        return std::make_unique<UnavailableMulticastClient>();
    }

#ifdef LANTERN_HAS_AVAHI
    if (backend != QLatin1String("avahi")) {
        qCWarning(lanternDiscoveryLog) << "Unknown discovery backend" << backend << "- using avahi";
    }
    return createAvahiClient();
#else
    qCWarning(lanternDiscoveryLog) << "Built without Avahi; discovery backend" << backend << "unavailable";
    return std::make_unique<UnavailableMulticastClient>();
#endif
}

} // namespace lantern::network
