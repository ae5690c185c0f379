#include "network/multicast_client.hpp"

#ifdef LANTERN_HAS_AVAHI

#include "core/logging.hpp"
#include "core/service_type.hpp"
#include "network/service_info_codec.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>
#include <avahi-common/timeval.h>

#include <QNetworkInterface>

#include <algorithm>
#include <map>
#include <vector>

namespace lantern::network {
namespace {

constexpr unsigned kOtherFamilyGraceMs = 300;

std::string client_error(AvahiClient* client) {
    return avahi_strerror(avahi_client_errno(client));
}

/**
 * Avahi-backed MulticastClient.
 *
 * Avahi runs its own poll thread and invokes our callbacks there with the
 * poll lock held. Every call made from the engine thread takes the same lock,
 * so the browser and resolver tables are only touched under it.
 */
class AvahiMulticastClient : public MulticastClient {
public:
    AvahiMulticastClient() = default;

    ~AvahiMulticastClient() override {
        close();
    }

    Result<void, Error> open(const QHostAddress& interface_address) override {
        if (poll_) {
            return Result<void, Error>::err(
                Error{"Avahi client already open", ErrorCode::StartupError});
        }

        if (!interface_address.isNull()) {
            auto bound = bind_interface(interface_address);
            if (bound.is_err()) {
                return bound;
            }
        }

        poll_ = avahi_threaded_poll_new();
        if (!poll_) {
            return Result<void, Error>::err(
                Error{"Failed to create Avahi poll", ErrorCode::StartupError});
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(poll_);
            poll_ = nullptr;
            return Result<void, Error>::err(Error{
                "Failed to create Avahi client: " + std::string(avahi_strerror(error)),
                ErrorCode::StartupError});
        }

        if (avahi_threaded_poll_start(poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(poll_);
            poll_ = nullptr;
            return Result<void, Error>::err(
                Error{"Failed to start Avahi poll thread", ErrorCode::StartupError});
        }

        qCDebug(lanternAvahiLog) << "Connected to avahi-daemon"
                                 << avahi_client_get_version_string(client_);
        return Result<void, Error>::ok();
    }

    Result<BrowserId, Error> browse(const QString& service_type,
                                    BrowseCallback on_change) override {
        if (!client_) {
            return Result<BrowserId, Error>::err(
                Error{"Avahi client not open", ErrorCode::BrowserStartError});
        }

        PollLock lock(poll_);

        auto browser = std::make_unique<Browser>();
        browser->owner = this;
        browser->id = ++next_id_;
        browser->service_type = service_type;
        browser->on_change = std::move(on_change);

        if (is_enumeration_type(service_type)) {
            browser->type_browser = avahi_service_type_browser_new(
                client_,
                iface_,
                proto_,
                nullptr,  // domain
                static_cast<AvahiLookupFlags>(0),
                type_browse_callback,
                browser.get()
            );
            if (!browser->type_browser) {
                return Result<BrowserId, Error>::err(Error{
                    "Failed to create service type browser: " + client_error(client_),
                    ErrorCode::BrowserStartError});
            }
        } else {
            const auto parts = split_service_type(service_type);
            const QByteArray type = parts.application.toUtf8();
            const QByteArray domain = parts.domain.toUtf8();
            browser->service_browser = avahi_service_browser_new(
                client_,
                iface_,
                proto_,
                type.constData(),
                domain.constData(),
                static_cast<AvahiLookupFlags>(0),
                service_browse_callback,
                browser.get()
            );
            if (!browser->service_browser) {
                return Result<BrowserId, Error>::err(Error{
                    "Failed to create service browser: " + client_error(client_),
                    ErrorCode::BrowserStartError});
            }
        }

        const BrowserId id = browser->id;
        browsers_[id] = std::move(browser);
        return Result<BrowserId, Error>::ok(id);
    }

    void resolve(const QString& service_type,
                 const QString& instance_name,
                 std::chrono::milliseconds timeout,
                 ResolveCallback on_done) override {
        if (!client_) {
            on_done(Result<RawServiceRecord, Error>::err(
                Error{"Avahi client not open", ErrorCode::ResolutionError}));
            return;
        }

        const auto label = split_instance_name(instance_name, service_type);
        if (!label) {
            on_done(Result<RawServiceRecord, Error>::err(Error{
                "Instance " + instance_name.toStdString() + " is not of type "
                    + service_type.toStdString(),
                ErrorCode::ResolutionError}));
            return;
        }
        const QByteArray name = label->toUtf8();
        const auto parts = split_service_type(service_type);
        const QByteArray type = parts.application.toUtf8();
        const QByteArray domain = parts.domain.toUtf8();

        PollLock lock(poll_);

        auto pending = std::make_unique<PendingResolve>();
        pending->owner = this;
        pending->id = ++next_id_;
        pending->service_type = service_type;
        pending->instance_name = instance_name;
        pending->on_done = std::move(on_done);

        // One resolver per address family; each reports a single address.
        std::vector<AvahiProtocol> families;
        if (proto_ == AVAHI_PROTO_UNSPEC) {
            families = {AVAHI_PROTO_INET, AVAHI_PROTO_INET6};
        } else {
            families = {proto_};
        }

        for (AvahiProtocol family : families) {
            AvahiServiceResolver* resolver = avahi_service_resolver_new(
                client_,
                iface_,
                proto_,
                name.constData(),
                type.constData(),
                domain.constData(),
                family,
                static_cast<AvahiLookupFlags>(0),
                resolve_callback,
                pending.get()
            );
            if (resolver) {
                pending->resolvers.push_back(resolver);
            }
        }

        if (pending->resolvers.empty()) {
            pending->on_done(Result<RawServiceRecord, Error>::err(Error{
                "Failed to create resolver: " + client_error(client_),
                ErrorCode::ResolutionError}));
            return;
        }

        struct timeval deadline;
        avahi_elapse_time(&deadline, static_cast<unsigned>(timeout.count()), 0);
        const AvahiPoll* api = avahi_threaded_poll_get(poll_);
        pending->timeout = api->timeout_new(api, &deadline, timeout_callback, pending.get());

        resolves_[pending->id] = std::move(pending);
    }

    void cancel(BrowserId id) override {
        if (!poll_) return;

        PollLock lock(poll_);
        auto it = browsers_.find(id);
        if (it == browsers_.end()) return;
        free_browser(*it->second);
        browsers_.erase(it);
    }

    void close() override {
        if (!poll_) return;

        {
            PollLock lock(poll_);
            for (auto& [id, browser] : browsers_) {
                free_browser(*browser);
            }
            browsers_.clear();

            for (auto& [id, pending] : resolves_) {
                free_resolve(*pending);
            }
            resolves_.clear();
        }

        avahi_threaded_poll_stop(poll_);
        if (client_) {
            avahi_client_free(client_);
            client_ = nullptr;
        }
        avahi_threaded_poll_free(poll_);
        poll_ = nullptr;
        qCDebug(lanternAvahiLog) << "Avahi client closed";
    }

private:
    struct Browser {
        AvahiMulticastClient* owner = nullptr;
        BrowserId id = 0;
        QString service_type;
        BrowseCallback on_change;
        AvahiServiceTypeBrowser* type_browser = nullptr;
        AvahiServiceBrowser* service_browser = nullptr;
        // The same name is reported once per interface and protocol.
        std::map<QString, int> sightings;
    };

    struct PendingResolve {
        AvahiMulticastClient* owner = nullptr;
        uint64_t id = 0;
        QString service_type;
        QString instance_name;
        ResolveCallback on_done;
        std::vector<AvahiServiceResolver*> resolvers;
        AvahiTimeout* timeout = nullptr;
        RawServiceRecord record;
        bool found = false;
        std::string last_error;
    };

    class PollLock {
    public:
        explicit PollLock(AvahiThreadedPoll* poll) : poll_(poll) { avahi_threaded_poll_lock(poll_); }
        ~PollLock() { avahi_threaded_poll_unlock(poll_); }
        PollLock(const PollLock&) = delete;
        PollLock& operator=(const PollLock&) = delete;
    private:
        AvahiThreadedPoll* poll_;
    };

    Result<void, Error> bind_interface(const QHostAddress& address) {
        for (const auto& iface : QNetworkInterface::allInterfaces()) {
            for (const auto& entry : iface.addressEntries()) {
                if (entry.ip().isEqual(address)) {
                    iface_ = iface.index();
                    proto_ = address.protocol() == QAbstractSocket::IPv6Protocol
                        ? AVAHI_PROTO_INET6 : AVAHI_PROTO_INET;
                    qCDebug(lanternAvahiLog) << "Binding to" << iface.name()
                                             << "index" << iface_;
                    return Result<void, Error>::ok();
                }
            }
        }
        return Result<void, Error>::err(Error{
            "No local interface has address " + address.toString().toStdString(),
            ErrorCode::StartupError});
    }

    void free_browser(Browser& browser) {
        if (browser.type_browser) {
            avahi_service_type_browser_free(browser.type_browser);
            browser.type_browser = nullptr;
        }
        if (browser.service_browser) {
            avahi_service_browser_free(browser.service_browser);
            browser.service_browser = nullptr;
        }
    }

    void free_resolve(PendingResolve& pending) {
        for (AvahiServiceResolver* resolver : pending.resolvers) {
            avahi_service_resolver_free(resolver);
        }
        pending.resolvers.clear();
        if (pending.timeout) {
            const AvahiPoll* api = avahi_threaded_poll_get(poll_);
            api->timeout_free(pending.timeout);
            pending.timeout = nullptr;
        }
    }

    // Runs on the poll thread; removes the entry and hands the result over.
    void finish_resolve(PendingResolve* pending, Result<RawServiceRecord, Error> result) {
        auto it = resolves_.find(pending->id);
        if (it == resolves_.end()) return;

        auto owned = std::move(it->second);
        resolves_.erase(it);
        free_resolve(*owned);
        owned->on_done(std::move(result));
    }

    static void record_sighting(Browser* browser, AvahiBrowserEvent event, const QString& name) {
        if (name.isEmpty()) return;

        if (event == AVAHI_BROWSER_NEW) {
            if (++browser->sightings[name] == 1) {
                browser->on_change(BrowseEvent{BrowseEventKind::Added, browser->service_type, name});
            }
            return;
        }

        auto it = browser->sightings.find(name);
        if (it == browser->sightings.end()) return;
        if (--it->second <= 0) {
            browser->sightings.erase(it);
            browser->on_change(BrowseEvent{BrowseEventKind::Removed, browser->service_type, name});
        }
    }

    static void report_browser_event(Browser* browser, AvahiBrowserEvent event) {
        switch (event) {
            case AVAHI_BROWSER_FAILURE: {
                const QString message = QString::fromStdString(client_error(browser->owner->client_));
                qCWarning(lanternAvahiLog) << "Browser for" << browser->service_type << "failed:"
                                           << message;
                BrowseEvent failed;
                failed.kind = BrowseEventKind::Failed;
                failed.service_type = browser->service_type;
                failed.message = message;
                browser->on_change(failed);
                break;
            }
            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                qCDebug(lanternAvahiLog) << "Browser for" << browser->service_type << "settled";
                break;
            case AVAHI_BROWSER_NEW:
            case AVAHI_BROWSER_REMOVE:
                break;
        }
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiMulticastClient*>(userdata);

        switch (state) {
            case AVAHI_CLIENT_S_RUNNING:
                qCDebug(lanternAvahiLog) << "avahi-daemon running";
                break;
            case AVAHI_CLIENT_FAILURE:
                qCWarning(lanternAvahiLog) << "Avahi client failure:" << client_error(client).c_str();
                if (self->on_failure) {
                    self->on_failure(Error{client_error(client), ErrorCode::ClientFailure});
                }
                break;
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    static void type_browse_callback(AvahiServiceTypeBrowser*,
                                     AvahiIfIndex,
                                     AvahiProtocol,
                                     AvahiBrowserEvent event,
                                     const char* type,
                                     const char* domain,
                                     AvahiLookupResultFlags,
                                     void* userdata) {
        auto* browser = static_cast<Browser*>(userdata);

        if (event == AVAHI_BROWSER_NEW || event == AVAHI_BROWSER_REMOVE) {
            const QString name = QStringLiteral("%1.%2.")
                .arg(QString::fromUtf8(type), QString::fromUtf8(domain));
            record_sighting(browser, event, name);
            return;
        }
        report_browser_event(browser, event);
    }

    static void service_browse_callback(AvahiServiceBrowser*,
                                        AvahiIfIndex,
                                        AvahiProtocol,
                                        AvahiBrowserEvent event,
                                        const char* name,
                                        const char*,
                                        const char*,
                                        AvahiLookupResultFlags,
                                        void* userdata) {
        auto* browser = static_cast<Browser*>(userdata);

        if (event == AVAHI_BROWSER_NEW || event == AVAHI_BROWSER_REMOVE) {
            record_sighting(browser, event,
                            join_instance_name(QString::fromUtf8(name), browser->service_type));
            return;
        }
        report_browser_event(browser, event);
    }

    static RawServiceRecord record_from_answer(const char* host_name,
                                               const AvahiAddress* address,
                                               uint16_t port,
                                               AvahiStringList* txt) {
        RawServiceRecord answer;
        answer.port = port;
        if (host_name) {
            answer.server = QString::fromUtf8(host_name) + QLatin1Char('.');
        }

        if (address) {
            char addr_str[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(addr_str, sizeof(addr_str), address);
            answer.addresses.emplace_back(QString::fromUtf8(addr_str));
        }

        for (AvahiStringList* item = txt; item; item = item->next) {
            char* key = nullptr;
            char* value = nullptr;
            size_t size = 0;
            if (avahi_string_list_get_pair(item, &key, &value, &size) != 0) {
                continue;
            }

            RawTxtEntry entry;
            entry.key = QByteArray(key);
            if (value) {
                entry.value = QByteArray(value, static_cast<int>(size));
            }
            answer.txt.push_back(std::move(entry));

            avahi_free(key);
            avahi_free(value);
        }
        return answer;
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex,
                                 AvahiProtocol,
                                 AvahiResolverEvent event,
                                 const char*,
                                 const char*,
                                 const char*,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags,
                                 void* userdata) {
        auto* pending = static_cast<PendingResolve*>(userdata);
        AvahiMulticastClient* self = pending->owner;

        auto it = std::find(pending->resolvers.begin(), pending->resolvers.end(), resolver);
        if (it == pending->resolvers.end()) {
            return;
        }
        pending->resolvers.erase(it);
        avahi_service_resolver_free(resolver);

        if (event == AVAHI_RESOLVER_FOUND) {
            merge_resolved(pending->record, record_from_answer(host_name, address, port, txt));
            pending->found = true;
        } else {
            pending->last_error = client_error(self->client_);
        }

        if (!pending->resolvers.empty()) {
            if (event == AVAHI_RESOLVER_FOUND && pending->timeout) {
                // Hosts without an address of the other family only answer
                // with a failure after Avahi's own timeout; don't wait for it.
                struct timeval grace;
                avahi_elapse_time(&grace, kOtherFamilyGraceMs, 0);
                const AvahiPoll* api = avahi_threaded_poll_get(self->poll_);
                api->timeout_update(pending->timeout, &grace);
            }
            return;
        }

        if (pending->found) {
            RawServiceRecord record = std::move(pending->record);
            record.name = pending->instance_name;
            record.type = pending->service_type;
            self->finish_resolve(pending, Result<RawServiceRecord, Error>::ok(std::move(record)));
            return;
        }
        self->finish_resolve(pending, Result<RawServiceRecord, Error>::err(Error{
            "Failed to resolve " + pending->instance_name.toStdString() + ": "
                + pending->last_error,
            ErrorCode::ResolutionError}));
    }

    static void timeout_callback(AvahiTimeout*, void* userdata) {
        auto* pending = static_cast<PendingResolve*>(userdata);
        if (pending->found) {
            // The other address family never answered; report what we have.
            RawServiceRecord record = std::move(pending->record);
            record.name = pending->instance_name;
            record.type = pending->service_type;
            pending->owner->finish_resolve(pending,
                Result<RawServiceRecord, Error>::ok(std::move(record)));
            return;
        }
        pending->owner->finish_resolve(pending, Result<RawServiceRecord, Error>::err(Error{
            "Timed out resolving " + pending->instance_name.toStdString(),
            ErrorCode::Timeout}));
    }

    AvahiThreadedPoll* poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiIfIndex iface_ = AVAHI_IF_UNSPEC;
    AvahiProtocol proto_ = AVAHI_PROTO_UNSPEC;

    uint64_t next_id_ = 0;
    std::map<BrowserId, std::unique_ptr<Browser>> browsers_;
    std::map<uint64_t, std::unique_ptr<PendingResolve>> resolves_;
};

} // namespace

std::unique_ptr<MulticastClient> createAvahiClient() {
    return std::make_unique<AvahiMulticastClient>();
}

} // namespace lantern::network

#endif // LANTERN_HAS_AVAHI
