#pragma once

#include "network/multicast_client.hpp"

#include <QHostAddress>
#include <QStringList>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace lantern::testing {

class FakeMulticastClient;

/**
 * FakeNetwork - In-memory stand-in for the multicast network.
 *
 * Shared by every FakeMulticastClient a test creates. Tests announce and
 * withdraw names from their own thread, the way Avahi would from its poll
 * thread, and register the records resolutions should return.
 */
class FakeNetwork {
public:
    // Behaviour knobs
    std::atomic<bool> fail_open{false};
    std::atomic<bool> defer_resolutions{false};
    std::atomic<bool> block_close{false};

    void failBrowseOf(const QString& type);
    void addRecord(const network::RawServiceRecord& record);
    void removeRecord(const QString& name);

    void announceType(const QString& type);
    void withdrawType(const QString& type);
    void announce(const QString& type, const QString& name);
    void withdraw(const QString& type, const QString& name);
    // Reports a runtime failure on every open browser of `type`.
    void failBrowser(const QString& type, const QString& message);
    void failClients(const QString& message);

    // Completes deferred resolutions in request order. Names without a
    // record time out.
    int releaseResolutions();

    [[nodiscard]] QStringList browseCalls() const;
    [[nodiscard]] int browseCount(const QString& type) const;
    [[nodiscard]] int activeBrowsers() const;
    [[nodiscard]] int resolveCount() const;
    [[nodiscard]] int openCount() const;
    [[nodiscard]] int closeCount() const;
    [[nodiscard]] QList<QHostAddress> openedAddresses() const;

private:
    friend class FakeMulticastClient;

    struct Browser {
        FakeMulticastClient* client = nullptr;
        QString type;
        network::BrowseCallback callback;
    };

    struct DeferredResolve {
        FakeMulticastClient* client = nullptr;
        QString type;
        QString name;
        network::ResolveCallback callback;
    };

    void fire(const QString& browsed_type, network::BrowseEventKind kind,
              const QString& event_type, const QString& name);
    [[nodiscard]] Result<network::RawServiceRecord, Error> lookup(const QString& type,
                                                                   const QString& name) const;

    mutable std::mutex mutex_;
    std::set<QString> failing_types_;
    std::map<QString, network::RawServiceRecord> records_;
    std::map<network::BrowserId, Browser> browsers_;
    std::vector<DeferredResolve> deferred_;
    std::set<FakeMulticastClient*> open_clients_;
    QStringList browse_calls_;
    QList<QHostAddress> opened_addresses_;
    network::BrowserId next_id_ = 0;
    int resolve_count_ = 0;
    int open_count_ = 0;
    int close_count_ = 0;
};

class FakeMulticastClient : public network::MulticastClient {
public:
    explicit FakeMulticastClient(std::shared_ptr<FakeNetwork> net);
    ~FakeMulticastClient() override;

    Result<void, Error> open(const QHostAddress& interface_address) override;
    Result<network::BrowserId, Error> browse(const QString& service_type,
                                             network::BrowseCallback on_change) override;
    void resolve(const QString& service_type,
                 const QString& instance_name,
                 std::chrono::milliseconds timeout,
                 network::ResolveCallback on_done) override;
    void cancel(network::BrowserId browser) override;
    void close() override;

private:
    std::shared_ptr<FakeNetwork> network_;
    std::unique_ptr<QObject> timer_context_;
    bool open_ = false;
};

[[nodiscard]] network::MulticastClientFactory fake_client_factory(std::shared_ptr<FakeNetwork> net);

[[nodiscard]] network::RawServiceRecord make_record(const QString& type,
                                                    const QString& name,
                                                    const QString& address,
                                                    uint16_t port);

} // namespace lantern::testing
