#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace lantern::network {

using BrowserId = uint64_t;

enum class BrowseEventKind {
    Added,
    Removed,
    Failed,  // the browser stopped working; no further events follow
};

/**
 * BrowseEvent - A state change reported by a browser.
 *
 * For the enumeration browser, `name` is a service type such as
 * "_http._tcp.local."; otherwise it is an instance name in presentation form
 * (see join_instance_name()). Failed events carry `message` and no name.
 */
struct BrowseEvent {
    BrowseEventKind kind = BrowseEventKind::Added;
    QString service_type;
    QString name;
    QString message;
};

struct RawTxtEntry {
    QByteArray key;
    std::optional<QByteArray> value;
};

/**
 * RawServiceRecord - What a successful resolution returns, before decoding.
 */
struct RawServiceRecord {
    QString name;
    QString type;
    std::vector<QHostAddress> addresses;
    uint16_t port = 0;
    std::optional<uint16_t> priority;
    std::optional<uint16_t> weight;
    std::optional<QString> server;
    std::vector<RawTxtEntry> txt;
};

using BrowseCallback = std::function<void(const BrowseEvent&)>;
using ResolveCallback = std::function<void(Result<RawServiceRecord, Error>)>;

/**
 * MulticastClient - Abstract interface over the mDNS/DNS-SD library.
 *
 * Methods are called from a single thread (the engine's). Callbacks may be
 * invoked on any thread, including an internal poll thread, and must not
 * call back into the client. No callback fires after close() returns.
 */
class MulticastClient {
public:
    virtual ~MulticastClient() = default;

    /**
     * Connect the client. A null address means all interfaces; otherwise
     * browsing and resolution are restricted to the interface carrying it.
     */
    virtual Result<void, Error> open(const QHostAddress& interface_address) = 0;

    virtual Result<BrowserId, Error> browse(const QString& service_type,
                                            BrowseCallback on_change) = 0;

    /**
     * Resolve an instance. `on_done` is called exactly once, with the record,
     * a ResolutionError, or a Timeout after `timeout`, unless the client is
     * closed first.
     */
    virtual void resolve(const QString& service_type,
                         const QString& instance_name,
                         std::chrono::milliseconds timeout,
                         ResolveCallback on_done) = 0;

    virtual void cancel(BrowserId browser) = 0;
    virtual void close() = 0;

    // Runtime failure after open(), e.g. the daemon went away.
    std::function<void(Error)> on_failure;
};

using MulticastClientFactory = std::function<std::unique_ptr<MulticastClient>()>;

/**
 * Create the client for a backend name ("avahi", or "none" for a client
 * that always fails to open).
 */
std::unique_ptr<MulticastClient> createMulticastClient(const QString& backend);

} // namespace lantern::network
