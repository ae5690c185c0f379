#pragma once

#include "core/result.hpp"
#include "network/event_bridge.hpp"
#include "network/multicast_client.hpp"

#include <QHostAddress>
#include <QObject>
#include <QStringList>
#include <QThread>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>


namespace lantern::network {

enum class EngineState {
    Starting,
    Running,
    Stopping,
    Stopped,
};

[[nodiscard]] const char* to_string(EngineState state);

struct EngineOptions {
    uint64_t session_id = 0;
    QHostAddress interface_address;  // null = all interfaces
    std::chrono::milliseconds resolve_timeout{3000};
};

/**
 * DiscoveryEngine - Runs one discovery session.
 *
 * Browses the enumeration pseudo-type, starts one browser per service type
 * it reports (or that is requested manually), resolves every instance that
 * is added and reports the results through an EventSink.
 *
 * All state is owned by the engine's thread. Client callbacks are re-posted
 * to that thread as queued calls, so bookkeeping never needs a lock. The
 * request*() methods are the only entry points safe to call from other
 * threads.
 */
class DiscoveryEngine : public QObject {
    Q_OBJECT

public:
    DiscoveryEngine(EngineOptions options,
                    MulticastClientFactory client_factory,
                    std::shared_ptr<EventSink> sink,
                    QObject* parent = nullptr);
    ~DiscoveryEngine() override;

    [[nodiscard]] EngineState state() const { return state_.load(); }
    [[nodiscard]] uint64_t sessionId() const { return options_.session_id; }
    [[nodiscard]] const QHostAddress& interfaceAddress() const { return options_.interface_address; }

    void requestBrowse(const QString& raw_type);
    void requestStop();

    // Engine thread only.
    [[nodiscard]] QStringList seenTypes() const { return seen_types_; }
    [[nodiscard]] QStringList browsedTypes() const;
    [[nodiscard]] int pendingResolutions() const { return static_cast<int>(pending_.size()); }

public slots:
    void start();
    void browse(const QString& raw_type);
    void stop();

signals:
    void stateChanged(lantern::network::EngineState state);
    void stopped();

private:
    using BrowseHandler = void (DiscoveryEngine::*)(const BrowseEvent&);

    void setState(EngineState state);
    void report(DiscoveryEvent event);
    void failStartup(const Error& error);
    void shutdownClient();

    BrowseCallback postingCallback(BrowseHandler handler);
    bool startTypeBrowser(const QString& type);

    void handleEnumerationEvent(const BrowseEvent& event);
    void handleInstanceEvent(const BrowseEvent& event);
    void browserFailed(const BrowseEvent& event);
    void handleResolved(const QString& service_type,
                        const QString& name,
                        uint64_t token,
                        const Result<RawServiceRecord, Error>& result);
    void handleClientFailure(const Error& error);

    EngineOptions options_;
    MulticastClientFactory client_factory_;
    std::shared_ptr<EventSink> sink_;
    std::atomic<EngineState> state_{EngineState::Starting};

    std::unique_ptr<MulticastClient> client_;
    std::optional<BrowserId> enumeration_browser_;
    QStringList seen_types_;
    std::map<QString, BrowserId> browsers_;

    // Latest resolution token per instance name; a newer add or a remove
    // invalidates whatever is still in flight.
    std::map<QString, uint64_t> pending_;
    uint64_t next_token_ = 0;
};

/**
 * EngineHost - Hosts one DiscoveryEngine on a dedicated QThread.
 */
class EngineHost {
public:
    explicit EngineHost(std::unique_ptr<DiscoveryEngine> engine);
    ~EngineHost();

    EngineHost(const EngineHost&) = delete;
    EngineHost& operator=(const EngineHost&) = delete;

    void start();

    /**
     * Ask the engine to stop and wait up to `timeout` for its thread. On
     * timeout the thread is abandoned and cleans itself up when it finishes.
     * Returns false if the wait timed out.
     */
    bool stop(std::chrono::milliseconds timeout);

    [[nodiscard]] DiscoveryEngine* engine() const { return engine_.get(); }

private:
    // Hands both objects over to the thread's finished signal.
    void abandon();

    std::unique_ptr<QThread> thread_;
    std::unique_ptr<DiscoveryEngine> engine_;
};

} // namespace lantern::network

Q_DECLARE_METATYPE(lantern::network::EngineState)
