#pragma once

#include "core/result.hpp"
#include "core/service_instance.hpp"

#include <QObject>
#include <QString>
#include <cstdint>
#include <memory>
#include <mutex>

namespace lantern::network {

enum class DiscoveryEventKind {
    TypeFound,
    InstanceAdded,
    InstanceRemoved,
    Error,
};

/**
 * DiscoveryEvent - One engine event, carried by value across threads.
 *
 * `session_id` identifies the session that produced it; 0 marks events that
 * do not belong to a session (controller-level errors).
 */
struct DiscoveryEvent {
    DiscoveryEventKind kind = DiscoveryEventKind::Error;
    uint64_t session_id = 0;
    QString service_type;
    QString name;
    ServiceInstance instance;
    QString message;
    ErrorCode error_code = ErrorCode::Unknown;

    [[nodiscard]] static DiscoveryEvent typeFound(uint64_t session, const QString& type);
    [[nodiscard]] static DiscoveryEvent instanceAdded(uint64_t session,
                                                      const QString& name,
                                                      ServiceInstance instance);
    [[nodiscard]] static DiscoveryEvent instanceRemoved(uint64_t session, const QString& name);
    [[nodiscard]] static DiscoveryEvent error(uint64_t session, const Error& error);
};

class EventBridge;

/**
 * EventSink - Thread-safe handle engines post through.
 *
 * Shared between the bridge and every engine it serves; once the bridge is
 * destroyed the sink is detached and further posts are discarded.
 */
class EventSink {
public:
    explicit EventSink(EventBridge* bridge) : bridge_(bridge) {}

    void post(DiscoveryEvent event);
    void detach();

private:
    std::mutex mutex_;
    EventBridge* bridge_;
};

/**
 * EventBridge - Delivers discovery events on the thread the bridge lives on.
 *
 * post() may be called from any thread and never blocks: it queues the
 * event onto the bridge's event loop. Events posted from one thread are
 * delivered in the order they were posted. Events from a session other
 * than the active one are dropped on delivery.
 */
class EventBridge : public QObject {
    Q_OBJECT

public:
    explicit EventBridge(QObject* parent = nullptr);
    ~EventBridge() override;

    void post(DiscoveryEvent event);

    [[nodiscard]] std::shared_ptr<EventSink> sink() const { return sink_; }

    // Must be called on the bridge's thread.
    void setActiveSession(uint64_t session_id);
    [[nodiscard]] uint64_t activeSession() const { return active_session_; }

signals:
    void eventDelivered(const lantern::network::DiscoveryEvent& event);
    void typeFound(const QString& type);
    void instanceAdded(const QString& name, const lantern::ServiceInstance& instance);
    void instanceRemoved(const QString& name);
    void error(const QString& message, lantern::ErrorCode code);

private:
    void deliver(const DiscoveryEvent& event);

    std::shared_ptr<EventSink> sink_;
    uint64_t active_session_ = 0;
};

} // namespace lantern::network

Q_DECLARE_METATYPE(lantern::ErrorCode)
Q_DECLARE_METATYPE(lantern::network::DiscoveryEvent)
