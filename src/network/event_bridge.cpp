#include "network/event_bridge.hpp"

#include "core/logging.hpp"

#include <QMetaObject>

namespace lantern::network {

DiscoveryEvent DiscoveryEvent::typeFound(uint64_t session, const QString& type) {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::TypeFound;
    event.session_id = session;
    event.service_type = type;
    return event;
}

DiscoveryEvent DiscoveryEvent::instanceAdded(uint64_t session,
                                             const QString& name,
                                             ServiceInstance instance) {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::InstanceAdded;
    event.session_id = session;
    event.service_type = instance.type;
    event.name = name;
    event.instance = std::move(instance);
    return event;
}

DiscoveryEvent DiscoveryEvent::instanceRemoved(uint64_t session, const QString& name) {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::InstanceRemoved;
    event.session_id = session;
    event.name = name;
    return event;
}

DiscoveryEvent DiscoveryEvent::error(uint64_t session, const Error& error) {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::Error;
    event.session_id = session;
    event.message = QString::fromStdString(error.message);
    event.error_code = error.code;
    return event;
}

void EventSink::post(DiscoveryEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bridge_) {
        bridge_->post(std::move(event));
    }
}

void EventSink::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    bridge_ = nullptr;
}

EventBridge::EventBridge(QObject* parent)
    : QObject(parent)
    , sink_(std::make_shared<EventSink>(this))
{
    qRegisterMetaType<lantern::ServiceInstance>();
    qRegisterMetaType<lantern::ErrorCode>();
    qRegisterMetaType<lantern::network::DiscoveryEvent>();
}

EventBridge::~EventBridge() {
    sink_->detach();
}

void EventBridge::post(DiscoveryEvent event) {
    QMetaObject::invokeMethod(this, [this, event = std::move(event)]() {
        deliver(event);
    }, Qt::QueuedConnection);
}

void EventBridge::setActiveSession(uint64_t session_id) {
    active_session_ = session_id;
}

void EventBridge::deliver(const DiscoveryEvent& event) {
    if (event.session_id != 0 && event.session_id != active_session_) {
        qCDebug(lanternSessionLog) << "Dropping event from inactive session" << event.session_id
                                   << "active=" << active_session_;
        return;
    }

    emit eventDelivered(event);

    switch (event.kind) {
        case DiscoveryEventKind::TypeFound:
            emit typeFound(event.service_type);
            break;
        case DiscoveryEventKind::InstanceAdded:
            emit instanceAdded(event.name, event.instance);
            break;
        case DiscoveryEventKind::InstanceRemoved:
            emit instanceRemoved(event.name);
            break;
        case DiscoveryEventKind::Error:
            emit error(event.message, event.error_code);
            break;
    }
}

} // namespace lantern::network
