#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "network/discovery_engine.hpp"
#include "network/event_bridge.hpp"
#include "network/multicast_client.hpp"
#include "ui/models/ServiceTable.hpp"

#include <QHostAddress>
#include <QObject>
#include <QStringList>
#include <memory>
#include <optional>

namespace lantern::ui {

/**
 * SessionController - Owns the discovery session of one consumer.
 *
 * At most one DiscoveryEngine exists per controller, hosted on its own
 * thread. Restarts (start, switchInterface, rescan) are serialized: a request
 * made while another is being carried out is folded into it and the most
 * recent interface wins. Events reach the ServiceTable through the
 * EventBridge, which drops anything from a session that is no longer active.
 */
class SessionController : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(quint64 sessionId READ sessionId NOTIFY runningChanged)

public:
    explicit SessionController(QObject* parent = nullptr);
    SessionController(DiscoveryConfig config,
                      network::MulticastClientFactory client_factory,
                      QObject* parent = nullptr);
    ~SessionController() override;

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] QHostAddress currentInterface() const { return current_interface_; }
    [[nodiscard]] quint64 sessionId() const { return session_id_; }
    [[nodiscard]] const DiscoveryConfig& config() const { return config_; }

    [[nodiscard]] ServiceTable* table() { return &table_; }
    [[nodiscard]] network::EventBridge* bridge() { return &bridge_; }

    // Engine of the current session; null when none was started.
    [[nodiscard]] network::DiscoveryEngine* engine() const;

    [[nodiscard]] static QStringList presetQueries(const QString& name);

    void start(const QHostAddress& interface_address = QHostAddress{});
    void switchInterface(const QHostAddress& interface_address);
    void rescan();
    void submitManualQuery(const QString& raw_text);
    void submitPresetQueries(const QStringList& queries);
    void submitPreset(const QString& name);
    void shutdown();

signals:
    void runningChanged();
    void sessionStarted(quint64 sessionId);
    void sessionStopped(quint64 sessionId);
    void error(const QString& message, lantern::ErrorCode code);

private:
    void restart(const QHostAddress& interface_address);
    void stopCurrent();
    void startEngine(const QHostAddress& interface_address);
    void reportError(const Error& error);

    DiscoveryConfig config_;
    network::MulticastClientFactory client_factory_;
    network::EventBridge bridge_;
    ServiceTable table_;

    std::unique_ptr<network::EngineHost> host_;
    QHostAddress current_interface_;
    quint64 session_id_ = 0;
    quint64 next_session_id_ = 0;

    bool restarting_ = false;
    std::optional<QHostAddress> pending_interface_;
};

} // namespace lantern::ui
