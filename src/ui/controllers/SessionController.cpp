#include "ui/controllers/SessionController.hpp"

#include "core/logging.hpp"
#include "core/service_type.hpp"

namespace lantern::ui {

namespace {

QString describe(const QHostAddress& address) {
    return address.isNull() ? QStringLiteral("all interfaces") : address.toString();
}

} // namespace

SessionController::SessionController(QObject* parent)
    : SessionController(load_discovery_config(), {}, parent)
{
}

SessionController::SessionController(DiscoveryConfig config,
                                     network::MulticastClientFactory client_factory,
                                     QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , client_factory_(std::move(client_factory))
{
    if (!client_factory_) {
        client_factory_ = [backend = config_.backend]() {
            return network::createMulticastClient(backend);
        };
    }

    connect(&bridge_, &network::EventBridge::typeFound,
            &table_, &ServiceTable::onTypeFound);
    connect(&bridge_, &network::EventBridge::instanceAdded,
            &table_, &ServiceTable::onInstanceAdded);
    connect(&bridge_, &network::EventBridge::instanceRemoved,
            &table_, &ServiceTable::onInstanceRemoved);
    connect(&bridge_, &network::EventBridge::error,
            this, [this](const QString& message, lantern::ErrorCode code) {
                emit error(message, code);
                if (code == ErrorCode::StartupError) {
                    emit runningChanged();
                }
            });
}

SessionController::~SessionController() {
    shutdown();
}

bool SessionController::isRunning() const {
    auto* current = engine();
    return current && current->state() != network::EngineState::Stopped;
}

network::DiscoveryEngine* SessionController::engine() const {
    return host_ ? host_->engine() : nullptr;
}

QStringList SessionController::presetQueries(const QString& name) {
    return preset_queries(name).value_or(QStringList{});
}

void SessionController::start(const QHostAddress& interface_address) {
    restart(interface_address);
}

void SessionController::switchInterface(const QHostAddress& interface_address) {
    qInfo() << "DISCOVERY: switching to" << describe(interface_address);
    restart(interface_address);
}

void SessionController::rescan() {
    qInfo() << "DISCOVERY: rescanning" << describe(current_interface_);
    restart(current_interface_);
}

void SessionController::restart(const QHostAddress& interface_address) {
    pending_interface_ = interface_address;
    if (restarting_) {
        qCDebug(lanternSessionLog) << "Restart in progress; queued" << describe(interface_address);
        return;
    }

    restarting_ = true;
    while (pending_interface_) {
        const QHostAddress next = *pending_interface_;
        pending_interface_.reset();

        stopCurrent();
        table_.clear();
        startEngine(next);
    }
    restarting_ = false;
}

void SessionController::stopCurrent() {
    if (!host_) {
        return;
    }

    const quint64 stopping = session_id_;
    bridge_.setActiveSession(0);

    const bool clean = host_->stop(config_.stop_timeout);
    host_.reset();

    if (!clean) {
        qWarning() << "DISCOVERY: session" << stopping << "did not stop within"
                   << config_.stop_timeout.count() << "ms";
        emit error(QStringLiteral("Discovery session did not stop in time"), ErrorCode::Timeout);
    }

    emit sessionStopped(stopping);
    emit runningChanged();
}

void SessionController::startEngine(const QHostAddress& interface_address) {
    session_id_ = ++next_session_id_;
    current_interface_ = interface_address;
    bridge_.setActiveSession(session_id_);

    network::EngineOptions options;
    options.session_id = session_id_;
    options.interface_address = interface_address;
    options.resolve_timeout = config_.resolve_timeout;

    host_ = std::make_unique<network::EngineHost>(std::make_unique<network::DiscoveryEngine>(
        options, client_factory_, bridge_.sink()));
    host_->start();

    qInfo() << "DISCOVERY: session" << session_id_ << "started on" << describe(interface_address);
    emit sessionStarted(session_id_);
    emit runningChanged();
}

void SessionController::submitManualQuery(const QString& raw_text) {
    auto* current = engine();
    if (!current || current->state() == network::EngineState::Stopped) {
        qCDebug(lanternSessionLog) << "No running session; ignoring query" << raw_text;
        return;
    }

    auto type = normalize_query(raw_text);
    if (type.is_err()) {
        reportError(type.unwrap_err());
        return;
    }

    qCDebug(lanternSessionLog) << "Submitting query" << type.unwrap();
    current->requestBrowse(type.unwrap());
}

void SessionController::submitPresetQueries(const QStringList& queries) {
    for (const auto& query : queries) {
        submitManualQuery(query);
    }
}

void SessionController::submitPreset(const QString& name) {
    const auto queries = preset_queries(name);
    if (!queries) {
        reportError(Error{"Unknown preset: " + name.toStdString(), ErrorCode::QuerySubmissionError});
        return;
    }
    submitPresetQueries(*queries);
}

void SessionController::shutdown() {
    pending_interface_.reset();
    if (!host_) {
        return;
    }
    qInfo() << "DISCOVERY: shutting down session" << session_id_;
    stopCurrent();
}

void SessionController::reportError(const Error& error) {
    bridge_.post(network::DiscoveryEvent::error(session_id_, error));
}

} // namespace lantern::ui
