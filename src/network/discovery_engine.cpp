#include "network/discovery_engine.hpp"

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/service_type.hpp"
#include "network/service_info_codec.hpp"

#include <QDeadlineTimer>
#include <QMetaObject>
#include <QThread>

namespace lantern::network {

const char* to_string(EngineState state) {
    switch (state) {
        case EngineState::Starting: return "starting";
        case EngineState::Running: return "running";
        case EngineState::Stopping: return "stopping";
        case EngineState::Stopped: return "stopped";
    }
    return "unknown";
}

DiscoveryEngine::DiscoveryEngine(EngineOptions options,
                                 MulticastClientFactory client_factory,
                                 std::shared_ptr<EventSink> sink,
                                 QObject* parent)
    : QObject(parent)
    , options_(std::move(options))
    , client_factory_(std::move(client_factory))
    , sink_(std::move(sink))
{
    qRegisterMetaType<lantern::network::EngineState>();
}

DiscoveryEngine::~DiscoveryEngine() {
    shutdownClient();
}

void DiscoveryEngine::requestBrowse(const QString& raw_type) {
    QMetaObject::invokeMethod(this, [this, raw_type]() {
        browse(raw_type);
    }, Qt::QueuedConnection);
}

void DiscoveryEngine::requestStop() {
    QMetaObject::invokeMethod(this, &DiscoveryEngine::stop, Qt::QueuedConnection);
}

QStringList DiscoveryEngine::browsedTypes() const {
    QStringList types;
    for (const auto& [type, id] : browsers_) {
        types.append(type);
    }
    return types;
}

void DiscoveryEngine::setState(EngineState state) {
    if (state_.exchange(state) != state) {
        qCDebug(lanternDiscoveryLog) << "Session" << options_.session_id
                                     << "state ->" << to_string(state);
        emit stateChanged(state);
    }
}

void DiscoveryEngine::report(DiscoveryEvent event) {
    if (state_.load() == EngineState::Stopped || !sink_) {
        return;
    }
    sink_->post(std::move(event));
}

void DiscoveryEngine::start() {
    if (state_.load() != EngineState::Starting) {
        return;
    }

    client_ = client_factory_ ? client_factory_() : nullptr;
    if (!client_) {
        failStartup(Error{"No multicast client available", ErrorCode::StartupError});
        return;
    }

    client_->on_failure = [this](Error error) {
        QMetaObject::invokeMethod(this, [this, error]() {
            handleClientFailure(error);
        }, Qt::QueuedConnection);
    };

    auto opened = client_->open(options_.interface_address);
    if (opened.is_err()) {
        failStartup(Error{opened.unwrap_err().message, ErrorCode::StartupError});
        return;
    }

    auto meta = client_->browse(QString::fromLatin1(kEnumerationType),
                                postingCallback(&DiscoveryEngine::handleEnumerationEvent));
    if (meta.is_err()) {
        failStartup(Error{"Failed to browse service types: " + meta.unwrap_err().message,
                          ErrorCode::StartupError});
        return;
    }
    enumeration_browser_ = meta.unwrap();

    qInfo() << "Discovery session" << options_.session_id << "running on"
            << (options_.interface_address.isNull() ? QStringLiteral("all interfaces")
                                                    : options_.interface_address.toString());
    setState(EngineState::Running);
}

void DiscoveryEngine::failStartup(const Error& error) {
    qWarning() << "Discovery session" << options_.session_id << "failed to start:"
               << QString::fromStdString(error.message);
    report(DiscoveryEvent::error(options_.session_id, error));
    shutdownClient();
    setState(EngineState::Stopped);
    emit stopped();
}

void DiscoveryEngine::browse(const QString& raw_type) {
    if (state_.load() != EngineState::Running) {
        qCDebug(lanternDiscoveryLog) << "Ignoring browse request while"
                                     << to_string(state_.load()) << raw_type;
        return;
    }

    auto type = normalize_query(raw_type);
    if (type.is_err()) {
        report(DiscoveryEvent::error(options_.session_id, type.unwrap_err()));
        return;
    }

    if (!startTypeBrowser(type.unwrap())) {
        qCDebug(lanternDiscoveryLog) << "Already browsing" << type.unwrap();
    }
}

void DiscoveryEngine::stop() {
    const EngineState current = state_.load();
    if (current == EngineState::Stopped) {
        emit stopped();
        return;
    }

    setState(EngineState::Stopping);
    shutdownClient();
    setState(EngineState::Stopped);
    qInfo() << "Discovery session" << options_.session_id << "stopped";
    emit stopped();
}

void DiscoveryEngine::shutdownClient() {
    if (!client_) {
        return;
    }

    for (const auto& [type, id] : browsers_) {
        client_->cancel(id);
    }
    browsers_.clear();

    if (enumeration_browser_) {
        client_->cancel(*enumeration_browser_);
        enumeration_browser_.reset();
    }

    pending_.clear();
    client_->close();
    client_.reset();
}

BrowseCallback DiscoveryEngine::postingCallback(BrowseHandler handler) {
    return [this, handler](const BrowseEvent& event) {
        QMetaObject::invokeMethod(this, [this, handler, event]() {
            (this->*handler)(event);
        }, Qt::QueuedConnection);
    };
}

bool DiscoveryEngine::startTypeBrowser(const QString& type) {
    if (seen_types_.contains(type)) {
        return false;
    }

    seen_types_.append(type);
    report(DiscoveryEvent::typeFound(options_.session_id, type));

    auto browser = client_->browse(type, postingCallback(&DiscoveryEngine::handleInstanceEvent));
    if (browser.is_err()) {
        qCWarning(lanternDiscoveryLog) << "Failed to browse" << type
                                       << QString::fromStdString(browser.unwrap_err().message);
        report(DiscoveryEvent::error(options_.session_id,
            Error{"Failed to browse " + type.toStdString() + ": "
                      + browser.unwrap_err().message,
                  ErrorCode::BrowserStartError}));
        return true;
    }

    browsers_[type] = browser.unwrap();
    qCDebug(lanternDiscoveryLog) << "Browsing" << type;
    return true;
}

void DiscoveryEngine::handleEnumerationEvent(const BrowseEvent& event) {
    if (state_.load() != EngineState::Running || !enumeration_browser_) {
        return;
    }

    if (event.kind == BrowseEventKind::Failed) {
        qCWarning(lanternDiscoveryLog) << "Service type enumeration failed:" << event.message;
        client_->cancel(*enumeration_browser_);
        enumeration_browser_.reset();
        report(DiscoveryEvent::error(options_.session_id,
            Error{"Service type enumeration failed: " + event.message.toStdString(),
                  ErrorCode::BrowserStartError}));
        return;
    }

    if (event.kind == BrowseEventKind::Removed) {
        qCDebug(lanternDiscoveryLog) << "Service type withdrawn" << event.name;
        return;
    }

    const QString type = derive_service_type(event.name);
    if (type.isEmpty() || is_enumeration_type(type)) {
        return;
    }

    startTypeBrowser(type);
}

void DiscoveryEngine::handleInstanceEvent(const BrowseEvent& event) {
    if (state_.load() != EngineState::Running) {
        return;
    }
    if (is_enumeration_type(event.service_type)) {
        return;
    }

    if (event.kind == BrowseEventKind::Failed) {
        browserFailed(event);
        return;
    }

    if (event.kind == BrowseEventKind::Removed) {
        pending_.erase(event.name);
        report(DiscoveryEvent::instanceRemoved(options_.session_id, event.name));
        return;
    }

    const uint64_t token = ++next_token_;
    pending_[event.name] = token;

    const QString type = event.service_type;
    const QString name = event.name;
    client_->resolve(type, name, options_.resolve_timeout,
        [this, type, name, token](Result<RawServiceRecord, Error> result) {
            QMetaObject::invokeMethod(this, [this, type, name, token, result]() {
                handleResolved(type, name, token, result);
            }, Qt::QueuedConnection);
        });
}

void DiscoveryEngine::browserFailed(const BrowseEvent& event) {
    auto it = browsers_.find(event.service_type);
    if (it == browsers_.end()) {
        return;
    }
    client_->cancel(it->second);
    browsers_.erase(it);

    qCWarning(lanternDiscoveryLog) << "Browser for" << event.service_type << "failed:"
                                   << event.message;
    report(DiscoveryEvent::error(options_.session_id,
        Error{"Browser for " + event.service_type.toStdString() + " failed: "
                  + event.message.toStdString(),
              ErrorCode::BrowserStartError}));
}

void DiscoveryEngine::handleResolved(const QString& service_type,
                                     const QString& name,
                                     uint64_t token,
                                     const Result<RawServiceRecord, Error>& result) {
    auto it = pending_.find(name);
    if (it == pending_.end() || it->second != token) {
        qCDebug(lanternDiscoveryLog) << "Discarding superseded resolution of" << name;
        return;
    }
    pending_.erase(it);

    if (state_.load() != EngineState::Running) {
        return;
    }

    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        qCDebug(lanternDiscoveryLog) << "Resolution of" << name << "failed:"
                                     << to_string(error.code)
                                     << QString::fromStdString(error.message);
        return;
    }

    ServiceInstance instance = decode_service_record(result.unwrap());
    if (instance.name.isEmpty()) {
        instance.name = name;
    }
    if (instance.type.isEmpty()) {
        instance.type = service_type;
    }

    report(DiscoveryEvent::instanceAdded(options_.session_id, name, std::move(instance)));
}

void DiscoveryEngine::handleClientFailure(const Error& error) {
    if (state_.load() != EngineState::Running) {
        return;
    }
    qWarning() << "Multicast client failure:" << QString::fromStdString(error.message);
    report(DiscoveryEvent::error(options_.session_id,
                                 Error{error.message, ErrorCode::ClientFailure}));
}

EngineHost::EngineHost(std::unique_ptr<DiscoveryEngine> engine)
    : thread_(std::make_unique<QThread>())
    , engine_(std::move(engine))
{
    thread_->setObjectName(QStringLiteral("discovery-%1").arg(engine_->sessionId()));
    engine_->moveToThread(thread_.get());

    QObject::connect(thread_.get(), &QThread::started, engine_.get(), &DiscoveryEngine::start);
    QObject::connect(engine_.get(), &DiscoveryEngine::stopped, thread_.get(), &QThread::quit,
                     Qt::DirectConnection);
}

EngineHost::~EngineHost() {
    stop(std::chrono::milliseconds(DiscoveryConfig::kDefaultStopTimeoutMs));
}

void EngineHost::start() {
    if (thread_ && !thread_->isRunning()) {
        thread_->start();
    }
}

bool EngineHost::stop(std::chrono::milliseconds timeout) {
    if (!thread_) {
        return true;
    }

    if (thread_->isRunning()) {
        engine_->requestStop();
        if (!thread_->wait(QDeadlineTimer(timeout))) {
            qWarning() << "Discovery session" << engine_->sessionId() << "did not stop within"
                       << timeout.count() << "ms; abandoning it";
            abandon();
            return false;
        }
    }

    engine_.reset();
    thread_.reset();
    return true;
}

void EngineHost::abandon() {
    // The thread keeps running until the engine gets to the stop request.
    // Whichever of the signal or the check below sees it finish cleans up.
    QThread* thread = thread_.release();
    DiscoveryEngine* engine = engine_.release();

    auto cleaned = std::make_shared<std::atomic<bool>>(false);
    auto cleanup = [engine, thread, cleaned]() {
        if (!cleaned->exchange(true)) {
            delete engine;
            thread->deleteLater();
        }
    };
    QObject::connect(thread, &QThread::finished, thread, cleanup, Qt::DirectConnection);
    if (thread->isFinished()) {
        cleanup();
    }
}

} // namespace lantern::network
