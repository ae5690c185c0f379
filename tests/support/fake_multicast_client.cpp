#include "support/fake_multicast_client.hpp"

#include "core/service_type.hpp"

#include <QObject>
#include <QTimer>

#include <algorithm>
#include <chrono>
#include <thread>

namespace lantern::testing {

using network::BrowseEvent;
using network::BrowseEventKind;
using network::BrowserId;
using network::RawServiceRecord;

void FakeNetwork::failBrowseOf(const QString& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_types_.insert(type);
}

void FakeNetwork::addRecord(const RawServiceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.name] = record;
}

void FakeNetwork::removeRecord(const QString& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(name);
}

void FakeNetwork::announceType(const QString& type) {
    const QString enumeration = QString::fromLatin1(kEnumerationType);
    fire(enumeration, BrowseEventKind::Added, enumeration, type);
}

void FakeNetwork::withdrawType(const QString& type) {
    const QString enumeration = QString::fromLatin1(kEnumerationType);
    fire(enumeration, BrowseEventKind::Removed, enumeration, type);
}

void FakeNetwork::announce(const QString& type, const QString& name) {
    fire(type, BrowseEventKind::Added, type, name);
}

void FakeNetwork::withdraw(const QString& type, const QString& name) {
    fire(type, BrowseEventKind::Removed, type, name);
}

void FakeNetwork::failBrowser(const QString& type, const QString& message) {
    std::vector<network::BrowseCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, browser] : browsers_) {
            if (browser.type == type) {
                callbacks.push_back(browser.callback);
            }
        }
    }
    BrowseEvent failed;
    failed.kind = BrowseEventKind::Failed;
    failed.service_type = type;
    failed.message = message;
    for (const auto& callback : callbacks) {
        callback(failed);
    }
}

void FakeNetwork::failClients(const QString& message) {
    std::vector<std::function<void(Error)>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* client : open_clients_) {
            if (client->on_failure) handlers.push_back(client->on_failure);
        }
    }
    for (const auto& handler : handlers) {
        handler(Error{message.toStdString(), ErrorCode::ClientFailure});
    }
}

int FakeNetwork::releaseResolutions() {
    std::vector<DeferredResolve> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready.swap(deferred_);
    }
    for (auto& pending : ready) {
        pending.callback(lookup(pending.type, pending.name));
    }
    return static_cast<int>(ready.size());
}

QStringList FakeNetwork::browseCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return browse_calls_;
}

int FakeNetwork::browseCount(const QString& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(browse_calls_.count(type));
}

int FakeNetwork::activeBrowsers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(browsers_.size());
}

int FakeNetwork::resolveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolve_count_;
}

int FakeNetwork::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
}

int FakeNetwork::closeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_count_;
}

QList<QHostAddress> FakeNetwork::openedAddresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_addresses_;
}

void FakeNetwork::fire(const QString& browsed_type, BrowseEventKind kind,
                       const QString& event_type, const QString& name) {
    std::vector<network::BrowseCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, browser] : browsers_) {
            if (browser.type == browsed_type) {
                callbacks.push_back(browser.callback);
            }
        }
    }
    for (const auto& callback : callbacks) {
        callback(BrowseEvent{kind, event_type, name});
    }
}

Result<RawServiceRecord, Error> FakeNetwork::lookup(const QString& type, const QString& name) const {
    // Resolvers are addressed by label, the way Avahi's are.
    if (!split_instance_name(name, type)) {
        return Result<RawServiceRecord, Error>::err(Error{
            name.toStdString() + " is not an instance of " + type.toStdString(),
            ErrorCode::ResolutionError});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(name);
    if (it == records_.end()) {
        return Result<RawServiceRecord, Error>::err(
            Error{"No answer from " + name.toStdString(), ErrorCode::Timeout});
    }
    RawServiceRecord record = it->second;
    if (record.type.isEmpty()) {
        record.type = type;
    }
    return Result<RawServiceRecord, Error>::ok(std::move(record));
}

FakeMulticastClient::FakeMulticastClient(std::shared_ptr<FakeNetwork> net)
    : network_(std::move(net))
    , timer_context_(std::make_unique<QObject>())
{
}

FakeMulticastClient::~FakeMulticastClient() {
    close();
}

Result<void, Error> FakeMulticastClient::open(const QHostAddress& interface_address) {
    std::lock_guard<std::mutex> lock(network_->mutex_);
    network_->open_count_++;
    network_->opened_addresses_.append(interface_address);
    if (network_->fail_open) {
        return Result<void, Error>::err(Error{"simulated open failure", ErrorCode::StartupError});
    }
    open_ = true;
    network_->open_clients_.insert(this);
    return Result<void, Error>::ok();
}

Result<BrowserId, Error> FakeMulticastClient::browse(const QString& service_type,
                                                     network::BrowseCallback on_change) {
    std::lock_guard<std::mutex> lock(network_->mutex_);
    network_->browse_calls_.append(service_type);
    if (network_->failing_types_.count(service_type) > 0) {
        return Result<BrowserId, Error>::err(
            Error{"simulated browse failure", ErrorCode::BrowserStartError});
    }

    const BrowserId id = ++network_->next_id_;
    network_->browsers_[id] = FakeNetwork::Browser{this, service_type, std::move(on_change)};
    return Result<BrowserId, Error>::ok(id);
}

void FakeMulticastClient::resolve(const QString& service_type,
                                  const QString& instance_name,
                                  std::chrono::milliseconds timeout,
                                  network::ResolveCallback on_done) {
    {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        network_->resolve_count_++;
        if (network_->defer_resolutions) {
            network_->deferred_.push_back(
                FakeNetwork::DeferredResolve{this, service_type, instance_name, std::move(on_done)});
            return;
        }
    }

    auto result = network_->lookup(service_type, instance_name);
    if (result.is_ok()) {
        on_done(std::move(result));
        return;
    }

    // Unknown names stay silent until the timeout, like a host that never answers.
    QTimer::singleShot(timeout, timer_context_.get(), [on_done, result]() {
        on_done(result);
    });
}

void FakeMulticastClient::cancel(BrowserId browser) {
    std::lock_guard<std::mutex> lock(network_->mutex_);
    network_->browsers_.erase(browser);
}

void FakeMulticastClient::close() {
    if (!open_) return;

    while (network_->block_close) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::lock_guard<std::mutex> lock(network_->mutex_);
    for (auto it = network_->browsers_.begin(); it != network_->browsers_.end();) {
        it = it->second.client == this ? network_->browsers_.erase(it) : std::next(it);
    }
    auto& deferred = network_->deferred_;
    deferred.erase(std::remove_if(deferred.begin(), deferred.end(),
                                  [this](const FakeNetwork::DeferredResolve& pending) {
                                      return pending.client == this;
                                  }),
                   deferred.end());
    network_->open_clients_.erase(this);
    network_->close_count_++;
    open_ = false;
    timer_context_.reset();
    timer_context_ = std::make_unique<QObject>();
}

network::MulticastClientFactory fake_client_factory(std::shared_ptr<FakeNetwork> net) {
    return [net]() -> std::unique_ptr<network::MulticastClient> {
        return std::make_unique<FakeMulticastClient>(net);
    };
}

RawServiceRecord make_record(const QString& type,
                             const QString& name,
                             const QString& address,
                             uint16_t port) {
    RawServiceRecord record;
    record.name = name;
    record.type = type;
    record.addresses.emplace_back(address);
    record.port = port;
    record.server = QStringLiteral("host.local.");
    return record;
}

} // namespace lantern::testing
