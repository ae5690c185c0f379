#include "core/config.hpp"

#include <QSettings>
#include <QtGlobal>

namespace lantern {
namespace {

constexpr int kMaxTimeoutMs = 60000;

// Positive millisecond values only; anything else keeps the fallback.
std::chrono::milliseconds parse_timeout(const QString& text, std::chrono::milliseconds fallback) {
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value <= 0 || value > kMaxTimeoutMs) {
        return fallback;
    }
    return std::chrono::milliseconds{value};
}

} // namespace

DiscoveryConfig load_discovery_config() {
    QSettings settings;
    return load_discovery_config(settings);
}

DiscoveryConfig load_discovery_config(QSettings& settings) {
    DiscoveryConfig config;

    config.resolve_timeout = parse_timeout(
        settings.value(QStringLiteral("discovery/resolve_timeout_ms")).toString(),
        config.resolve_timeout);
    config.stop_timeout = parse_timeout(
        settings.value(QStringLiteral("discovery/stop_timeout_ms")).toString(),
        config.stop_timeout);
    const auto storedBackend = settings.value(QStringLiteral("discovery/backend")).toString().trimmed();
    if (!storedBackend.isEmpty()) {
        config.backend = storedBackend.toLower();
    }

    if (qEnvironmentVariableIsSet("LANTERN_RESOLVE_TIMEOUT_MS")) {
        config.resolve_timeout = parse_timeout(
            qEnvironmentVariable("LANTERN_RESOLVE_TIMEOUT_MS"), config.resolve_timeout);
    }
    if (qEnvironmentVariableIsSet("LANTERN_STOP_TIMEOUT_MS")) {
        config.stop_timeout = parse_timeout(
            qEnvironmentVariable("LANTERN_STOP_TIMEOUT_MS"), config.stop_timeout);
    }
    const auto envBackend = qEnvironmentVariable("LANTERN_DISCOVERY_BACKEND").trimmed().toLower();
    if (!envBackend.isEmpty()) {
        config.backend = envBackend;
    }

    return config;
}

void save_discovery_config(QSettings& settings, const DiscoveryConfig& config) {
    settings.setValue(QStringLiteral("discovery/resolve_timeout_ms"),
                      static_cast<int>(config.resolve_timeout.count()));
    settings.setValue(QStringLiteral("discovery/stop_timeout_ms"),
                      static_cast<int>(config.stop_timeout.count()));
    settings.setValue(QStringLiteral("discovery/backend"), config.backend);
}

} // namespace lantern
