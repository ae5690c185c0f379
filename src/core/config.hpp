#pragma once

#include <QString>
#include <chrono>

class QSettings;

namespace lantern {

/**
 * DiscoveryConfig - Tunables for discovery sessions.
 *
 * Sources, lowest to highest precedence:
 * - built-in defaults
 * - QSettings keys under "discovery/"
 * - LANTERN_RESOLVE_TIMEOUT_MS, LANTERN_STOP_TIMEOUT_MS, LANTERN_DISCOVERY_BACKEND
 */
struct DiscoveryConfig {
    static constexpr int kDefaultResolveTimeoutMs = 3000;
    static constexpr int kDefaultStopTimeoutMs = 5000;

    std::chrono::milliseconds resolve_timeout{kDefaultResolveTimeoutMs};
    std::chrono::milliseconds stop_timeout{kDefaultStopTimeoutMs};
    QString backend = QStringLiteral("avahi");
};

[[nodiscard]] DiscoveryConfig load_discovery_config();
[[nodiscard]] DiscoveryConfig load_discovery_config(QSettings& settings);

void save_discovery_config(QSettings& settings, const DiscoveryConfig& config);

} // namespace lantern
