#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QString>
#include <chrono>

namespace lantern::ui {

// Longest --duration whose millisecond count still fits a timer interval.
inline constexpr int kMaxDurationSeconds = 2147483;

// Non-negative whole seconds, at most kMaxDurationSeconds. 0 means no limit.
[[nodiscard]] Result<std::chrono::seconds> parse_duration(const QString& text);

// An IPv4 address to bind discovery to.
[[nodiscard]] Result<QHostAddress> parse_interface_address(const QString& text);

} // namespace lantern::ui
