#include "ui/cli/options.hpp"

#include <string>

namespace lantern::ui {

Result<std::chrono::seconds> parse_duration(const QString& text) {
    bool ok = false;
    const qlonglong seconds = text.trimmed().toLongLong(&ok);
    if (!ok || seconds < 0 || seconds > kMaxDurationSeconds) {
        return Result<std::chrono::seconds>::err(Error{
            "Invalid duration: " + text.toStdString() + " (expected 0.."
                + std::to_string(kMaxDurationSeconds) + " seconds)",
            ErrorCode::ConfigurationError});
    }
    return Result<std::chrono::seconds>::ok(std::chrono::seconds(seconds));
}

Result<QHostAddress> parse_interface_address(const QString& text) {
    const QString trimmed = text.trimmed();
    QHostAddress address;
    if (!address.setAddress(trimmed) || address.protocol() != QAbstractSocket::IPv4Protocol) {
        return Result<QHostAddress>::err(Error{
            "Invalid interface address: " + trimmed.toStdString(),
            ErrorCode::ConfigurationError});
    }
    return Result<QHostAddress>::ok(address);
}

} // namespace lantern::ui
