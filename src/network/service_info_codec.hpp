#pragma once

#include "core/service_instance.hpp"
#include "network/multicast_client.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QJsonObject>
#include <QString>

namespace lantern::network {

/**
 * Convert a resolved record into the value delivered to consumers.
 *
 * - addresses become "address:port" strings, IPv6 bracketed
 * - TXT keys are decoded as UTF-8 with replacement characters
 * - TXT values that are not valid UTF-8 become lowercase hex
 * - a repeated TXT key keeps its first position and its last value
 */
[[nodiscard]] ServiceInstance decode_service_record(const RawServiceRecord& record);

/**
 * Fold another answer for the same instance into `into`, as when IPv4 and
 * IPv6 are resolved separately. Addresses are appended unless already
 * present; host, port and TXT come from the first answer that has them.
 */
void merge_resolved(RawServiceRecord& into, const RawServiceRecord& answer);

[[nodiscard]] QString decode_txt_value(const QByteArray& raw);

[[nodiscard]] QString format_endpoint(const QHostAddress& address, uint16_t port);

[[nodiscard]] QJsonObject to_json(const ServiceInstance& instance);

} // namespace lantern::network
