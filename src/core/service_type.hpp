#pragma once

#include "core/result.hpp"

#include <QString>
#include <QStringList>
#include <optional>

namespace lantern {

/**
 * The DNS-SD enumeration pseudo-type. Its "instances" are service types.
 */
inline constexpr const char* kEnumerationType = "_services._dns-sd._udp.local.";

[[nodiscard]] bool is_enumeration_type(const QString& type);

/**
 * Normalize user-entered service type text so it ends in ".local.".
 *
 *   "_http"             -> "_http.local."
 *   "_http._tcp."       -> "_http._tcp.local."
 *   "_http._tcp.local"  -> "_http._tcp.local."
 *
 * Surrounding whitespace is trimmed. Returns an empty string when nothing is
 * left after trimming.
 */
[[nodiscard]] QString normalize_service_type(const QString& text);

/**
 * normalize_service_type() for manual queries: empty input and the
 * enumeration pseudo-type are rejected with QuerySubmissionError.
 */
[[nodiscard]] Result<QString> normalize_query(const QString& text);

/**
 * Derive the browsable service type from a name reported by the enumeration
 * browser. Names with more than four dot-separated labels keep only the last
 * four ("a._sub._http._tcp.local." -> "_http._tcp.local.").
 */
[[nodiscard]] QString derive_service_type(const QString& advertised_name);

/**
 * A service type split for DNS-SD APIs that take the application part and the
 * domain separately: "_ipp._tcp.local." -> {"_ipp._tcp", "local"}.
 */
struct ServiceTypeParts {
    QString application;
    QString domain;
};

[[nodiscard]] ServiceTypeParts split_service_type(const QString& service_type);

/**
 * Instance names are kept in presentation form: the label exactly as
 * advertised, without DNS escaping, then the service type.
 *
 *   join_instance_name("My Printer", "_ipp._tcp.local.")
 *       -> "My Printer._ipp._tcp.local."
 *
 * split_instance_name() strips the type suffix to get the label back, so
 * labels containing dots survive. Returns nullopt if `instance_name` does not
 * end in `service_type` or the label would be empty.
 */
[[nodiscard]] QString join_instance_name(const QString& label, const QString& service_type);
[[nodiscard]] std::optional<QString> split_instance_name(const QString& instance_name,
                                                         const QString& service_type);

/**
 * Built-in batches of service types for submitPresetQueries().
 */
[[nodiscard]] QStringList preset_names();
[[nodiscard]] std::optional<QStringList> preset_queries(const QString& name);

} // namespace lantern
