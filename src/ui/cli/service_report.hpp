#pragma once

#include "core/service_instance.hpp"
#include "network/interfaces.hpp"

#include <QList>
#include <QString>
#include <QStringList>
#include <vector>

namespace lantern::ui {

// One instance as a block of "Label: value" lines, TXT properties last.
// The empty key with no value that some responders publish is skipped.
[[nodiscard]] QString format_instance_details(const ServiceInstance& instance);

[[nodiscard]] QString format_service_report(const QStringList& types,
                                            const std::vector<ServiceInstance>& instances);

// JSON output:
// {
//   "types": [ "_http._tcp.local.", ... ],
//   "instances": [ { "name", "type", "addresses", "port", "priority", "weight",
//                    "server", "properties" }, ... ]
// }
[[nodiscard]] QString format_service_report_json(const QStringList& types,
                                                 const std::vector<ServiceInstance>& instances);

[[nodiscard]] QString format_interface_list(const QList<network::InterfaceChoice>& choices);

} // namespace lantern::ui
