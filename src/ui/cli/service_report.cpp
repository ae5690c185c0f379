#include "ui/cli/service_report.hpp"

#include "network/service_info_codec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace lantern::ui {

namespace {

[[nodiscard]] QString optional_number(const std::optional<uint16_t>& value) {
    return value ? QString::number(*value) : QStringLiteral("none");
}

[[nodiscard]] QString render_field(const QString& label, const QString& value) {
    return QStringLiteral("  %1 %2\n").arg(label.leftJustified(12), value);
}

} // namespace

QString format_instance_details(const ServiceInstance& instance) {
    QString out = instance.name + QLatin1Char('\n');
    out += render_field(QStringLiteral("Type:"), instance.type);
    out += render_field(QStringLiteral("Server:"), instance.server.value_or(QString{}));

    if (instance.addresses.isEmpty()) {
        out += render_field(QStringLiteral("IP address:"), QString{});
    }
    for (int i = 0; i < instance.addresses.size(); ++i) {
        out += render_field(i == 0 ? QStringLiteral("IP address:") : QString{},
                            instance.addresses.at(i));
    }

    out += render_field(QStringLiteral("Loadbalance:"),
                        QStringLiteral("Priority: %1 weight: %2")
                            .arg(optional_number(instance.priority),
                                 optional_number(instance.weight)));

    QStringList props;
    for (const auto& prop : instance.properties) {
        if (prop.key.isEmpty() && !prop.value) continue;
        props.append(QStringLiteral("    %1: %2")
                         .arg(prop.key, prop.value.value_or(QStringLiteral("none"))));
    }
    if (!props.isEmpty()) {
        out += QStringLiteral("  Properties\n");
        out += props.join(QLatin1Char('\n')) + QLatin1Char('\n');
    }

    return out;
}

QString format_service_report(const QStringList& types,
                              const std::vector<ServiceInstance>& instances) {
    QString out = QStringLiteral("Service types (%1):\n").arg(types.size());
    for (const auto& type : types) {
        out += QStringLiteral("  ") + type + QLatin1Char('\n');
    }

    out += QStringLiteral("\nInstances (%1):\n").arg(instances.size());
    for (const auto& instance : instances) {
        out += QLatin1Char('\n');
        out += format_instance_details(instance);
    }
    return out;
}

QString format_service_report_json(const QStringList& types,
                                   const std::vector<ServiceInstance>& instances) {
    QJsonArray instanceArray;
    for (const auto& instance : instances) {
        instanceArray.append(network::to_json(instance));
    }

    QJsonObject root;
    root["types"] = QJsonArray::fromStringList(types);
    root["instances"] = instanceArray;
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_interface_list(const QList<network::InterfaceChoice>& choices) {
    QString out;
    for (const auto& choice : choices) {
        out += choice.address.isNull()
            ? choice.label + QLatin1Char('\n')
            : QStringLiteral("%1\t%2\n").arg(choice.address.toString(), choice.label);
    }
    return out;
}

} // namespace lantern::ui
