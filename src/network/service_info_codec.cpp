#include "network/service_info_codec.hpp"

#include <QJsonArray>
#include <QJsonValue>
#include <QStringDecoder>

#include <algorithm>

namespace lantern::network {

QString decode_txt_value(const QByteArray& raw) {
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    const QString text = decoder(raw);
    if (decoder.hasError()) {
        return QString::fromLatin1(raw.toHex());
    }
    return text;
}

void merge_resolved(RawServiceRecord& into, const RawServiceRecord& answer) {
    for (const auto& address : answer.addresses) {
        const bool known = std::any_of(into.addresses.begin(), into.addresses.end(),
            [&address](const QHostAddress& existing) { return existing.isEqual(address); });
        if (!known) {
            into.addresses.push_back(address);
        }
    }

    if (!into.server && answer.server) {
        into.server = answer.server;
    }
    if (into.port == 0) {
        into.port = answer.port;
    }
    if (into.txt.empty()) {
        into.txt = answer.txt;
    }
}

QString format_endpoint(const QHostAddress& address, uint16_t port) {
    if (address.protocol() == QAbstractSocket::IPv6Protocol) {
        return QStringLiteral("[%1]:%2").arg(address.toString()).arg(port);
    }
    return QStringLiteral("%1:%2").arg(address.toString()).arg(port);
}

ServiceInstance decode_service_record(const RawServiceRecord& record) {
    ServiceInstance instance;
    instance.name = record.name;
    instance.type = record.type;
    instance.port = record.port;
    instance.priority = record.priority;
    instance.weight = record.weight;
    instance.server = record.server;

    for (const auto& address : record.addresses) {
        if (address.isNull()) continue;
        instance.addresses.append(format_endpoint(address, record.port));
    }

    for (const auto& entry : record.txt) {
        TxtProperty prop;
        prop.key = QString::fromUtf8(entry.key);
        if (entry.value) {
            prop.value = decode_txt_value(*entry.value);
        }

        auto it = std::find_if(instance.properties.begin(), instance.properties.end(),
            [&](const TxtProperty& existing) { return existing.key == prop.key; });
        if (it != instance.properties.end()) {
            it->value = std::move(prop.value);
        } else {
            instance.properties.push_back(std::move(prop));
        }
    }

    return instance;
}

QJsonObject to_json(const ServiceInstance& instance) {
    QJsonObject obj;
    obj["name"] = instance.name;
    obj["type"] = instance.type;
    obj["addresses"] = QJsonArray::fromStringList(instance.addresses);
    obj["port"] = static_cast<int>(instance.port);
    obj["priority"] = instance.priority ? QJsonValue(static_cast<int>(*instance.priority))
                                        : QJsonValue(QJsonValue::Null);
    obj["weight"] = instance.weight ? QJsonValue(static_cast<int>(*instance.weight))
                                    : QJsonValue(QJsonValue::Null);
    obj["server"] = instance.server ? QJsonValue(*instance.server)
                                    : QJsonValue(QJsonValue::Null);

    QJsonObject props;
    for (const auto& prop : instance.properties) {
        props[prop.key] = prop.value ? QJsonValue(*prop.value) : QJsonValue(QJsonValue::Null);
    }
    obj["properties"] = props;
    return obj;
}

} // namespace lantern::network
