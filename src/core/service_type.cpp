#include "core/service_type.hpp"

namespace lantern {
namespace {

constexpr int kMaxTypeLabels = 4;

const QStringList& dante_presets() {
    static const QStringList presets{
        QStringLiteral("_dante-safe._udp"),
        QStringLiteral("_dante-upgr._udp"),
        QStringLiteral("_netaudio-arc._udp"),
        QStringLiteral("_netaudio-chan._udp"),
        QStringLiteral("_netaudio-cmc._udp"),
        QStringLiteral("_netaudio-dbc._udp"),
        QStringLiteral("_dante-ddm-d._udp"),
        QStringLiteral("_dante-ddm-c._tcp"),
    };
    return presets;
}

QString with_trailing_dot(const QString& name) {
    return name.endsWith(QLatin1Char('.')) ? name : name + QLatin1Char('.');
}

} // namespace

bool is_enumeration_type(const QString& type) {
    return type == QLatin1String(kEnumerationType);
}

QString normalize_service_type(const QString& text) {
    const auto trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return QString{};
    }
    if (trimmed.endsWith(QLatin1String(".local."))) {
        return trimmed;
    }
    if (trimmed.endsWith(QLatin1String(".local"))) {
        return trimmed + QLatin1Char('.');
    }
    if (trimmed.endsWith(QLatin1Char('.'))) {
        return trimmed + QLatin1String("local.");
    }
    return trimmed + QLatin1String(".local.");
}

Result<QString> normalize_query(const QString& text) {
    const auto normalized = normalize_service_type(text);
    if (normalized.isEmpty()) {
        return Result<QString>::err(
            Error{"Empty service query", ErrorCode::QuerySubmissionError});
    }
    if (is_enumeration_type(normalized)) {
        return Result<QString>::err(
            Error{"Refusing to browse the enumeration type " + normalized.toStdString(),
                  ErrorCode::QuerySubmissionError});
    }
    return Result<QString>::ok(normalized);
}

QString derive_service_type(const QString& advertised_name) {
    const auto labels = advertised_name.split(QLatin1Char('.'));
    if (labels.size() <= kMaxTypeLabels) {
        return advertised_name;
    }
    return labels.mid(labels.size() - kMaxTypeLabels).join(QLatin1Char('.'));
}

ServiceTypeParts split_service_type(const QString& service_type) {
    QString type = service_type;
    if (type.endsWith(QLatin1Char('.'))) {
        type.chop(1);
    }

    const auto labels = type.split(QLatin1Char('.'));
    qsizetype application_labels = 0;
    while (application_labels < labels.size()
           && labels[application_labels].startsWith(QLatin1Char('_'))) {
        ++application_labels;
    }

    ServiceTypeParts parts;
    parts.application = labels.mid(0, application_labels).join(QLatin1Char('.'));
    parts.domain = labels.mid(application_labels).join(QLatin1Char('.'));
    if (parts.domain.isEmpty()) {
        parts.domain = QStringLiteral("local");
    }
    return parts;
}

QString join_instance_name(const QString& label, const QString& service_type) {
    return label + QLatin1Char('.') + with_trailing_dot(service_type);
}

std::optional<QString> split_instance_name(const QString& instance_name,
                                           const QString& service_type) {
    const QString name = with_trailing_dot(instance_name);
    const QString suffix = QStringLiteral(".") + with_trailing_dot(service_type);
    if (name.size() <= suffix.size() || !name.endsWith(suffix, Qt::CaseInsensitive)) {
        return std::nullopt;
    }
    return name.chopped(suffix.size());
}

QStringList preset_names() {
    return {QStringLiteral("dante")};
}

std::optional<QStringList> preset_queries(const QString& name) {
    if (name.compare(QLatin1String("dante"), Qt::CaseInsensitive) == 0) {
        return dante_presets();
    }
    return std::nullopt;
}

} // namespace lantern
