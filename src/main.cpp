#include <QCoreApplication>
#include <QCommandLineParser>
#include <QHostAddress>
#include <QTextStream>
#include <QTimer>

#include "core/logging.hpp"
#include "core/service_type.hpp"
#include "network/interfaces.hpp"
#include "ui/cli/options.hpp"
#include "ui/cli/service_report.hpp"
#include "ui/controllers/SessionController.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("Lantern");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Lantern");
    app.setOrganizationDomain("lantern.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Browse mDNS / DNS-SD services on the local network"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption listInterfacesOption(
        QStringList{QStringLiteral("list-interfaces")},
        QStringLiteral("List the interfaces discovery can be bound to and exit."));
    parser.addOption(listInterfacesOption);

    const QCommandLineOption interfaceOption(
        QStringList{QStringLiteral("i"), QStringLiteral("interface")},
        QStringLiteral("Bind discovery to the interface carrying this IPv4 address."),
        QStringLiteral("address"));
    parser.addOption(interfaceOption);

    const QCommandLineOption queryOption(
        QStringList{QStringLiteral("q"), QStringLiteral("query")},
        QStringLiteral("Also browse this service type (repeatable), e.g. _http._tcp."),
        QStringLiteral("type"));
    parser.addOption(queryOption);

    const QCommandLineOption presetOption(
        QStringList{QStringLiteral("preset")},
        QStringLiteral("Browse a built-in list of service types (%1).")
            .arg(lantern::preset_names().join(QStringLiteral(", "))),
        QStringLiteral("name"));
    parser.addOption(presetOption);

    const QCommandLineOption durationOption(
        QStringList{QStringLiteral("d"), QStringLiteral("duration")},
        QStringLiteral("Seconds to browse before printing the report; 0 runs until terminated."),
        QStringLiteral("seconds"),
        QStringLiteral("10"));
    parser.addOption(durationOption);

    const QCommandLineOption filterOption(
        QStringList{QStringLiteral("filter")},
        QStringLiteral("Only report instances whose type contains this text."),
        QStringLiteral("type"));
    parser.addOption(filterOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Print the report as JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable discovery debug logging."));
    parser.addOption(debugOption);

    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (parser.isSet(listInterfacesOption)) {
        out << lantern::ui::format_interface_list(lantern::network::list_interface_choices());
        return 0;
    }

    QHostAddress interfaceAddress;
    if (parser.isSet(interfaceOption)) {
        auto parsed = lantern::ui::parse_interface_address(parser.value(interfaceOption));
        if (parsed.is_err()) {
            err << QString::fromStdString(parsed.unwrap_err().message) << Qt::endl;
            return 1;
        }
        interfaceAddress = parsed.unwrap();
    }

    auto duration = lantern::ui::parse_duration(parser.value(durationOption));
    if (duration.is_err()) {
        err << QString::fromStdString(duration.unwrap_err().message) << Qt::endl;
        return 1;
    }
    const std::chrono::seconds runTime = duration.unwrap();

    const QString presetName = parser.value(presetOption).trimmed().toLower();
    if (!presetName.isEmpty() && !lantern::preset_queries(presetName)) {
        err << "Unknown preset: " << presetName << Qt::endl;
        return 1;
    }

    const QString logPath = lantern::default_log_file_path();
    auto logging = lantern::install_file_logging(logPath);
    if (logging.is_err()) {
        err << "warning: " << QString::fromStdString(logging.unwrap_err().message) << Qt::endl;
    } else if (parser.isSet(debugOption)) {
        err << "Logging to " << logPath << Qt::endl;
    }
    lantern::enable_debug_logging(parser.isSet(debugOption));

    lantern::ui::SessionController controller;
    auto* bridge = controller.bridge();

    QObject::connect(bridge, &lantern::network::EventBridge::typeFound,
                     &app, [&out](const QString& type) {
                         out << "type    " << type << Qt::endl;
                     });
    QObject::connect(bridge, &lantern::network::EventBridge::instanceAdded,
                     &app, [&out](const QString& name, const lantern::ServiceInstance& instance) {
                         out << "added   " << name << "  " << instance.addresses.join(QStringLiteral(", "))
                             << Qt::endl;
                     });
    QObject::connect(bridge, &lantern::network::EventBridge::instanceRemoved,
                     &app, [&out](const QString& name) {
                         out << "removed " << name << Qt::endl;
                     });
    QObject::connect(&controller, &lantern::ui::SessionController::error,
                     &app, [&err](const QString& message, lantern::ErrorCode code) {
                         err << "error [" << lantern::to_string(code) << "] " << message << Qt::endl;
                         if (code == lantern::ErrorCode::StartupError) {
                             QCoreApplication::exit(1);
                         }
                     });
    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &controller, &lantern::ui::SessionController::shutdown);

    controller.start(interfaceAddress);
    for (const auto& query : parser.values(queryOption)) {
        controller.submitManualQuery(query);
    }
    if (!presetName.isEmpty()) {
        controller.submitPreset(presetName);
    }

    if (runTime.count() > 0) {
        QTimer::singleShot(std::chrono::milliseconds(runTime), &app, [&]() {
            auto* table = controller.table();
            if (parser.isSet(filterOption)) {
                table->setFilter(parser.value(filterOption).trimmed());
            }

            const auto instances = table->visibleInstances();
            out << (parser.isSet(jsonOption)
                        ? lantern::ui::format_service_report_json(table->types(), instances)
                        : lantern::ui::format_service_report(table->types(), instances));
            out.flush();

            controller.shutdown();
            QCoreApplication::exit(0);
        });
    }

    return app.exec();
}
