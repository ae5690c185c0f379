#include <catch2/catch_test_macros.hpp>
#include "core/logging.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace lantern;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* name) : name_(name) {}
    ~EnvGuard() { qunsetenv(name_); }
    const char* name_;
};

QString read_all(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString{};
    }
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST_CASE("Default log file lives under the app data directory", "[logging]") {
    qunsetenv("LANTERN_LOG_FILE");

    const QString path = default_log_file_path();

    REQUIRE_FALSE(path.isEmpty());
    REQUIRE(path.endsWith(QStringLiteral("logs/lantern.log")));
}

TEST_CASE("LANTERN_LOG_FILE overrides the log file path", "[logging]") {
    EnvGuard guard("LANTERN_LOG_FILE");
    qputenv("LANTERN_LOG_FILE", "/tmp/lantern-custom.log");

    REQUIRE(default_log_file_path() == QStringLiteral("/tmp/lantern-custom.log"));
}

TEST_CASE("File logging writes timestamped category lines", "[logging]") {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("nested/logs/lantern.log"));

    auto installed = install_file_logging(path);
    REQUIRE(installed.is_ok());
    qCInfo(lanternSessionLog) << "session 7 started";
    uninstall_file_logging();
    qCInfo(lanternSessionLog) << "after uninstall";

    const QString contents = read_all(path);
    REQUIRE(contents.contains(QStringLiteral(" I lantern.session ")));
    REQUIRE(contents.contains(QStringLiteral("session 7 started")));
    REQUIRE_FALSE(contents.contains(QStringLiteral("after uninstall")));
}

TEST_CASE("File logging reports a path it cannot open", "[logging]") {
    QTemporaryDir dir;
    // A directory where the file should be.
    const QString path = dir.filePath(QStringLiteral("taken"));
    REQUIRE(QDir().mkpath(path));

    auto installed = install_file_logging(path);

    REQUIRE(installed.is_err());
    REQUIRE(installed.unwrap_err().code == ErrorCode::ConfigurationError);
}

TEST_CASE("File logging rejects an empty path", "[logging]") {
    auto installed = install_file_logging(QString{});

    REQUIRE(installed.is_err());
    REQUIRE(installed.unwrap_err().code == ErrorCode::ConfigurationError);
}
