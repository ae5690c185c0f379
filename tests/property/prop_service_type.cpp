#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/service_type.hpp"

using namespace lantern;

namespace {

// Service-type-like text: labels, dots and whitespace in any arrangement.
rc::Gen<std::string> service_text() {
    return rc::gen::container<std::string>(
        rc::gen::elementOf(std::string("_abc.-local tcp\t")));
}

} // namespace

TEST_CASE("Property: normalization is idempotent", "[property][service_type]") {
    REQUIRE(rc::check("normalize(normalize(s)) == normalize(s)",
        [](const std::string& raw) {
            const auto text = QString::fromStdString(raw);
            const auto once = normalize_service_type(text);
            RC_ASSERT(normalize_service_type(once) == once);
            return true;
        }
    ));

    REQUIRE(rc::check("idempotent on service-type-like text",
        []() {
            const auto text = QString::fromStdString(*service_text());
            const auto once = normalize_service_type(text);
            RC_ASSERT(normalize_service_type(once) == once);
            return true;
        }
    ));
}

TEST_CASE("Property: normalized types end with the local domain", "[property][service_type]") {
    REQUIRE(rc::check("non-empty results end with .local.",
        []() {
            const auto text = QString::fromStdString(*service_text());
            const auto normalized = normalize_service_type(text);
            if (text.trimmed().isEmpty()) {
                RC_ASSERT(normalized.isEmpty());
            } else {
                RC_ASSERT(normalized.endsWith(QStringLiteral(".local.")));
            }
            return true;
        }
    ));
}

TEST_CASE("Property: derived types have at most four labels", "[property][service_type]") {
    REQUIRE(rc::check("derive keeps the tail of the name",
        []() {
            const auto name = QString::fromStdString(*service_text());
            const auto derived = derive_service_type(name);
            RC_ASSERT(derived.split(QLatin1Char('.')).size() <= 4);
            RC_ASSERT(name.endsWith(derived));
            return true;
        }
    ));
}
