#include <catch2/catch.hpp>
#include <kspver/result.hpp>
#include <kspver/version.hpp>
#include <memory>
#include <string>

using namespace kspver;

// Parses both sides and reports whether `filter` targets `release`
static Result<bool> parse_and_target(const std::string& filter,
                                     const std::string& release) {
    auto f = GameVersion::parse(filter);
    KSPVER_TRY(f);
    auto r = GameVersion::parse(release);
    KSPVER_TRY(r);
    return f.value().targets(r.value());
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(99);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 99);
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(KspVerError{KspVerError::BadVersion, "bad"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == KspVerError::BadVersion);
    REQUIRE(r.error().message == "bad");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(KspVerError{KspVerError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or_throw() raises VersionException on Err", "[result]") {
    auto r = Result<int>::err(KspVerError{KspVerError::Incomparable, "1.2 and 1.2.3"});
    REQUIRE_THROWS_AS(r.value_or_throw(), VersionException);
    try {
        r.value_or_throw();
    } catch (const VersionException& e) {
        REQUIRE(e.error().code == KspVerError::Incomparable);
        REQUIRE(std::string(e.what()).find("error[Incomparable]") != std::string::npos);
    }

    auto ok = Result<int>::ok(3);
    REQUIRE(ok.value_or_throw() == 3);
}

TEST_CASE("map() and and_then() over a parsed version", "[result]") {
    auto text = GameVersion::parse("1.4").map([](GameVersion& v) {
        return v.to_long_max().to_string();
    });
    REQUIRE(text.is_ok());
    REQUIRE(text.value() == "1.4.99");

    auto chained = GameVersion::parse("1.4").and_then([](GameVersion& v) {
        return v.short_form();
    });
    REQUIRE(chained.is_ok());
    REQUIRE(chained.value().to_string() == "1.4");
}

TEST_CASE("map() passes through Err", "[result]") {
    bool called = false;
    auto mapped = GameVersion::parse("x.y").map([&](GameVersion& v) {
        called = true;
        return v.to_string();
    });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().code == KspVerError::BadVersion);
}

TEST_CASE("KSPVER_TRY propagates the first error", "[result]") {
    auto bad_filter = parse_and_target("1..2", "1.2.3");
    REQUIRE(bad_filter.is_err());
    REQUIRE(bad_filter.error().code == KspVerError::BadVersion);
    REQUIRE(bad_filter.error().message.find("1..2") != std::string::npos);

    auto bad_release = parse_and_target("1.2", "v1.2.3");
    REQUIRE(bad_release.is_err());
    REQUIRE(bad_release.error().message.find("v1.2.3") != std::string::npos);
}

TEST_CASE("KSPVER_TRY passes through Ok", "[result]") {
    auto r = parse_and_target("0.25", "0.25.2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value());
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);
}

TEST_CASE("KspVerError format() output", "[error]") {
    KspVerError e{KspVerError::Config, "unknown log level 'loud'",
                  "expected one of: trace, debug, info, warn, error",
                  "config.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("unknown log level 'loud'") != std::string::npos);
    REQUIRE(formatted.find("hint: expected one of") != std::string::npos);
    REQUIRE(formatted.find("--> config.toml:3") != std::string::npos);
}

TEST_CASE("KspVerError format() without hint or file", "[error]") {
    KspVerError e{KspVerError::BadVersion, "'abc' is not a valid game version"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[BadVersion]: 'abc' is not a valid game version");
}

TEST_CASE("KspVerError code_name() for all codes", "[error]") {
    REQUIRE(std::string(KspVerError::code_name(KspVerError::BadVersion)) == "BadVersion");
    REQUIRE(std::string(KspVerError::code_name(KspVerError::Incomparable)) == "Incomparable");
    REQUIRE(std::string(KspVerError::code_name(KspVerError::Parse)) == "Parse");
    REQUIRE(std::string(KspVerError::code_name(KspVerError::IO)) == "IO");
    REQUIRE(std::string(KspVerError::code_name(KspVerError::Config)) == "Config");
    REQUIRE(std::string(KspVerError::code_name(KspVerError::InvalidArg)) == "InvalidArg");
}
