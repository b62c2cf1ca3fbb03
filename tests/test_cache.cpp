#include <catch2/catch.hpp>
#include <kspver/cache.hpp>
#include <kspver/version.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace kspver;

TEST_CASE("MemoCache counts hits and misses", "[cache]") {
    MemoCache<std::string, int> memo;
    REQUIRE_FALSE(memo.find("a").has_value());
    memo.insert("a", 1);
    REQUIRE(memo.find("a") == std::optional<int>(1));

    auto s = memo.stats();
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 1);
    REQUIRE(s.entries == 1);

    memo.clear();
    REQUIRE(memo.stats().entries == 0);
    REQUIRE(memo.stats().hits == 0);
}

TEST_CASE("MemoCache keeps the first value for a key", "[cache]") {
    MemoCache<std::string, int> memo;
    memo.insert("k", 1);
    memo.insert("k", 2);
    REQUIRE(*memo.find("k") == 1);
}

TEST_CASE("repeated parse returns the first result", "[cache]") {
    VersionCache cache;
    auto first = GameVersion::parse(".7", cache);
    auto second = GameVersion::parse(".7", cache);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    REQUIRE(first.value() == second.value());
    REQUIRE(second.value().is_short() == first.value().is_short());
    REQUIRE(second.value().to_string() == "0.7");

    auto stats = cache.normal_stats();
    REQUIRE(stats.entries == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hits == 1);
}

TEST_CASE("repeated compare returns the first result", "[cache]") {
    VersionCache cache;
    auto a = GameVersion::parse("1.2.9", cache).value();
    auto b = GameVersion::parse("1.2.10", cache).value();

    auto first = compare(a, b, cache);
    auto second = compare(a, b, cache);
    REQUIRE(first.value() == Ordering::Less);
    REQUIRE(second.value() == first.value());
    REQUIRE(cache.order_stats().hits == 1);
}

TEST_CASE("comparison cache key is the ordered pair", "[cache]") {
    VersionCache cache;
    auto a = GameVersion::parse("1.0.0", cache).value();
    auto b = GameVersion::parse("2.0.0", cache).value();

    REQUIRE(compare(a, b, cache).value() == Ordering::Less);
    REQUIRE(compare(b, a, cache).value() == Ordering::Greater);
    REQUIRE(cache.order_stats().entries == 2);
    REQUIRE(cache.order_stats().hits == 0);
}

TEST_CASE("incomparable operands are not cached", "[cache]") {
    VersionCache cache;
    auto s = GameVersion::parse("1.2", cache).value();
    auto l = GameVersion::parse("1.2.3", cache).value();
    REQUIRE(compare(s, l, cache).is_err());
    REQUIRE(compare(s, l, cache).is_err());
    REQUIRE(cache.order_stats().entries == 0);
}

TEST_CASE("equality does not touch the comparison cache", "[cache]") {
    VersionCache cache;
    auto a = GameVersion::parse("1.2.3", cache).value();
    auto b = GameVersion::parse("1.2.3", cache).value();
    REQUIRE(a == b);
    auto stats = cache.order_stats();
    REQUIRE(stats.hits + stats.misses == 0);
}

TEST_CASE("disabled cache gives the same answers", "[cache]") {
    VersionCache on;
    VersionCache off;
    off.set_enabled(false);
    REQUIRE_FALSE(off.enabled());

    for (const char* s : {".5", "0.25", "0.25.2", "any", "1.2.3.4"}) {
        auto x = GameVersion::parse(s, on);
        auto y = GameVersion::parse(s, off);
        REQUIRE(x.value() == y.value());
        REQUIRE(x.value().is_short() == y.value().is_short());
    }
    auto filter_on = GameVersion::parse("0.25", on).value();
    auto filter_off = GameVersion::parse("0.25", off).value();
    auto release = GameVersion::parse("0.25.7", off).value();
    REQUIRE(filter_on.targets(release, on).value() == filter_off.targets(release, off).value());

    REQUIRE(off.normal_stats().entries == 0);
    REQUIRE(off.order_stats().entries == 0);
}

TEST_CASE("clear() empties both maps", "[cache]") {
    VersionCache cache;
    auto a = GameVersion::parse("3.0.0", cache).value();
    auto b = GameVersion::parse("3.0.1", cache).value();
    REQUIRE(compare(a, b, cache).is_ok());
    cache.clear();
    REQUIRE(cache.normal_stats().entries == 0);
    REQUIRE(cache.order_stats().entries == 0);
    REQUIRE(compare(a, b, cache).value() == Ordering::Less);
}

TEST_CASE("shared cache is a single instance", "[cache]") {
    REQUIRE(&VersionCache::shared() == &VersionCache::shared());
}

TEST_CASE("concurrent parse and compare agree", "[cache]") {
    VersionCache cache;
    const std::vector<std::string> inputs = {
        "0.23", "0.23.5", ".24", "0.24.2", "0.25.0", "1.0.5", "1.2.10", "1.2.9"};

    std::vector<std::thread> workers;
    std::vector<int> failures(8, 0);
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            for (int round = 0; round < 200; ++round) {
                for (const auto& s : inputs) {
                    auto a = GameVersion::parse(s, cache);
                    if (a.is_err()) { ++failures[t]; continue; }
                    auto lo = a.value().to_long_min();
                    auto ord = compare(lo, lo.to_long_max(), cache);
                    if (ord.is_err() || ord.value() != Ordering::Equal) ++failures[t];
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int f : failures) REQUIRE(f == 0);
    REQUIRE(cache.normal_stats().entries == inputs.size());
}
