#include <catch2/catch_test_macros.hpp>
#include <quiver/index/tombstone_set.hpp>

#include <thread>
#include <vector>

using quiver::index::TombstoneSet;
using quiver::core::error_code;

TEST_CASE("tombstone set marks slots once", "[tombstone]") {
    TombstoneSet set;
    REQUIRE(set.count() == 0);
    REQUIRE(set.mark(7).has_value());
    REQUIRE(set.mark(3).has_value());
    REQUIRE(set.mark(100000).has_value());
    REQUIRE(set.mark(7).error().code == error_code::precondition_failed);
    REQUIRE(set.count() == 3);

    set.clear();
    REQUIRE(set.count() == 0);
    REQUIRE(set.mark(7).has_value());
}

TEST_CASE("tombstone set compaction threshold", "[tombstone]") {
    TombstoneSet set;
    for (std::uint32_t i = 0; i < 25; ++i) REQUIRE(set.mark(i).has_value());
    REQUIRE(set.needs_compaction(100, 0.25));
    REQUIRE_FALSE(set.needs_compaction(100, 0.3));
    REQUIRE_FALSE(set.needs_compaction(100, 0.0));
    REQUIRE_FALSE(set.needs_compaction(0, 0.1));
}

TEST_CASE("tombstone set is safe under concurrent marking", "[tombstone][concurrency]") {
    TombstoneSet set;
    std::vector<std::thread> threads;
    for (std::uint32_t t = 0; t < 4; ++t) {
        threads.emplace_back([&set, t] {
            for (std::uint32_t i = 0; i < 1000; ++i) {
                (void)set.mark(t * 1000 + i);
                (void)set.count();
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(set.count() == 4000);
}
