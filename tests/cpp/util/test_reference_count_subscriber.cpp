#include <revscope/util/reference_count_subscriber.h>

#include <catch2/catch_test_macros.hpp>

#include <vector>

namespace revscope::test {

TEST_CASE("Subscribers are removed once every subscription is released", "[subscriber]") {
    ReferenceCountSubscriber<int> subscriber;
    subscriber.subscribe(1);
    subscriber.subscribe(1);
    subscriber.subscribe(2);
    REQUIRE(subscriber.size() == 2);

    REQUIRE_FALSE(subscriber.un_subscribe(1));
    REQUIRE(subscriber.contains(1));
    REQUIRE(subscriber.un_subscribe(1));
    REQUIRE_FALSE(subscriber.contains(1));

    // Unknown subscribers are ignored.
    REQUIRE_FALSE(subscriber.un_subscribe(3));
}

TEST_CASE("apply visits subscribers in subscription order", "[subscriber]") {
    ReferenceCountSubscriber<int> subscriber;
    for (int i: {3, 1, 2}) { subscriber.subscribe(i); }

    std::vector<int> seen;
    subscriber.apply([&seen](int v) { seen.push_back(v); });
    REQUIRE(seen == std::vector<int>{3, 1, 2});
}

} // namespace revscope::test
