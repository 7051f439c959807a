#include "../revscope_test_support.h"

#include <catch2/catch_test_macros.hpp>

namespace revscope::test {

TEST_CASE("AtomicBlock commits when closed and rolls back when dropped", "[transaction]") {
    auto resource{std::make_shared<RecordingResource>("atomic_a")};
    {
        AtomicBlock outer{resource};
        {
            AtomicBlock inner{resource};
            REQUIRE(resource->depth == 2);
        }
        outer.close(true);
        REQUIRE_FALSE(outer.is_open());
        // Closing twice is a no-op.
        outer.close(false);
    }
    REQUIRE(resource->log == std::vector<std::string>{"begin", "savepoint", "rollback_to_savepoint", "commit"});
}

TEST_CASE("The default alias is always available", "[transaction]") {
    auto &registry{ResourceRegistry::instance()};
    REQUIRE(registry.has_resource(""));
    auto resource{registry.get_resource("")};
    REQUIRE(resource->alias() == config().default_db);

    auto in_process{std::dynamic_pointer_cast<InProcessResource>(resource)};
    REQUIRE(in_process);
    {
        AtomicBlock block{resource};
        REQUIRE(in_process->depth() == 1);
    }
    REQUIRE(in_process->depth() == 0);
}

TEST_CASE("Resources are looked up by alias", "[transaction]") {
    auto &registry{ResourceRegistry::instance()};
    REQUIRE_THROWS_AS(registry.get_resource("transaction_missing"), RevisionManagementError);

    registry.register_resource(std::make_shared<RecordingResource>("transaction_other"));
    REQUIRE(registry.get_resource("transaction_other")->alias() == "transaction_other");
    registry.unregister_resource("transaction_other");
    REQUIRE_FALSE(registry.has_resource("transaction_other"));
}

TEST_CASE("A failed rollback in the destructor is logged", "[transaction]") {
    struct FailingResource : RecordingResource {
        using RecordingResource::RecordingResource;

        void exit_atomic(bool commit) override {
            RecordingResource::exit_atomic(commit);
            throw 7;
        }
    };

    auto resource{std::make_shared<FailingResource>("atomic_failing")};
    REQUIRE_NOTHROW([&] { AtomicBlock block{resource}; }());
    REQUIRE(resource->log == std::vector<std::string>{"begin", "rollback"});
}

TEST_CASE("Unbalanced exits are reported by the in-process resource", "[transaction]") {
    InProcessResource resource{"transaction_unbalanced"};
    REQUIRE_THROWS_AS(resource.exit_atomic(true), RevisionManagementError);
}

} // namespace revscope::test
