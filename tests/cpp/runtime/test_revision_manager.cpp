#include "../revscope_test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

namespace revscope::test {

namespace {
    /**
     * Keeps the versions it is given in memory, newest last. Deleted objects are the ones named in ``live_ids``
     * that are absent.
     */
    struct MemoryVersionStore : VersionStore {
        std::vector<VersionRecord> versions_for_object(const RevisionManager &, const VersionId &id,
                                                       const std::string &db) const override {
            last_db = db;
            std::vector<VersionRecord> result;
            for (auto it = records.rbegin(); it != records.rend(); ++it) {
                if (it->data.version_id() == id) { result.push_back(*it); }
            }
            return result;
        }

        std::vector<VersionRecord> deleted_versions(const RevisionManager &, const std::string &app_label,
                                                    const std::string &model_name, const std::string &db,
                                                    const std::string &model_db) const override {
            last_db = db;
            last_model_db = model_db;
            std::vector<VersionRecord> result;
            for (auto it = records.rbegin(); it != records.rend(); ++it) {
                if (it->data.app_label == app_label && it->data.model_name == model_name &&
                    !live_ids.contains(it->data.object_id)) {
                    result.push_back(*it);
                }
            }
            return result;
        }

        VersionRecord &add(std::string model_name, std::string object_id, revision_time_t when) {
            VersionRecord record;
            record.id = static_cast<int64_t>(records.size()) + 1;
            record.date_created = when;
            record.data.app_label = "library";
            record.data.model_name = std::move(model_name);
            record.data.object_id = std::move(object_id);
            return records.emplace_back(std::move(record));
        }

        std::vector<VersionRecord> records;
        std::set<std::string> live_ids;
        mutable std::string last_db;
        mutable std::string last_model_db;
    };

    struct TitleOnlyAdapter : VersionAdapter {
        using VersionAdapter::VersionAdapter;

        std::vector<std::string> get_fields_to_serialize() const override { return {"title"}; }
    };

    revision_time_t at(int seconds) { return revision_time_t{std::chrono::seconds{seconds}}; }
}

// ============================================================================
// Slugs
// ============================================================================

TEST_CASE("Slugs are claimed by one live manager", "[revision_manager][slug]") {
    auto manager{RevisionManager::create("mgr_unique")};
    REQUIRE(RevisionManager::has_manager("mgr_unique"));
    REQUIRE(RevisionManager::get_manager("mgr_unique") == manager);
    REQUIRE_THROWS_AS(RevisionManager::create("mgr_unique"), RegistrationError);

    {
        auto created{RevisionManager::get_created_managers()};
        REQUIRE(std::any_of(created.begin(), created.end(),
                            [](const auto &entry) { return entry.first == "mgr_unique"; }));
    }

    manager.reset();
    REQUIRE_FALSE(RevisionManager::has_manager("mgr_unique"));
    REQUIRE_THROWS_AS(RevisionManager::get_manager("mgr_unique"), RegistrationError);

    // The slug can be claimed again once released.
    auto replacement{RevisionManager::create("mgr_unique")};
    REQUIRE(RevisionManager::get_manager("mgr_unique") == replacement);
}

TEST_CASE("Closing a manager releases its slug and registrations", "[revision_manager][slug]") {
    ChangeEventDispatcher dispatcher;
    auto manager{RevisionManager::create("mgr_close", {}, &dispatcher)};
    manager->register_model(author_type());
    REQUIRE(dispatcher.has_receivers(author_type(), post_save));

    manager->close();
    REQUIRE(manager->is_closed());
    REQUIRE_FALSE(RevisionManager::has_manager("mgr_close"));
    REQUIRE_FALSE(dispatcher.has_receivers(author_type(), post_save));
    REQUIRE_FALSE(manager->is_registered(author_type()));
    REQUIRE_THROWS_AS(manager->register_model(author_type()), RegistrationError);

    // Closing again is a no-op, and a closed manager does not release a slug someone else now holds.
    auto successor{RevisionManager::create("mgr_close")};
    manager->close();
    manager.reset();
    REQUIRE(RevisionManager::get_manager("mgr_close") == successor);
}

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("Registering subscribes to every configured event", "[revision_manager][registration]") {
    ManagerFixture fixture{"mgr_register"};
    AdapterOverrides overrides;
    overrides.eager_signals = std::vector<ChangeEvent>{pre_delete};

    REQUIRE(&fixture.manager->register_model(book_type(), overrides) == &book_type());
    REQUIRE(fixture.manager->is_registered(book_type()));
    REQUIRE_FALSE(fixture.manager->is_registered(ebook_type()));
    REQUIRE(fixture.dispatcher.has_receivers(book_type(), post_save));
    REQUIRE(fixture.dispatcher.has_receivers(book_type(), pre_delete));
    REQUIRE(fixture.manager->get_registered_models() == std::vector<const EntityType *>{&book_type()});

    fixture.manager->unregister(book_type());
    REQUIRE_FALSE(fixture.manager->is_registered(book_type()));
    REQUIRE_FALSE(fixture.dispatcher.has_receivers(book_type(), post_save));
    REQUIRE_FALSE(fixture.dispatcher.has_receivers(book_type(), pre_delete));
}

TEST_CASE("Registration errors", "[revision_manager][registration]") {
    ManagerFixture fixture{"mgr_register_errors"};
    fixture.manager->register_model(author_type());
    REQUIRE_THROWS_AS(fixture.manager->register_model(author_type()), RegistrationError);
    REQUIRE_THROWS_AS(fixture.manager->unregister(book_type()), RegistrationError);
    REQUIRE_THROWS_AS(fixture.manager->get_adapter(book_type()), RegistrationError);
    REQUIRE_THROWS_AS(fixture.manager->register_model(book_type(), {}, AdapterFactory{}), RegistrationError);
    REQUIRE_THROWS_AS(fixture.manager->register_model(book_type(), {}, [](const EntityType &) {
        return std::unique_ptr<VersionAdapter>{};
    }), RegistrationError);
}

TEST_CASE("The same type can be registered with different managers", "[revision_manager][registration]") {
    ManagerFixture first{"mgr_shared_first"};
    ManagerFixture second{"mgr_shared_second"};
    first.manager->register_model(author_type());
    second.manager->register_model(author_type(), {.format = "json", .for_concrete_model = false});

    REQUIRE(first.manager->get_adapter(author_type())->for_concrete_model);
    REQUIRE_FALSE(second.manager->get_adapter(author_type())->for_concrete_model);
}

TEST_CASE("Adapter factories customise behaviour beyond the overrides", "[revision_manager][registration]") {
    ManagerFixture fixture{"mgr_factory"};
    AdapterOverrides overrides;
    overrides.follow = std::vector<std::string>{"author"};
    fixture.manager->register_model(book_type(), overrides, [](const EntityType &type) {
        return std::make_unique<TitleOnlyAdapter>(type);
    });

    auto adapter{fixture.manager->get_adapter(book_type())};
    REQUIRE(dynamic_cast<const TitleOnlyAdapter *>(adapter.get()) != nullptr);
    REQUIRE(adapter->get_fields_to_serialize() == std::vector<std::string>{"title"});
    REQUIRE(adapter->follow == std::vector<std::string>{"author"});
}

// ============================================================================
// Following relationships
// ============================================================================

TEST_CASE("Following relationships visits each reachable object once", "[revision_manager][follow]") {
    ManagerFixture fixture{"mgr_follow"};
    fixture.manager->register_model(book_type(), {.follow = std::vector<std::string>{"author"}});
    fixture.manager->register_model(author_type(), {.follow = std::vector<std::string>{"books"}});

    auto author{make_entity(author_type(), "a1")};
    auto book1{make_entity(book_type(), "b1")};
    auto book2{make_entity(book_type(), "b2")};
    book1->relations["author"] = entity_ptr{author};
    book2->relations["author"] = entity_ptr{author};
    author->relations["books"] = entity_list{book1, book2};

    auto followed{fixture.manager->follow_relationships(book1)};
    REQUIRE(pks(followed) == std::vector<std::string>{"b1", "a1", "b2"});

    author->relations.clear();
}

TEST_CASE("Following terminates on cycles", "[revision_manager][follow]") {
    ManagerFixture fixture{"mgr_follow_cycle"};
    fixture.manager->register_model(node_type(), {.follow = std::vector<std::string>{"next"}});

    std::vector<std::shared_ptr<FakeEntity>> ring;
    for (int i = 0; i < 5; ++i) { ring.push_back(make_entity(node_type(), std::to_string(i))); }
    for (std::size_t i = 0; i < ring.size(); ++i) { ring[i]->relations["next"] = entity_ptr{ring[(i + 1) % ring.size()]}; }
    // A second handle to the same stored row is the same object.
    ring[2]->relations["next"] = entity_list{ring[3], make_entity(node_type(), "0")};

    auto followed{fixture.manager->follow_relationships(ring[0])};
    REQUIRE(followed.size() == 5);
    REQUIRE(pk_set(followed) == std::set<std::string>{"0", "1", "2", "3", "4"});

    for (auto &node: ring) { node->relations.clear(); }
}

TEST_CASE("Unsaved and missing objects end the branch", "[revision_manager][follow]") {
    ManagerFixture fixture{"mgr_follow_unsaved"};
    fixture.manager->register_model(book_type(), {.follow = std::vector<std::string>{"author", "editor"}});
    fixture.manager->register_model(author_type());

    auto book{make_entity(book_type(), "b1")};
    book->relations["author"] = entity_ptr{make_entity(author_type(), std::nullopt)};
    book->missing.insert("editor");
    REQUIRE(pks(fixture.manager->follow_relationships(book)) == std::vector<std::string>{"b1"});

    auto unsaved{make_entity(book_type(), std::nullopt)};
    REQUIRE(fixture.manager->follow_relationships(unsaved).empty());
}

TEST_CASE("Following into an unregistered type is a registration error", "[revision_manager][follow]") {
    ManagerFixture fixture{"mgr_follow_unregistered"};
    fixture.manager->register_model(book_type(), {.follow = std::vector<std::string>{"author"}});

    auto book{make_entity(book_type(), "b1")};
    book->relations["author"] = entity_ptr{make_entity(author_type(), "a1")};
    REQUIRE_THROWS_AS(fixture.manager->follow_relationships(book), RegistrationError);
}

// ============================================================================
// Eager capture
// ============================================================================

TEST_CASE("Eager events snapshot the entity and its followed relations", "[revision_manager][eager]") {
    ManagerFixture fixture{"mgr_eager"};
    fixture.manager->register_model(book_type(), {
        .fields = std::vector<std::string>{"title"},
        .follow = std::vector<std::string>{"author"},
        .eager_signals = std::vector<ChangeEvent>{pre_delete},
    });
    fixture.manager->register_model(author_type(), {.fields = std::vector<std::string>{"name"}});
    auto &context{fixture.manager->context_manager()};

    auto author{make_entity(author_type(), "a1", {{"name", std::string{"Herbert"}}})};
    auto book{make_entity(book_type(), "b1", {{"title", std::string{"Dune"}}})};
    book->relations["author"] = entity_ptr{author};

    context.create_revision()([&] {
        fixture.dispatcher.send(pre_delete, book);
        // The entity is gone by the time the revision closes, the snapshot is what survives.
        book->values["title"] = std::string{"changed after delete"};
        book->primary_key.reset();
    });

    REQUIRE(fixture.observer.revisions.size() == 1);
    const auto &revision{fixture.observer.revisions.front()};
    REQUIRE(revision.objects.empty());
    REQUIRE(revision.serialized_objects.size() == 2);
    REQUIRE(revision.serialized_objects[0].version_id() == VersionId{"library", "book", "b1"});
    REQUIRE(revision.serialized_objects[0].serialized_data == "title=Dune");
    REQUIRE(revision.serialized_objects[1].serialized_data == "name=Herbert");
}

TEST_CASE("A later save replaces an eager snapshot of the same object", "[revision_manager][eager]") {
    ManagerFixture fixture{"mgr_eager_replace"};
    fixture.manager->register_model(author_type(), {.eager_signals = std::vector<ChangeEvent>{pre_delete}});
    auto &context{fixture.manager->context_manager()};

    auto author{make_entity(author_type(), "a1")};
    context.create_revision()([&] {
        fixture.dispatcher.send(pre_delete, author);
        fixture.dispatcher.send(post_save, author);
    });

    const auto &revision{fixture.observer.revisions.front()};
    REQUIRE(revision.objects.size() == 1);
    REQUIRE(revision.serialized_objects.empty());
}

TEST_CASE("Proxies share the concrete object's entry", "[revision_manager]") {
    ManagerFixture fixture{"mgr_proxy"};
    fixture.manager->register_model(book_type());
    fixture.manager->register_model(ebook_type());
    auto &context{fixture.manager->context_manager()};

    context.create_revision()([&] {
        fixture.dispatcher.send(post_save, make_entity(book_type(), "1"));
        fixture.dispatcher.send(post_save, make_entity(ebook_type(), "1"));
    });

    const auto &objects{fixture.observer.revisions.front().objects};
    REQUIRE(objects.size() == 1);
    REQUIRE(&objects.front()->entity_type() == &ebook_type());
}

TEST_CASE("Revisions are delivered per manager", "[revision_manager]") {
    ChangeEventDispatcher dispatcher;
    RecordingObserver first_observer;
    RecordingObserver second_observer;
    auto first{RevisionManager::create("mgr_multi_first", {}, &dispatcher)};
    auto second{RevisionManager::create("mgr_multi_second", {}, &dispatcher)};
    first->add_revision_observer(&first_observer);
    second->add_revision_observer(&second_observer);
    first->register_model(author_type());
    second->register_model(book_type());

    first->create_revision()([&] {
        dispatcher.send(post_save, make_entity(author_type(), "a1"));
        dispatcher.send(post_save, make_entity(book_type(), "b1"));
    });

    REQUIRE(first_observer.revisions.size() == 1);
    REQUIRE(pks(first_observer.revisions.front().objects) == std::vector<std::string>{"a1"});
    REQUIRE(second_observer.revisions.size() == 1);
    REQUIRE(second_observer.revisions.front().manager == second.get());
    REQUIRE(pks(second_observer.revisions.front().objects) == std::vector<std::string>{"b1"});

    second->remove_revision_observer(&second_observer);
    first->close();
    second->close();
}

TEST_CASE("Objects captured for a destroyed manager are dropped", "[revision_manager]") {
    ChangeEventDispatcher dispatcher;
    auto manager{RevisionManager::create("mgr_destroyed", {}, &dispatcher)};
    manager->register_model(author_type());
    auto &context{manager->context_manager()};

    REQUIRE_NOTHROW(context.create_revision()([&] {
        dispatcher.send(post_save, make_entity(author_type(), "a1"));
        manager.reset();
    }));
    REQUIRE_FALSE(context.is_active());
}

// ============================================================================
// Queries
// ============================================================================

TEST_CASE("Queries need a version store", "[revision_manager][queries]") {
    ManagerFixture fixture{"mgr_no_store"};
    REQUIRE_THROWS_AS(fixture.manager->get_for_object_reference(book_type(), "1"), RevisionManagementError);
}

TEST_CASE("Queries delegate to the version store", "[revision_manager][queries]") {
    ManagerFixture fixture{"mgr_queries"};
    fixture.manager->register_model(book_type());
    auto store{std::make_shared<MemoryVersionStore>()};
    fixture.manager->set_version_store(store);
    REQUIRE(fixture.manager->version_store() == store);

    store->add("book", "1", at(10));
    store->add("book", "2", at(20));
    store->add("book", "1", at(30));
    store->live_ids.insert("1");

    auto book{make_entity(book_type(), "1")};
    auto versions{fixture.manager->get_for_object(*book, "db_a")};
    REQUIRE(versions.size() == 2);
    REQUIRE(versions.front().date_created == at(30));
    REQUIRE(store->last_db == "db_a");

    // Proxies are looked up under the concrete labels.
    REQUIRE(fixture.manager->get_for_object(*make_entity(ebook_type(), "1")).size() == 2);
    REQUIRE(fixture.manager->get_for_object(*make_entity(book_type(), std::nullopt)).empty());

    REQUIRE(fixture.manager->get_for_date(*book, at(20))->date_created == at(10));
    REQUIRE(fixture.manager->get_for_date(*book, at(30))->date_created == at(30));
    REQUIRE_FALSE(fixture.manager->get_for_date(*book, at(5)).has_value());

    auto deleted{fixture.manager->get_deleted(book_type(), "db_a")};
    REQUIRE(deleted.size() == 1);
    REQUIRE(deleted.front().data.object_id == "2");
    REQUIRE(store->last_model_db == "db_a");
    static_cast<void>(fixture.manager->get_deleted(book_type(), "db_a", "db_b"));
    REQUIRE(store->last_model_db == "db_b");
}

// ============================================================================
// Default manager
// ============================================================================

TEST_CASE("The module level API uses the default manager", "[revision_manager][default]") {
    install_test_codec();
    static EntityType journal_type{"library", "journal", {FieldDescriptor::value("id")}};
    RecordingObserver observer;
    default_revision_manager().add_revision_observer(&observer);
    REQUIRE(RevisionManager::get_manager("default").get() == &default_revision_manager());

    revscope::register_model(journal_type);
    REQUIRE(revscope::is_registered(journal_type));
    REQUIRE(revscope::get_adapter(journal_type)->get_fields_to_serialize() == std::vector<std::string>{"id"});
    auto registered{revscope::get_registered_models()};
    REQUIRE(std::find(registered.begin(), registered.end(), &journal_type) != registered.end());

    revscope::create_revision()([&] {
        revscope::set_user(Actor{"7", "Grace"});
        revscope::set_ignore_duplicates(true);
        revscope::add_meta<CommentMeta>("imported");
        ChangeEventDispatcher::instance().send(post_save, make_entity(journal_type, "j1"));
        REQUIRE(revscope::get_user() == Actor{"7", "Grace"});
        REQUIRE(revscope::get_ignore_duplicates());
    });

    REQUIRE(observer.revisions.size() == 1);
    REQUIRE(observer.revisions.front().user == Actor{"7", "Grace"});
    REQUIRE(observer.revisions.front().meta.size() == 1);

    revscope::unregister(journal_type);
    REQUIRE_FALSE(revscope::is_registered(journal_type));
    REQUIRE_THROWS_AS(revscope::get_for_object_reference(journal_type, "j1"), RevisionManagementError);
    default_revision_manager().remove_revision_observer(&observer);
}

} // namespace revscope::test
