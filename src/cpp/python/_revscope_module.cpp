/*
 * The entry point into the python _revscope module, exposing revision blocks, the user and comment accessors
 * and the revision managers to python.
 *
 * Entities are implemented in python by sub-classing ``Entity``, change events are raised with
 * ``ChangeEventDispatcher.send`` from whatever layer performs the mutation.
 */
#include <revscope/revscope.h>

#include <nanobind/nanobind.h>
#include <nanobind/trampoline.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <ankerl/unordered_dense.h>

#include <mutex>
#include <set>
#include <thread>

namespace nb = nanobind;
using namespace nb::literals;

namespace revscope {
    namespace {
        // Event names from python need static storage, they are interned for the life-time of the module.
        ChangeEvent intern_event(const std::string &name) {
            static std::mutex lock;
            static std::set<std::string, std::less<>> names;
            std::lock_guard guard{lock};
            auto it{names.insert(name).first};
            return ChangeEvent{*it};
        }

        std::vector<ChangeEvent> intern_events(const std::vector<std::string> &names) {
            std::vector<ChangeEvent> events;
            events.reserve(names.size());
            for (const auto &name: names) { events.push_back(intern_event(name)); }
            return events;
        }

        std::vector<std::string> event_names(const std::vector<ChangeEvent> &events) {
            std::vector<std::string> names;
            names.reserve(events.size());
            for (const auto &event: events) { names.emplace_back(event.name); }
            return names;
        }

        struct PyEntity : Entity {
            NB_TRAMPOLINE(Entity, 6);

            const EntityType &entity_type() const override { NB_OVERRIDE_PURE(entity_type); }

            std::optional<std::string> pk() const override { NB_OVERRIDE_PURE(pk); }

            FieldValue field(std::string_view attname) const override { NB_OVERRIDE_PURE(field, attname); }

            RelationValue relation(std::string_view name) const override { NB_OVERRIDE_PURE(relation, name); }

            std::string repr() const override { NB_OVERRIDE(repr); }

            std::string database() const override { NB_OVERRIDE(database); }
        };

        struct PyRevisionObserver : RevisionObserver {
            NB_TRAMPOLINE(RevisionObserver, 1);

            void on_revision_ready(const RevisionReady &revision) override {
                NB_OVERRIDE_PURE(on_revision_ready, revision);
            }
        };

        struct PySerializationCodec : SerializationCodec {
            NB_TRAMPOLINE(SerializationCodec, 2);

            std::string format() const override { NB_OVERRIDE_PURE(format); }

            std::string serialize(const Entity &entity, const std::vector<std::string> &field_names) const override {
                NB_OVERRIDE_PURE(serialize, entity, field_names);
            }
        };

        /**
         * ``with revision_scope:`` support, each ``__enter__`` opens a new block so the scope is reusable. Open blocks
         * are kept per thread, a scope shared between threads enters each thread's own revision.
         */
        struct PyRevisionScope {
            using block_stack = std::vector<std::unique_ptr<RevisionBlock>>;

            struct OpenBlocks {
                std::mutex lock;
                ankerl::unordered_dense::map<std::thread::id, block_stack> by_thread;
            };

            explicit PyRevisionScope(RevisionContext context_)
                : context{std::move(context_)}, open_blocks{std::make_shared<OpenBlocks>()} {}

            void enter() {
                auto block{std::make_unique<RevisionBlock>(context)};
                std::lock_guard guard{open_blocks->lock};
                open_blocks->by_thread[std::this_thread::get_id()].push_back(std::move(block));
            }

            bool exit(nb::handle exc_type, nb::handle, nb::handle) {
                std::unique_ptr<RevisionBlock> block;
                {
                    std::lock_guard guard{open_blocks->lock};
                    auto it{open_blocks->by_thread.find(std::this_thread::get_id())};
                    if (it == open_blocks->by_thread.end() || it->second.empty()) {
                        throw_error<RevisionManagementError>("The revision scope was not entered on this thread");
                    }
                    block = std::move(it->second.back());
                    it->second.pop_back();
                    if (it->second.empty()) { open_blocks->by_thread.erase(it); }
                }
                if (exc_type.is_none()) {
                    block->close();
                } else {
                    block->abort();
                }
                return false;
            }

            RevisionContext context;
            std::shared_ptr<OpenBlocks> open_blocks;
        };
    }
} // namespace revscope

NB_MODULE(_revscope, m) {
    using namespace revscope;
    m.doc() = "Nested, transactional change capture";

    auto base_error = nb::exception<RevscopeError>(m, "RevscopeError");
    nb::exception<RevisionManagementError>(m, "RevisionManagementError", base_error);
    nb::exception<RegistrationError>(m, "RegistrationError", base_error);
    nb::exception<RelationshipError>(m, "RelationshipError", base_error);
    nb::exception<SerializationError>(m, "SerializationError", base_error);
    nb::exception<ObjectDoesNotExist>(m, "ObjectDoesNotExist");

    nb::class_<Actor>(m, "Actor")
        .def(nb::init<>())
        .def("__init__", [](Actor *self, std::string id, std::string display_name) {
            new (self) Actor{std::move(id), std::move(display_name)};
        }, "id"_a, "display_name"_a = "")
        .def_rw("id", &Actor::id)
        .def_rw("display_name", &Actor::display_name)
        .def("__eq__", [](const Actor &self, const Actor &other) { return self == other; });

    nb::class_<FieldDescriptor>(m, "FieldDescriptor")
        .def_static("value", &FieldDescriptor::value, "name"_a)
        .def_static("relation", &FieldDescriptor::relation, "name"_a)
        .def_ro("name", &FieldDescriptor::name)
        .def_ro("attname", &FieldDescriptor::attname)
        .def_ro("is_relation", &FieldDescriptor::is_relation);

    nb::class_<EntityType>(m, "EntityType")
        .def(nb::init<std::string, std::string, std::vector<FieldDescriptor>, const EntityType *>(),
             "app_label"_a, "model_name"_a, "fields"_a, "concrete_type"_a = nb::none(), nb::keep_alive<1, 5>())
        .def_prop_ro("app_label", &EntityType::app_label)
        .def_prop_ro("model_name", &EntityType::model_name)
        .def_prop_ro("fields", &EntityType::fields)
        .def_prop_ro("is_proxy", &EntityType::is_proxy)
        .def_prop_ro("label", &EntityType::label)
        .def("__repr__", [](const EntityType &self) { return fmt::format("EntityType({})", self.label()); });

    nb::class_<Entity, PyEntity>(m, "Entity")
        .def(nb::init<>())
        .def("repr", &Entity::repr)
        .def("database", &Entity::database);

    nb::class_<VersionData>(m, "VersionData")
        .def_ro("app_label", &VersionData::app_label)
        .def_ro("model_name", &VersionData::model_name)
        .def_ro("object_id", &VersionData::object_id)
        .def_ro("db", &VersionData::db)
        .def_ro("format", &VersionData::format)
        .def_ro("serialized_data", &VersionData::serialized_data)
        .def_ro("object_repr", &VersionData::object_repr);

    nb::class_<SerializationCodec, PySerializationCodec>(m, "SerializationCodec")
        .def(nb::init<>());

    m.def("register_codec", [](std::shared_ptr<SerializationCodec> codec) {
        CodecRegistry::instance().register_codec(std::move(codec));
    }, "codec"_a);

    nb::class_<RevisionReady>(m, "RevisionReady")
        .def_prop_ro("manager_slug", [](const RevisionReady &self) { return self.manager->slug(); })
        .def_ro("objects", &RevisionReady::objects)
        .def_ro("serialized_objects", &RevisionReady::serialized_objects)
        .def_ro("user", &RevisionReady::user)
        .def_ro("comment", &RevisionReady::comment)
        .def_ro("ignore_duplicates", &RevisionReady::ignore_duplicates)
        .def_ro("db", &RevisionReady::db);

    nb::class_<RevisionObserver, PyRevisionObserver>(m, "RevisionObserver")
        .def(nb::init<>());

    nb::class_<ChangeEventDispatcher>(m, "ChangeEventDispatcher")
        .def_static("send", [](const std::string &event, entity_ptr entity) {
            return ChangeEventDispatcher::instance().send(intern_event(event), entity);
        }, "event"_a, "entity"_a);

    nb::class_<PyRevisionScope>(m, "RevisionScope")
        .def("__enter__", &PyRevisionScope::enter)
        .def("__exit__", &PyRevisionScope::exit, "exc_type"_a.none(), "exc_value"_a.none(), "traceback"_a.none());

    m.def("create_revision", [](bool manage_manually, std::string db) {
        return PyRevisionScope{create_revision(manage_manually, std::move(db))};
    }, "manage_manually"_a = false, "db"_a = "");

    m.def("is_active", &revscope::is_active);
    m.def("get_user", &revscope::get_user);
    m.def("set_user", &revscope::set_user, "user"_a.none());
    m.def("get_comment", &revscope::get_comment);
    m.def("set_comment", &revscope::set_comment, "comment"_a);
    m.def("get_ignore_duplicates", &revscope::get_ignore_duplicates);
    m.def("set_ignore_duplicates", &revscope::set_ignore_duplicates, "ignore_duplicates"_a);

    nb::class_<RevisionManager>(m, "RevisionManager")
        .def_static("create", [](std::string slug) { return RevisionManager::create(std::move(slug)); }, "slug"_a)
        .def_static("get_manager", &RevisionManager::get_manager, "slug"_a)
        .def_static("get_created_managers", &RevisionManager::get_created_managers)
        .def_prop_ro("slug", &RevisionManager::slug)
        .def("close", &RevisionManager::close)
        .def("is_registered", &RevisionManager::is_registered, "entity_type"_a)
        .def("register", [](RevisionManager &self, const EntityType &entity_type,
                            std::optional<std::vector<std::string>> fields,
                            std::optional<std::vector<std::string>> exclude,
                            std::optional<std::vector<std::string>> follow,
                            std::optional<std::string> format,
                            std::optional<bool> for_concrete_model,
                            std::optional<std::vector<std::string>> signals,
                            std::optional<std::vector<std::string>> eager_signals) -> const EntityType & {
            AdapterOverrides overrides{std::move(fields), std::move(exclude), std::move(follow), std::move(format),
                                       for_concrete_model};
            if (signals) { overrides.signals = intern_events(*signals); }
            if (eager_signals) { overrides.eager_signals = intern_events(*eager_signals); }
            return self.register_model(entity_type, overrides);
        }, "entity_type"_a, "fields"_a = nb::none(), "exclude"_a = nb::none(), "follow"_a = nb::none(),
           "format"_a = nb::none(), "for_concrete_model"_a = nb::none(), "signals"_a = nb::none(),
           "eager_signals"_a = nb::none(), nb::rv_policy::reference)
        .def("unregister", &RevisionManager::unregister, "entity_type"_a)
        .def("get_adapter_signals", [](const RevisionManager &self, const EntityType &entity_type) {
            return event_names(self.get_adapter(entity_type)->get_all_signals());
        }, "entity_type"_a)
        .def("follow_relationships", &RevisionManager::follow_relationships, "instance"_a)
        .def("create_revision", [](const RevisionManager &self, bool manage_manually, std::string db) {
            return PyRevisionScope{self.create_revision(manage_manually, std::move(db))};
        }, "manage_manually"_a = false, "db"_a = "")
        .def("add_revision_observer", &RevisionManager::add_revision_observer, "observer"_a, nb::keep_alive<1, 2>())
        .def("remove_revision_observer", &RevisionManager::remove_revision_observer, "observer"_a);

    m.def("default_revision_manager", &default_revision_manager, nb::rv_policy::reference);
}
