#ifndef REVSCOPE_RUNTIME_REVISION_MANAGER_H
#define REVSCOPE_RUNTIME_REVISION_MANAGER_H

#include <revscope/runtime/change_events.h>
#include <revscope/runtime/revision_context.h>
#include <revscope/runtime/version_store.h>

#include <ankerl/unordered_dense.h>

#include <shared_mutex>

namespace revscope {
    /**
     * Manages the configuration and creation of revisions for a set of registered entity types.
     *
     * A manager is identified by a unique slug. Managers are looked up by slug for as long as someone owns them or
     * until ``close`` is called, which also drops every registration.
     *
     * Registering a type subscribes the manager to the type's change events, when one fires inside an active
     * revision block (not managed manually) the entity is captured into the current revision.
     */
    struct REVSCOPE_EXPORT RevisionManager : ChangeReceiver, std::enable_shared_from_this<RevisionManager> {
        using ptr = std::shared_ptr<RevisionManager>;
        using ContextResolver = revscope::ContextResolver;

        /**
         * Creates a manager, the slug must not be claimed by another live manager. The resolver provides the
         * context manager to capture into, by default the calling thread's.
         */
        static ptr create(std::string slug, ContextResolver context_resolver = {},
                          ChangeEventDispatcher *dispatcher = nullptr);

        static ptr get_manager(const std::string &slug);

        [[nodiscard]] static bool has_manager(const std::string &slug);

        // All live managers by slug.
        static std::vector<std::pair<std::string, ptr>> get_created_managers();

        ~RevisionManager() override;

        RevisionManager(const RevisionManager &) = delete;

        RevisionManager &operator=(const RevisionManager &) = delete;

        /**
         * Unregisters every type and releases the slug. Idempotent.
         */
        void close();

        [[nodiscard]] bool is_closed() const;

        [[nodiscard]] const std::string &slug() const { return _slug; }

        // Registration.

        [[nodiscard]] bool is_registered(const EntityType &entity_type) const;

        [[nodiscard]] std::vector<const EntityType *> get_registered_models() const;

        /**
         * Registers the type, the adapter comes from the factory with the overrides applied on top.
         */
        const EntityType &register_model(const EntityType &entity_type, const AdapterOverrides &overrides = {},
                                         const AdapterFactory &adapter_factory = make_default_adapter);

        [[nodiscard]] adapter_ptr get_adapter(const EntityType &entity_type) const;

        void unregister(const EntityType &entity_type);

        // Revision management.

        [[nodiscard]] RevisionContextManager &context_manager() const;

        /**
         * A revision context that resolves the context manager through this manager's resolver each time it is
         * entered, so callables wrapped by it capture into the calling thread's revision.
         */
        [[nodiscard]] RevisionContext create_revision(bool manage_manually = false, std::string db = {}) const;

        /**
         * The entity and everything reachable from it through the adapters' followed relations, each object once,
         * in depth first order. Objects without a primary key are not followed.
         */
        [[nodiscard]] entity_list follow_relationships(const entity_ptr &instance) const;

        void add_revision_observer(RevisionObserver *observer);

        void remove_revision_observer(RevisionObserver *observer);

        void notify_revision_ready(const RevisionReady &revision) const;

        // Queries, these delegate to the version store.

        void set_version_store(VersionStore::ptr store);

        [[nodiscard]] VersionStore::ptr version_store() const;

        [[nodiscard]] std::vector<VersionRecord> get_for_object_reference(
            const EntityType &entity_type, const std::string &object_id, const std::string &db = {}) const;

        [[nodiscard]] std::vector<VersionRecord> get_for_object(const Entity &entity,
                                                                const std::string &db = {}) const;

        // The latest version created at or before the date, if any.
        [[nodiscard]] std::optional<VersionRecord> get_for_date(const Entity &entity, revision_time_t date,
                                                                const std::string &db = {}) const;

        [[nodiscard]] std::vector<VersionRecord> get_deleted(const EntityType &entity_type,
                                                             const std::string &db = {},
                                                             const std::string &model_db = {}) const;

        void on_change(const ChangeEvent &event, const entity_ptr &entity) override;

    private:
        RevisionManager(std::string slug, ContextResolver context_resolver, ChangeEventDispatcher &dispatcher);

        [[nodiscard]] VersionStore::ptr require_version_store() const;

        [[nodiscard]] const EntityType &labels_for(const EntityType &entity_type) const;

        void disconnect(const EntityType &entity_type, const VersionAdapter &adapter);

        std::string _slug;
        ContextResolver _context_resolver;
        ChangeEventDispatcher &_dispatcher;

        mutable std::shared_mutex _lock;
        ankerl::unordered_dense::map<const EntityType *, adapter_ptr> _registered_models;
        std::vector<RevisionObserver *> _revision_observers;
        VersionStore::ptr _version_store;
        bool _closed{false};
    };

    /**
     * The shared manager with the slug ``default``, created on first use.
     */
    REVSCOPE_EXPORT RevisionManager &default_revision_manager();
} // namespace revscope

#endif  // REVSCOPE_RUNTIME_REVISION_MANAGER_H
