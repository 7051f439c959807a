#include <revscope/revscope.h>

namespace revscope {
    namespace {
        RevisionContextManager &current_context() { return RevisionContextManager::for_current_thread(); }
    }

    RevisionContext create_revision(bool manage_manually, std::string db) {
        // Unbound, so a decorated callable captures into whichever thread calls it.
        return RevisionContext{{}, manage_manually, std::move(db)};
    }

    bool is_active() { return current_context().is_active(); }

    std::optional<Actor> get_user() { return current_context().get_user(); }

    void set_user(std::optional<Actor> user) { current_context().set_user(std::move(user)); }

    std::string get_comment() { return current_context().get_comment(); }

    void set_comment(std::string comment) { current_context().set_comment(std::move(comment)); }

    bool get_ignore_duplicates() { return current_context().get_ignore_duplicates(); }

    void set_ignore_duplicates(bool ignore_duplicates) { current_context().set_ignore_duplicates(ignore_duplicates); }

    void add_meta(meta_ptr meta) { current_context().add_meta(std::move(meta)); }

    const EntityType &register_model(const EntityType &entity_type, const AdapterOverrides &overrides,
                                     const AdapterFactory &adapter_factory) {
        return default_revision_manager().register_model(entity_type, overrides, adapter_factory);
    }

    bool is_registered(const EntityType &entity_type) { return default_revision_manager().is_registered(entity_type); }

    void unregister(const EntityType &entity_type) { default_revision_manager().unregister(entity_type); }

    adapter_ptr get_adapter(const EntityType &entity_type) { return default_revision_manager().get_adapter(entity_type); }

    std::vector<const EntityType *> get_registered_models() { return default_revision_manager().get_registered_models(); }

    std::vector<VersionRecord> get_for_object_reference(const EntityType &entity_type, const std::string &object_id,
                                                        const std::string &db) {
        return default_revision_manager().get_for_object_reference(entity_type, object_id, db);
    }

    std::vector<VersionRecord> get_for_object(const Entity &entity, const std::string &db) {
        return default_revision_manager().get_for_object(entity, db);
    }

    std::optional<VersionRecord> get_for_date(const Entity &entity, revision_time_t date, const std::string &db) {
        return default_revision_manager().get_for_date(entity, date, db);
    }

    std::vector<VersionRecord> get_deleted(const EntityType &entity_type, const std::string &db,
                                           const std::string &model_db) {
        return default_revision_manager().get_deleted(entity_type, db, model_db);
    }
} // namespace revscope
