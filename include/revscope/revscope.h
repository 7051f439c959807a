/*
 * The convenience API, bound to the default revision manager and to the calling thread's revision context.
 *
 *     revscope::register_model(article_type(), {.follow = std::vector<std::string>{"author"}});
 *
 *     revscope::create_revision()([&] {
 *         save(article);
 *         revscope::set_comment("Edited the headline");
 *     });
 */
#ifndef REVSCOPE_H
#define REVSCOPE_H

#include <revscope/runtime/revision_manager.h>
#include <revscope/util/config.h>
#include <revscope/util/errors.h>
#include <revscope/util/logging.h>

namespace revscope {
    // Context management.

    REVSCOPE_EXPORT RevisionContext create_revision(bool manage_manually = false, std::string db = {});

    REVSCOPE_EXPORT bool is_active();

    // Revision meta data.

    REVSCOPE_EXPORT std::optional<Actor> get_user();

    REVSCOPE_EXPORT void set_user(std::optional<Actor> user);

    REVSCOPE_EXPORT std::string get_comment();

    REVSCOPE_EXPORT void set_comment(std::string comment);

    REVSCOPE_EXPORT bool get_ignore_duplicates();

    REVSCOPE_EXPORT void set_ignore_duplicates(bool ignore_duplicates);

    REVSCOPE_EXPORT void add_meta(meta_ptr meta);

    template<typename T, typename... Args>
        requires std::is_base_of_v<RevisionMeta, T>
    void add_meta(Args &&...args) {
        RevisionContextManager::for_current_thread().add_meta<T>(std::forward<Args>(args)...);
    }

    // Registration.

    REVSCOPE_EXPORT const EntityType &register_model(const EntityType &entity_type,
                                                     const AdapterOverrides &overrides = {},
                                                     const AdapterFactory &adapter_factory = make_default_adapter);

    REVSCOPE_EXPORT bool is_registered(const EntityType &entity_type);

    REVSCOPE_EXPORT void unregister(const EntityType &entity_type);

    REVSCOPE_EXPORT adapter_ptr get_adapter(const EntityType &entity_type);

    REVSCOPE_EXPORT std::vector<const EntityType *> get_registered_models();

    // Low level API.

    REVSCOPE_EXPORT std::vector<VersionRecord> get_for_object_reference(const EntityType &entity_type,
                                                                        const std::string &object_id,
                                                                        const std::string &db = {});

    REVSCOPE_EXPORT std::vector<VersionRecord> get_for_object(const Entity &entity, const std::string &db = {});

    REVSCOPE_EXPORT std::optional<VersionRecord> get_for_date(const Entity &entity, revision_time_t date,
                                                              const std::string &db = {});

    REVSCOPE_EXPORT std::vector<VersionRecord> get_deleted(const EntityType &entity_type, const std::string &db = {},
                                                           const std::string &model_db = {});
} // namespace revscope

#endif  // REVSCOPE_H
