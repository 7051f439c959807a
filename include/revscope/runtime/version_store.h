#ifndef REVSCOPE_RUNTIME_VERSION_STORE_H
#define REVSCOPE_RUNTIME_VERSION_STORE_H

#include <revscope/runtime/revision_context.h>
#include <revscope/util/date_time.h>

namespace revscope {
    /**
     * A stored version of one object as reported back by the storage layer.
     */
    struct VersionRecord {
        int64_t id{0};
        int64_t revision_id{0};
        revision_time_t date_created{};
        std::optional<Actor> user;
        std::string comment;
        VersionData data;
    };

    /**
     * The read side of the storage layer. Persisting revisions is done by a RevisionObserver, usually the same
     * object. All results are ordered with the most recent version first.
     */
    struct REVSCOPE_EXPORT VersionStore {
        using ptr = std::shared_ptr<VersionStore>;

        virtual ~VersionStore() = default;

        [[nodiscard]] virtual std::vector<VersionRecord> versions_for_object(
            const RevisionManager &manager, const VersionId &id, const std::string &db) const = 0;

        /**
         * The latest version of every object of the type that no longer exists in ``model_db``.
         */
        [[nodiscard]] virtual std::vector<VersionRecord> deleted_versions(
            const RevisionManager &manager, const std::string &app_label, const std::string &model_name,
            const std::string &db, const std::string &model_db) const = 0;
    };
} // namespace revscope

#endif  // REVSCOPE_RUNTIME_VERSION_STORE_H
