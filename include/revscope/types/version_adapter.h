#ifndef REVSCOPE_TYPES_VERSION_ADAPTER_H
#define REVSCOPE_TYPES_VERSION_ADAPTER_H

#include <revscope/runtime/change_events.h>
#include <revscope/types/entity.h>

namespace revscope {
    /**
     * The pre-serialized snapshot of an entity, captured eagerly when the entity may not exist once the revision
     * closes.
     */
    struct REVSCOPE_EXPORT VersionData {
        std::string app_label;
        std::string model_name;
        std::string object_id;
        std::string db;
        std::string format;
        std::string serialized_data;
        std::string object_repr;

        bool operator==(const VersionData &) const = default;

        [[nodiscard]] VersionId version_id() const { return {app_label, model_name, object_id}; }
    };

    /**
     * Replacement values for the configurable attributes of an adapter, applied at registration time.
     */
    struct AdapterOverrides {
        std::optional<std::vector<std::string>> fields;
        std::optional<std::vector<std::string>> exclude;
        std::optional<std::vector<std::string>> follow;
        std::optional<std::string> format;
        std::optional<bool> for_concrete_model;
        std::optional<std::vector<ChangeEvent>> signals;
        std::optional<std::vector<ChangeEvent>> eager_signals;

        [[nodiscard]] bool empty() const;
    };

    /**
     * Describes how a registered entity type is versioned. Sub-class to customise the behaviour beyond the
     * attributes, the registry only ever hands out const adapters once registration has completed.
     */
    struct REVSCOPE_EXPORT VersionAdapter {
        explicit VersionAdapter(const EntityType &entity_type);

        virtual ~VersionAdapter() = default;

        [[nodiscard]] const EntityType &entity_type() const { return _entity_type; }

        // Field names to include in the serialized data, empty means all local fields of the concrete type.
        std::optional<std::vector<std::string>> fields;

        // Field names to exclude from the serialized data.
        std::vector<std::string> exclude;

        // Relationships to follow when saving a version of the entity.
        std::vector<std::string> follow;

        // The name of the serialization codec.
        std::string format{"json"};

        // Record proxy types under the labels of their concrete type, sharing one history.
        bool for_concrete_model{true};

        // Events that capture the entity at the end of the outermost revision block.
        std::vector<ChangeEvent> signals{post_save};

        // Events that capture the entity immediately, for events raised before the entity goes away.
        std::vector<ChangeEvent> eager_signals;

        void apply(const AdapterOverrides &overrides);

        /**
         * The attribute names to serialize, relations are reported by their relation name and plain fields by
         * their stored attribute name.
         */
        [[nodiscard]] virtual std::vector<std::string> get_fields_to_serialize() const;

        /**
         * The entities reached directly through the followed relationships of ``entity``. Relations that no
         * longer resolve are skipped.
         */
        [[nodiscard]] virtual entity_list get_followed_relations(const Entity &entity) const;

        [[nodiscard]] virtual std::string get_serialization_format() const;

        [[nodiscard]] std::vector<ChangeEvent> get_all_signals() const;

        [[nodiscard]] bool is_eager_signal(const ChangeEvent &event) const;

        [[nodiscard]] virtual std::string get_serialized_data(const Entity &entity) const;

        [[nodiscard]] virtual VersionId get_version_id(const Entity &entity) const;

        [[nodiscard]] virtual VersionData get_version_data(const Entity &entity) const;

    private:
        const EntityType &_entity_type;
    };

    using AdapterFactory = std::function<std::unique_ptr<VersionAdapter>(const EntityType &)>;

    REVSCOPE_EXPORT std::unique_ptr<VersionAdapter> make_default_adapter(const EntityType &entity_type);
} // namespace revscope

#endif  // REVSCOPE_TYPES_VERSION_ADAPTER_H
