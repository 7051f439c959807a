#ifndef REVSCOPE_TYPES_ENTITY_H
#define REVSCOPE_TYPES_ENTITY_H

#include <revscope/revscope_base.h>

#include <variant>

namespace revscope {
    /**
     * The value of a single stored field as seen by a serialization codec.
     */
    using FieldValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

    REVSCOPE_EXPORT std::string to_string(const FieldValue &value);

    struct FieldDescriptor {
        // The accessor name, for relations this is the name of the relationship.
        std::string name;
        // The stored attribute, for relations this is the key column (``owner_id``), otherwise the same as name.
        std::string attname;
        bool is_relation{false};

        static FieldDescriptor value(std::string name);

        static FieldDescriptor relation(std::string name);
    };

    /**
     * Describes a kind of tracked entity. Entity types are compared by address, so they are expected to be long
     * lived (usually function statics or globals owned by the application).
     *
     * A proxy type shares its storage with a concrete type, adapters configured with ``for_concrete_model`` record
     * proxies under the concrete type's labels.
     */
    struct REVSCOPE_EXPORT EntityType {
        EntityType(std::string app_label, std::string model_name, std::vector<FieldDescriptor> fields,
                   const EntityType *concrete_type = nullptr);

        EntityType(const EntityType &) = delete;

        EntityType &operator=(const EntityType &) = delete;

        [[nodiscard]] const std::string &app_label() const { return _app_label; }

        [[nodiscard]] const std::string &model_name() const { return _model_name; }

        [[nodiscard]] const std::vector<FieldDescriptor> &fields() const { return _fields; }

        [[nodiscard]] const FieldDescriptor &get_field(std::string_view name) const;

        [[nodiscard]] bool has_field(std::string_view name) const;

        [[nodiscard]] const EntityType &concrete_type() const;

        [[nodiscard]] bool is_proxy() const { return _concrete_type != nullptr; }

        // ``app_label.model_name``
        [[nodiscard]] std::string label() const;

    private:
        std::string _app_label;
        std::string _model_name;
        std::vector<FieldDescriptor> _fields;
        const EntityType *_concrete_type;
    };

    /**
     * The result of resolving a named relation on an entity. The scalar alternative is what an accessor that is
     * not actually a relationship resolves to, following it is a configuration error unless it is null.
     */
    using RelationValue = std::variant<std::monostate, entity_ptr, entity_list, FieldValue>;

    /**
     * A tracked object. Implementations wrap whatever the application stores, revscope only needs the identity,
     * the field values (for the codec) and the relationships (for following).
     */
    struct REVSCOPE_EXPORT Entity {
        virtual ~Entity() = default;

        [[nodiscard]] virtual const EntityType &entity_type() const = 0;

        /**
         * The persisted identity, empty when the entity has never been saved (or was deleted within the revision).
         */
        [[nodiscard]] virtual std::optional<std::string> pk() const = 0;

        [[nodiscard]] virtual FieldValue field(std::string_view attname) const = 0;

        /**
         * Resolves a relationship by name, may throw ObjectDoesNotExist if the referenced object is gone.
         */
        [[nodiscard]] virtual RelationValue relation(std::string_view name) const = 0;

        [[nodiscard]] virtual std::string repr() const;

        // The alias of the store the entity was loaded from or saved to.
        [[nodiscard]] virtual std::string database() const;
    };

    /**
     * The identity key of a captured entity, unique within one manager's object set.
     */
    struct REVSCOPE_EXPORT VersionId {
        std::string app_label;
        std::string model_name;
        std::string object_id;

        bool operator==(const VersionId &) const = default;

        [[nodiscard]] std::string to_string() const;
    };

    struct VersionIdHash {
        [[nodiscard]] std::size_t operator()(const VersionId &id) const noexcept;
    };

    /**
     * Entity identity as used for cycle detection: the concrete type and the primary key. Two proxies of the
     * same stored row are the same object.
     */
    struct EntityKey {
        const EntityType *concrete_type{nullptr};
        std::string pk;

        bool operator==(const EntityKey &) const = default;

        static std::optional<EntityKey> of(const Entity &entity);
    };

    struct EntityKeyHash {
        [[nodiscard]] std::size_t operator()(const EntityKey &key) const noexcept;
    };
} // namespace revscope

template<>
struct fmt::formatter<revscope::VersionId> : fmt::formatter<std::string> {
    auto format(const revscope::VersionId &id, format_context &ctx) const {
        return fmt::formatter<std::string>::format(id.to_string(), ctx);
    }
};

#endif  // REVSCOPE_TYPES_ENTITY_H
