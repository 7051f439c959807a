#include <revscope/types/entity.h>
#include <revscope/util/errors.h>

#include <algorithm>

namespace revscope {
    std::string to_string(const FieldValue &value) {
        return std::visit([](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "None";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        }, value);
    }

    FieldDescriptor FieldDescriptor::value(std::string name) {
        auto attname{name};
        return {std::move(name), std::move(attname), false};
    }

    FieldDescriptor FieldDescriptor::relation(std::string name) {
        auto attname{fmt::format("{}_id", name)};
        return {std::move(name), std::move(attname), true};
    }

    EntityType::EntityType(std::string app_label, std::string model_name, std::vector<FieldDescriptor> fields,
                           const EntityType *concrete_type)
        : _app_label{std::move(app_label)}, _model_name{std::move(model_name)}, _fields{std::move(fields)},
          _concrete_type{concrete_type} {
        // A proxy of a proxy is flattened onto the storage type.
        if (_concrete_type != nullptr) { _concrete_type = &_concrete_type->concrete_type(); }
    }

    const FieldDescriptor &EntityType::get_field(std::string_view name) const {
        auto it = std::find_if(_fields.begin(), _fields.end(), [name](const FieldDescriptor &f) {
            return f.name == name || f.attname == name;
        });
        if (it == _fields.end()) { throw_error<RegistrationError>("{} has no field named '{}'", label(), name); }
        return *it;
    }

    bool EntityType::has_field(std::string_view name) const {
        return std::any_of(_fields.begin(), _fields.end(), [name](const FieldDescriptor &f) {
            return f.name == name || f.attname == name;
        });
    }

    const EntityType &EntityType::concrete_type() const {
        return _concrete_type == nullptr ? *this : *_concrete_type;
    }

    std::string EntityType::label() const { return fmt::format("{}.{}", _app_label, _model_name); }

    std::string Entity::repr() const {
        return fmt::format("{} object ({})", entity_type().model_name(), pk().value_or("None"));
    }

    std::string Entity::database() const { return {}; }

    std::string VersionId::to_string() const { return fmt::format("{}.{}:{}", app_label, model_name, object_id); }

    std::size_t VersionIdHash::operator()(const VersionId &id) const noexcept {
        std::size_t seed{std::hash<std::string>{}(id.app_label)};
        hash_combine(seed, std::hash<std::string>{}(id.model_name));
        hash_combine(seed, std::hash<std::string>{}(id.object_id));
        return seed;
    }

    std::optional<EntityKey> EntityKey::of(const Entity &entity) {
        auto pk{entity.pk()};
        if (!pk) { return std::nullopt; }
        return EntityKey{&entity.entity_type().concrete_type(), std::move(*pk)};
    }

    std::size_t EntityKeyHash::operator()(const EntityKey &key) const noexcept {
        std::size_t seed{std::hash<const EntityType *>{}(key.concrete_type)};
        hash_combine(seed, std::hash<std::string>{}(key.pk));
        return seed;
    }
} // namespace revscope
