#include <revscope/types/serialization.h>
#include <revscope/types/version_adapter.h>
#include <revscope/util/config.h>
#include <revscope/util/errors.h>
#include <revscope/util/logging.h>

#include <algorithm>

namespace revscope {
    bool AdapterOverrides::empty() const {
        return !fields && !exclude && !follow && !format && !for_concrete_model && !signals && !eager_signals;
    }

    VersionAdapter::VersionAdapter(const EntityType &entity_type) : _entity_type{entity_type} {}

    void VersionAdapter::apply(const AdapterOverrides &overrides) {
        if (overrides.fields) { fields = overrides.fields; }
        if (overrides.exclude) { exclude = *overrides.exclude; }
        if (overrides.follow) { follow = *overrides.follow; }
        if (overrides.format) { format = *overrides.format; }
        if (overrides.for_concrete_model) { for_concrete_model = *overrides.for_concrete_model; }
        if (overrides.signals) { signals = *overrides.signals; }
        if (overrides.eager_signals) { eager_signals = *overrides.eager_signals; }
    }

    std::vector<std::string> VersionAdapter::get_fields_to_serialize() const {
        const auto &concrete{_entity_type.concrete_type()};
        std::vector<std::string> names;
        if (fields) {
            names = *fields;
        } else {
            names.reserve(concrete.fields().size());
            for (const auto &field: concrete.fields()) { names.push_back(field.name); }
        }

        std::vector<std::string> result;
        result.reserve(names.size());
        for (const auto &name: names) {
            if (std::find(exclude.begin(), exclude.end(), name) != exclude.end()) { continue; }
            const auto &field{concrete.get_field(name)};
            result.push_back(field.is_relation ? field.name : field.attname);
        }
        return result;
    }

    entity_list VersionAdapter::get_followed_relations(const Entity &entity) const {
        entity_list related;
        for (const auto &relationship: follow) {
            RelationValue value;
            try {
                value = entity.relation(relationship);
            } catch (const ObjectDoesNotExist &e) {
                if (config().warn_on_missing_relations) {
                    logger()->warn("Skipping relationship '{}' of {}: {}", relationship, entity.repr(), e.what());
                }
                continue;
            }
            std::visit([&](auto &v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, entity_ptr>) {
                    if (v) { related.push_back(std::move(v)); }
                } else if constexpr (std::is_same_v<T, entity_list>) {
                    for (auto &obj: v) {
                        if (obj) { related.push_back(std::move(obj)); }
                    }
                } else if constexpr (std::is_same_v<T, FieldValue>) {
                    if (!std::holds_alternative<std::monostate>(v)) {
                        throw_error<RelationshipError>(
                            "Cannot follow the relationship {}. Expected an entity or entity list, found {}",
                            relationship, to_string(v));
                    }
                }
            }, value);
        }
        return related;
    }

    std::string VersionAdapter::get_serialization_format() const { return format; }

    std::vector<ChangeEvent> VersionAdapter::get_all_signals() const {
        std::vector<ChangeEvent> all{signals};
        all.insert(all.end(), eager_signals.begin(), eager_signals.end());
        return all;
    }

    bool VersionAdapter::is_eager_signal(const ChangeEvent &event) const {
        return std::find(eager_signals.begin(), eager_signals.end(), event) != eager_signals.end();
    }

    std::string VersionAdapter::get_serialized_data(const Entity &entity) const {
        auto codec{CodecRegistry::instance().get_codec(get_serialization_format())};
        return codec->serialize(entity, get_fields_to_serialize());
    }

    VersionId VersionAdapter::get_version_id(const Entity &entity) const {
        const auto &type{for_concrete_model ? entity.entity_type().concrete_type() : entity.entity_type()};
        return {type.app_label(), type.model_name(), entity.pk().value_or("")};
    }

    VersionData VersionAdapter::get_version_data(const Entity &entity) const {
        auto id{get_version_id(entity)};
        return {
            std::move(id.app_label),
            std::move(id.model_name),
            std::move(id.object_id),
            entity.database(),
            get_serialization_format(),
            get_serialized_data(entity),
            entity.repr(),
        };
    }

    std::unique_ptr<VersionAdapter> make_default_adapter(const EntityType &entity_type) {
        return std::make_unique<VersionAdapter>(entity_type);
    }
} // namespace revscope
