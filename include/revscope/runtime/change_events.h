#ifndef REVSCOPE_RUNTIME_CHANGE_EVENTS_H
#define REVSCOPE_RUNTIME_CHANGE_EVENTS_H

#include <revscope/revscope_base.h>
#include <revscope/util/reference_count_subscriber.h>

#include <ankerl/unordered_dense.h>

#include <shared_mutex>

namespace revscope {
    /**
     * Names a kind of mutation. The name must have static storage duration, events are compared by name.
     */
    struct ChangeEvent {
        std::string_view name;

        constexpr bool operator==(const ChangeEvent &other) const { return name == other.name; }
    };

    inline constexpr ChangeEvent post_save{"post_save"};
    inline constexpr ChangeEvent pre_delete{"pre_delete"};
    inline constexpr ChangeEvent post_delete{"post_delete"};
    inline constexpr ChangeEvent m2m_changed{"m2m_changed"};

    /**
     * Receives change events for the entity types it subscribed to. Called synchronously from within the call
     * that performed the mutation.
     */
    struct REVSCOPE_EXPORT ChangeReceiver {
        virtual ~ChangeReceiver() = default;

        virtual void on_change(const ChangeEvent &event, const entity_ptr &entity) = 0;
    };

    /**
     * Routes change events to receivers by (entity type, event). The application, or its storage layer, calls
     * ``send`` whenever a tracked entity is mutated.
     */
    struct REVSCOPE_EXPORT ChangeEventDispatcher {
        static ChangeEventDispatcher &instance();

        void subscribe(const EntityType &entity_type, const ChangeEvent &event, ChangeReceiver *receiver);

        void unsubscribe(const EntityType &entity_type, const ChangeEvent &event, ChangeReceiver *receiver);

        /**
         * Delivers the event to every receiver subscribed for the entity's type, returns the number of receivers
         * notified.
         */
        std::size_t send(const ChangeEvent &event, const entity_ptr &entity) const;

        [[nodiscard]] bool has_receivers(const EntityType &entity_type, const ChangeEvent &event) const;

    private:
        struct Key {
            const EntityType *entity_type;
            std::string_view event;

            bool operator==(const Key &) const = default;
        };

        struct KeyHash {
            [[nodiscard]] std::size_t operator()(const Key &key) const noexcept;
        };

        mutable std::shared_mutex _lock;
        ankerl::unordered_dense::map<Key, ReferenceCountSubscriber<ChangeReceiver *>, KeyHash> _subscriptions;
    };
} // namespace revscope

template<>
struct fmt::formatter<revscope::ChangeEvent> : fmt::formatter<std::string_view> {
    auto format(const revscope::ChangeEvent &event, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(event.name, ctx);
    }
};

#endif  // REVSCOPE_RUNTIME_CHANGE_EVENTS_H
