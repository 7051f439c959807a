#include <revscope/runtime/change_events.h>
#include <revscope/types/entity.h>
#include <revscope/util/errors.h>

#include <mutex>

namespace revscope {
    std::size_t ChangeEventDispatcher::KeyHash::operator()(const Key &key) const noexcept {
        std::size_t seed{std::hash<const EntityType *>{}(key.entity_type)};
        hash_combine(seed, std::hash<std::string_view>{}(key.event));
        return seed;
    }

    ChangeEventDispatcher &ChangeEventDispatcher::instance() {
        static ChangeEventDispatcher dispatcher;
        return dispatcher;
    }

    void ChangeEventDispatcher::subscribe(const EntityType &entity_type, const ChangeEvent &event,
                                          ChangeReceiver *receiver) {
        if (receiver == nullptr) { throw_error<RegistrationError>("Cannot subscribe a null change receiver"); }
        std::unique_lock guard{_lock};
        _subscriptions[Key{&entity_type, event.name}].subscribe(receiver);
    }

    void ChangeEventDispatcher::unsubscribe(const EntityType &entity_type, const ChangeEvent &event,
                                            ChangeReceiver *receiver) {
        std::unique_lock guard{_lock};
        auto it{_subscriptions.find(Key{&entity_type, event.name})};
        if (it == _subscriptions.end()) { return; }
        it->second.un_subscribe(receiver);
        if (it->second.empty()) { _subscriptions.erase(it); }
    }

    std::size_t ChangeEventDispatcher::send(const ChangeEvent &event, const entity_ptr &entity) const {
        if (!entity) { return 0; }
        // Copy the receivers out so a receiver may (un)subscribe while being notified.
        std::vector<ChangeReceiver *> receivers;
        {
            std::shared_lock guard{_lock};
            auto it{_subscriptions.find(Key{&entity->entity_type(), event.name})};
            if (it == _subscriptions.end()) { return 0; }
            receivers.reserve(it->second.size());
            it->second.apply([&receivers](ChangeReceiver *receiver) { receivers.push_back(receiver); });
        }
        for (auto *receiver: receivers) { receiver->on_change(event, entity); }
        return receivers.size();
    }

    bool ChangeEventDispatcher::has_receivers(const EntityType &entity_type, const ChangeEvent &event) const {
        std::shared_lock guard{_lock};
        return _subscriptions.contains(Key{&entity_type, event.name});
    }
} // namespace revscope
