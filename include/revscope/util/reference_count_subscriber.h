#ifndef REVSCOPE_REFERENCE_COUNT_SUBSCRIBER_H
#define REVSCOPE_REFERENCE_COUNT_SUBSCRIBER_H

#include <ankerl/unordered_dense.h>

#include <cstddef>

namespace revscope {
    /**
     * Tracks subscribers with a reference count, a subscriber is only removed once it has been un-subscribed
     * as many times as it was subscribed. Iteration follows first-subscription order.
     */
    template<typename T>
    class ReferenceCountSubscriber {
    public:
        void subscribe(T subscriber);

        // Returns true when the last reference to the subscriber was released.
        bool un_subscribe(T subscriber);

        [[nodiscard]] bool contains(const T &subscriber) const { return m_subscriptions.contains(subscriber); }

        [[nodiscard]] bool empty() const { return m_subscriptions.empty(); }

        [[nodiscard]] std::size_t size() const { return m_subscriptions.size(); }

        template<typename Op>
        void apply(Op op) const {
            for (const auto &[k, _]: m_subscriptions) { op(k); }
        }

    private:
        ankerl::unordered_dense::map<T, std::size_t> m_subscriptions{};
    };

    template<typename T>
    void ReferenceCountSubscriber<T>::subscribe(T subscriber) {
        auto [it, success] = m_subscriptions.insert({subscriber, 1});
        if (!success) { ++(it->second); }
    }

    template<typename T>
    bool ReferenceCountSubscriber<T>::un_subscribe(T subscriber) {
        auto it{m_subscriptions.find(subscriber)};
        if (it != m_subscriptions.end()) {
            if (--(it->second) == 0) {
                m_subscriptions.erase(it);
                return true;
            }
        }
        return false;
    }
}
#endif  // REVSCOPE_REFERENCE_COUNT_SUBSCRIBER_H
