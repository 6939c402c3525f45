#pragma once
#include <string>
#include <functional>
#include <vector>
#include <unordered_map>
#include <any>
#include <mutex>

namespace PeerBeam {

    using EventCallback = std::function<void(const std::any&)>;
    using EventFilter = std::function<bool(const std::any&)>;

    class EventBus {
    public:
        using SubscriptionId = unsigned long;

        struct Subscription {
            SubscriptionId id;
            EventCallback callback;
            int priority;
            EventFilter filter;
        };

        /**
         * @brief Subscribe to an event.
         * @param eventName The name of the event.
         * @param callback The function to call when the event is published.
         * @param priority Higher priorities are called first.
         * @param filter Optional predicate; the callback is skipped when it returns false.
         * @return Id usable with unsubscribe().
         */
        SubscriptionId subscribe(const std::string& eventName,
                                 EventCallback callback,
                                 int priority = 0,
                                 EventFilter filter = nullptr);

        /**
         * @brief Remove a subscription. Unknown ids are ignored.
         */
        void unsubscribe(SubscriptionId id);

        /**
         * @brief Publish an event to every matching subscriber, in priority order.
         *
         * Callbacks run on the publishing thread, outside the internal lock, so
         * they may subscribe or publish themselves.
         */
        void publish(const std::string& eventName, const std::any& data);

        size_t subscriberCount(const std::string& eventName) const;

    private:
        std::unordered_map<std::string, std::vector<Subscription>> subscribers_;
        SubscriptionId nextId_{1};
        mutable std::mutex mutex_;
    };

}
