#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace rf::engine
{

// In-process fan-out for orchestrator and scheduler events. Handlers run on
// the publishing thread.
class EventBus
{
  public:
    using SubscriptionId = std::size_t;
    template <typename T> using Handler = std::function<void(T const &)>;

    template <typename T> SubscriptionId subscribe(Handler<T> handler)
    {
        std::unique_lock lock(handlers_mutex_);
        auto id = next_id_++;
        auto &handlers = handlers_[std::type_index(typeid(T))];
        handlers.push_back(
            {id, [handler](std::any const &event)
             { handler(std::any_cast<T const &>(event)); }});
        return id;
    }

    // Returns false when the id is unknown.
    bool unsubscribe(SubscriptionId id)
    {
        std::unique_lock lock(handlers_mutex_);
        for (auto &[type, handlers] : handlers_)
        {
            for (auto it = handlers.begin(); it != handlers.end(); ++it)
            {
                if (it->id == id)
                {
                    handlers.erase(it);
                    return true;
                }
            }
        }
        return false;
    }

    template <typename T> void publish(T const &event) const
    {
        // handlers run unlocked; they may subscribe or publish
        std::vector<Entry> handlers_copy;
        {
            std::shared_lock lock(handlers_mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end())
            {
                handlers_copy = it->second;
            }
        }
        if (handlers_copy.empty())
        {
            return;
        }
        std::any const boxed = event;
        for (auto const &entry : handlers_copy)
        {
            entry.handler(boxed);
        }
    }

  private:
    struct Entry
    {
        SubscriptionId id;
        std::function<void(std::any const &)> handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    SubscriptionId next_id_ = 1;
    mutable std::shared_mutex handlers_mutex_;
};

} // namespace rf::engine
