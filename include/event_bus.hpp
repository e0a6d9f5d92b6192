#pragma once
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include "types.hpp"

class EventBus {
    public:
        template<typename EventType>
        using Handler = std::function<void(const EventType&)>;

        template<typename EventType>
        void subscribe(Handler<EventType> handler) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& handlers = handlers_[typeid(EventType)];
            if (handlers.empty()) {
                handlers.reserve(8); // Preallocate for 8 handlers
            }
            handlers.push_back([handler](const Event& e) {
                handler(static_cast<const EventType&>(e));
            });
        }

        // Workers publish concurrently; handlers run on the publishing thread.
        template<typename EventType>
        void publish(const EventType& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(typeid(EventType));
            if (it != handlers_.end()) {
                for (const auto& handler : it->second) {
                    handler(event);
                }
            }
        }

        template<typename EventType>
        std::size_t subscriber_count() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(typeid(EventType));
            return it == handlers_.end() ? 0 : it->second.size();
        }

    private:
        std::unordered_map<std::type_index, std::vector<std::function<void(const Event&)>>> handlers_;
        std::mutex mutex_;
};
