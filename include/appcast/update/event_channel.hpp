#pragma once

#include "appcast/util/logger.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace appcast {

// Subscription list for push notifications. Delivery is synchronous on the
// publishing thread and best-effort: a throwing subscriber is logged and the
// remaining subscribers still run.
template <typename... Args>
class EventChannel {
public:
    using Handler = std::function<void(const Args&...)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId Subscribe(Handler handler) {
        std::lock_guard<std::mutex> lk(mu_);
        const SubscriptionId id = ++next_id_;
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    bool Unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == id) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::size_t SubscriberCount() const {
        std::lock_guard<std::mutex> lk(mu_);
        return handlers_.size();
    }

    void Publish(const Args&... args) const {
        std::vector<std::pair<SubscriptionId, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lk(mu_);
            snapshot = handlers_;
        }
        for (const auto& [id, handler] : snapshot) {
            try {
                handler(args...);
            } catch (const std::exception& e) {
                LogWarn("Subscriber %llu failed: %s", static_cast<unsigned long long>(id), e.what());
            } catch (...) {
                LogWarn("Subscriber %llu failed with a non-standard exception",
                        static_cast<unsigned long long>(id));
            }
        }
    }

private:
    mutable std::mutex mu_;
    SubscriptionId next_id_ = 0;
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
};

} // namespace appcast
