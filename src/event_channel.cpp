#include "event_channel.h"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace Quire {

EventChannel::SubscriptionId EventChannel::subscribe(const std::string& event, Handler handler) {
    if (!handler) return NO_SUBSCRIPTION;
    std::lock_guard<std::mutex> lk(m_mutex);
    SubscriptionId id = m_nextId++;
    m_subscriptions.push_back({id, event, std::make_shared<Handler>(std::move(handler))});
    return id;
}

bool EventChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = std::find_if(m_subscriptions.begin(), m_subscriptions.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == m_subscriptions.end()) return false;
    m_subscriptions.erase(it);
    return true;
}

size_t EventChannel::emit(const std::string& event, const std::string& payload) {
    // Snapshot under the lock, call outside it so handlers may (un)subscribe
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (const auto& s : m_subscriptions) {
            if (s.event == event) handlers.push_back(s.handler);
        }
    }

    for (const auto& h : handlers) {
        try {
            (*h)(payload);
        } catch (const std::exception& e) {
            fprintf(stderr, "[channel] handler for '%s' threw: %s\n", event.c_str(), e.what());
        } catch (...) {
            fprintf(stderr, "[channel] handler for '%s' threw a non-standard exception\n", event.c_str());
        }
    }
    return handlers.size();
}

size_t EventChannel::subscriberCount(const std::string& event) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return (size_t)std::count_if(m_subscriptions.begin(), m_subscriptions.end(),
                                 [&event](const Subscription& s) { return s.event == event; });
}

} // namespace Quire
