#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Quire {

// Event names shared between the pipeline and the display layer
constexpr const char* kOpenPdfFileEvent = "open-pdf-file";
constexpr const char* kDropEvent = "drop";
constexpr const char* kDropHoverEvent = "drop-hover";
constexpr const char* kDropCancelledEvent = "drop-cancelled";

// Named events carrying a string payload. Fire-and-forget: no acknowledgment,
// handlers run in subscription order on the emitting thread.
class EventChannel {
public:
    using Handler = std::function<void(const std::string& payload)>;
    using SubscriptionId = uint64_t;

    static constexpr SubscriptionId NO_SUBSCRIPTION = 0;

    SubscriptionId subscribe(const std::string& event, Handler handler);
    // Returns false if the id was unknown (already removed)
    bool unsubscribe(SubscriptionId id);

    // Deliver payload to every handler of the event; returns how many ran
    size_t emit(const std::string& event, const std::string& payload);

    size_t subscriberCount(const std::string& event) const;

private:
    struct Subscription {
        SubscriptionId id;
        std::string event;
        std::shared_ptr<Handler> handler;
    };

    mutable std::mutex m_mutex;
    std::vector<Subscription> m_subscriptions;
    SubscriptionId m_nextId = 1;
};

} // namespace Quire
