#pragma once

#include "candidate_path.h"
#include "event_channel.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace Quire {

struct PendingOpenRequest {
    std::string path;
    CandidateSource source = CandidateSource::LaunchArgument;
    std::chrono::steady_clock::time_point observedAt;
};

enum class DispatchState {
    Idle,       // nothing held
    Pending,    // a request is held, waiting for readiness or the drain loop
    Delivered   // the held request is being emitted
};

// Holds the latest accepted open request and emits it on the frontend channel
// exactly once, and only after the display surface has reported it is ready.
//
// submit() overwrites any undelivered request (last valid candidate wins).
// markReady() flips NotReady -> Ready once; later calls are ignored.
// Emissions are serialized through one drain loop: a handler that submits
// from inside its callback gets its request delivered right after it returns.
class OpenDispatcher {
public:
    explicit OpenDispatcher(EventChannel& frontend);

    OpenDispatcher(const OpenDispatcher&) = delete;
    OpenDispatcher& operator=(const OpenDispatcher&) = delete;

    void submit(const CandidatePath& candidate);
    void markReady();

    bool isReady() const;
    DispatchState state() const;
    std::optional<PendingOpenRequest> pending() const;
    size_t deliveredCount() const;

    // Block until ready or until timeout expires. Returns true if ready.
    bool waitUntilReady(std::chrono::milliseconds timeout) const;

    // Readiness failed to arrive: drop the held request and report it.
    // Returns the dropped request, if there was one.
    std::optional<PendingOpenRequest> abandonPending(const std::string& reason);

private:
    // Emit held requests until none remain. Caller must have set m_draining.
    void drain();

    EventChannel& m_frontend;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_readyCv;
    std::optional<PendingOpenRequest> m_pending;
    bool m_ready = false;
    bool m_draining = false;
    size_t m_delivered = 0;
};

} // namespace Quire
