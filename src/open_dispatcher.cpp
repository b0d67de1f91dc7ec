#include "open_dispatcher.h"

#include <cstdio>

namespace Quire {

OpenDispatcher::OpenDispatcher(EventChannel& frontend) : m_frontend(frontend) {}

void OpenDispatcher::submit(const CandidatePath& candidate) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_pending) {
            fprintf(stderr, "[dispatch] '%s' supersedes undelivered '%s'\n",
                    candidate.path.c_str(), m_pending->path.c_str());
        }
        m_pending = PendingOpenRequest{candidate.path, candidate.source,
                                       std::chrono::steady_clock::now()};
        // Held until ready; an active drain loop will pick it up by itself
        if (!m_ready || m_draining) return;
        m_draining = true;
    }
    drain();
}

void OpenDispatcher::markReady() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_ready) {
            fprintf(stderr, "[dispatch] display surface already ready, ignoring signal\n");
            return;
        }
        m_ready = true;
        m_readyCv.notify_all();
        if (!m_pending || m_draining) return;
        m_draining = true;
    }
    drain();
}

void OpenDispatcher::drain() {
    for (;;) {
        PendingOpenRequest request;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (!m_pending) {
                m_draining = false;
                return;
            }
            request = std::move(*m_pending);
            m_pending.reset();
            ++m_delivered;
        }

        size_t receivers = 0;
        try {
            receivers = m_frontend.emit(kOpenPdfFileEvent, request.path);
        } catch (...) {
            // Release the loop so later submissions are not held forever
            std::lock_guard<std::mutex> lk(m_mutex);
            m_draining = false;
            throw;
        }
        if (receivers == 0) {
            fprintf(stderr, "[dispatch] no frontend listener for '%s'\n", request.path.c_str());
        }
    }
}

bool OpenDispatcher::isReady() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_ready;
}

DispatchState OpenDispatcher::state() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_pending) return DispatchState::Pending;
    return m_draining ? DispatchState::Delivered : DispatchState::Idle;
}

std::optional<PendingOpenRequest> OpenDispatcher::pending() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_pending;
}

size_t OpenDispatcher::deliveredCount() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_delivered;
}

bool OpenDispatcher::waitUntilReady(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_mutex);
    return m_readyCv.wait_for(lk, timeout, [this] { return m_ready; });
}

std::optional<PendingOpenRequest> OpenDispatcher::abandonPending(const std::string& reason) {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_pending) {
        fprintf(stderr, "[dispatch] %s\n", reason.c_str());
        return std::nullopt;
    }
    fprintf(stderr, "[dispatch] %s; dropping open request for '%s' (%s)\n",
            reason.c_str(), m_pending->path.c_str(), sourceName(m_pending->source));
    std::optional<PendingOpenRequest> dropped = std::move(m_pending);
    m_pending.reset();
    return dropped;
}

} // namespace Quire
