#pragma once

#include "candidate_producer.h"
#include "open_dispatcher.h"
#include <atomic>
#include <memory>
#include <vector>

namespace Quire {

// Owns the open-intent producers, validates what they report with one shared
// file-type rule, and forwards accepted candidates to the dispatcher.
class OpenIntentPipeline {
public:
    OpenIntentPipeline(OpenDispatcher& dispatcher, FileTypeRule rule);
    ~OpenIntentPipeline();

    OpenIntentPipeline(const OpenIntentPipeline&) = delete;
    OpenIntentPipeline& operator=(const OpenIntentPipeline&) = delete;

    // Returns a reference to the added producer
    CandidateProducer& addProducer(std::unique_ptr<CandidateProducer> producer);

    // Start every producer in insertion order. Producers that fail to attach
    // are logged and skipped. Returns the number that started.
    size_t start();
    void stop();

    // Validate and forward one candidate. Returns true if it was accepted.
    bool submit(const CandidatePath& candidate);

    const FileTypeRule& rule() const { return m_rule; }
    size_t rejectedCount() const { return m_rejected.load(); }

private:
    OpenDispatcher& m_dispatcher;
    FileTypeRule m_rule;
    std::vector<std::unique_ptr<CandidateProducer>> m_producers;
    std::vector<CandidateProducer*> m_started;
    std::atomic<size_t> m_rejected{0};
};

} // namespace Quire
