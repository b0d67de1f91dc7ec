#include "open_pipeline.h"

#include <cstdio>

namespace Quire {

OpenIntentPipeline::OpenIntentPipeline(OpenDispatcher& dispatcher, FileTypeRule rule)
    : m_dispatcher(dispatcher), m_rule(std::move(rule)) {}

OpenIntentPipeline::~OpenIntentPipeline() {
    stop();
}

CandidateProducer& OpenIntentPipeline::addProducer(std::unique_ptr<CandidateProducer> producer) {
    m_producers.push_back(std::move(producer));
    return *m_producers.back();
}

size_t OpenIntentPipeline::start() {
    for (auto& producer : m_producers) {
        CandidateProducer* p = producer.get();
        bool alreadyStarted = false;
        for (auto* s : m_started) alreadyStarted |= (s == p);
        if (alreadyStarted) continue;

        if (p->start([this](const CandidatePath& c) { submit(c); })) {
            m_started.push_back(p);
        } else {
            fprintf(stderr, "[pipeline] producer '%s' failed to start, continuing without it\n",
                    p->name());
        }
    }
    return m_started.size();
}

void OpenIntentPipeline::stop() {
    for (auto it = m_started.rbegin(); it != m_started.rend(); ++it) {
        (*it)->stop();
    }
    m_started.clear();
}

bool OpenIntentPipeline::submit(const CandidatePath& candidate) {
    if (!isValidCandidate(candidate, m_rule)) {
        ++m_rejected;
        fprintf(stderr, "[pipeline] rejected %s candidate '%s'\n",
                sourceName(candidate.source), candidate.path.c_str());
        return false;
    }
    fprintf(stderr, "[pipeline] accepted %s candidate '%s'\n",
            sourceName(candidate.source), candidate.path.c_str());
    m_dispatcher.submit(candidate);
    return true;
}

} // namespace Quire
