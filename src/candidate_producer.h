#pragma once

#include "candidate_path.h"
#include <functional>

namespace Quire {

// Common interface of every open-intent source. A producer reports zero or one
// candidate per OS signal it observes; it knows nothing about who consumes them.
class CandidateProducer {
public:
    using Sink = std::function<void(const CandidatePath&)>;

    virtual ~CandidateProducer() = default;

    // Short name used in log lines
    virtual const char* name() const = 0;

    // Begin observing. Returns false if the producer could not attach to its
    // source; the caller carries on without it.
    virtual bool start(Sink sink) = 0;

    // Detach from the source. Safe to call more than once.
    virtual void stop() {}
};

} // namespace Quire
