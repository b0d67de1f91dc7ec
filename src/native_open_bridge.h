#pragma once

#include "candidate_producer.h"
#include <memory>
#include <optional>
#include <string>

namespace Quire {

// Turn a native "open document" payload into a plain path.
// POSIX paths are taken as-is; file:// URLs have their escapes decoded.
// Returns nothing for empty payloads, malformed escapes or embedded NULs.
std::optional<std::string> normalizeNativePayload(const std::string& raw);

// Receives "open this document" requests the OS sends to the running process
// (double-click on a file while the viewer is open). Hosts without such a
// facility get NullOpenBridge.
class NativeOpenBridge : public CandidateProducer {
public:
    const char* name() const override { return "native-open"; }

    virtual bool canReceiveOpenEvents() const = 0;

protected:
    // Called by platform code for every raw payload it receives
    void deliver(const std::string& raw);

    Sink m_sink;
};

class NullOpenBridge : public NativeOpenBridge {
public:
    bool canReceiveOpenEvents() const override { return false; }
    bool start(Sink sink) override;
};

// Bridge for the host platform. Defined by the platform source the build selects.
std::unique_ptr<NativeOpenBridge> createNativeOpenBridge();

} // namespace Quire
