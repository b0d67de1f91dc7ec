#pragma once

#include "candidate_producer.h"
#include "event_channel.h"
#include <optional>
#include <string>
#include <vector>

namespace Quire {

// Encode dropped paths as the JSON list the listener decodes. Paths that are
// not valid UTF-8 cannot survive the round trip and are skipped.
std::string encodeDropPayload(const std::vector<std::string>& paths);

// Decode a drop payload (JSON array of path strings). Returns nothing if the
// payload is not valid JSON, not an array, or holds a non-string entry.
std::optional<std::vector<std::string>> decodeDropPayload(const std::string& payload);

// First path (in drop order) with the supported extension
std::optional<std::string> selectFirstSupported(const std::vector<std::string>& paths,
                                                const FileTypeRule& rule);

// Listens to the display layer's drop notifications and turns a drop into at
// most one candidate.
class DragDropListener : public CandidateProducer {
public:
    DragDropListener(EventChannel& displayEvents, FileTypeRule rule);
    ~DragDropListener() override;

    const char* name() const override { return "drop"; }
    bool start(Sink sink) override;
    void stop() override;

    bool isListening() const { return m_dropSub != EventChannel::NO_SUBSCRIPTION; }

private:
    void onDrop(const std::string& payload);
    void onHover(const std::string& payload);
    void onCancelled(const std::string& payload);

    EventChannel& m_displayEvents;
    FileTypeRule m_rule;
    Sink m_sink;

    EventChannel::SubscriptionId m_dropSub = EventChannel::NO_SUBSCRIPTION;
    EventChannel::SubscriptionId m_hoverSub = EventChannel::NO_SUBSCRIPTION;
    EventChannel::SubscriptionId m_cancelSub = EventChannel::NO_SUBSCRIPTION;
};

} // namespace Quire
