#include "drop_listener.h"

#include <nlohmann/json.hpp>
#include <cstdio>

namespace Quire {

using json = nlohmann::json;

std::string encodeDropPayload(const std::vector<std::string>& paths) {
    json list = json::array();
    for (const auto& p : paths) {
        json entry = p;
        try {
            // Strict dump throws on invalid UTF-8
            entry.dump();
        } catch (const json::type_error&) {
            fprintf(stderr, "[drop] skipping dropped path that is not valid UTF-8 (%zu bytes)\n", p.size());
            continue;
        }
        list.push_back(std::move(entry));
    }
    return list.dump();
}

std::optional<std::vector<std::string>> decodeDropPayload(const std::string& payload) {
    try {
        json data = json::parse(payload);
        if (!data.is_array()) {
            fprintf(stderr, "[drop] payload is not a list, ignoring\n");
            return std::nullopt;
        }

        std::vector<std::string> paths;
        paths.reserve(data.size());
        for (const auto& item : data) {
            if (!item.is_string()) {
                fprintf(stderr, "[drop] payload entry is not a string, ignoring drop\n");
                return std::nullopt;
            }
            paths.push_back(item.get<std::string>());
        }
        return paths;
    } catch (const json::exception& e) {
        fprintf(stderr, "[drop] malformed payload: %s\n", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> selectFirstSupported(const std::vector<std::string>& paths,
                                                const FileTypeRule& rule) {
    for (const auto& p : paths) {
        if (rule.matches(p)) return p;
    }
    return std::nullopt;
}

DragDropListener::DragDropListener(EventChannel& displayEvents, FileTypeRule rule)
    : m_displayEvents(displayEvents), m_rule(std::move(rule)) {}

DragDropListener::~DragDropListener() {
    stop();
}

bool DragDropListener::start(Sink sink) {
    stop();
    m_sink = std::move(sink);

    m_dropSub = m_displayEvents.subscribe(kDropEvent,
        [this](const std::string& payload) { onDrop(payload); });
    // Hover and cancel stay subscribed even though they change nothing yet
    m_hoverSub = m_displayEvents.subscribe(kDropHoverEvent,
        [this](const std::string& payload) { onHover(payload); });
    m_cancelSub = m_displayEvents.subscribe(kDropCancelledEvent,
        [this](const std::string& payload) { onCancelled(payload); });

    return isListening();
}

void DragDropListener::stop() {
    if (m_dropSub) m_displayEvents.unsubscribe(m_dropSub);
    if (m_hoverSub) m_displayEvents.unsubscribe(m_hoverSub);
    if (m_cancelSub) m_displayEvents.unsubscribe(m_cancelSub);
    m_dropSub = m_hoverSub = m_cancelSub = EventChannel::NO_SUBSCRIPTION;
}

void DragDropListener::onDrop(const std::string& payload) {
    auto paths = decodeDropPayload(payload);
    if (!paths) return;

    auto chosen = selectFirstSupported(*paths, m_rule);
    if (!chosen) {
        fprintf(stderr, "[drop] no .%s file among %zu dropped path(s)\n",
                m_rule.extension.c_str(), paths->size());
        return;
    }
    if (m_sink) m_sink(CandidatePath{*chosen, CandidateSource::DragDrop});
}

void DragDropListener::onHover(const std::string&) {}

void DragDropListener::onCancelled(const std::string&) {}

} // namespace Quire
