#pragma once

#include "config.h"
#include "document_info.h"
#include "event_channel.h"
#include "frontend_commands.h"
#include "open_dispatcher.h"
#include "open_pipeline.h"
#include <chrono>
#include <optional>
#include <string>

struct GLFWwindow;

namespace Quire {

class NativeOpenBridge;

class App {
public:
    explicit App(AppConfig config);
    ~App();

    // Register the process arguments as an open-intent source. Call before init().
    void addLaunchArguments(int argc, char** argv);

    // Initialize the window and start listening for open requests
    bool init();

    // Main run loop
    void run();

    // Cleanup
    void shutdown();

private:
    void renderUI();
    void renderPlaceholder();
    void renderDocument();
    void renderOpenPathBar();
    void renderStatusBar();

    // GLFW hands us the dropped paths; republished as a JSON list on the display channel
    void publishDrop(int count, const char** paths);

    // Frontend side of the open-pdf-file notification
    void onOpenPdfFile(const std::string& path);

    // Called after every presented frame; the first non-empty one marks the surface ready
    void afterFramePresented();
    void checkReadinessDeadline();

    AppConfig m_config;

    // Window handle
    GLFWwindow* m_window = nullptr;
    bool m_glfwInitialized = false;
    bool m_running = false;

    // Open-intent plumbing. Display events flow in, the frontend channel flows out.
    EventChannel m_displayEvents;
    EventChannel m_frontend;
    OpenDispatcher m_dispatcher;
    OpenIntentPipeline m_pipeline;
    FrontendCommands m_commands;
    NativeOpenBridge* m_nativeBridge = nullptr;  // owned by m_pipeline
    EventChannel::SubscriptionId m_openSub = EventChannel::NO_SUBSCRIPTION;

    // Readiness watchdog
    std::chrono::steady_clock::time_point m_startedAt;
    bool m_readinessAbandoned = false;

    // Document state
    std::optional<DocumentInfo> m_document;
    std::string m_openError;
    std::chrono::system_clock::time_point m_openedAt;

    // Open-path bar
    char m_openPathBuf[1024] = "";
    std::string m_commandFeedback;
};

} // namespace Quire
