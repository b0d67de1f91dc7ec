#include "app.h"

#include "drop_listener.h"
#include "launch_args.h"
#include "native_open_bridge.h"

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace Quire {

constexpr const char* QUIRE_VERSION = "0.3";

// Error callback for GLFW
static void glfw_error_callback(int error, const char* description) {
    fprintf(stderr, "GLFW Error %d: %s\n", error, description);
}

App::App(AppConfig config)
    : m_config(std::move(config)),
      m_dispatcher(m_frontend),
      m_pipeline(m_dispatcher, m_config.fileTypeRule()) {
    m_pipeline.addProducer(std::make_unique<DragDropListener>(m_displayEvents, m_pipeline.rule()));

    auto bridge = createNativeOpenBridge();
    m_nativeBridge = bridge.get();
    m_pipeline.addProducer(std::move(bridge));
}

App::~App() {
    shutdown();
}

void App::addLaunchArguments(int argc, char** argv) {
    m_pipeline.addProducer(std::make_unique<LaunchArgumentScanner>(argc, argv, m_pipeline.rule()));
}

bool App::init() {
    // The frontend listens before any producer runs; requests are held until
    // the first frame is on screen anyway.
    m_openSub = m_frontend.subscribe(kOpenPdfFileEvent,
        [this](const std::string& path) { onOpenPdfFile(path); });
    size_t started = m_pipeline.start();
    fprintf(stderr, "[app] %zu open-intent source(s) active, native open events %s\n",
            started, m_nativeBridge && m_nativeBridge->canReceiveOpenEvents() ? "on" : "off");

    // Setup GLFW
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        m_dispatcher.abandonPending("GLFW failed to initialize");
        return false;
    }
    m_glfwInitialized = true;

    // GL version hints
#if defined(__APPLE__)
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
    const char* glsl_version = "#version 150";
#else
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    const char* glsl_version = "#version 130";
#endif

    // Create window
    m_window = glfwCreateWindow(m_config.windowWidth, m_config.windowHeight, "Quire", nullptr, nullptr);
    if (!m_window) {
        m_dispatcher.abandonPending("display surface failed to construct");
        return false;
    }

    // Store pointer for callbacks
    glfwSetWindowUserPointer(m_window, this);
    glfwSetDropCallback(m_window, [](GLFWwindow* w, int count, const char** paths) {
        auto app = static_cast<App*>(glfwGetWindowUserPointer(w));
        if (app) {
            app->publishDrop(count, paths);
        }
    });

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(1); // Enable vsync

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    // Setup style
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.FramePadding = ImVec2(8, 4);
    style.ItemSpacing = ImVec2(8, 6);

    ImVec4* colors = style.Colors;
    colors[ImGuiCol_WindowBg] = ImVec4(0.12f, 0.13f, 0.15f, 1.00f);
    colors[ImGuiCol_Button] = ImVec4(0.22f, 0.35f, 0.50f, 0.80f);
    colors[ImGuiCol_ButtonHovered] = ImVec4(0.28f, 0.45f, 0.65f, 1.00f);
    colors[ImGuiCol_ButtonActive] = ImVec4(0.25f, 0.50f, 0.75f, 1.00f);

    // Setup Platform/Renderer backends
    ImGui_ImplGlfw_InitForOpenGL(m_window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    m_startedAt = std::chrono::steady_clock::now();
    m_running = true;
    return true;
}

void App::run() {
    while (m_running && !glfwWindowShouldClose(m_window)) {
        glfwPollEvents();

        // A minimized window has nothing to present and is not ready
        int display_w, display_h;
        glfwGetFramebufferSize(m_window, &display_w, &display_h);
        if (display_w <= 0 || display_h <= 0) {
            checkReadinessDeadline();
            glfwWaitEventsTimeout(0.1);
            continue;
        }

        // Start the Dear ImGui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        renderUI();

        ImGui::Render();
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.10f, 0.10f, 0.12f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(m_window);

        afterFramePresented();
    }
}

void App::shutdown() {
    // Stop producers first so nothing is delivered into a dying frontend
    m_pipeline.stop();
    if (m_openSub) {
        m_frontend.unsubscribe(m_openSub);
        m_openSub = EventChannel::NO_SUBSCRIPTION;
    }

    if (m_window) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_glfwInitialized) {
        glfwTerminate();
        m_glfwInitialized = false;
    }
    m_running = false;
}

void App::publishDrop(int count, const char** paths) {
    if (count <= 0 || !paths) return;

    std::vector<std::string> dropped;
    dropped.reserve(count);
    for (int i = 0; i < count; ++i) {
        if (paths[i]) dropped.emplace_back(paths[i]);
    }
    m_displayEvents.emit(kDropEvent, encodeDropPayload(dropped));
}

void App::onOpenPdfFile(const std::string& path) {
    if (path.empty()) return;

    auto info = describeDocument(path);
    if (!info) {
        fprintf(stderr, "[app] cannot open '%s': not a readable file\n", path.c_str());
        m_openError = "Could not open " + displayNameForPath(path);
        return;
    }

    fprintf(stderr, "[app] opened '%s' (%s)\n", info->path.c_str(), formatFileSize(info->sizeBytes).c_str());
    m_document = std::move(info);
    m_openError.clear();
    m_openedAt = std::chrono::system_clock::now();
    if (m_window) glfwSetWindowTitle(m_window, ("Quire - " + m_document->name).c_str());
}

void App::afterFramePresented() {
    if (m_dispatcher.isReady()) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_startedAt);
    fprintf(stderr, "[app] display surface ready after %lld ms\n", (long long)elapsed.count());
    m_dispatcher.markReady();
}

void App::checkReadinessDeadline() {
    if (m_readinessAbandoned || m_dispatcher.isReady()) return;

    auto elapsed = std::chrono::steady_clock::now() - m_startedAt;
    if (elapsed < std::chrono::milliseconds(m_config.readinessTimeoutMs)) return;

    m_readinessAbandoned = true;
    char reason[128];
    snprintf(reason, sizeof(reason), "display surface not ready after %d ms", m_config.readinessTimeoutMs);
    m_dispatcher.abandonPending(reason);
}

void App::renderUI() {
    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoNavFocus;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0f);
    ImGui::Begin("MainWindow", nullptr, window_flags);
    ImGui::PopStyleVar(2);

    renderOpenPathBar();
    ImGui::Separator();

    ImVec2 contentSize = ImGui::GetContentRegionAvail();
    contentSize.y -= 30.0f;  // Reserve space for status bar
    ImGui::BeginChild("DocumentPanel", contentSize, true);
    if (m_document) {
        renderDocument();
    } else {
        renderPlaceholder();
    }
    ImGui::EndChild();

    renderStatusBar();
    ImGui::End();
}

void App::renderPlaceholder() {
    const char* title = "Open a PDF Document";
    const char* hint = "Drag and drop a PDF file here, or pass one on the command line";

    ImVec2 avail = ImGui::GetContentRegionAvail();
    ImGui::SetCursorPosY(avail.y * 0.4f);

    ImGui::SetCursorPosX((avail.x - ImGui::CalcTextSize(title).x) * 0.5f);
    ImGui::TextUnformatted(title);
    ImGui::SetCursorPosX((avail.x - ImGui::CalcTextSize(hint).x) * 0.5f);
    ImGui::TextColored(ImVec4(0.6f, 0.6f, 0.6f, 1.0f), "%s", hint);

    if (!m_openError.empty()) {
        ImGui::SetCursorPosX((avail.x - ImGui::CalcTextSize(m_openError.c_str()).x) * 0.5f);
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", m_openError.c_str());
    }
}

void App::renderDocument() {
    ImGui::Text("%s", m_document->name.c_str());
    ImGui::Separator();
    ImGui::TextColored(ImVec4(0.6f, 0.6f, 0.6f, 1.0f), "Path");
    ImGui::SameLine(90.0f);
    ImGui::TextWrapped("%s", m_document->path.c_str());
    ImGui::TextColored(ImVec4(0.6f, 0.6f, 0.6f, 1.0f), "Size");
    ImGui::SameLine(90.0f);
    ImGui::Text("%s", formatFileSize(m_document->sizeBytes).c_str());

    std::time_t t = std::chrono::system_clock::to_time_t(m_openedAt);
    char when[64] = "";
    if (std::tm* local = std::localtime(&t)) {
        std::strftime(when, sizeof(when), "%Y-%m-%d %H:%M:%S", local);
    }
    ImGui::TextColored(ImVec4(0.6f, 0.6f, 0.6f, 1.0f), "Opened");
    ImGui::SameLine(90.0f);
    ImGui::Text("%s", when);

    if (!m_openError.empty()) {
        ImGui::Spacing();
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", m_openError.c_str());
    }
}

void App::renderOpenPathBar() {
    const float btnW = 64.0f;
    float avail = ImGui::GetContentRegionAvail().x;
    ImGui::PushItemWidth(avail - btnW - ImGui::GetStyle().ItemSpacing.x);
    bool submitted = ImGui::InputTextWithHint("##open_path", "Path to a PDF file", m_openPathBuf,
                                              sizeof(m_openPathBuf), ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::PopItemWidth();
    ImGui::SameLine();
    submitted |= ImGui::Button("Open", ImVec2(btnW, 0));

    if (submitted) {
        nlohmann::json args = {{"filePath", std::string(m_openPathBuf)}};
        CommandResult result = m_commands.invoke("open_file_path", args.dump());
        m_commandFeedback = result ? "Request acknowledged" : ("Error: " + result.error);
    }
    if (!m_commandFeedback.empty()) {
        ImGui::TextColored(ImVec4(0.5f, 0.5f, 0.5f, 1.0f), "%s", m_commandFeedback.c_str());
    }
}

void App::renderStatusBar() {
    ImGui::Separator();

    if (m_dispatcher.isReady()) {
        ImGui::Text("Ready  |  Open requests delivered: %zu", m_dispatcher.deliveredCount());
    } else {
        ImGui::Text("Waiting for display surface");
    }

    ImGui::SameLine(ImGui::GetWindowWidth() - 260);
    ImGui::TextColored(ImVec4(0.5f, 0.5f, 0.5f, 1.0f), "Quire %s  |  .%s files",
                       QUIRE_VERSION, m_pipeline.rule().extension.c_str());
}

} // namespace Quire
