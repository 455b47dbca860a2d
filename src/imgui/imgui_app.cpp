#include "imgui_app.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <cassert>
#include <format>
#include <stdexcept>

namespace lazylist {

ImGuiApp::ImGuiApp(ContentBrowser* browser, UiTaskQueue* ui_queue, ErrorLog* error_log)
    : browser_(browser)
    , ui_queue_(ui_queue)
    , error_log_(error_log) {

    // Validate required dependencies
    assert(browser_ && "ContentBrowser must not be null");
    assert(ui_queue_ && "UiTaskQueue must not be null");
    assert(error_log_ && "ErrorLog must not be null");

    // Wake up the UI when a page is ready to settle
    ui_queue_->set_on_posted([this]() {
        post_empty_event_debounced();
    });
}

ImGuiApp::~ImGuiApp() {
    ui_queue_->set_on_posted(nullptr);
}

void ImGuiApp::run() {
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    window_ = glfwCreateWindow(1100, 900, "lazylist - content directory", nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.ScrollbarRounding = 2.0f;

    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    // Start the page source and show the first page
    browser_->start();
    apply_query();

    while (!glfwWindowShouldClose(window_)) {
        glfwWaitEventsTimeout(0.1);

        // Settle finished pages on this thread
        ui_queue_->run_pending();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);
    }

    // Release the observer and drop pages still in flight before the
    // worker goes away
    browser_->loader().teardown();
    browser_->stop();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void ImGuiApp::post_empty_event_debounced() {
    if (!window_) return;

    std::lock_guard lock(event_debounce_mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (now - last_event_post_time_ >= kEventDebounceInterval) {
        last_event_post_time_ = now;
        glfwPostEmptyEvent();
    }
}

void ImGuiApp::apply_query() {
    if (!browser_->apply_query(view_model_.collection.query())) return;

    view_model_.collection.selected_absolute = kNoSelection;
    scroll_to_top_ = true;
}

void ImGuiApp::render() {
    view_model_.update_from_browser(*browser_, *error_log_);

    // Create main window that fills the viewport
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);

    constexpr ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                              ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                              ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar;

    ImGui::Begin("lazylist", nullptr, window_flags);

    render_menu_bar();
    render_toolbar();

    // List pane, leaving room for the status bar
    const float list_height = ImGui::GetContentRegionAvail().y - ImGui::GetFrameHeightWithSpacing();
    ImGui::BeginChild("CollectionPane", ImVec2(0, list_height), true);
    handle_keyboard_navigation();
    render_collection();
    ImGui::EndChild();

    render_status_bar();

    ImGui::End();
}

void ImGuiApp::render_menu_bar() {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Exit", "Alt+F4")) {
                glfwSetWindowShouldClose(glfwGetCurrentContext(), GLFW_TRUE);
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            auto& loader = browser_->loader();
            if (ImGui::MenuItem("Load More", "M", false, loader.has_more() && !loader.is_loading())) {
                loader.load_more();
            }
            if (ImGui::MenuItem("Retry", "R", false, loader.phase() == LoadPhase::Error)) {
                loader.retry();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Reload", "F5")) {
                browser_->reload();
                view_model_.collection.selected_absolute = kNoSelection;
                scroll_to_top_ = true;
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Clear Errors")) {
                error_log_->clear();
            }
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

void ImGuiApp::render_toolbar() {
    auto& collection = view_model_.collection;

    // Category tabs
    if (ImGui::BeginTabBar("Categories")) {
        for (size_t i = 0; i < kTabLabels.size(); ++i) {
            if (ImGui::BeginTabItem(kTabLabels[i])) {
                if (collection.active_tab != static_cast<int>(i)) {
                    collection.active_tab = static_cast<int>(i);
                    apply_query();
                }
                ImGui::EndTabItem();
            }
        }
        ImGui::EndTabBar();
    }

    ImGui::Text("Search:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(250);
    if (collection.focus_search_box) {
        ImGui::SetKeyboardFocusHere();
        collection.focus_search_box = false;
    }
    ImGui::InputText("##search", collection.search_buffer, sizeof(collection.search_buffer));
    if (ImGui::IsItemEdited()) {
        collection.search_text = collection.search_buffer;
        apply_query();
    }
    ImGui::SameLine();

    if (ImGui::Button("Clear") && collection.search_buffer[0] != '\0') {
        collection.search_buffer[0] = '\0';
        collection.search_text.clear();
        apply_query();
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%zu results", view_model_.status_bar.total_results);
}

void ImGuiApp::render_status_bar() {
    const auto& status = view_model_.status_bar;

    if (!status.recent_errors.empty()) {
        const auto& latest = status.recent_errors.back();
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.8f, 0.2f, 1.0f));
        ImGui::Text("[!] %s: %s", error_kind_name(latest.kind), latest.message.c_str());
        ImGui::PopStyleColor();
        ImGui::SameLine();
        ImGui::TextDisabled("|");
        ImGui::SameLine();
    }

    ImGui::Text("Retained: %zu | Evicted: %zu | %s | %s",
                status.retained_count,
                status.evicted_count,
                status.has_more ? "More available" : "End of list",
                load_phase_name(status.phase));
}

} // namespace lazylist
