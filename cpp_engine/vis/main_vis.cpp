// main_vis.cpp (cuf_monitor)
// - Engine lives on one worker thread; the UI never touches it.
// - Worker publishes immutable MonitorFrame copies (EngineSnapshot + event log) through a
//   mutex-guarded slot; UI commands go the other way through a small queue.
// - Plots: mean-state / void-entropy trends and the current node-state profile.

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

#include "Engine.h"
#include "EngineErrors.h"
#include "SnapshotCodec.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define CUF_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

// ============================================================
// Worker <-> UI exchange
// ============================================================

struct MonitorFrame {
    cuf::EngineSnapshot snap;
    std::vector<cuf::EventRecord> events;
    std::size_t set_count = 0;
    double mean_state = 0.0;
    std::uint32_t state_digest_u32 = 0;
    std::string backend;
};

enum class MonitorCommand { Step, Reset, Save, Load };

struct MonitorRequest {
    MonitorCommand cmd = MonitorCommand::Step;
    std::string path;
};

class MonitorChannel {
public:
    void publish(MonitorFrame frame) {
        std::lock_guard<std::mutex> lock(mu_);
        frame_ = std::move(frame);
        ++version_;
    }

    // Copies the latest frame if it is newer than *seen.
    bool latest(std::uint64_t* seen, MonitorFrame* out) const {
        std::lock_guard<std::mutex> lock(mu_);
        if (version_ == *seen) return false;
        *out = frame_;
        *seen = version_;
        return true;
    }

    void request(MonitorRequest r) {
        std::lock_guard<std::mutex> lock(mu_);
        requests_.push_back(std::move(r));
    }

    bool nextRequest(MonitorRequest* out) {
        std::lock_guard<std::mutex> lock(mu_);
        if (requests_.empty()) return false;
        *out = std::move(requests_.front());
        requests_.pop_front();
        return true;
    }

    void setStatus(const std::string& s) {
        std::lock_guard<std::mutex> lock(mu_);
        status_ = s;
    }

    std::string status() const {
        std::lock_guard<std::mutex> lock(mu_);
        return status_;
    }

    std::atomic<bool> running{false};
    std::atomic<bool> quit{false};
    std::atomic<int> cycles_per_second{20};

private:
    mutable std::mutex mu_;
    MonitorFrame frame_;
    std::uint64_t version_ = 0;
    std::deque<MonitorRequest> requests_;
    std::string status_ = "Idle";
};

static MonitorFrame make_frame(const cuf::Engine& engine) {
    MonitorFrame f;
    f.snap = engine.captureSnapshot();
    f.events.resize(static_cast<std::size_t>(engine.config().event_log_capacity_u32));
    const int n = engine.getEventLog(f.events.data(), static_cast<int>(f.events.size()));
    f.events.resize(static_cast<std::size_t>(n));
    f.set_count = engine.unionFind().setCount();
    f.mean_state = engine.meanState();
    f.state_digest_u32 = engine.getRunSignatures().state_digest_u32;
    f.backend = engine.backend().name();
    return f;
}

static void engine_worker(MonitorChannel* ch, cuf::EngineConfigV1 cfg, std::string initial_load) {
    cuf::Engine engine(cfg, cuf::referenceKernels());
    const cuf::SnapshotCodec codec;

    if (!initial_load.empty()) {
        try {
            engine.restoreSnapshot(codec.loadFromFile(initial_load));
            ch->setStatus("Loaded " + initial_load);
        } catch (const cuf::SnapshotCorrupt& e) {
            ch->setStatus(std::string("Load failed: ") + e.what());
        }
    }
    ch->publish(make_frame(engine));

    auto next_tick = std::chrono::steady_clock::now();
    while (!ch->quit.load()) {
        bool changed = false;

        MonitorRequest req;
        while (ch->nextRequest(&req)) {
            switch (req.cmd) {
            case MonitorCommand::Step:
                if (!engine.isHalted()) {
                    try {
                        engine.step();
                    } catch (const cuf::NumericDivergence& e) {
                        ch->setStatus(std::string("Diverged: ") + e.what());
                        ch->running = false;
                    }
                }
                break;
            case MonitorCommand::Reset:
                engine.reset();
                ch->running = false;
                ch->setStatus("Reset");
                break;
            case MonitorCommand::Save: {
                cuf::EncodeReport report;
                if (codec.saveToFile(engine.captureSnapshot(), req.path, &report)) {
                    char buf[256];
                    std::snprintf(buf, sizeof(buf), "Saved %s (%zu bytes, %zu coeffs, err %.2g)",
                                  req.path.c_str(), report.compressed_bytes,
                                  report.retained_coefficients, report.max_abs_error);
                    ch->setStatus(buf);
                } else {
                    ch->setStatus("Save failed: cannot write " + req.path);
                }
                break;
            }
            case MonitorCommand::Load:
                try {
                    engine.restoreSnapshot(codec.loadFromFile(req.path));
                    ch->running = false;
                    ch->setStatus("Loaded " + req.path);
                } catch (const cuf::SnapshotCorrupt& e) {
                    ch->setStatus(std::string("Load failed: ") + e.what());
                }
                break;
            }
            changed = true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (ch->running.load() && !engine.isHalted() && now >= next_tick) {
            const int rate = std::clamp(ch->cycles_per_second.load(), 1, 1000);
            next_tick = now + std::chrono::microseconds(1000000 / rate);
            try {
                if (engine.step() == cuf::StepOutcome::Skipped) {
                    ch->setStatus("Quiescent: cycles are being skipped");
                }
            } catch (const cuf::NumericDivergence& e) {
                ch->setStatus(std::string("Diverged: ") + e.what());
                ch->running = false;
            }
            if (engine.isHalted()) {
                ch->running = false;
                ch->setStatus(std::string("Halted: ") + cuf::haltReasonName(engine.haltReason()));
            }
            changed = true;
        }

        if (changed) {
            ch->publish(make_frame(engine));
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }
}

static void plot_series(const char* title, const char* label, const std::vector<double>& ys) {
    if (ys.size() <= 1)
        return;

    std::vector<double> xs(ys.size());
    for (std::size_t i = 0; i < xs.size(); ++i) xs[i] = static_cast<double>(i);

    if (ImPlot::BeginPlot(title)) {
#if defined(ImAxis_X1)
        ImPlot::SetupAxisLimits(ImAxis_X1, 0.0, xs.back(), ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, 0.0, xs.back(), ImGuiCond_Always);
#endif
        ImPlot::PlotLine(label, xs.data(), ys.data(), static_cast<int>(ys.size()));
        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    // --- CLI flags ---
    cuf::EngineConfigV1 cfg;
    std::string initial_load;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--nodes" && i + 1 < argc) {
            cfg.node_count_u32 = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--seed" && i + 1 < argc) {
            cfg.seed_u32 = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--backend" && i + 1 < argc) {
            if (!cuf::parseBackendKind(argv[++i], &cfg.backend)) {
                std::fprintf(stderr, "Unknown backend: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
        } else if (arg == "--load" && i + 1 < argc) {
            initial_load = argv[++i];
        }
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "CUF Monitor", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef CUF_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    MonitorChannel channel;
    std::thread worker(engine_worker, &channel, cfg, initial_load);

    MonitorFrame frame;
    std::uint64_t seen_version = 0;
    bool show_hud = true;
    bool show_controls = true;
    char snapshot_path[256] = "cuf_snapshot.cufz";
    int rate_slider = channel.cycles_per_second.load();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        channel.latest(&seen_version, &frame);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef CUF_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        const cuf::EngineSnapshot& s = frame.snap;
        const ImVec4 header_col = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_ok = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_fail = ImVec4(1.0f, 0.2f, 0.2f, 1.0f);

        if (show_hud) {
            ImGuiWindowFlags dashboard_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImVec2 viewport_size = ImGui::GetMainViewport()->Size;
            ImGui::SetNextWindowPos(ImVec2(viewport_size.x - 12, 12), ImGuiCond_Always, ImVec2(1.0f, 0.0f));
            ImGui::SetNextWindowBgAlpha(0.85f);

            if (ImGui::Begin("##Dashboard", &show_hud, dashboard_flags)) {
                ImGui::TextColored(header_col, "[ CUF ENGINE ]");
                ImGui::Separator();
                ImGui::Text("Cycle:        %llu", static_cast<unsigned long long>(s.cycle));
                ImGui::Text("Nodes:        %u (%s)", s.node_count_u32, frame.backend.c_str());
                ImGui::Text("Mean state:   %.5f", frame.mean_state);
                ImGui::Text("Void entropy: %+.5f", s.void_entropy);
                ImGui::Text("Ledger:       %.4f", s.ledger_value);
                ImGui::Text("Leakage:      %.4f", s.leakage);
                ImGui::Text("Sets:         %zu", frame.set_count);
                ImGui::Text("Digest:       0x%08X", frame.state_digest_u32);
                if (s.halted) {
                    ImGui::TextColored(status_fail, "HALTED: %s", cuf::haltReasonName(s.halt_reason));
                } else {
                    ImGui::TextColored(status_ok, channel.running.load() ? "RUNNING" : "PAUSED");
                }
            }
            ImGui::End();
        }

        if (show_controls) {
            ImGui::SetNextWindowSize(ImVec2(640, 700), ImGuiCond_FirstUseEver);
            ImGui::Begin(">> CONTROL CONSOLE", &show_controls);

            if (ImGui::BeginTabBar("ControlTabs", ImGuiTabBarFlags_None)) {
                if (ImGui::BeginTabItem("  EXEC  ")) {
                    ImGui::TextColored(header_col, "[EXEC] Transport Controls");
                    ImGui::Separator();

                    const bool running = channel.running.load();
                    if (ImGui::Button(running ? "  PAUSE  " : "   RUN   ", ImVec2(100, 0))) {
                        channel.running = !running;
                    }
                    ImGui::SameLine();
                    if (ImGui::Button("  STEP  ", ImVec2(100, 0))) {
                        channel.request({MonitorCommand::Step, std::string()});
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(" RESET ", ImVec2(100, 0))) {
                        channel.request({MonitorCommand::Reset, std::string()});
                    }

                    ImGui::Spacing();
                    ImGui::SliderInt("Cycles / s", &rate_slider, 1, 500);
                    channel.cycles_per_second = rate_slider;

                    ImGui::Spacing();
                    ImGui::TextColored(header_col, "[SNAPSHOT] Persistence");
                    ImGui::Separator();
                    ImGui::InputText("Path", snapshot_path, sizeof(snapshot_path));
                    if (ImGui::Button("[ SAVE ]", ImVec2(150, 0))) {
                        channel.request({MonitorCommand::Save, snapshot_path});
                    }
                    ImGui::SameLine();
                    if (ImGui::Button("[ LOAD ]", ImVec2(150, 0))) {
                        channel.request({MonitorCommand::Load, snapshot_path});
                    }

                    ImGui::Spacing();
                    ImGui::TextWrapped("Status: %s", channel.status().c_str());
                    ImGui::EndTabItem();
                }

                if (ImGui::BeginTabItem("  PLOTS  ")) {
                    const int n = static_cast<int>(s.trend_mean_state.size());
                    ImGui::Text("Trend samples: %d", n);
                    ImGui::Separator();
                    if (n > 1) {
                        plot_series("Mean node state", "mean", s.trend_mean_state);
                        plot_series("Void entropy", "void", s.trend_void_entropy);
                    } else {
                        ImGui::TextUnformatted("No trend data yet (press Run or Step).");
                    }
                    plot_series("Node state", "state", s.node_state);
                    ImGui::EndTabItem();
                }

                if (ImGui::BeginTabItem("  EVENTS  ")) {
                    ImGui::BeginChild("events", ImVec2(0, 0), true);
                    for (const auto& ev : frame.events) {
                        if (ev.kind == cuf::EventKind::Fatal) {
                            ImGui::TextColored(status_fail, "%s", ev.text.c_str());
                        } else {
                            ImGui::TextUnformatted(ev.text.c_str());
                        }
                    }
                    ImGui::EndChild();
                    ImGui::EndTabItem();
                }

                ImGui::EndTabBar();
            }
            ImGui::End();
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);
        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    channel.quit = true;
    worker.join();

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
