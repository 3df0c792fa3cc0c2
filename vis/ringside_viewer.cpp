// ringside_viewer.cpp
// - Runs one seeded fight in batch mode and records every event
// - Replays the TICK stream against a wall-time accumulator (pause, scrub, speed)
// - Top-down ring drawn from RingGeometry, fighter markers from the snapshots
// - Stamina and damage plots with the X axis locked to the replay window

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "Events.h"
#include "FightScenario.h"

#include "../ring/ring_geometry.h"

#include "imgui.h"
#ifndef ImGuiConfigFlags_DockingEnable
#define RINGSIM_NO_IMGUI_DOCKING 1
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
    return EXIT_FAILURE;
}

// ============================================================
// Replay data
// ============================================================

struct TickSample {
    double t = 0.0;
    int round = 0;
    double round_t = 0.0;
    ringsim::FighterSnapshot f[2];
    double distance_ft = 0.0;
};

struct ReplayLog {
    std::vector<TickSample> ticks;
    std::vector<ringsim::FightEvent> notable; // everything but TICK
    std::vector<double> t_hist;
    std::vector<double> stamina_hist[2];
    std::vector<double> head_hist[2];
    std::vector<double> body_hist[2];
    std::string names[2];
};

static ReplayLog build_replay(const ringsim::EventRecorder& rec) {
    ReplayLog log;
    for (const ringsim::FightEvent& e : rec.events()) {
        if (e.type != ringsim::EventType::Tick) {
            log.notable.push_back(e);
            if (e.type == ringsim::EventType::FightStart && e.hasFighters) {
                log.names[0] = e.fighters[0].name;
                log.names[1] = e.fighters[1].name;
            }
            continue;
        }
        TickSample s;
        s.t = e.totalTime_s;
        s.round = e.round;
        s.round_t = e.roundTime_s;
        s.f[0] = e.fighters[0];
        s.f[1] = e.fighters[1];
        s.distance_ft = e.distance_ft;
        log.ticks.push_back(s);

        log.t_hist.push_back(s.t);
        for (int i = 0; i < 2; ++i) {
            log.stamina_hist[i].push_back(s.f[i].staminaPercent * 100.0);
            log.head_hist[i].push_back(s.f[i].headDamagePercent * 100.0);
            log.body_hist[i].push_back(s.f[i].bodyDamagePercent * 100.0);
        }
    }
    return log;
}

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;
    bool show_plots = true;
    bool show_log = true;
    bool draw_zones = true;
};

static void plot_two_lines_with_xlimits(const char* title,
                                        const char* labelA,
                                        const char* labelB,
                                        const double* xs,
                                        const double* ysA,
                                        const double* ysB,
                                        int count,
                                        double t0,
                                        double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {
#if defined(ImAxis_X1)
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 100.0, ImGuiCond_Once);
#elif defined(ImPlotAxis_X1)
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#endif
        ImPlot::PlotLine(labelA, xs, ysA, count);
        ImPlot::PlotLine(labelB, xs, ysB, count);
        ImPlot::EndPlot();
    }
}

static ImU32 fighter_color(int i, const ringsim::FighterSnapshot& s) {
    if (s.state == ringsim::FighterState::KnockedDown || s.state == ringsim::FighterState::FlashDown)
        return IM_COL32(240, 240, 240, 255);
    if (s.isHurt) return IM_COL32(255, 140, 0, 255);
    return (i == 0) ? IM_COL32(220, 50, 50, 255) : IM_COL32(60, 110, 230, 255);
}

static void draw_ring(const ringsim::ring::RingGeometry& ring,
                      const TickSample* sample,
                      const VisualUIState& ui)
{
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const float side = std::max(100.0f, std::min(avail.x, avail.y));
    const float half_ft = (float)ring.config().rope_half_ft;
    const float scale = side / (2.0f * (half_ft + 1.0f));
    const ImVec2 center(origin.x + side * 0.5f, origin.y + side * 0.5f);

    auto to_screen = [&](double x_ft, double y_ft) {
        // Screen Y grows downward.
        return ImVec2(center.x + (float)x_ft * scale, center.y - (float)y_ft * scale);
    };

    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddRectFilled(origin, ImVec2(origin.x + side, origin.y + side), IM_COL32(30, 30, 34, 255));

    const auto& geo = ring.geometry();
    for (int i = 0; i < ringsim::ring::RingGeometryData::kNumSegments; ++i) {
        const auto& a = geo.corners_ft[i];
        const auto& b = geo.corners_ft[(i + 1) % ringsim::ring::RingGeometryData::kNumCorners];
        dl->AddLine(to_screen(a.x, a.y), to_screen(b.x, b.y), IM_COL32(200, 200, 200, 255), 3.0f);
    }

    if (ui.draw_zones) {
        const double c = ring.config().center_zone_ft;
        dl->AddRect(to_screen(-c, c), to_screen(c, -c), IM_COL32(80, 160, 80, 160));
        const double r = ring.config().rope_zone_ft;
        dl->AddRect(to_screen(-r, r), to_screen(r, -r), IM_COL32(160, 160, 80, 120));
    }

    if (sample) {
        for (int i = 0; i < 2; ++i) {
            const auto& s = sample->f[i];
            const ImVec2 p = to_screen(s.x_ft, s.y_ft);
            dl->AddCircleFilled(p, std::max(4.0f, 0.8f * scale), fighter_color(i, s));
            dl->AddText(ImVec2(p.x + 8.0f, p.y - 8.0f), IM_COL32(255, 255, 255, 255), i == 0 ? "A" : "B");
        }
    }

    ImGui::Dummy(ImVec2(side, side));
}

static std::string describe(const ringsim::FightEvent& e, const ReplayLog& log) {
    char buf[256];
    const std::string& who = log.names[ringsim::sideIndex(e.side)];
    switch (e.type) {
        case ringsim::EventType::Knockdown:
        case ringsim::EventType::FlashKnockdown:
            std::snprintf(buf, sizeof(buf), "R%d %5.1fs %s down (%s)", e.round, e.roundTime_s, who.c_str(),
                          ringsim::toString(e.punch));
            break;
        case ringsim::EventType::Hurt:
            std::snprintf(buf, sizeof(buf), "R%d %5.1fs %s hurt", e.round, e.roundTime_s, who.c_str());
            break;
        case ringsim::EventType::Cut:
            std::snprintf(buf, sizeof(buf), "R%d %5.1fs %s cut %s", e.round, e.roundTime_s, who.c_str(),
                          e.text.c_str());
            break;
        case ringsim::EventType::FightEnd:
            std::snprintf(buf, sizeof(buf), "END %s", ringsim::toString(e.method));
            break;
        default:
            std::snprintf(buf, sizeof(buf), "R%d %5.1fs %s", e.round, e.roundTime_s, ringsim::toString(e.type));
            break;
    }
    return buf;
}

static bool is_headline(ringsim::EventType t) {
    switch (t) {
        case ringsim::EventType::RoundStart:
        case ringsim::EventType::Knockdown:
        case ringsim::EventType::FlashKnockdown:
        case ringsim::EventType::Recovery:
        case ringsim::EventType::Hurt:
        case ringsim::EventType::Cut:
        case ringsim::EventType::PointDeduction:
        case ringsim::EventType::FightEnding:
        case ringsim::EventType::FightEnd:
            return true;
        default:
            return false;
    }
}

int main(int argc, char** argv) {
    std::string archA = "boxer";
    std::string archB = "slugger";
    std::uint32_t seed = 0x5EEDu;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--a" && i + 1 < argc) archA = argv[++i];
        else if (arg == "--b" && i + 1 < argc) archB = argv[++i];
        else if (arg == "--seed" && i + 1 < argc) seed = (std::uint32_t)std::strtoul(argv[++i], nullptr, 10);
    }

    ringsim::EventRecorder recorder;
    ringsim::BoutOutcome outcome;
    try {
        const ringsim::FighterProfile a = ringsim::FighterProfile::preset(archA, archA + " A");
        const ringsim::FighterProfile b = ringsim::FighterProfile::preset(archB, archB + " B");
        outcome = ringsim::runBout(a, b, ringsim::BoutConfig{}, seed, &recorder);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[ringsim] error: %s\n", e.what());
        return EXIT_FAILURE;
    }
    const ReplayLog log = build_replay(recorder);
    if (log.ticks.empty()) return fail("fight produced no ticks");

    const ringsim::ring::RingGeometry ring;

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Ringside Viewer", nullptr, nullptr);
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

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef RINGSIM_NO_IMGUI_DOCKING
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

    VisualUIState ui;
    bool running = true;
    float speed = 4.0f;
    float window_s = 180.0f;
    int cursor = 0;
    double accum_s = 0.0;
    double wall_prev = glfwGetTime();

    const int n = (int)log.ticks.size();
    const double tick_s = (n > 1) ? std::max(1e-3, log.ticks[1].t - log.ticks[0].t) : 0.5;

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance replay (wall-time accumulator) ---
        const double wall_now = glfwGetTime();
        double wall_dt = wall_now - wall_prev;
        wall_prev = wall_now;
        wall_dt = std::clamp(wall_dt, 0.0, 0.1);

        if (running && cursor < n - 1) {
            accum_s += wall_dt * speed;
            constexpr int kMaxTicksPerFrame = 200;
            int stepped = 0;
            while (accum_s >= tick_s && cursor < n - 1 && stepped < kMaxTicksPerFrame) {
                ++cursor;
                accum_s -= tick_s;
                ++stepped;
            }
            if (stepped == kMaxTicksPerFrame) accum_s = 0.0;
        }

        const TickSample& cur = log.ticks[cursor];

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef RINGSIM_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        if (ui.show_hud) {
            ImGui::Begin("Scoreboard");
            ImGui::Text("Round %d   %02d:%02d", cur.round, (int)cur.round_t / 60, (int)cur.round_t % 60);
            ImGui::Separator();
            for (int i = 0; i < 2; ++i) {
                const auto& s = cur.f[i];
                ImGui::Text("%s  [%s]", log.names[i].c_str(), ringsim::toString(s.state));
                ImGui::Text("  stamina %5.1f%%  head %5.1f%%  body %5.1f%%", s.staminaPercent * 100.0,
                            s.headDamagePercent * 100.0, s.bodyDamagePercent * 100.0);
                ImGui::Text("  landed %d/%d  KD %d  momentum %+.0f", s.punchesLanded, s.punchesThrown,
                            s.knockdownsTotal, s.momentum);
            }
            ImGui::Text("Distance %.1f ft", cur.distance_ft);
            ImGui::Separator();
            ImGui::Text("Result: %s (round %d)", ringsim::toString(outcome.method), outcome.endRound);
            ImGui::Text("Events CRC 0x%08X", (unsigned)outcome.signatures.event_crc_u32);
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::Begin("Controls");
            if (ImGui::Button(running ? "Pause" : "Play")) running = !running;
            ImGui::SameLine();
            if (ImGui::Button("Restart")) { cursor = 0; accum_s = 0.0; }
            ImGui::SliderFloat("Speed", &speed, 0.25f, 64.0f, "%.2fx");
            ImGui::SliderInt("Tick", &cursor, 0, n - 1);
            ImGui::SliderFloat("Plot window (s)", &window_s, 30.0f, 3600.0f, "%.0f");
            ImGui::Checkbox("HUD", &ui.show_hud);
            ImGui::Checkbox("Plots", &ui.show_plots);
            ImGui::Checkbox("Event log", &ui.show_log);
            ImGui::Checkbox("Zones", &ui.draw_zones);
            ImGui::End();
        }

        ImGui::Begin("Ring");
        draw_ring(ring, &cur, ui);
        ImGui::End();

        if (ui.show_plots) {
            ImGui::Begin("Plots");
            const double t1 = cur.t;
            const double t0 = std::max(0.0, t1 - (double)window_s);
            int start = 0;
            while (start < cursor && log.t_hist[start] < t0) ++start;
            const int count = cursor - start + 1;
            ImGui::Text("Samples: %d  (%.1f .. %.1f s)", count, t0, t1);
            plot_two_lines_with_xlimits("Stamina (%)", "A", "B", log.t_hist.data() + start,
                                        log.stamina_hist[0].data() + start, log.stamina_hist[1].data() + start,
                                        count, t0, t1);
            plot_two_lines_with_xlimits("Head damage (%)", "A", "B", log.t_hist.data() + start,
                                        log.head_hist[0].data() + start, log.head_hist[1].data() + start,
                                        count, t0, t1);
            plot_two_lines_with_xlimits("Body damage (%)", "A", "B", log.t_hist.data() + start,
                                        log.body_hist[0].data() + start, log.body_hist[1].data() + start,
                                        count, t0, t1);
            ImGui::End();
        }

        if (ui.show_log) {
            ImGui::Begin("Event log");
            for (const ringsim::FightEvent& e : log.notable) {
                if (e.totalTime_s > cur.t + 1e-9) break;
                if (!is_headline(e.type)) continue;
                ImGui::TextUnformatted(describe(e, log).c_str());
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

    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
