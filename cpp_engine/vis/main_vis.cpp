// main_vis.cpp
// - Engine block, pistons, crank journals and car body drawn from the
//   model-backed world layout (EngineLayout / VehicleBody), not UI constants
// - One EngineSimulation::step() per displayed frame, fed by glfwGetTime()
//   deltas clamped to [0, 0.1] s; the core never sees the wall clock
// - Trail vertices are staged per cylinder and only re-copied when a trail is
//   dirty; all staging is released when the rebuild generation changes
// - Road grid scrolls by the accumulated road offset (1 repeat = 10 m)

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "Simulation.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define PFLOW_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
// Include <windows.h> first to avoid syntax errors in the Windows SDK gl.h.
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
// Fixed-pipeline scene helpers (deterministic, no assets)
// ============================================================

struct Vec3f { float x, y, z; };

static Vec3f v3(float x, float y, float z) { return {x,y,z}; }

static Vec3f to_v3f(const pflow::Point3& p) {
    return v3((float)p.x, (float)p.y, (float)p.z);
}

static Vec3f sub(Vec3f a, Vec3f b) { return {a.x-b.x, a.y-b.y, a.z-b.z}; }
static Vec3f mul(Vec3f a, float s)  { return {a.x*s, a.y*s, a.z*s}; }

static float dot(Vec3f a, Vec3f b) { return a.x*b.x + a.y*b.y + a.z*b.z; }
static Vec3f cross(Vec3f a, Vec3f b) { return { a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x }; }
static float len(Vec3f a) { return std::sqrt(dot(a,a)); }

static void set_perspective(float fovy_deg, float aspect, float znear, float zfar) {
    // OpenGL fixed pipeline expects column-major matrix.
    const float fovy_rad = fovy_deg * 3.1415926535f / 180.0f;
    const float f = 1.0f / std::tan(0.5f * fovy_rad);

    float m[16] = {};
    m[0]  = f / aspect;
    m[5]  = f;
    m[10] = (zfar + znear) / (znear - zfar);
    m[11] = -1.0f;
    m[14] = (2.0f * zfar * znear) / (znear - zfar);

    glMatrixMode(GL_PROJECTION);
    glLoadMatrixf(m);
}

static void look_at(Vec3f eye, Vec3f center, Vec3f up) {
    Vec3f fwd = sub(center, eye);
    float fl = len(fwd);
    if (fl > 1e-6f) fwd = mul(fwd, 1.0f / fl);

    float ul = len(up);
    if (ul > 1e-6f) up = mul(up, 1.0f / ul);

    Vec3f s = cross(fwd, up);
    float sl = len(s);
    if (sl > 1e-6f) s = mul(s, 1.0f / sl);

    Vec3f u = cross(s, fwd);

    float m[16] = {
        s.x,  u.x,  -fwd.x, 0.0f,
        s.y,  u.y,  -fwd.y, 0.0f,
        s.z,  u.z,  -fwd.z, 0.0f,
        0.0f, 0.0f, 0.0f,   1.0f
    };

    glMatrixMode(GL_MODELVIEW);
    glLoadMatrixf(m);
    glTranslatef(-eye.x, -eye.y, -eye.z);
}

// Corner k of an axis-aligned box: bit 0 -> +x, bit 1 -> +y, bit 2 -> +z.
static Vec3f box_corner(Vec3f c, Vec3f half, int k) {
    return v3(c.x + ((k & 1) ? half.x : -half.x),
              c.y + ((k & 2) ? half.y : -half.y),
              c.z + ((k & 4) ? half.z : -half.z));
}

static void draw_wire_box(Vec3f c, Vec3f half) {
    static const int kEdges[12][2] = {
        {0,1}, {2,3}, {4,5}, {6,7},   // along X
        {0,2}, {1,3}, {4,6}, {5,7},   // along Y
        {0,4}, {1,5}, {2,6}, {3,7},   // along Z
    };

    glBegin(GL_LINES);
    for (const auto& e : kEdges) {
        const Vec3f a = box_corner(c, half, e[0]);
        const Vec3f b = box_corner(c, half, e[1]);
        glVertex3f(a.x, a.y, a.z);
        glVertex3f(b.x, b.y, b.z);
    }
    glEnd();
}

static void draw_solid_box(Vec3f c, Vec3f half) {
    static const int kFaces[6][4] = {
        {4,5,7,6}, // +Z
        {1,0,2,3}, // -Z
        {5,1,3,7}, // +X
        {0,4,6,2}, // -X
        {6,7,3,2}, // +Y
        {0,1,5,4}, // -Y
    };

    glBegin(GL_QUADS);
    for (const auto& f : kFaces) {
        for (int k : f) {
            const Vec3f p = box_corner(c, half, k);
            glVertex3f(p.x, p.y, p.z);
        }
    }
    glEnd();
}

// Closed cylinder. axis 0 = X, 1 = Y.
static void draw_solid_cylinder(Vec3f c, float radius, float height, int axis, int slices = 24) {
    if (radius <= 1e-5f || height <= 1e-5f || slices < 3) return;
    const float h = 0.5f * height;

    auto at = [&](float a, float side) -> Vec3f {
        const float ca = radius * std::cos(a);
        const float sa = radius * std::sin(a);
        return (axis == 0) ? v3(c.x + side, c.y + ca, c.z + sa)
                           : v3(c.x + ca, c.y + side, c.z + sa);
    };

    glBegin(GL_QUADS);
    for (int i = 0; i < slices; ++i) {
        const float a0 = (2.0f * 3.1415926535f * (float)i) / (float)slices;
        const float a1 = (2.0f * 3.1415926535f * (float)(i+1)) / (float)slices;
        const Vec3f p0 = at(a0, -h), p1 = at(a1, -h), p2 = at(a1, h), p3 = at(a0, h);
        glVertex3f(p0.x,p0.y,p0.z); glVertex3f(p1.x,p1.y,p1.z);
        glVertex3f(p2.x,p2.y,p2.z); glVertex3f(p3.x,p3.y,p3.z);
    }
    glEnd();

    for (int cap = 0; cap < 2; ++cap) {
        const float side = cap ? h : -h;
        const Vec3f cc = (axis == 0) ? v3(c.x + side, c.y, c.z) : v3(c.x, c.y + side, c.z);
        glBegin(GL_TRIANGLE_FAN);
        glVertex3f(cc.x, cc.y, cc.z);
        for (int i = 0; i <= slices; ++i) {
            const float a = (2.0f * 3.1415926535f * (float)i) / (float)slices;
            const Vec3f p = at(a, side);
            glVertex3f(p.x, p.y, p.z);
        }
        glEnd();
    }
}

// Road: one line across X per meter; every 5th brighter (texture major lines).
// The pattern repeats every kLaneMeters, so only the wrapped offset matters.
static void draw_road_grid(double road_offset, float y, float half_extent_m) {
    const float lane = (float)pflow::kLaneMeters;
    const float shift_m = (float)pflow::wrapRoadOffset(road_offset) * lane;
    const int n = (int)std::ceil(half_extent_m);

    glBegin(GL_LINES);
    for (int i = -n; i <= n; ++i) {
        float z = (float)i + shift_m;
        if (z > half_extent_m) z -= 2.0f * (float)n;
        const int meter = ((i % 10) + 10) % 10;
        if (meter % 5 == 0) glColor3f(0.40f, 0.40f, 0.40f);
        else                glColor3f(0.20f, 0.20f, 0.20f);
        glVertex3f(-half_extent_m, y, z);
        glVertex3f( half_extent_m, y, z);
    }
    // Road edges
    glColor3f(0.35f, 0.35f, 0.38f);
    glVertex3f(-half_extent_m, y, -half_extent_m); glVertex3f(-half_extent_m, y, half_extent_m);
    glVertex3f( half_extent_m, y, -half_extent_m); glVertex3f( half_extent_m, y, half_extent_m);
    glEnd();
}

// xyz holds TrailBuffer::floatCount() floats, newest first; fades towards the tail.
static void draw_trail(const std::vector<float>& xyz) {
    const int count = (int)(xyz.size() / 3);
    if (count < 2) return;

    glBegin(GL_LINE_STRIP);
    for (int k = 0; k < count; ++k) {
        const float age = (float)k / (float)(count - 1);
        const float fade = 1.0f - 0.75f * age;
        glColor3f(1.0f * fade, 0.20f * fade, 0.20f * fade);
        glVertex3f(xyz[3*k + 0], xyz[3*k + 1], xyz[3*k + 2]);
    }
    glEnd();
}

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;

    bool draw_block = true;
    bool draw_pistons = true;
    bool draw_cranks = true;
    bool draw_body = true;
    bool draw_road = true;
    bool draw_trails = true;
};

// Renderer-side copy of every trail, refreshed from dirty trails only.
struct TrailStaging {
    std::uint32_t generation_u32 = 0;
    std::vector<std::vector<float>> xyz;
};

static void sync_trail_staging(pflow::EngineSimulation& sim, TrailStaging& staging) {
    if (staging.generation_u32 != sim.generation() || (int)staging.xyz.size() != sim.trailCount()) {
        // Rebuild: drop every previously presented trail, then allocate fresh ones.
        staging.xyz.clear();
        staging.xyz.shrink_to_fit();
        staging.xyz.resize((std::size_t)sim.trailCount());
        for (auto& v : staging.xyz) v.assign(pflow::TrailBuffer::floatCount(), 0.0f);
        staging.generation_u32 = sim.generation();
        for (int i = 0; i < sim.trailCount(); ++i) {
            const pflow::TrailBuffer* t = sim.trail(i);
            if (t) t->copyXYZ(staging.xyz[(std::size_t)i].data());
            sim.clearTrailDirty(i);
        }
        return;
    }

    for (int i = 0; i < sim.trailCount(); ++i) {
        const pflow::TrailBuffer* t = sim.trail(i);
        if (!t || !t->isDirty()) continue;
        t->copyXYZ(staging.xyz[(std::size_t)i].data());
        sim.clearTrailDirty(i);
    }
}

static void plot_line_with_xlimits(const char* title,
                                  const char* label,
                                  const double* xs,
                                  const double* ys,
                                  int count,
                                  double t0,
                                  double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        // ImPlot >= 0.16
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        // Transitional versions
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#else
        // Very old ImPlot: DO NOT set limits (auto-fit fallback)
#endif

        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

static const char* param_status_text(std::uint32_t bits) {
    if (bits & pflow::Param_RebuildFailed)     return "REBUILD FAILED";
    if (bits & pflow::Param_RejectedNonFinite) return "REJECTED NON-FINITE";
    if (bits & pflow::Param_Clamped)           return "CLAMPED";
    if (bits & pflow::Param_Rebuilt)           return "REBUILT";
    return "OK";
}

// "--rpm 3000" style flags; a malformed value is reported and skipped.
static bool parse_double_flag(const char* flag, const char* text, double& out) {
    char* end = nullptr;
    const double v = std::strtod(text, &end);
    if (end == text || (end && *end != '\0')) {
        std::fprintf(stderr, "Ignoring %s: not a number (%s)\n", flag, text);
        return false;
    }
    out = v;
    return true;
}

int main(int argc, char** argv) {
    // --- CLI flags ---
    bool start_paused = false;
    pflow::EngineParameters cli_params;
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) continue;
        const std::string arg = argv[i];
        double v = 0.0;
        if (arg == "--paused") {
            start_paused = true;
        } else if (arg == "--cylinders" && i + 1 < argc) {
            if (parse_double_flag("--cylinders", argv[++i], v)) {
                if (std::isfinite(v)) {
                    v = std::clamp(v, (double)pflow::ParameterLimits::kMinCylinders,
                                      (double)pflow::ParameterLimits::kMaxCylinders);
                    cli_params.cylinder_count = (int)std::lround(v);
                } else {
                    std::fprintf(stderr, "Ignoring --cylinders: not finite\n");
                }
            }
        } else if (arg == "--rpm" && i + 1 < argc) {
            if (parse_double_flag("--rpm", argv[++i], v)) cli_params.rpm = v;
        } else if (arg == "--speed" && i + 1 < argc) {
            if (parse_double_flag("--speed", argv[++i], v)) cli_params.speed_kph = v;
        } else if (arg == "--time-scale" && i + 1 < argc) {
            if (parse_double_flag("--time-scale", argv[++i], v)) cli_params.time_scale = v;
        } else {
            std::fprintf(stderr, "Ignoring unknown argument: %s\n", arg.c_str());
        }
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "PistonFlow", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Validate OpenGL context exists.
    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Vendor:   %s\n", glGetString(GL_VENDOR));
    std::fprintf(stderr, "OpenGL Renderer: %s\n", glGetString(GL_RENDERER));
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef PFLOW_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    io.IniFilename = nullptr;

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

    pflow::EngineSimulation sim;
    std::uint32_t last_status = sim.setParameters(cli_params);
    if (last_status & (pflow::Param_Clamped | pflow::Param_RejectedNonFinite)) {
        std::fprintf(stderr, "Startup parameters adjusted: %s\n", param_status_text(last_status));
    }
    bool running = !start_paused;

    {
        char cfg_text[512];
        sim.exportConfigText(cfg_text, (int)sizeof(cfg_text));
        std::fprintf(stderr, "%s", cfg_text);
    }

    VisualUIState ui;
    TrailStaging trail_staging;

    // --- Orbit camera (ImGui-controlled) ---
    float cam_yaw_deg   = 32.0f;
    float cam_pitch_deg = 28.0f;
    float cam_dist      = 11.0f;
    Vec3f cam_target    = v3(0.0f, 0.0f, 0.0f);

    const float road_y_m = -2.0f;
    const float road_half_m = 100.0f;

    // UI mirrors of the simulation parameters.
    int   ui_cylinders  = sim.parameters().cylinder_count;
    float ui_rpm        = (float)sim.parameters().rpm;
    float ui_speed_kph  = (float)sim.parameters().speed_kph;
    float ui_time_scale = (float)sim.parameters().time_scale;
    float ui_spacing_m  = (float)sim.layout().config().cylinder_spacing_m;

    double wall_prev = glfwGetTime();
    double last_wall_dt = 0.0;

    // History buffers
    std::vector<double> t_hist, off0_hist, road_hist;
    t_hist.reserve(20000);
    off0_hist.reserve(20000);
    road_hist.reserve(20000);

    constexpr size_t kMaxHistory = 200000;
    constexpr size_t kTrimChunk  = 10000;
    constexpr int kPlotWindowN   = 600;

    auto trim_history_if_needed = [&]() {
        if (t_hist.size() <= kMaxHistory) return;
        const size_t drop = std::min(kTrimChunk, t_hist.size());
        auto erase_front = [&](std::vector<double>& v) {
            v.erase(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(drop));
        };
        erase_front(t_hist);
        erase_front(off0_hist);
        erase_front(road_hist);
    };

    auto push_sample = [&](const pflow::FrameSnapshot& s) {
        t_hist.push_back(s.time_s);
        off0_hist.push_back(s.cylinder_count > 0 ? s.piston_offset_m[0] : 0.0);
        road_hist.push_back(s.road_offset);
        trim_history_if_needed();
    };

    auto clear_history = [&]() {
        t_hist.clear(); off0_hist.clear(); road_hist.clear();
    };

    pflow::FrameSnapshot last_obs = sim.observe();
    push_sample(last_obs);

    auto apply_ui_params = [&]() {
        pflow::EngineParameters p;
        p.cylinder_count = ui_cylinders;
        p.rpm = (double)ui_rpm;
        p.speed_kph = (double)ui_speed_kph;
        p.time_scale = (double)ui_time_scale;
        last_status = sim.setParameters(p);
        if (last_status & pflow::Param_Rebuilt) {
            std::fprintf(stderr, "Rebuilt engine: %d cylinders (generation %u)\n",
                         sim.parameters().cylinder_count, (unsigned)sim.generation());
        }
        if (last_status & pflow::Param_RebuildFailed) {
            std::fprintf(stderr, "Rebuild to %d cylinders failed; keeping %d\n",
                         ui_cylinders, sim.parameters().cylinder_count);
            ui_cylinders = sim.parameters().cylinder_count;
        }
        last_obs = sim.observe();
    };

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance sim (one step per displayed frame) ---
        const double wall_now = glfwGetTime();
        double wall_dt = wall_now - wall_prev;
        wall_prev = wall_now;

        wall_dt = std::clamp(wall_dt, 0.0, 0.1);
        last_wall_dt = wall_dt;

        if (running) {
            sim.step(wall_dt);
            last_obs = sim.observe();
            push_sample(last_obs);
        }

        sync_trail_staging(sim, trail_staging);

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        if (ui.show_hud) {
            ImGuiWindowFlags hud_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImVec2 viewport_size = ImGui::GetMainViewport()->Size;
            ImGui::SetNextWindowPos(ImVec2(viewport_size.x - 12, 12), ImGuiCond_Always, ImVec2(1.0f, 0.0f));
            ImGui::SetNextWindowBgAlpha(0.85f);

            if (ImGui::Begin("##Dashboard", &ui.show_hud, hud_flags)) {
                const ImVec4 header_col = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
                const ImVec4 status_ok  = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
                const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);

                ImGui::TextColored(header_col, "[ PISTONFLOW ]");
                ImGui::Separator();

                ImGui::Text("TIME: %.2f s", last_obs.time_s);
                ImGui::SameLine(180);
                ImGui::TextColored(running ? status_ok : ImVec4(0.5f, 0.8f, 1.0f, 1.0f),
                                   "[%s]", running ? "RUNNING" : "PAUSED");
                ImGui::Text("Frame dt:   %.1f ms", 1000.0 * last_wall_dt);
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== ENGINE ===");
                ImGui::Text("Cylinders:  %d", last_obs.cylinder_count);
                ImGui::Text("RPM:        %.0f", last_obs.params.rpm);
                ImGui::Text("Visual RPM: %.0f", last_obs.visual_rpm);
                ImGui::SameLine(180);
                ImGui::ProgressBar((float)std::clamp(last_obs.visual_rpm / 1700.0, 0.0, 1.0), ImVec2(160, 12), "");
                ImGui::Text("Omega:      %.2f rad/s", last_obs.angular_velocity_radps);
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== MOTION ===");
                ImGui::Text("Speed:      %.0f km/h", last_obs.params.speed_kph);
                ImGui::Text("Flow:       %.3f m/frame", last_obs.flow_dz_m);
                ImGui::Text("Road:       %.3f rep", last_obs.road_offset);
                ImGui::Text("Time scale: %.1fx", last_obs.params.time_scale);
                ImGui::Spacing();

                ImGui::Text("Generation: %u", (unsigned)last_obs.generation_u32);
                if (last_status != pflow::Param_None) {
                    ImGui::TextColored(status_warn, "[ %s ]", param_status_text(last_status));
                }
            }
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::SetNextWindowSize(ImVec2(460, 560), ImGuiCond_FirstUseEver);
            ImGui::SetNextWindowPos(ImVec2(12, 12), ImGuiCond_FirstUseEver);
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.2f, 1.0f, 0.2f, 1.0f));  // Terminal green
            ImGui::PushStyleColor(ImGuiCol_FrameBg, ImVec4(0.05f, 0.05f, 0.05f, 1.0f));
            ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.1f, 0.3f, 0.1f, 1.0f));
            ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(0.2f, 0.6f, 0.2f, 1.0f));

            const ImVec4 cmd_header = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);

            if (ImGui::BeginTabBar("ControlTabs", ImGuiTabBarFlags_None)) {

                // ===== TAB 1: ENGINE =====
                if (ImGui::BeginTabItem("  ENGINE  ")) {
                    ImGui::TextColored(cmd_header, "[EXEC] Transport Controls");
                    ImGui::Separator();

                    if (ImGui::Button(running ? "  PAUSE  " : "   RUN   ", ImVec2(100, 0))) running = !running;
                    ImGui::SameLine();
                    if (ImGui::Button("  STEP  ", ImVec2(100, 0))) {
                        sim.step(1.0 / 60.0);
                        last_obs = sim.observe();
                        push_sample(last_obs);
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(" RESTART ", ImVec2(100, 0))) {
                        sim.restart();
                        last_obs = sim.observe();
                        clear_history();
                        push_sample(last_obs);
                    }

                    ImGui::Spacing();
                    ImGui::TextColored(cmd_header, "[PARAMS] Engine & Vehicle");
                    ImGui::Separator();

                    bool changed = false;
                    changed |= ImGui::SliderInt("Cylinders", &ui_cylinders,
                                                pflow::ParameterLimits::kMinCylinders,
                                                pflow::ParameterLimits::kMaxCylinders);
                    changed |= ImGui::SliderFloat("RPM", &ui_rpm, 0.0f,
                                                  (float)pflow::ParameterLimits::kMaxRpm, "%.0f");
                    changed |= ImGui::SliderFloat("Speed (km/h)", &ui_speed_kph, 0.0f,
                                                  (float)pflow::ParameterLimits::kMaxSpeedKph, "%.0f");
                    changed |= ImGui::SliderFloat("Time scale", &ui_time_scale, 0.0f,
                                                  (float)pflow::ParameterLimits::kMaxTimeScale, "%.1fx");
                    if (changed) {
                        apply_ui_params();
                    }

                    if (ImGui::SliderFloat("Spacing (m)", &ui_spacing_m, 0.8f, 2.0f, "%.2f")) {
                        pflow::world::EngineLayoutConfig lc = sim.layout().config();
                        lc.cylinder_spacing_m = (double)ui_spacing_m;
                        last_status = sim.setLayoutConfig(lc);
                        if (last_status & pflow::Param_RebuildFailed) {
                            std::fprintf(stderr, "Layout rejected (spacing %.2f m); keeping %.2f m\n",
                                         (double)ui_spacing_m, sim.layout().config().cylinder_spacing_m);
                            ui_spacing_m = (float)sim.layout().config().cylinder_spacing_m;
                        }
                        last_obs = sim.observe();
                    }

                    ImGui::Spacing();
                    ImGui::TextColored(cmd_header, "[STATUS] Current State");
                    ImGui::Separator();
                    ImGui::Text("Crank:       %.2f rad", last_obs.crank_angle_rad);
                    ImGui::Text("Visual RPM:  %.1f", last_obs.visual_rpm);
                    ImGui::Text("Road delta:  %.5f rep", last_obs.road_offset_delta);
                    ImGui::Text("Param hash:  0x%08X", (unsigned)sim.runParamHash());

                    ImGui::EndTabItem();
                }

                // ===== TAB 2: VIEW =====
                if (ImGui::BeginTabItem("  VIEW  ")) {
                    ImGui::TextColored(cmd_header, "[CAMERA] Orbit");
                    ImGui::Separator();
                    ImGui::SliderFloat("Yaw (deg)", &cam_yaw_deg, -180.0f, 180.0f, "%.1f");
                    ImGui::SliderFloat("Pitch (deg)", &cam_pitch_deg, -10.0f, 89.0f, "%.1f");
                    ImGui::SliderFloat("Distance (m)", &cam_dist, 3.0f, 40.0f, "%.1f");

                    ImGui::Spacing();
                    ImGui::TextColored(cmd_header, "[VISUALIZATION] Draw Layers");
                    ImGui::Separator();
                    ImGui::Checkbox("Engine block", &ui.draw_block);
                    ImGui::Checkbox("Pistons", &ui.draw_pistons);
                    ImGui::Checkbox("Crank journals", &ui.draw_cranks);
                    ImGui::Checkbox("Car body", &ui.draw_body);
                    ImGui::Checkbox("Road", &ui.draw_road);
                    ImGui::Checkbox("Trails", &ui.draw_trails);
                    ImGui::Checkbox("HUD", &ui.show_hud);

                    ImGui::EndTabItem();
                }

                // ===== TAB 3: PLOTS =====
                if (ImGui::BeginTabItem("  PLOTS  ")) {
                    const int N = (int)t_hist.size();
                    const int start = (N > kPlotWindowN) ? (N - kPlotWindowN) : 0;
                    const int count = N - start;

                    if (count > 1) {
                        const double t0 = t_hist[start];
                        const double t1 = t_hist[start + count - 1];

                        ImGui::Text("Samples: %d   Window: [%0.2f, %0.2f] s", N, t0, t1);
                        ImGui::Separator();

                        plot_line_with_xlimits("Cylinder 0 offset (m)", "offset_m",
                                               t_hist.data() + start, off0_hist.data() + start, count, t0, t1);

                        plot_line_with_xlimits("Road offset (repeats)", "road",
                                               t_hist.data() + start, road_hist.data() + start, count, t0, t1);
                    } else {
                        ImGui::Text("Samples: %d", N);
                        ImGui::TextUnformatted("No data yet (press Run or Step).");
                    }

                    ImGui::EndTabItem();
                }

                ImGui::EndTabBar();
            }

            ImGui::PopStyleColor(4);
            ImGui::End();
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glEnable(GL_DEPTH_TEST);
            glDepthFunc(GL_LESS);
            glDisable(GL_CULL_FACE);

            glClearColor(0.05f, 0.07f, 0.09f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            const float aspect = (float)fb_w / (float)fb_h;
            set_perspective(60.0f, aspect, 0.1f, 300.0f);

            const float yaw   = cam_yaw_deg   * 3.1415926535f / 180.0f;
            const float pitch = cam_pitch_deg * 3.1415926535f / 180.0f;
            Vec3f eye = v3(
                cam_target.x + cam_dist * std::cos(pitch) * std::sin(yaw),
                cam_target.y + cam_dist * std::sin(pitch),
                cam_target.z + cam_dist * std::cos(pitch) * std::cos(yaw)
            );
            look_at(eye, cam_target, v3(0.0f, 1.0f, 0.0f));

            if (ui.draw_road) {
                draw_road_grid(last_obs.road_offset, road_y_m, road_half_m);
            }

            const auto& layout = sim.layout();
            if (layout.isValid()) {
                const auto& g = layout.geometry();
                const auto& lc = layout.config();

                if (ui.draw_pistons) {
                    for (int i = 0; i < last_obs.cylinder_count; ++i) {
                        const Vec3f head = to_v3f(last_obs.piston_pos_m[(std::size_t)i]);
                        glColor3f(0.85f, 0.85f, 0.87f);
                        draw_solid_cylinder(head, (float)lc.piston_radius_m, (float)lc.piston_height_m, 1);

                        const Vec3f rod_c = v3(head.x, head.y - (float)lc.rod_drop_m, head.z);
                        const float rw = 0.5f * (float)lc.rod_width_m;
                        glColor3f(0.60f, 0.60f, 0.62f);
                        draw_solid_box(rod_c, v3(rw, 0.5f * (float)lc.rod_length_m, rw));
                    }
                }

                if (ui.draw_cranks) {
                    glColor3f(0.55f, 0.55f, 0.58f);
                    for (const auto& c : g.crank_center_m) {
                        draw_solid_cylinder(to_v3f(c), (float)lc.crank_radius_m, (float)lc.crank_width_m, 0, 8);
                    }
                }

                if (ui.draw_block) {
                    glColor3f(0.30f, 0.30f, 0.32f);
                    draw_wire_box(to_v3f(g.block_center_m), to_v3f(g.block_half_m));
                }
            }

            if (ui.draw_trails) {
                for (const auto& xyz : trail_staging.xyz) {
                    draw_trail(xyz);
                }
            }

            if (ui.draw_body && sim.body().isValid()) {
                const auto& pose = sim.body().pose();
                glEnable(GL_BLEND);
                glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
                glDepthMask(GL_FALSE);
                glColor4f(0.13f, 0.40f, 0.80f, 0.18f);
                draw_solid_box(to_v3f(pose.center_m), to_v3f(pose.half_extent_m));
                glDepthMask(GL_TRUE);
                glDisable(GL_BLEND);
                glColor3f(0.25f, 0.55f, 0.95f);
                draw_wire_box(to_v3f(pose.center_m), to_v3f(pose.half_extent_m));
            }

            glDisable(GL_DEPTH_TEST);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
