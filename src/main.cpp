#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <algorithm>

#ifdef __APPLE__
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

#include <GLFW/glfw3.h>

#include <imgui.h>
#include <imgui/backends/imgui_impl_glfw.h>
#include <imgui/backends/imgui_impl_opengl2.h>

#include "simulation.h"
#include "renderer.h"
#include "display_sink.h"
#include "led_view.h"
#include "tilt_input.h"

struct UIState {
    bool running = true;
    TiltInput tilt;
    RenderSettings render;
    ViewSettings view;
    bool showDemo = false;
};

static const float kGravity = 9.8f;

static void glfwErrorCallback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description);
}

// Board-like config: 5x5 interior, light damping as on the device
static SimConfig boardConfig() {
    SimConfig config;
    config.velocityDamping = 0.99f;
    return config;
}

// Console tick source: runs a fixed number of ticks and prints every frame.
static int runHeadless(int ticks) {
    Simulation sim;
    if (!sim.init(boardConfig())) return 1;
    AsciiDisplaySink sink;
    RenderSettings rs;
    for (int i = 0; i < ticks; ++i) {
        sim.tick();
        sink.show(MatrixRenderer::project(sim.snapshot(), rs));
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc >= 2 && std::strcmp(argv[1], "--headless") == 0) {
        int ticks = argc >= 3 ? std::atoi(argv[2]) : 60;
        return runHeadless(ticks > 0 ? ticks : 60);
    }

    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) return 1;
    GLFWwindow* window = glfwCreateWindow(1280, 720, "MicroFlip - 5x5 LED fluid", nullptr, nullptr);
    if (!window) { glfwTerminate(); return 1; }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    // Setup ImGui
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL2_Init();

    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameRounding = 5.0f;
    style.GrabRounding = 4.0f;
    style.WindowRounding = 7.0f;

    Simulation sim;
    if (!sim.init(boardConfig())) {
        ImGui_ImplOpenGL2_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    UIState ui;
    const float tickDt = sim.config().timestep;
    float accumulator = 0.0f;

    auto lastTime = std::chrono::high_resolution_clock::now();
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        int fbW, fbH; glfwGetFramebufferSize(window, &fbW, &fbH);

        // Arrow keys tilt the "board" like the accelerometer would
        if (!ImGui::GetIO().WantCaptureKeyboard) {
            ArrowKeys keys;
            keys.left = glfwGetKey(window, GLFW_KEY_LEFT) == GLFW_PRESS;
            keys.right = glfwGetKey(window, GLFW_KEY_RIGHT) == GLFW_PRESS;
            keys.up = glfwGetKey(window, GLFW_KEY_UP) == GLFW_PRESS;
            keys.down = glfwGetKey(window, GLFW_KEY_DOWN) == GLFW_PRESS;
            updateTiltFromKeys(ui.tilt, keys, kGravity);
        }
        if (ui.tilt.active) sim.setTilt(ui.tilt.accel);
        else sim.clearTilt();

        // Fixed-rate tick source
        auto now = std::chrono::high_resolution_clock::now();
        float realDt = std::chrono::duration<float>(now - lastTime).count();
        lastTime = now;
        if (ui.running) {
            accumulator += std::min(realDt, 0.25f);
            while (accumulator >= tickDt) {
                sim.tick();
                accumulator -= tickDt;
            }
        } else {
            accumulator = 0.0f;
        }

        DisplayFrame frame = MatrixRenderer::project(sim.snapshot(), ui.render);

        Viewport matrixVp, domainVp;
        LedView::computeViewports(fbW, fbH, matrixVp, domainVp);
        LedView::drawBackground(fbW, fbH);
        LedView::drawMatrix(frame, matrixVp, ui.render.maxIntensity);
        LedView::drawCells(sim.snapshot(), domainVp, ui.view);
        LedView::drawParticles(sim.snapshot(), domainVp, ui.view);

        ImGui_ImplOpenGL2_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
        ImGui::SetNextWindowSize(ImVec2(320.0f, (float)fbH), ImGuiCond_Always);
        ImGuiWindowFlags sidebarFlags = ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                        ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoCollapse;
        if (ImGui::Begin("Controls", nullptr, sidebarFlags)) {
            if (ImGui::Button(ui.running ? "Pause" : "Play")) ui.running = !ui.running;
            ImGui::SameLine();
            if (ImGui::Button("Step")) sim.tick();
            ImGui::SameLine();
            if (ImGui::Button("Reset") && !sim.init(sim.config())) ui.running = false;
            ImGui::Separator();
            ImGui::Text("Tick: %llu", (unsigned long long)sim.tickCount());
            ImGui::Text("Particles: %d", sim.particles().size());
            ImGui::Text("Fluid cells: %d", sim.grid().fluidCellCount());
            ImGui::Text("|div| over fluid: %.4f", sim.grid().totalFluidDivergence());

            ImGui::Separator();
            if (ImGui::CollapsingHeader("Tilt", ImGuiTreeNodeFlags_DefaultOpen)) {
                bool edited = ImGui::Checkbox("Use tilt", &ui.tilt.active);
                edited |= ImGui::SliderFloat("Accel X", &ui.tilt.accel.x, -kGravity, kGravity);
                edited |= ImGui::SliderFloat("Accel Y", &ui.tilt.accel.y, -kGravity, kGravity);
                if (edited) ui.tilt.fromKeys = false;
                if (ImGui::Button("Level")) levelTilt(ui.tilt, kGravity);
            }
            if (ImGui::CollapsingHeader("Display", ImGuiTreeNodeFlags_DefaultOpen)) {
                int mode = (int)ui.render.mode;
                const char* modes[] = { "Occupancy", "Density", "Fluid Cells" };
                ImGui::Combo("Mode", &mode, modes, IM_ARRAYSIZE(modes));
                ui.render.mode = (RenderMode)mode;
                ImGui::SliderInt("Particles for full", &ui.render.particlesForFull, 1, 8);
                ImGui::Checkbox("Show Particles", &ui.view.showParticles); ImGui::SameLine();
                ImGui::Checkbox("Cells", &ui.view.showCells);
                ImGui::SliderFloat("Particle Size", &ui.view.particleSize, 1.0f, 16.0f);
                ImGui::Checkbox("ImGui Demo", &ui.showDemo);
            }
        }
        ImGui::End();

        if (ui.showDemo) ImGui::ShowDemoWindow(&ui.showDemo);

        ImGui::Render();
        ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // Cleanup
    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
