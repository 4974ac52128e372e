// OpenGL drawing for the desktop demo: the LED matrix next to a debug view
// of the fluid domain.
#pragma once
#include "vec2.h"
#include "renderer.h"

struct SimulationState;

struct ViewSettings {
    bool showParticles = true;
    bool showCells = true;
    float particleSize = 6.0f; // pixels
};

struct Viewport {
    int width{1280};
    int height{720};
    float scale{1.0f};
    Vec2 offset{0,0}; // screen space offset in pixels
};

class LedView {
public:
    // Left half of the free area holds the matrix, right half the domain view.
    static void computeViewports(int fbWidth, int fbHeight, Viewport& matrixVp, Viewport& domainVp);
    // Maps world coordinates of the state's grid into the square viewport.
    static Vec2 worldToScreen(const SimulationState& state, const Vec2& wp, const Viewport& vp);

    static void drawBackground(int fbWidth, int fbHeight);
    static void drawMatrix(const DisplayFrame& frame, const Viewport& vp, uint8_t maxIntensity);
    static void drawCells(const SimulationState& state, const Viewport& vp, const ViewSettings& vs);
    static void drawParticles(const SimulationState& state, const Viewport& vp, const ViewSettings& vs);
};
