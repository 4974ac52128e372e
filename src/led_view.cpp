#include "led_view.h"
#include "simulation.h"
#include <cmath>
#include <algorithm>

#ifdef __APPLE__
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

void LedView::computeViewports(int fbWidth, int fbHeight, Viewport& matrixVp, Viewport& domainVp) {
    // Reserve a fixed sidebar on the left for UI and minimal margins
    const float kSidebar = 320.0f; // pixels
    const float kMargin = 16.0f;   // pixels
    float availW = std::max(0.0f, (float)fbWidth - kSidebar - 3.0f * kMargin);
    float availH = std::max(0.0f, (float)fbHeight - 2.0f * kMargin);
    float half = 0.5f * availW;
    float s = std::min(half, availH);
    matrixVp.width = domainVp.width = fbWidth;
    matrixVp.height = domainVp.height = fbHeight;
    matrixVp.scale = domainVp.scale = s;
    matrixVp.offset = Vec2(kSidebar + kMargin + 0.5f * (half - s), kMargin + 0.5f * (availH - s));
    domainVp.offset = Vec2(kSidebar + 2.0f * kMargin + half + 0.5f * (half - s), matrixVp.offset.y);
}

Vec2 LedView::worldToScreen(const SimulationState& state, const Vec2& wp, const Viewport& vp) {
    // Whole grid including the solid ring fills the viewport, y up
    float ext = std::max(state.grid.width(), state.grid.height()) * state.grid.spacing();
    float x = wp.x / ext;
    float y = wp.y / ext;
    return Vec2(vp.offset.x + x * vp.scale, vp.offset.y + (1.0f - y) * vp.scale);
}

void LedView::drawBackground(int fbWidth, int fbHeight) {
    glViewport(0, 0, fbWidth, fbHeight);
    glClearColor(0.08f, 0.09f, 0.11f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    glMatrixMode(GL_PROJECTION); glLoadIdentity();
    glOrtho(0, fbWidth, fbHeight, 0, -1, 1);
    glMatrixMode(GL_MODELVIEW); glLoadIdentity();
}

static void fillRect(float x0, float y0, float x1, float y1) {
    glBegin(GL_QUADS);
    glVertex2f(x0, y0); glVertex2f(x1, y0); glVertex2f(x1, y1); glVertex2f(x0, y1);
    glEnd();
}

static void fillCircle(float cx, float cy, float r) {
    const int seg = 32;
    glBegin(GL_TRIANGLE_FAN);
    glVertex2f(cx, cy);
    for (int k = 0; k <= seg; ++k) {
        float ang = (float)k / seg * 6.2831853f;
        glVertex2f(cx + std::cos(ang) * r, cy + std::sin(ang) * r);
    }
    glEnd();
}

void LedView::drawMatrix(const DisplayFrame& frame, const Viewport& vp, uint8_t maxIntensity) {
    // Board
    glColor3f(0.05f, 0.05f, 0.06f);
    fillRect(vp.offset.x, vp.offset.y, vp.offset.x + vp.scale, vp.offset.y + vp.scale);

    float pitch = vp.scale / (float)DisplayFrame::kWidth;
    float r = 0.3f * pitch;
    for (int row = 0; row < DisplayFrame::kHeight; ++row) {
        for (int col = 0; col < DisplayFrame::kWidth; ++col) {
            float t = maxIntensity > 0 ? (float)frame.at(col, row) / (float)maxIntensity : 0.0f;
            float cx = vp.offset.x + (col + 0.5f) * pitch;
            float cy = vp.offset.y + (row + 0.5f) * pitch;
            // unlit LEDs stay faintly visible
            glColor3f(0.15f + 0.85f * t, 0.03f + 0.12f * t, 0.03f);
            fillCircle(cx, cy, r);
        }
    }
}

void LedView::drawCells(const SimulationState& state, const Viewport& vp, const ViewSettings& vs) {
    if (!vs.showCells) return;
    const Grid& grid = state.grid;
    const float h = grid.spacing();
    for (int j = 0; j < grid.height(); ++j) {
        for (int i = 0; i < grid.width(); ++i) {
            CellType t = grid.cellType(i, j);
            if (t == CellType::Solid) glColor3f(0.35f, 0.22f, 0.2f);
            else if (t == CellType::Fluid) glColor3f(0.12f, 0.25f, 0.45f);
            else glColor3f(0.12f, 0.13f, 0.16f);
            Vec2 s0 = worldToScreen(state, Vec2(i * h, (j + 1) * h), vp);
            Vec2 s1 = worldToScreen(state, Vec2((i + 1) * h, j * h), vp);
            fillRect(s0.x + 1.0f, s0.y + 1.0f, s1.x - 1.0f, s1.y - 1.0f);
        }
    }
}

void LedView::drawParticles(const SimulationState& state, const Viewport& vp, const ViewSettings& vs) {
    if (!vs.showParticles) return;
    glEnable(GL_POINT_SMOOTH);
    glPointSize(clampf(vs.particleSize, 1.0f, 16.0f));
    glBegin(GL_POINTS);
    for (const auto& prt : state.particles) {
        if (!isFinite(prt.p)) continue;
        float speed = length(prt.v);
        float t = clampf(speed / 5.0f, 0.0f, 1.0f);
        // blue at rest, white when fast
        glColor3f(0.2f + 0.8f * t, 0.5f + 0.5f * t, 0.95f);
        Vec2 sp = worldToScreen(state, prt.p, vp);
        glVertex2f(sp.x, sp.y);
    }
    glEnd();
    glDisable(GL_POINT_SMOOTH);
}
