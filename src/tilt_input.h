// Desktop stand-in for the board accelerometer: arrow keys or sliders.
#pragma once
#include "vec2.h"

struct TiltInput {
    bool active = false;   // tilt replaces gravity while set
    bool fromKeys = false; // set by held arrow keys rather than the sliders
    Vec2 accel{0.0f, -9.8f};
};

struct ArrowKeys {
    bool left = false, right = false, up = false, down = false;
    bool any() const { return left || right || up || down; }
};

// Held keys tilt the board by g along their axis; the vertical axis stays at
// -g unless up is held. Releasing every key levels the board again, unless the
// tilt came from the sliders.
void updateTiltFromKeys(TiltInput& tilt, const ArrowKeys& keys, float g);
// Board lying flat: gravity straight down, tilt off.
void levelTilt(TiltInput& tilt, float g);
