#include "tilt_input.h"

void updateTiltFromKeys(TiltInput& tilt, const ArrowKeys& keys, float g) {
    if (keys.any()) {
        tilt.active = true;
        tilt.fromKeys = true;
        tilt.accel.x = (keys.right ? g : 0.0f) - (keys.left ? g : 0.0f);
        tilt.accel.y = (keys.up && !keys.down) ? g : -g;
        return;
    }
    if (tilt.fromKeys) levelTilt(tilt, g);
}

void levelTilt(TiltInput& tilt, float g) {
    tilt.active = false;
    tilt.fromKeys = false;
    tilt.accel = Vec2(0.0f, -g);
}
