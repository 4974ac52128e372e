#pragma once
#include <cstdio>
#include "renderer.h"

// Consumer of finished frames: LED driver on the board, a window or a console
// on the desktop. Each show() receives a complete frame.
class DisplaySink {
public:
    virtual ~DisplaySink() = default;
    virtual void show(const DisplayFrame& frame) = 0;
};

// Prints frames as rows of brightness digits.
class AsciiDisplaySink : public DisplaySink {
public:
    explicit AsciiDisplaySink(std::FILE* out = stdout) : out_(out) {}
    void show(const DisplayFrame& frame) override;

private:
    std::FILE* out_;
};
