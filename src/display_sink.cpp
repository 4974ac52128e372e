#include "display_sink.h"

void AsciiDisplaySink::show(const DisplayFrame& frame) {
    for (int row = 0; row < DisplayFrame::kHeight; ++row) {
        char line[DisplayFrame::kWidth + 1];
        for (int col = 0; col < DisplayFrame::kWidth; ++col) {
            int level = frame.at(col, row);
            line[col] = level == 0 ? '.' : (char)('0' + (level > 9 ? 9 : level));
        }
        line[DisplayFrame::kWidth] = '\0';
        std::fprintf(out_, "%s\n", line);
    }
    std::fprintf(out_, "\n");
    std::fflush(out_);
}
