// Shared PASS/FAIL reporting for the deterministic test executables
#pragma once
#include <cstdio>
#include <cmath>

inline int& failureCount() {
    static int failures = 0;
    return failures;
}

inline void check(bool ok, const char* name) {
    std::printf("%-60s -> %s\n", name, ok ? "PASS" : "FAIL");
    if (!ok) failureCount()++;
}

inline bool near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) <= eps; }

inline int finish(const char* suite) {
    int n = failureCount();
    if (n == 0) std::printf("%s: all checks passed\n", suite);
    else std::printf("%s: %d check(s) failed\n", suite, n);
    return n == 0 ? 0 : 1;
}
