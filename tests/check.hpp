#pragma once
// 테스트 공용 체크 함수. 실패 시 [FAIL] 출력 후 계속 진행, main()은 finish()로 종료 코드 결정
#include <cmath>
#include <cstdio>

inline int g_fail = 0;
inline const char* g_case = "";

inline void check(bool ok, int line) {
    if (ok) return;
    std::fprintf(stderr, "[FAIL] %s (line %d)\n", g_case, line);
    ++g_fail;
}

inline void check_near(double a, double b, double eps, int line) {
    if (std::fabs(a - b) <= eps) return;
    std::fprintf(stderr, "[FAIL] %s (line %d): %.9f != %.9f\n", g_case, line, a, b);
    ++g_fail;
}

inline void run(const char* name, void (*fn)()) {
    g_case = name;
    std::printf("[RUN] %s\n", name);
    fn();
}

inline int finish(const char* name) {
    if (g_fail) { std::fprintf(stderr, "[DONE] %s: %d failure(s)\n", name, g_fail); return 1; }
    std::printf("[DONE] %s: all passed\n", name);
    return 0;
}
