#pragma once
#include <cstdint>
#include <string>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2i& a, const Vec2i& b) {
    return !(a == b);
}

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline std::string coordString(const Vec2i& p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}
