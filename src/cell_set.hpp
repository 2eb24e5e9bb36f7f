#pragma once
#include <cstddef>
#include <functional>
#include <unordered_set>

// 网格坐标
struct Point {
    int x;
    int y;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

struct PointHash {
    size_t operator()(const Point& p) const {
        size_t h = std::hash<int>{}(p.x);
        h ^= std::hash<int>{}(p.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

using CellSet = std::unordered_set<Point, PointHash>;

// 有界棋盘，只记录活细胞
// occupied 中的坐标始终满足 0 <= x < width, 0 <= y < height
struct Board {
    int width;
    int height;
    CellSet occupied;

    Board(int w, int h) : width(w), height(h) {}

    bool in_bounds(Point p) const;
    bool is_alive(Point p) const;

    // 越界坐标直接拒绝，返回 false
    bool set_alive(Point p);
    bool toggle_cell(Point p);

    void clear_cells() { occupied.clear(); }
    size_t live_count() const { return occupied.size(); }
};
