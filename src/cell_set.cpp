#include "cell_set.hpp"

bool Board::in_bounds(Point p) const {
    return p.x >= 0 && p.x < width && p.y >= 0 && p.y < height;
}

bool Board::is_alive(Point p) const {
    return occupied.find(p) != occupied.end();
}

bool Board::set_alive(Point p) {
    if (!in_bounds(p)) return false;
    occupied.insert(p);
    return true;
}

bool Board::toggle_cell(Point p) {
    if (!in_bounds(p)) return false;

    auto it = occupied.find(p);
    if (it != occupied.end()) {
        occupied.erase(it);
    } else {
        occupied.insert(p);
    }
    return true;
}
