#include "automaton.hpp"

#include <unordered_map>
#include <utility>

namespace {

const int neighbor_offsets[8][2] = {
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},           {1,  0},
    {-1,  1}, {0,  1}, {1,  1}
};

} // namespace

int random_trials(const Board& board) {
    return (board.width * board.height) / 4;
}

void randomize(Board& board, std::mt19937& rng) {
    board.clear_cells();

    std::uniform_int_distribution<int> dist_x(0, board.width - 1);
    std::uniform_int_distribution<int> dist_y(0, board.height - 1);

    int trials = random_trials(board);
    for (int i = 0; i < trials; i++) {
        int x = dist_x(rng);
        int y = dist_y(rng);
        board.occupied.insert({x, y});
    }
}

void advance(Board& board) {
    // 先统计邻居数（邻居数为 0 的坐标不会出现）
    std::unordered_map<Point, int, PointHash> counts;
    counts.reserve(board.occupied.size() * 8);

    for (const Point& cell : board.occupied) {
        for (int i = 0; i < 8; i++) {
            Point n = {cell.x + neighbor_offsets[i][0], cell.y + neighbor_offsets[i][1]};
            if (!board.in_bounds(n)) continue;
            counts[n]++;
        }
    }

    // 存活: 2 或 3 个邻居；诞生: 恰好 3 个
    CellSet next;
    for (const auto& [cell, n] : counts) {
        bool alive = board.is_alive(cell);
        if (alive && (n == 2 || n == 3)) {
            next.insert(cell);
        } else if (!alive && n == 3) {
            next.insert(cell);
        }
    }

    board.occupied = std::move(next);
}
