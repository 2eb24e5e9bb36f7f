#include "renderer.hpp"

#include <algorithm>
#include <cstdio>

namespace {

const char* const BORDER_V = "║";
const char* const BORDER_H = "═";

const char* const help_text[] = {
    " space   play/pause",
    " f       step one frame",
    " r       randomize",
    " c       clear",
    " arrows  move cursor",
    " enter   toggle cell",
    " v       show/hide cursor",
    " g       switch glyph",
    " + / -   frame delay",
    " q       quit",
};
const int HELP_LINES = sizeof(help_text) / sizeof(help_text[0]);

std::string repeat(const char* s, int n) {
    std::string out;
    for (int i = 0; i < n; i++) out += s;
    return out;
}

// 定宽输出，擦掉上一次更长的文字
std::string pad(std::string text, int width) {
    text.resize(width, ' ');
    return text;
}

} // namespace

const char* glyph_text(Glyph glyph) {
    return glyph == GLYPH_UNICODE ? "■" : "#";
}

Glyph next_glyph(Glyph glyph) {
    return glyph == GLYPH_UNICODE ? GLYPH_ASCII : GLYPH_UNICODE;
}

std::string Frame::row_text(int row) const {
    std::string text;
    for (int col = 0; col < width; col++) {
        text += at(col, row);
    }
    return text;
}

Frame render(const Board& board, Glyph glyph) {
    Frame frame;
    frame.width = board.width + 2;
    frame.height = board.height;
    frame.cells.assign(frame.width * frame.height, " ");

    for (int y = 0; y < frame.height; y++) {
        frame.cells[y * frame.width] = BORDER_V;
        frame.cells[y * frame.width + frame.width - 1] = BORDER_V;
    }

    // 第一列是边框，所以 x+1
    const char* text = glyph_text(glyph);
    for (const Point& p : board.occupied) {
        frame.cells[p.y * frame.width + p.x + 1] = text;
    }
    return frame;
}

std::vector<ScreenLine> static_lines(const Board& board) {
    std::vector<ScreenLine> lines;
    std::string long_pipe = repeat(BORDER_H, board.width);

    lines.push_back({0, 0, "╔" + long_pipe + "╗"});

    // 下边框，在帮助面板右边缘处接 ╦
    std::vector<std::string> bottom(board.width + 2, BORDER_H);
    bottom.front() = "╠";
    bottom.back() = "╝";
    if (HELP_WIDTH - 1 <= board.width) {
        bottom[HELP_WIDTH - 1] = "╦";
    }
    std::string bottom_text;
    for (const auto& s : bottom) bottom_text += s;
    lines.push_back({0, board.height + 1, bottom_text});

    int row = board.height + 2;
    for (int i = 0; i < HELP_LINES; i++) {
        lines.push_back({0, row++, BORDER_V + pad(help_text[i], HELP_WIDTH - 2) + BORDER_V});
    }
    lines.push_back({0, row, "╚" + repeat(BORDER_H, HELP_WIDTH - 2) + "╝"});

    return lines;
}

int help_rows() {
    return HELP_LINES + 1;
}

int required_rows(int board_height) {
    // 上下边框、帮助面板，再留一行给退出后的 shell 提示符
    return board_height + 2 + help_rows() + 1;
}

int required_cols(int board_width) {
    return std::max(board_width + 2, HELP_WIDTH + 1 + STATUS_WIDTH);
}

Point cursor_screen_position(Point cursor) {
    return {cursor.x + BOARD_ORIGIN_COL + 1, cursor.y + BOARD_ORIGIN_ROW};
}

Point delay_position(const Board& board) {
    return {HELP_WIDTH + 1, board.height + 2};
}

Point status_position(const Board& board) {
    return {HELP_WIDTH + 1, board.height + 3};
}

Point exit_position(const Board& board) {
    return {0, board.height + 2 + help_rows()};
}

std::string delay_text(int delay_ms) {
    char buf[64];
    snprintf(buf, sizeof(buf), "Delay: %d ms", delay_ms);
    return pad(buf, STATUS_WIDTH);
}

std::string status_text(long generation, size_t live_cells) {
    char buf[64];
    snprintf(buf, sizeof(buf), "Gen: %ld  Cells: %zu", generation, live_cells);
    return pad(buf, STATUS_WIDTH);
}
