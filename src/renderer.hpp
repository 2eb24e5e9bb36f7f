#pragma once
#include <string>
#include <vector>
#include "cell_set.hpp"

// 活细胞的显示字符
enum Glyph { GLYPH_UNICODE, GLYPH_ASCII };

const char* glyph_text(Glyph glyph);
Glyph next_glyph(Glyph glyph);

// 屏幕布局（列、行均从 0 开始）
//   第 0 行           ╔═══╗ 上边框
//   第 1..height 行   ║...║ 棋盘
//   第 height+1 行    ╠═╦═╝ 下边框，与帮助面板相接
//   之后              帮助面板，右侧是延迟与状态读数
const int BOARD_ORIGIN_COL = 0;
const int BOARD_ORIGIN_ROW = 1;
const int HELP_WIDTH = 28;
const int STATUS_WIDTH = 24;

// 每个格子是一个 UTF-8 字符串，宽度含左右边框
struct Frame {
    int width;
    int height;
    std::vector<std::string> cells;

    const std::string& at(int col, int row) const {
        return cells[row * width + col];
    }
    std::string row_text(int row) const;
};

struct ScreenLine {
    int col;
    int row;
    std::string text;
};

// 纯函数，只依赖 occupied/width/height/glyph
Frame render(const Board& board, Glyph glyph);

// 整个会话期间不变的部分：边框与帮助面板
std::vector<ScreenLine> static_lines(const Board& board);

int help_rows();
int required_rows(int board_height);
int required_cols(int board_width);

// 返回的 Point 为 {列, 行}
Point cursor_screen_position(Point cursor);
Point delay_position(const Board& board);
Point status_position(const Board& board);
Point exit_position(const Board& board);

std::string delay_text(int delay_ms);
std::string status_text(long generation, size_t live_cells);
