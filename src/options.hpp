#pragma once
#include <string>
#include "session.hpp"
#include "terminal.hpp"

const int MIN_BOARD_WIDTH = 27;
const int MIN_BOARD_HEIGHT = 3;
const int MAX_BOARD_WIDTH = 150;
const int MAX_BOARD_HEIGHT = 30;

struct Options {
    int width = 0;   // 0 表示按终端大小
    int height = 0;
    int delay_ms = DEFAULT_DELAY;
    bool ascii = false;
    bool paused = false;
    bool has_seed = false;
    unsigned seed = 0;
    bool help = false;
};

enum StartupResult { STARTUP_READY, STARTUP_TOO_SMALL };

// 解析失败时返回 false，err 中是错误信息
bool parse_options(int argc, char** argv, Options& opts, std::string& err);

std::string usage_text(const char* prog);

// 按终端大小确定棋盘尺寸
StartupResult choose_board_size(const Options& opts, TermSize viewport, int& width, int& height);
