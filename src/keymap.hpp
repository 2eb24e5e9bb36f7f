#pragma once
#include <optional>

// 输入词汇表
enum Command {
    CMD_QUIT,
    CMD_TOGGLE_PAUSE,
    CMD_RANDOMIZE,
    CMD_CLEAR,
    CMD_STEP,
    CMD_MOVE_UP,
    CMD_MOVE_DOWN,
    CMD_MOVE_LEFT,
    CMD_MOVE_RIGHT,
    CMD_TOGGLE_CELL,
    CMD_TOGGLE_CURSOR,
    CMD_TOGGLE_GLYPH,
    CMD_DELAY_UP,
    CMD_DELAY_DOWN,
    CMD_UNRECOGNIZED
};

// curses 键码 -> 命令
// 没有按键 (ERR) 返回 nullopt；无法识别的键码返回 CMD_UNRECOGNIZED
std::optional<Command> decode_key(int ch);
