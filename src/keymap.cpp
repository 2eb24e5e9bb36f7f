#include "keymap.hpp"

#include <ncurses.h>

std::optional<Command> decode_key(int ch) {
    if (ch == ERR) return std::nullopt;
    if (ch < 0 || ch > KEY_MAX) return CMD_UNRECOGNIZED;

    switch (ch) {
        case 'q': case 'Q':
            return CMD_QUIT;
        case ' ':
            return CMD_TOGGLE_PAUSE;
        case 'r': case 'R':
            return CMD_RANDOMIZE;
        case 'c': case 'C':
            return CMD_CLEAR;
        case 'f': case 'F':
            return CMD_STEP;
        case KEY_UP: case 'k': case 'K':
            return CMD_MOVE_UP;
        case KEY_DOWN: case 'j': case 'J':
            return CMD_MOVE_DOWN;
        case KEY_LEFT: case 'h': case 'H':
            return CMD_MOVE_LEFT;
        case KEY_RIGHT: case 'l': case 'L':
            return CMD_MOVE_RIGHT;
        case '\n': case '\r': case KEY_ENTER: case 't': case 'T':
            return CMD_TOGGLE_CELL;
        case 'v': case 'V':
            return CMD_TOGGLE_CURSOR;
        case 'g': case 'G':
            return CMD_TOGGLE_GLYPH;
        case '+': case '=':
            return CMD_DELAY_UP;
        case '-': case '_':
            return CMD_DELAY_DOWN;
        default:
            return CMD_UNRECOGNIZED;
    }
}
