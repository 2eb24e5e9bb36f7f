#include "curses_terminal.hpp"

#include <clocale>
#include <ncurses.h>

CursesScreen::CursesScreen() {
    // UTF-8 字符（■ ║ ═）需要先设置 locale
    setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // 非阻塞输入
    set_escdelay(25);
    curs_set(0);
}

CursesScreen::~CursesScreen() {
    curs_set(1);
    endwin();
}

TermSize CursesDisplay::size() const {
    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    return {rows, cols};
}

bool CursesDisplay::clear_screen() {
    return wclear(stdscr) != ERR;
}

bool CursesDisplay::write_text(int col, int row, const std::string& text) {
    return mvwaddstr(stdscr, row, col, text.c_str()) != ERR;
}

bool CursesDisplay::set_cursor_visible(bool visible) {
    return curs_set(visible ? 1 : 0) != ERR;
}

bool CursesDisplay::move_cursor(int col, int row) {
    return wmove(stdscr, row, col) != ERR;
}

bool CursesDisplay::flush() {
    return wrefresh(stdscr) != ERR;
}

std::optional<Command> CursesInput::poll() {
    return decode_key(wgetch(stdscr));
}
