#pragma once
#include "terminal.hpp"

// curses 模式的 RAII 包装，析构时恢复终端
class CursesScreen {
public:
    CursesScreen();
    ~CursesScreen();

    CursesScreen(const CursesScreen&) = delete;
    CursesScreen& operator=(const CursesScreen&) = delete;
};

class CursesDisplay : public IDisplay {
public:
    TermSize size() const override;
    bool clear_screen() override;
    bool write_text(int col, int row, const std::string& text) override;
    bool set_cursor_visible(bool visible) override;
    bool move_cursor(int col, int row) override;
    bool flush() override;
};

class CursesInput : public IInput {
public:
    std::optional<Command> poll() override;
};
