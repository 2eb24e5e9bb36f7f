#pragma once
/*
 * IDisplay / IInput
 *
 * 会话只通过这两个接口访问终端，方便用假实现测试。
 * IDisplay 的写操作返回 false 表示这次写失败（curses 返回 ERR）。
 */
#include <optional>
#include <string>
#include "keymap.hpp"

struct TermSize { int rows; int cols; };

class IDisplay {
public:
    virtual ~IDisplay() = default;
    virtual TermSize size() const = 0;
    virtual bool clear_screen() = 0;
    virtual bool write_text(int col, int row, const std::string& text) = 0;
    virtual bool set_cursor_visible(bool visible) = 0;
    virtual bool move_cursor(int col, int row) = 0;
    virtual bool flush() = 0;
};

class IInput {
public:
    virtual ~IInput() = default;
    // 非阻塞，最多取一个事件
    virtual std::optional<Command> poll() = 0;
};
