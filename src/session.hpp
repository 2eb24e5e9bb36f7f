#pragma once
#include <functional>
#include <random>
#include "cell_set.hpp"
#include "keymap.hpp"
#include "renderer.hpp"
#include "terminal.hpp"

// 帧延迟（毫秒）
const int MIN_DELAY = 1;
const int MAX_DELAY = 250;
const int DEFAULT_DELAY = 30;

struct SessionState {
    bool paused = false;
    bool running = true;
    Point cursor = {0, 0};
    bool cursor_visible = true;
    Glyph glyph = GLYPH_UNICODE;
    int delay_ms = DEFAULT_DELAY;
    long generation = 0;
};

// 每帧重新计算，只用来避免多余的绘制
struct TickEffects {
    bool board_changed = false;
    bool delay_changed = false;
};

// 处理一个输入事件；光标可能被移出边界，由 clamp_cursor 收回
TickEffects apply_command(Board& board, SessionState& state, Command cmd, std::mt19937& rng);

void clamp_cursor(const Board& board, SessionState& state);

using Sleeper = std::function<void(int delay_ms)>;

void sleep_ms(int delay_ms);

class Session {
public:
    Session(IDisplay& display, IInput& input, Board board, SessionState state,
            std::mt19937 rng, Sleeper sleeper = sleep_ms);

    // 清屏并画出不变的边框和帮助面板
    void start();

    // 一帧：推进、取输入、收回光标、绘制、刷新、等待
    // 终止后返回 false
    bool tick();

    void run();

    const Board& board() const { return board_; }
    const SessionState& state() const { return state_; }
    long dropped_writes() const { return dropped_writes_; }

private:
    void emit(bool ok);
    void draw_board();

    IDisplay& display_;
    IInput& input_;
    Board board_;
    SessionState state_;
    std::mt19937 rng_;
    Sleeper sleeper_;
    bool first_tick_ = true;
    long dropped_writes_ = 0;
};
