#include "session.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>
#include "automaton.hpp"

TickEffects apply_command(Board& board, SessionState& state, Command cmd, std::mt19937& rng) {
    TickEffects effects;

    switch (cmd) {
        case CMD_QUIT:
            state.running = false;
            break;
        case CMD_TOGGLE_PAUSE:
            state.paused = !state.paused;
            break;
        case CMD_RANDOMIZE:
            randomize(board, rng);
            state.generation = 0;
            effects.board_changed = true;
            break;
        case CMD_CLEAR:
            board.clear_cells();
            state.generation = 0;
            effects.board_changed = true;
            break;
        case CMD_STEP:
            // 只在暂停时单步
            if (state.paused) {
                advance(board);
                state.generation++;
                effects.board_changed = true;
            }
            break;
        case CMD_MOVE_UP:
            state.cursor.y--;
            break;
        case CMD_MOVE_DOWN:
            state.cursor.y++;
            break;
        case CMD_MOVE_LEFT:
            state.cursor.x--;
            break;
        case CMD_MOVE_RIGHT:
            state.cursor.x++;
            break;
        case CMD_TOGGLE_CELL:
            if (board.toggle_cell(state.cursor)) {
                effects.board_changed = true;
            }
            break;
        case CMD_TOGGLE_CURSOR:
            state.cursor_visible = !state.cursor_visible;
            break;
        case CMD_TOGGLE_GLYPH:
            state.glyph = next_glyph(state.glyph);
            effects.board_changed = true;
            break;
        case CMD_DELAY_UP:
            state.delay_ms = std::clamp(state.delay_ms + 1, MIN_DELAY, MAX_DELAY);
            effects.delay_changed = true;
            break;
        case CMD_DELAY_DOWN:
            state.delay_ms = std::clamp(state.delay_ms - 1, MIN_DELAY, MAX_DELAY);
            effects.delay_changed = true;
            break;
        case CMD_UNRECOGNIZED:
            break;
    }
    return effects;
}

void clamp_cursor(const Board& board, SessionState& state) {
    state.cursor.x = std::clamp(state.cursor.x, 0, board.width - 1);
    state.cursor.y = std::clamp(state.cursor.y, 0, board.height - 1);
}

void sleep_ms(int delay_ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

Session::Session(IDisplay& display, IInput& input, Board board, SessionState state,
                 std::mt19937 rng, Sleeper sleeper)
    : display_(display),
      input_(input),
      board_(std::move(board)),
      state_(state),
      rng_(rng),
      sleeper_(std::move(sleeper)) {
    clamp_cursor(board_, state_);
}

// 写失败只记数，不重试，不中断会话
void Session::emit(bool ok) {
    if (!ok) dropped_writes_++;
}

void Session::start() {
    emit(display_.clear_screen());
    for (const auto& line : static_lines(board_)) {
        emit(display_.write_text(line.col, line.row, line.text));
    }
    // 第一帧总是画棋盘
    draw_board();
}

void Session::draw_board() {
    Frame frame = render(board_, state_.glyph);
    for (int y = 0; y < frame.height; y++) {
        emit(display_.write_text(BOARD_ORIGIN_COL, BOARD_ORIGIN_ROW + y, frame.row_text(y)));
    }

    Point status = status_position(board_);
    emit(display_.write_text(status.x, status.y,
                             status_text(state_.generation, board_.live_count())));
}

bool Session::tick() {
    if (!state_.running) return false;

    TickEffects effects;

    if (!state_.paused) {
        advance(board_);
        state_.generation++;
        effects.board_changed = true;
    }

    // 每帧只处理一个按键，多余的按键留在缓冲区里下一帧处理
    std::optional<Command> cmd = input_.poll();
    if (cmd) {
        TickEffects from_key = apply_command(board_, state_, *cmd, rng_);
        effects.board_changed = effects.board_changed || from_key.board_changed;
        effects.delay_changed = effects.delay_changed || from_key.delay_changed;
    }

    clamp_cursor(board_, state_);

    if (effects.board_changed) {
        draw_board();
    }

    if (effects.delay_changed || first_tick_) {
        Point pos = delay_position(board_);
        emit(display_.write_text(pos.x, pos.y, delay_text(state_.delay_ms)));
        first_tick_ = false;
    }

    Point cursor = cursor_screen_position(state_.cursor);
    emit(display_.move_cursor(cursor.x, cursor.y));
    emit(display_.set_cursor_visible(state_.cursor_visible));

    emit(display_.flush());

    if (!state_.running) return false;

    sleeper_(state_.delay_ms);
    return true;
}

void Session::run() {
    start();
    while (tick()) {
    }

    // 光标移到帮助面板下方，交还给 shell
    Point pos = exit_position(board_);
    emit(display_.set_cursor_visible(true));
    emit(display_.move_cursor(pos.x, pos.y));
    emit(display_.flush());
}
