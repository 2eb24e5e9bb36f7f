#include <iostream>
#include <random>
#include <string>
#include <utility>
#include "automaton.hpp"
#include "curses_terminal.hpp"
#include "options.hpp"
#include "renderer.hpp"
#include "session.hpp"

int main(int argc, char** argv) {
    Options opts;
    std::string err;
    if (!parse_options(argc, argv, opts, err)) {
        std::cerr << argv[0] << ": " << err << "\n" << usage_text(argv[0]);
        return 2;
    }
    if (opts.help) {
        std::cout << usage_text(argv[0]);
        return 0;
    }

    std::mt19937 rng(opts.has_seed ? opts.seed : std::random_device{}());

    TermSize viewport = {0, 0};
    int width = 0, height = 0;
    StartupResult result = STARTUP_READY;
    long dropped = 0;

    {
        CursesScreen screen;
        CursesDisplay display;
        CursesInput input;

        viewport = display.size();
        result = choose_board_size(opts, viewport, width, height);

        if (result == STARTUP_READY) {
            Board board(width, height);
            randomize(board, rng);

            SessionState state;
            state.paused = opts.paused;
            state.delay_ms = opts.delay_ms;
            state.glyph = opts.ascii ? GLYPH_ASCII : GLYPH_UNICODE;

            Session session(display, input, std::move(board), state, rng);
            session.run();
            dropped = session.dropped_writes();
        }
    }

    // 终端已恢复，可以正常输出
    if (result == STARTUP_TOO_SMALL) {
        int need_w = width < MIN_BOARD_WIDTH ? MIN_BOARD_WIDTH : width;
        int need_h = height < MIN_BOARD_HEIGHT ? MIN_BOARD_HEIGHT : height;
        // 请求的尺寸可能极大，这里不做布局计算
        std::cerr << "Terminal too small for a " << need_w << "x" << need_h
                  << " board plus borders and help panel: have "
                  << viewport.cols << "x" << viewport.rows
                  << " (columns x rows)\n";
        return 1;
    }

    if (dropped > 0) {
        std::cerr << dropped << " terminal writes were dropped\n";
    }
    return 0;
}
