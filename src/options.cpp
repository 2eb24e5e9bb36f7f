#include "options.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <getopt.h>
#include "renderer.hpp"

namespace {

bool parse_int(const char* text, long min, long max, long& out) {
    char* end;
    errno = 0;
    long value = strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return false;
    if (value < min || value > max) return false;
    out = value;
    return true;
}

} // namespace

bool parse_options(int argc, char** argv, Options& opts, std::string& err) {
    static struct option long_opts[] = {
        {"width",  required_argument, 0, 'W'},
        {"height", required_argument, 0, 'H'},
        {"delay",  required_argument, 0, 'd'},
        {"ascii",  no_argument,       0, 'a'},
        {"paused", no_argument,       0, 'p'},
        {"seed",   required_argument, 0, 's'},
        {"help",   no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 允许重复调用
    optind = 0;
    opterr = 0;

    long value;
    while (true) {
        int index = 0;
        int c = getopt_long(argc, argv, ":W:H:d:aps:h", long_opts, &index);
        if (c == -1) break;

        switch (c) {
            case 'W':
                if (!parse_int(optarg, MIN_BOARD_WIDTH, INT_MAX, value)) {
                    err = "width must be an integer >= " + std::to_string(MIN_BOARD_WIDTH);
                    return false;
                }
                opts.width = static_cast<int>(value);
                break;
            case 'H':
                if (!parse_int(optarg, MIN_BOARD_HEIGHT, INT_MAX, value)) {
                    err = "height must be an integer >= " + std::to_string(MIN_BOARD_HEIGHT);
                    return false;
                }
                opts.height = static_cast<int>(value);
                break;
            case 'd':
                if (!parse_int(optarg, MIN_DELAY, MAX_DELAY, value)) {
                    err = "delay must be between " + std::to_string(MIN_DELAY) +
                          " and " + std::to_string(MAX_DELAY) + " ms";
                    return false;
                }
                opts.delay_ms = static_cast<int>(value);
                break;
            case 'a':
                opts.ascii = true;
                break;
            case 'p':
                opts.paused = true;
                break;
            case 's':
                if (!parse_int(optarg, 0, UINT_MAX, value)) {
                    err = "seed must be a non-negative integer";
                    return false;
                }
                opts.has_seed = true;
                opts.seed = static_cast<unsigned>(value);
                break;
            case 'h':
                opts.help = true;
                break;
            case ':':
                err = std::string("missing value for ") + argv[optind - 1];
                return false;
            default:
                if (optopt != 0) {
                    err = std::string("unknown option -") + static_cast<char>(optopt);
                } else {
                    err = std::string("unknown option ") + argv[optind - 1];
                }
                return false;
        }
    }

    if (optind < argc) {
        err = std::string("unexpected argument ") + argv[optind];
        return false;
    }
    return true;
}

std::string usage_text(const char* prog) {
    std::string usage = "Usage: ";
    usage += prog;
    usage += " [options]\n"
             "  -W, --width N    board width (default: fit terminal, at most 150)\n"
             "  -H, --height N   board height (default: fit terminal, at most 30)\n"
             "  -d, --delay MS   frame delay in milliseconds (1-250, default 30)\n"
             "  -a, --ascii      draw cells with '#' instead of a unicode block\n"
             "  -p, --paused     start paused\n"
             "  -s, --seed N     random seed\n"
             "  -h, --help       show this help\n";
    return usage;
}

StartupResult choose_board_size(const Options& opts, TermSize viewport, int& width, int& height) {
    // 去掉边框、帮助面板和末尾一行
    int avail_w = viewport.cols - 2;
    int avail_h = viewport.rows - required_rows(0);

    width = opts.width > 0 ? opts.width : std::min(avail_w, MAX_BOARD_WIDTH);
    height = opts.height > 0 ? opts.height : std::min(avail_h, MAX_BOARD_HEIGHT);

    if (width < MIN_BOARD_WIDTH || height < MIN_BOARD_HEIGHT) {
        return STARTUP_TOO_SMALL;
    }
    // 先和可用区域比较，避免 required_* 中的整数溢出
    if (width > avail_w || height > avail_h) {
        return STARTUP_TOO_SMALL;
    }
    if (required_cols(width) > viewport.cols || required_rows(height) > viewport.rows) {
        return STARTUP_TOO_SMALL;
    }
    return STARTUP_READY;
}
