#include <cassert>
#include <iostream>
#include <string>
#include "renderer.hpp"

void test_frame_dimensions() {
    Board board(30, 7);
    Frame frame = render(board, GLYPH_UNICODE);
    assert(frame.width == 32);
    assert(frame.height == 7);
    assert(static_cast<int>(frame.cells.size()) == 32 * 7);
    std::cout << "PASSED: test_frame_dimensions\n";
}

void test_empty_board_is_blank() {
    Board board(5, 3);
    Frame frame = render(board, GLYPH_ASCII);
    for (int y = 0; y < 3; y++) {
        assert(frame.row_text(y) == "║     ║");
    }
    std::cout << "PASSED: test_empty_board_is_blank\n";
}

void test_glyph_placement() {
    Board board(5, 3);
    board.set_alive({0, 0});
    board.set_alive({4, 2});
    board.set_alive({2, 1});

    Frame ascii = render(board, GLYPH_ASCII);
    assert(ascii.row_text(0) == "║#    ║");
    assert(ascii.row_text(1) == "║  #  ║");
    assert(ascii.row_text(2) == "║    #║");

    Frame unicode = render(board, GLYPH_UNICODE);
    assert(unicode.at(1, 0) == "■");
    assert(unicode.at(3, 1) == "■");
    assert(unicode.at(5, 2) == "■");
    assert(unicode.at(2, 0) == " ");
    assert(unicode.at(0, 1) == "║");
    assert(unicode.at(6, 1) == "║");
    std::cout << "PASSED: test_glyph_placement\n";
}

void test_render_is_pure() {
    Board board(6, 4);
    board.set_alive({1, 1});
    Frame a = render(board, GLYPH_ASCII);
    Frame b = render(board, GLYPH_ASCII);
    assert(a.cells == b.cells);
    assert(board.live_count() == 1);
    std::cout << "PASSED: test_render_is_pure\n";
}

void test_glyph_switching() {
    assert(next_glyph(GLYPH_UNICODE) == GLYPH_ASCII);
    assert(next_glyph(GLYPH_ASCII) == GLYPH_UNICODE);
    assert(std::string(glyph_text(GLYPH_ASCII)) == "#");
    assert(std::string(glyph_text(GLYPH_UNICODE)) == "■");
    std::cout << "PASSED: test_glyph_switching\n";
}

void test_static_lines() {
    Board board(30, 4);
    auto lines = static_lines(board);

    std::string top = "╔";
    for (int i = 0; i < 30; i++) top += "═";
    top += "╗";
    assert(lines.front().row == 0);
    assert(lines.front().text == top);

    // 下边框在帮助面板右边缘处相接
    const ScreenLine& bottom = lines[1];
    assert(bottom.row == board.height + 1);
    assert(bottom.text.rfind("╠", 0) == 0);
    assert(bottom.text.find("╦") != std::string::npos);

    // 面板从棋盘下方一直到退出行之上
    assert(lines.back().row == exit_position(board).y - 1);
    assert(lines.back().text.rfind("╚", 0) == 0);
    assert(static_cast<int>(lines.size()) == 2 + help_rows());
    std::cout << "PASSED: test_static_lines\n";
}

void test_layout_positions() {
    Board board(40, 10);
    Point c = cursor_screen_position({0, 0});
    assert(c.x == 1 && c.y == 1);
    c = cursor_screen_position({39, 9});
    assert(c.x == 40 && c.y == 10);

    Point d = delay_position(board);
    Point s = status_position(board);
    assert(d.x == HELP_WIDTH + 1 && d.y == board.height + 2);
    assert(s.y == d.y + 1);

    assert(required_rows(10) == exit_position(board).y + 1);
    assert(required_cols(40) == HELP_WIDTH + 1 + STATUS_WIDTH);
    assert(required_cols(150) == 152);
    std::cout << "PASSED: test_layout_positions\n";
}

void test_readout_text() {
    std::string d = delay_text(30);
    assert(d.rfind("Delay: 30 ms", 0) == 0);
    assert(static_cast<int>(d.size()) == STATUS_WIDTH);

    std::string s = status_text(12, 345);
    assert(s.rfind("Gen: 12  Cells: 345", 0) == 0);
    assert(static_cast<int>(s.size()) == STATUS_WIDTH);
    std::cout << "PASSED: test_readout_text\n";
}

int main() {
    test_frame_dimensions();
    test_empty_board_is_blank();
    test_glyph_placement();
    test_render_is_pure();
    test_glyph_switching();
    test_static_lines();
    test_layout_positions();
    test_readout_text();

    std::cout << "\nAll renderer tests passed!\n";
    return 0;
}
