#include "ncurses_terminal.hpp"
#include <vector>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kPairTitle, COLOR_YELLOW, -1);
      init_pair(kPairReceipt, COLOR_BLACK, COLOR_WHITE);
      init_pair(kPairStatus, COLOR_CYAN, -1);
    } else {
      init_pair(kPairTitle, COLOR_YELLOW, COLOR_BLACK); // fallback
      init_pair(kPairReceipt, COLOR_BLACK, COLOR_WHITE);
      init_pair(kPairStatus, COLOR_CYAN, COLOR_BLACK);
    }
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

std::optional<std::string> NcursesTerminal::read_line(int row, int col, int max_len) {
  if (max_len <= 0) max_len = 1;
  std::vector<char> buf(static_cast<size_t>(max_len) + 1, '\0');
  move(row, col);
  clrtoeol();
  ::refresh();
  if (getnstr(buf.data(), max_len) == ERR) return std::nullopt;
  return std::string(buf.data());
}
