#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, line input, refresh).
 * Goal: decouple the kiosk screen from ncurses, enable testing.
 */
#include <optional>
#include <string>

struct TermSize { int rows; int cols; };

// color pairs understood by draw_colored
constexpr int kPairTitle = 1;
constexpr int kPairReceipt = 2;
constexpr int kPairStatus = 3;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // Blocks for one line typed at (row, col); nullopt when input is closed.
  virtual std::optional<std::string> read_line(int row, int col, int max_len) = 0;
};
