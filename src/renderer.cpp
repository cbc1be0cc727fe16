#include "renderer.hpp"
#include <algorithm>
#include <cstring>

static std::string clip(const std::string& s, int cols) {
  if (cols <= 0) return std::string();
  if ((int)s.size() <= cols) return s;
  return s.substr(0, cols);
}

static std::string join_amounts(const std::vector<uint64_t>& v) {
  std::string s;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) s += " + ";
    s += std::to_string(v[i]);
  }
  return s.empty() ? std::string("-") : s;
}

void Renderer::render(ITerminal& term, const KioskView& view) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int row = 0;
  auto line = [&](const std::string& s) {
    if (row < rows) term.draw_text(row, 0, clip(s, cols));
    row++;
  };
  if (row < rows) term.draw_colored(row, 0, clip("JONAS BONFABRIK - Kasse", cols), kPairTitle);
  row++;
  line("digits -> buffer, '+' commits, empty line prints");
  line("input: " + view.input_label + "   output: " + view.output_label);
  row++;
  line("buffer: " + (view.buffer.empty() ? std::string("-") : view.buffer));
  line("items:  " + join_amounts(view.committed));
  line("total:  " + std::to_string(view.running_total));
  row++;

  int prompt_row = std::min(row, std::max(0, rows - 1));
  int prompt_len = static_cast<int>(std::strlen(kLinePrompt));
  term.draw_text(prompt_row, 0, clip(kLinePrompt, cols));
  prompt_.row = prompt_row;
  prompt_.col = std::min(prompt_len, std::max(0, cols - 1));
  prompt_.max_len = std::max(1, cols - prompt_.col - 1);
  row++;

  if (!view.message.empty() && row < rows) {
    term.draw_colored(row, 0, clip(view.message, cols), kPairStatus);
  }
  row += 2;

  for (const auto& r : view.last_receipt) {
    if (row >= rows) break;
    term.draw_colored(row, 2, clip(r, cols - 2), kPairReceipt);
    row++;
  }
  term.move_cursor(prompt_.row, prompt_.col);
  term.refresh();
}
