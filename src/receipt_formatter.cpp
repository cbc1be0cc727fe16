#include "receipt_formatter.hpp"
#include <numeric>

ReceiptLayout ReceiptLayout::bonfabrik() {
  ReceiptLayout l;
  l.header = {
    ".-=-=-=-=-=--=-=-=-=-=-.",
    "|   JONAS  BONFABRIK   |",
    "|  * Bons * BonBons *  |",
    "'-=-=-=-=-=--=-=-=-=-=-'",
  };
  return l;
}

std::string ReceiptFormatter::fit_line(const std::string& line) const {
  std::string s;
  s.reserve(layout_.width);
  for (char c : line) if (c != '\r') s.push_back(c);
  if (s.size() > layout_.width) s.resize(layout_.width);
  else s.append(layout_.width - s.size(), ' ');
  return s;
}

std::string ReceiptFormatter::item_line(const std::string& label, uint64_t amount) const {
  std::string amt = std::to_string(amount);
  long spaces = static_cast<long>(layout_.width) - static_cast<long>(label.size()) - static_cast<long>(amt.size());
  if (spaces < 1) spaces = 1;
  return fit_line(label + std::string(static_cast<size_t>(spaces), ' ') + amt);
}

std::string ReceiptFormatter::pick_label(IWordSource& words, size_t max_len) const {
  if (auto w = words.select(max_len)) {
    if (w->size() <= max_len) return *w;
  }
  return layout_.fallback_label.substr(0, max_len);
}

std::vector<std::string> ReceiptFormatter::format_lines(const std::vector<uint64_t>& numbers, IWordSource& words) const {
  std::vector<std::string> out;
  out.reserve(layout_.header.size() + numbers.size() + 4);
  for (const auto& h : layout_.header) out.push_back(fit_line(h));
  out.push_back(fit_line(""));
  for (uint64_t n : numbers) {
    size_t amt_len = std::to_string(n).size();
    // one space between label and amount
    size_t max_word = layout_.width > amt_len + 1 ? layout_.width - amt_len - 1 : 1;
    out.push_back(item_line(pick_label(words, max_word), n));
  }
  out.push_back(fit_line(""));
  out.push_back(fit_line(std::string(layout_.width, '-')));
  uint64_t total = std::accumulate(numbers.begin(), numbers.end(), uint64_t{0});
  out.push_back(item_line(layout_.sum_label, total));
  return out;
}

std::string ReceiptFormatter::format(const std::vector<uint64_t>& numbers, IWordSource& words) const {
  return join_lines(format_lines(numbers, words));
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string s;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) s.push_back('\n');
    s += lines[i];
  }
  return s;
}
