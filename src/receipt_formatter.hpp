#pragma once
/*
 * ReceiptFormatter
 *
 * Purpose: lay out committed amounts as a fixed-width receipt.
 * Layout: header, blank, one "<label>   <amount>" line per amount, blank, dashes, SUMME line.
 * Constraint: every line is exactly width() chars; lines joined by '\n', no trailing newline.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "word_source.hpp"
#include "config.hpp"

struct ReceiptLayout {
  size_t width = BON_LINE_WIDTH;
  std::vector<std::string> header;
  std::string fallback_label = BON_FALLBACK_LABEL;
  std::string sum_label = "SUMME";

  static ReceiptLayout bonfabrik();
};

class ReceiptFormatter {
public:
  ReceiptFormatter() : layout_(ReceiptLayout::bonfabrik()) {}
  explicit ReceiptFormatter(ReceiptLayout layout) : layout_(std::move(layout)) {}

  std::string format(const std::vector<uint64_t>& numbers, IWordSource& words) const;
  std::vector<std::string> format_lines(const std::vector<uint64_t>& numbers, IWordSource& words) const;

  // Drops '\r', truncates to width or right-pads with spaces.
  std::string fit_line(const std::string& line) const;
  std::string item_line(const std::string& label, uint64_t amount) const;
  std::string pick_label(IWordSource& words, size_t max_len) const;
  size_t width() const { return layout_.width; }
  const ReceiptLayout& layout() const { return layout_; }
private:
  ReceiptLayout layout_;
};

std::string join_lines(const std::vector<std::string>& lines);
