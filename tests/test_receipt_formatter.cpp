#include "receipt_formatter.hpp"
#include "test_support.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_fit_line() {
  ReceiptFormatter f;
  assert(f.fit_line("") == std::string(24, ' '));
  assert(f.fit_line("ab\r") == "ab" + std::string(22, ' '));
  assert(f.fit_line(std::string(30, 'x')) == std::string(24, 'x'));
}

static void test_scenario_125_30() {
  ReceiptFormatter f;
  FixedWordSource words(std::string("Murmel"));
  std::string text = f.format({125, 30}, words);
  assert(text.back() != '\n');
  auto lines = split_lines(text);
  assert(lines.size() == 4 + 1 + 2 + 1 + 1 + 1);
  for (const auto& l : lines) assert(l.size() == 24);
  assert(lines[0] == ".-=-=-=-=-=--=-=-=-=-=-.");
  assert(lines[1] == "|   JONAS  BONFABRIK   |");
  assert(lines[2] == "|  * Bons * BonBons *  |");
  assert(lines[3] == "'-=-=-=-=-=--=-=-=-=-=-'");
  assert(lines[4] == std::string(24, ' '));
  assert(lines[5] == "Murmel" + std::string(15, ' ') + "125");
  assert(lines[6] == "Murmel" + std::string(16, ' ') + "30");
  assert(lines[7] == std::string(24, ' '));
  assert(lines[8] == std::string(24, '-'));
  assert(lines[9] == "SUMME" + std::string(16, ' ') + "155");
  assert((words.requests == std::vector<size_t>{20, 21}));
}

static void test_empty_receipt() {
  ReceiptFormatter f;
  FixedWordSource words(std::string("Ball"));
  auto lines = split_lines(f.format({}, words));
  assert(lines.size() == 8);
  for (const auto& l : lines) assert(l.size() == 24);
  assert(lines[7] == "SUMME" + std::string(18, ' ') + "0");
  assert(words.requests.empty());
}

static void test_fallback_label() {
  ReceiptFormatter f;
  FixedWordSource none(std::nullopt);
  auto lines = f.format_lines({12345}, none);
  assert(lines[5] == "Spielzeug" + std::string(10, ' ') + "12345");

  ReceiptLayout narrow = ReceiptLayout::bonfabrik();
  narrow.width = 8;
  ReceiptFormatter g(narrow);
  FixedWordSource long_word(std::string("Kuscheltier"));
  lines = g.format_lines({12345}, long_word);
  // max label 8 - 5 - 1 = 2 -> fallback cut to "Sp"
  assert(lines[5] == "Sp 12345");
  for (const auto& l : lines) assert(l.size() == 8);
}

static void test_sum_is_exact() {
  ReceiptFormatter f;
  RandomWordSource words(7);
  std::vector<uint64_t> n = {99999, 99999, 99999, 1, 0};
  auto lines = f.format_lines(n, words);
  assert(lines.back() == "SUMME" + std::string(13, ' ') + "299998");
  for (const auto& l : lines) assert(l.size() == 24);
  for (size_t i = 5; i < 10; ++i) {
    std::string amt = std::to_string(n[i - 5]);
    assert(lines[i].compare(24 - amt.size(), amt.size(), amt) == 0);
    assert(lines[i][24 - amt.size() - 1] == ' ');
  }
}

static void test_random_words_respect_limit() {
  RandomWordSource words(1234);
  for (size_t max_len = 1; max_len < 16; ++max_len) {
    for (int i = 0; i < 20; ++i) {
      auto w = words.select(max_len);
      if (w) assert(w->size() <= max_len);
    }
  }
  assert(!words.select(3));
  RandomWordSource a(42), b(42);
  for (int i = 0; i < 10; ++i) assert(a.select(20) == b.select(20));
}

int main() {
  test_fit_line();
  test_scenario_125_30();
  test_empty_receipt();
  test_fallback_label();
  test_sum_is_exact();
  test_random_words_respect_limit();
  return 0;
}
