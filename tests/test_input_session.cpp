#include "input_session.hpp"
#include "key_mapper.hpp"
#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

struct PrintLog {
  std::vector<std::vector<uint64_t>> calls;
  bool ok = true;
  InputSession::PrintHandler handler() {
    return [this](const std::vector<uint64_t>& n){ calls.push_back(n); return ok; };
  }
};

static void type_digits(InputSession& s, const std::string& digits) {
  for (char c : digits) s.apply(KeyAction::make_digit(c));
}

static void test_prefix_truncation() {
  const std::string typed = "98765432101";
  for (size_t n = 0; n <= typed.size(); ++n) {
    PrintLog log;
    InputSession s(log.handler());
    type_digits(s, typed.substr(0, n));
    assert(s.buffer() == typed.substr(0, std::min<size_t>(5, n)));
  }
  PrintLog log;
  InputSession s(log.handler());
  type_digits(s, "1234");
  assert(s.push_digit('5') == SessionEvent::DigitBuffered);
  assert(s.push_digit('6') == SessionEvent::DigitDropped);
  assert(s.buffer() == "12345");
}

static void test_commit() {
  PrintLog log;
  InputSession s(log.handler());
  assert(s.apply(KeyAction::commit()) == SessionEvent::NothingToCommit);
  assert(s.committed().empty() && s.buffer().empty());
  type_digits(s, "007");
  assert(s.apply(KeyAction::commit()) == SessionEvent::Committed);
  assert(s.buffer().empty());
  assert(s.committed().size() == 1 && s.committed()[0] == 7);
  assert(s.apply(KeyAction::commit()) == SessionEvent::NothingToCommit);
  assert(s.committed().size() == 1);
  assert(s.apply(KeyAction::noop()) == SessionEvent::None);
}

static void test_print_scenario() {
  PrintLog log;
  InputSession s(log.handler());
  type_digits(s, "125");
  s.apply(KeyAction::commit());
  type_digits(s, "30");
  assert(s.running_total() == 125);
  assert(s.apply(KeyAction::print_and_reset()) == SessionEvent::Printed);
  assert(log.calls.size() == 1);
  assert((log.calls[0] == std::vector<uint64_t>{125, 30}));
  assert(s.buffer().empty() && s.committed().empty());
  assert(s.last_print().lines == 2 && s.last_print().total == 155);
}

static void test_six_digits_then_enter() {
  PrintLog log;
  InputSession s(log.handler());
  type_digits(s, "123456");
  assert(s.apply(KeyAction::print_and_reset()) == SessionEvent::Printed);
  assert((log.calls.at(0) == std::vector<uint64_t>{12345}));
}

static void test_nothing_to_print() {
  PrintLog log;
  InputSession s(log.handler());
  assert(s.apply(KeyAction::print_and_reset()) == SessionEvent::NothingToPrint);
  assert(log.calls.empty());
  assert(s.buffer().empty() && s.committed().empty());
}

static void test_failed_print_still_resets() {
  PrintLog log;
  log.ok = false;
  InputSession s(log.handler());
  type_digits(s, "42");
  assert(s.apply(KeyAction::print_and_reset()) == SessionEvent::PrintFailed);
  assert(log.calls.size() == 1);
  assert(s.buffer().empty() && s.committed().empty());
}

static void test_text_lines() {
  PrintLog log;
  InputSession s(log.handler());
  for (const char* line : {"12", "3+", "4567890", ""}) {
    for (const auto& a : map_line(line)) s.apply(a);
  }
  assert(log.calls.size() == 1);
  assert((log.calls[0] == std::vector<uint64_t>{123, 45678}));
}

int main() {
  test_prefix_truncation();
  test_commit();
  test_print_scenario();
  test_six_digits_then_enter();
  test_nothing_to_print();
  test_failed_print_still_resets();
  test_text_lines();
  return 0;
}
