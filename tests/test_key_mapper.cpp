#include "key_mapper.hpp"
#include <cassert>
#include <vector>

static RawEvent key(uint16_t code, int32_t value = 1) { return RawEvent{1, code, value}; }

static void test_event_mapping() {
  KeyMapper m;
  assert(m.map_event(key(28)) == KeyAction::print_and_reset());
  assert(m.map_event(key(96)) == KeyAction::print_and_reset());
  assert(m.map_event(key(78)) == KeyAction::commit());
  const std::vector<std::pair<uint16_t, char>> digits = {
    {82, '0'}, {79, '1'}, {80, '2'}, {81, '3'}, {75, '4'},
    {76, '5'}, {77, '6'}, {71, '7'}, {72, '8'}, {73, '9'},
  };
  for (auto [code, d] : digits) assert(m.map_event(key(code)) == KeyAction::make_digit(d));
  // top-row "1" is not part of the numpad table
  assert(m.map_event(key(2)) == KeyAction::noop());
}

static void test_ignored_events() {
  KeyMapper m;
  assert(m.map_event(key(79, 0)) == KeyAction::noop()); // release
  assert(m.map_event(key(79, 2)) == KeyAction::noop()); // autorepeat
  assert(m.map_event(RawEvent{0, 0, 0}) == KeyAction::noop()); // EV_SYN
  assert(m.map_event(RawEvent{4, 4, 458841}) == KeyAction::noop()); // EV_MSC scan
  assert(m.map_event(RawEvent{4, 28, 1}) == KeyAction::noop());
}

static void test_line_mapping() {
  std::vector<KeyAction> a = map_line("");
  assert(a.size() == 1 && a[0] == KeyAction::print_and_reset());

  a = map_line("125");
  assert(a.size() == 3);
  assert(a[0] == KeyAction::make_digit('1') && a[2] == KeyAction::make_digit('5'));

  a = map_line("30+");
  assert(a.size() == 3);
  assert(a[1] == KeyAction::make_digit('0') && a[2] == KeyAction::commit());

  a = map_line("+");
  assert(a.size() == 1 && a[0] == KeyAction::commit());

  a = map_line("1a2,b");
  assert(a.size() == 2);
  assert(a[0] == KeyAction::make_digit('1') && a[1] == KeyAction::make_digit('2'));

  a = map_line("abc");
  assert(a.empty());
}

int main() {
  test_event_mapping();
  test_ignored_events();
  test_line_mapping();
  return 0;
}
