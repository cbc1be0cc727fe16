#include "key_mapper.hpp"

KeyMap KeyMap::numpad() {
  KeyMap m;
  m.enter_codes = {28, 96};
  m.plus_codes = {78};
  m.digit_codes = {
    {82, '0'}, {79, '1'}, {80, '2'}, {81, '3'}, {75, '4'},
    {76, '5'}, {77, '6'}, {71, '7'}, {72, '8'}, {73, '9'},
  };
  return m;
}

KeyAction KeyMapper::map_event(const RawEvent& ev) const {
  if (ev.type != kEvKey || ev.value != kKeyPress) return KeyAction::noop();
  if (map_.enter_codes.count(ev.code)) return KeyAction::print_and_reset();
  if (map_.plus_codes.count(ev.code)) return KeyAction::commit();
  if (auto it = map_.digit_codes.find(ev.code); it != map_.digit_codes.end()) {
    return KeyAction::make_digit(it->second);
  }
  return KeyAction::noop();
}

std::vector<KeyAction> map_line(std::string_view line) {
  std::vector<KeyAction> out;
  if (line.empty()) { out.push_back(KeyAction::print_and_reset()); return out; }
  bool commit = line.back() == '+';
  if (commit) line.remove_suffix(1);
  for (char c : line) {
    if (c >= '0' && c <= '9') out.push_back(KeyAction::make_digit(c));
  }
  if (commit) out.push_back(KeyAction::commit());
  return out;
}
