#pragma once
/*
 * KeyMapper
 *
 * Purpose: turn raw key events and text lines into semantic KeyActions.
 * Design: code tables live in an immutable KeyMap handed in at construction.
 */
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "types.hpp"

constexpr uint16_t kEvKey = 0x01;
constexpr int32_t kKeyPress = 1;

struct KeyMap {
  std::unordered_set<uint16_t> enter_codes;      // KEY_ENTER, KEY_KPENTER
  std::unordered_set<uint16_t> plus_codes;       // KEY_KPPLUS
  std::unordered_map<uint16_t, char> digit_codes; // numpad KEY_KP0..KEY_KP9

  static KeyMap numpad();
};

class KeyMapper {
public:
  KeyMapper() : map_(KeyMap::numpad()) {}
  explicit KeyMapper(KeyMap map) : map_(std::move(map)) {}
  KeyAction map_event(const RawEvent& ev) const;
  const KeyMap& key_map() const { return map_; }
private:
  KeyMap map_;
};

// Text mode: "" prints, "123+" buffers then commits, anything else buffers its digits.
std::vector<KeyAction> map_line(std::string_view line);
