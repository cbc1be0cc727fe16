#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (RawEvent/KeyAction/ReadStatus).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>
#include <string>
#include <vector>

struct RawEvent {
  uint16_t type = 0;
  uint16_t code = 0;
  int32_t value = 0;
};

struct KeyAction {
  enum class Kind { Noop, Digit, Commit, PrintAndReset };
  Kind kind = Kind::Noop;
  char digit = 0; // '0'..'9', valid when kind == Digit

  static KeyAction noop() { return {}; }
  static KeyAction make_digit(char d) { return {Kind::Digit, d}; }
  static KeyAction commit() { return {Kind::Commit, 0}; }
  static KeyAction print_and_reset() { return {Kind::PrintAndReset, 0}; }
  bool operator==(const KeyAction&) const = default;
};

enum class ReadStatus { Event, NoEventYet, Retry, DecodeError, EndOfInput };

struct SourceResult {
  ReadStatus status = ReadStatus::NoEventYet;
  std::vector<KeyAction> actions;
  std::string error; // set for DecodeError
};
