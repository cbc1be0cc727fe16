#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "types.hpp"
#include "config.hpp"
/*
 * InputSession
 *
 * Purpose: digit buffer + committed amounts driven by KeyActions.
 * States: Idle (empty buffer) / Buffering (1..max digits); commit and print are instant transitions.
 * Policy: over-length digits are dropped, empty commits and empty prints are absorbed, never errors.
 */

enum class SessionEvent {
  None,
  DigitBuffered,
  DigitDropped,
  Committed,
  NothingToCommit,
  Printed,
  NothingToPrint,
  PrintFailed,
};

struct PrintSummary {
  size_t lines = 0;
  uint64_t total = 0;
};

class InputSession {
public:
  // Receives the committed amounts in commit order; returns false if the output failed.
  using PrintHandler = std::function<bool(const std::vector<uint64_t>&)>;

  explicit InputSession(PrintHandler on_print, size_t max_digits = BON_MAX_DIGITS);

  SessionEvent apply(const KeyAction& action);
  SessionEvent push_digit(char d);
  SessionEvent commit();
  SessionEvent print_and_reset();

  const std::string& buffer() const { return buffer_; }
  const std::vector<uint64_t>& committed() const { return committed_; }
  uint64_t last_committed() const { return committed_.empty() ? 0 : committed_.back(); }
  uint64_t running_total() const;
  const PrintSummary& last_print() const { return last_print_; }
  size_t max_digits() const { return max_digits_; }
private:
  PrintHandler on_print_;
  size_t max_digits_;
  std::string buffer_;
  std::vector<uint64_t> committed_;
  PrintSummary last_print_;
};
