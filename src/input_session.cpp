#include "input_session.hpp"
#include <numeric>

InputSession::InputSession(PrintHandler on_print, size_t max_digits)
  : on_print_(std::move(on_print)), max_digits_(max_digits) {}

SessionEvent InputSession::apply(const KeyAction& action) {
  switch (action.kind) {
    case KeyAction::Kind::Digit: return push_digit(action.digit);
    case KeyAction::Kind::Commit: return commit();
    case KeyAction::Kind::PrintAndReset: return print_and_reset();
    case KeyAction::Kind::Noop: break;
  }
  return SessionEvent::None;
}

SessionEvent InputSession::push_digit(char d) {
  if (d < '0' || d > '9') return SessionEvent::None;
  if (buffer_.size() >= max_digits_) return SessionEvent::DigitDropped;
  buffer_.push_back(d);
  return SessionEvent::DigitBuffered;
}

SessionEvent InputSession::commit() {
  if (buffer_.empty()) return SessionEvent::NothingToCommit;
  uint64_t v = 0;
  for (char c : buffer_) v = v * 10 + static_cast<uint64_t>(c - '0');
  committed_.push_back(v);
  buffer_.clear();
  return SessionEvent::Committed;
}

SessionEvent InputSession::print_and_reset() {
  commit();
  buffer_.clear();
  if (committed_.empty()) return SessionEvent::NothingToPrint;
  last_print_.lines = committed_.size();
  last_print_.total = running_total();
  bool ok = on_print_ ? on_print_(committed_) : true;
  committed_.clear();
  return ok ? SessionEvent::Printed : SessionEvent::PrintFailed;
}

uint64_t InputSession::running_total() const {
  return std::accumulate(committed_.begin(), committed_.end(), uint64_t{0});
}
