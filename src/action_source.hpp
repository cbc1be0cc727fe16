#pragma once
/*
 * ActionSource
 *
 * Purpose: one interface over the two input modes (evdev key records, text lines).
 * Contract: next() performs at most one read and returns its status plus mapped actions;
 *           the only place the kiosk loop may block.
 */
#include <functional>
#include <istream>
#include <ostream>
#include <memory>
#include <string>
#include "types.hpp"
#include "byte_source.hpp"
#include "event_decoder.hpp"
#include "key_mapper.hpp"
#include "iterminal.hpp"
#include "log.hpp"

class IActionSource {
public:
  virtual ~IActionSource() = default;
  virtual SourceResult next() = 0;
  virtual std::string describe() const = 0;
};

class EventActionSource : public IActionSource {
public:
  EventActionSource(std::unique_ptr<IByteSource> bytes, const Logger& log, std::string label = "evdev");
  EventActionSource(std::unique_ptr<IByteSource> bytes, KeyMapper mapper, const Logger& log, std::string label);
  SourceResult next() override;
  std::string describe() const override { return "evdev input from " + label_; }
private:
  void log_action(const RawEvent& ev, const KeyAction& a) const;
  std::unique_ptr<IByteSource> bytes_;
  EventDecoder decoder_;
  KeyMapper mapper_;
  const Logger& log_;
  std::string label_;
};

// Trims the line, then maps it with map_line.
SourceResult actions_from_line(const std::string& raw);

class LineActionSource : public IActionSource {
public:
  explicit LineActionSource(std::istream& in, std::ostream* prompt_out = nullptr);
  SourceResult next() override;
  std::string describe() const override { return "stdin mode"; }
private:
  std::istream& in_;
  std::ostream* prompt_out_;
};

struct PromptPosition { int row = 0; int col = 0; int max_len = 64; };

class TerminalActionSource : public IActionSource {
public:
  using PromptLocator = std::function<PromptPosition()>;
  TerminalActionSource(ITerminal& term, PromptLocator locate);
  SourceResult next() override;
  std::string describe() const override { return "terminal mode"; }
private:
  ITerminal& term_;
  PromptLocator locate_;
};

extern const char* const kLinePrompt;
