#pragma once
/*
 * Logger
 *
 * Purpose: "[bonbon] ..." diagnostic lines routed to a replaceable sink.
 * Usage: stderr by default; the curses screen swaps in its status line.
 */
#include <functional>
#include <string>
#include <utility>

class Logger {
public:
  using Sink = std::function<void(const std::string&)>;
  Logger();
  explicit Logger(Sink sink) : sink_(std::move(sink)) {}
  void set_sink(Sink sink) { sink_ = std::move(sink); }
  void set_verbose(bool on) { verbose_ = on; }
  bool verbose() const { return verbose_; }
  void info(const std::string& text) const;
  void debug(const std::string& text) const { if (verbose_) info(text); }
private:
  Sink sink_;
  bool verbose_ = false;
};
