#pragma once
/*
 * Kiosk
 *
 * Purpose: single-threaded read → map → apply → (maybe) print loop around one InputSession.
 * Delays: NoEventYet sleeps idle_ms, DecodeError logs and sleeps error_ms, Retry loops at once.
 * Exit: only when the source reports EndOfInput (text streams); device mode runs until killed.
 */
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "action_source.hpp"
#include "input_session.hpp"
#include "log.hpp"
#include "output_sink.hpp"
#include "receipt_formatter.hpp"
#include "renderer.hpp"
#include "settings.hpp"
#include "word_source.hpp"

struct StepResult {
  ReadStatus status = ReadStatus::NoEventYet;
  std::vector<SessionEvent> events;
};

class Kiosk {
public:
  using Sleeper = std::function<void(int ms)>;

  Kiosk(std::unique_ptr<IActionSource> source,
        std::unique_ptr<IOutputSink> sink,
        std::unique_ptr<IWordSource> words,
        const Logger& log,
        const Settings& settings);

  // Curses mode: redraw before every read.
  void attach_screen(ITerminal* term) { term_ = term; }
  void set_sleeper(Sleeper s) { sleep_ = std::move(s); }
  void set_message(const std::string& m) { message_ = m; }

  void announce() const;
  StepResult step();
  void run();

  const InputSession& session() const { return session_; }
  const std::vector<std::string>& last_receipt() const { return last_receipt_; }
  const std::string& message() const { return message_; }
  PromptPosition prompt() const { return renderer_.prompt(); }
private:
  bool print(const std::vector<uint64_t>& numbers);
  void report(SessionEvent ev, size_t printed_lines, uint64_t printed_total);
  void render();

  std::unique_ptr<IActionSource> source_;
  std::unique_ptr<IOutputSink> sink_;
  std::unique_ptr<IWordSource> words_;
  const Logger& log_;
  int idle_ms_;
  int error_ms_;
  ReceiptFormatter formatter_;
  InputSession session_;
  Renderer renderer_;
  ITerminal* term_ = nullptr;
  Sleeper sleep_;
  std::string message_;
  std::vector<std::string> last_receipt_;
};
