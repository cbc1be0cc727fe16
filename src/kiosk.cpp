#include "kiosk.hpp"
#include <chrono>
#include <thread>

Kiosk::Kiosk(std::unique_ptr<IActionSource> source,
             std::unique_ptr<IOutputSink> sink,
             std::unique_ptr<IWordSource> words,
             const Logger& log,
             const Settings& settings)
  : source_(std::move(source)),
    sink_(std::move(sink)),
    words_(std::move(words)),
    log_(log),
    idle_ms_(settings.idle_ms),
    error_ms_(settings.error_ms),
    session_([this](const std::vector<uint64_t>& n){ return print(n); }),
    sleep_([](int ms){ std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }) {}

void Kiosk::announce() const {
  log_.info(source_->describe());
  log_.info("output to " + sink_->describe());
  log_.info("digits -> buffer, '+' commits, Enter prints");
  log_.info("READY");
}

bool Kiosk::print(const std::vector<uint64_t>& numbers) {
  std::vector<std::string> lines = formatter_.format_lines(numbers, *words_);
  std::string msg;
  if (!sink_->write(join_lines(lines), msg)) {
    log_.info("print failed: " + msg);
    return false;
  }
  last_receipt_ = std::move(lines);
  return true;
}

void Kiosk::report(SessionEvent ev, size_t printed_lines, uint64_t printed_total) {
  switch (ev) {
    case SessionEvent::Committed:
      log_.info("committed " + std::to_string(session_.last_committed()));
      break;
    case SessionEvent::NothingToPrint:
      log_.info("nothing to print");
      break;
    case SessionEvent::Printed:
      log_.info("printed " + std::to_string(printed_lines) + " lines, total=" + std::to_string(printed_total));
      break;
    case SessionEvent::PrintFailed:
      log_.info("discarded " + std::to_string(printed_lines) + " lines, total=" + std::to_string(printed_total));
      break;
    case SessionEvent::DigitDropped:
      log_.debug("buffer full (" + std::to_string(session_.max_digits()) + " digits), digit dropped");
      break;
    case SessionEvent::None:
    case SessionEvent::DigitBuffered:
    case SessionEvent::NothingToCommit:
      break;
  }
}

StepResult Kiosk::step() {
  render();
  StepResult res;
  SourceResult r = source_->next();
  res.status = r.status;
  switch (r.status) {
    case ReadStatus::Event:
      for (const auto& a : r.actions) {
        // Enter commits a pending buffer first; surface that commit on its own
        if (a.kind == KeyAction::Kind::PrintAndReset && !session_.buffer().empty()) {
          SessionEvent c = session_.commit();
          report(c, 0, 0);
          res.events.push_back(c);
        }
        SessionEvent ev = session_.apply(a);
        // print_and_reset clears committed; report from the summary it left behind
        report(ev, session_.last_print().lines, session_.last_print().total);
        res.events.push_back(ev);
      }
      break;
    case ReadStatus::NoEventYet:
      sleep_(idle_ms_);
      break;
    case ReadStatus::Retry:
      break;
    case ReadStatus::DecodeError:
      log_.info("read error: " + r.error);
      sleep_(error_ms_);
      break;
    case ReadStatus::EndOfInput:
      break;
  }
  return res;
}

void Kiosk::run() {
  while (step().status != ReadStatus::EndOfInput) {}
}

void Kiosk::render() {
  if (!term_) return;
  KioskView view;
  view.input_label = source_->describe();
  view.output_label = sink_->describe();
  view.buffer = session_.buffer();
  view.committed = session_.committed();
  view.running_total = session_.running_total();
  view.message = message_;
  view.last_receipt = last_receipt_;
  renderer_.render(*term_, view);
}
