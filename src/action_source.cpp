#include "action_source.hpp"
#include <cctype>
#include <ostream>

const char* const kLinePrompt = "Eingabe (digits, digits+, oder leer=print): ";

EventActionSource::EventActionSource(std::unique_ptr<IByteSource> bytes, const Logger& log, std::string label)
  : EventActionSource(std::move(bytes), KeyMapper(), log, std::move(label)) {}

EventActionSource::EventActionSource(std::unique_ptr<IByteSource> bytes, KeyMapper mapper, const Logger& log, std::string label)
  : bytes_(std::move(bytes)), mapper_(std::move(mapper)), log_(log), label_(std::move(label)) {}

SourceResult EventActionSource::next() {
  SourceResult r;
  DecodeResult d = decoder_.read_next(*bytes_);
  r.status = d.status;
  if (d.status == ReadStatus::DecodeError) { r.error = d.error; return r; }
  if (d.status != ReadStatus::Event) return r;
  log_.debug("event type=" + std::to_string(d.event.type) + " code=" + std::to_string(d.event.code) +
             " value=" + std::to_string(d.event.value));
  KeyAction a = mapper_.map_event(d.event);
  if (a.kind != KeyAction::Kind::Noop) {
    log_action(d.event, a);
    r.actions.push_back(a);
  }
  return r;
}

void EventActionSource::log_action(const RawEvent& ev, const KeyAction& a) const {
  std::string code = "(code=" + std::to_string(ev.code) + ")";
  switch (a.kind) {
    case KeyAction::Kind::PrintAndReset: log_.info("ENTER " + code); break;
    case KeyAction::Kind::Commit: log_.info("PLUS " + code); break;
    case KeyAction::Kind::Digit: log_.info(std::string("digit ") + a.digit + " " + code); break;
    case KeyAction::Kind::Noop: break;
  }
}

SourceResult actions_from_line(const std::string& raw) {
  size_t i = 0; while (i < raw.size() && std::isspace((unsigned char)raw[i])) i++;
  size_t j = raw.size(); while (j > i && std::isspace((unsigned char)raw[j-1])) j--;
  SourceResult r;
  r.status = ReadStatus::Event;
  r.actions = map_line(std::string_view(raw).substr(i, j - i));
  return r;
}

LineActionSource::LineActionSource(std::istream& in, std::ostream* prompt_out)
  : in_(in), prompt_out_(prompt_out) {}

SourceResult LineActionSource::next() {
  if (prompt_out_) { *prompt_out_ << kLinePrompt; prompt_out_->flush(); }
  std::string line;
  if (!std::getline(in_, line)) {
    SourceResult r;
    r.status = ReadStatus::EndOfInput;
    return r;
  }
  return actions_from_line(line);
}

TerminalActionSource::TerminalActionSource(ITerminal& term, PromptLocator locate)
  : term_(term), locate_(std::move(locate)) {}

SourceResult TerminalActionSource::next() {
  PromptPosition p = locate_ ? locate_() : PromptPosition{};
  auto line = term_.read_line(p.row, p.col, p.max_len);
  if (!line) {
    SourceResult r;
    r.status = ReadStatus::EndOfInput;
    return r;
  }
  return actions_from_line(*line);
}
