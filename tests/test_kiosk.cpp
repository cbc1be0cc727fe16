#include "kiosk.hpp"
#include "test_support.hpp"
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

struct Harness {
  std::vector<std::string> log_lines;
  Logger log{[this](const std::string& l){ log_lines.push_back(l); }};
  Settings settings;
  RecordingSink* sink = nullptr;
  std::vector<int> sleeps;

  std::unique_ptr<Kiosk> make(std::unique_ptr<IActionSource> src) {
    auto rec = std::make_unique<RecordingSink>();
    sink = rec.get();
    auto k = std::make_unique<Kiosk>(std::move(src), std::move(rec),
                                     std::make_unique<FixedWordSource>(std::string("Puppe")), log, settings);
    k->set_sleeper([this](int ms){ sleeps.push_back(ms); });
    return k;
  }
  bool logged(const std::string& s) const {
    for (const auto& l : log_lines) if (l == "[bonbon] " + s) return true;
    return false;
  }
};

static void test_evdev_flow() {
  Harness h;
  h.log.set_verbose(true);
  auto bytes = std::make_unique<MemoryByteSource>();
  auto push = [&](uint16_t type, uint16_t code, int32_t value) {
    auto r = make_record(1, 0, type, code, value);
    bytes->append(r.data(), r.size());
  };
  for (uint16_t code : {79, 80, 76}) { push(1, code, 1); push(1, code, 0); push(0, 0, 0); }
  push(1, 78, 1);
  push(1, 81, 1);
  push(1, 82, 1);
  push(1, 96, 1);
  auto kiosk = h.make(std::make_unique<EventActionSource>(std::move(bytes), h.log, "test"));
  int guard = 0;
  while (h.sink->writes.empty() && guard++ < 100) kiosk->step();
  assert(h.sink->writes.size() == 1);
  auto lines = split_lines(h.sink->writes[0]);
  assert(lines[5] == "Puppe" + std::string(16, ' ') + "125");
  assert(lines[6] == "Puppe" + std::string(17, ' ') + "30");
  assert(lines.back() == "SUMME" + std::string(16, ' ') + "155");
  assert(kiosk->last_receipt() == lines);
  assert(h.logged("committed 125"));
  assert(h.logged("committed 30"));
  assert(h.logged("PLUS (code=78)"));
  assert(h.logged("ENTER (code=96)"));
  assert(h.logged("digit 2 (code=80)"));
  assert(h.logged("event type=1 code=79 value=0"));
  assert(h.logged("printed 2 lines, total=155"));
  assert(kiosk->session().committed().empty());

  StepResult idle = kiosk->step();
  assert(idle.status == ReadStatus::NoEventYet);
  assert(h.sleeps.back() == 50);
}

static void test_read_error_backoff() {
  Harness h;
  SourceResult err;
  err.status = ReadStatus::DecodeError;
  err.error = "Input/output error";
  SourceResult retry;
  retry.status = ReadStatus::Retry;
  auto kiosk = h.make(std::make_unique<ScriptedSource>(std::vector<SourceResult>{err, retry}));
  assert(kiosk->step().status == ReadStatus::DecodeError);
  assert(h.logged("read error: Input/output error"));
  assert((h.sleeps == std::vector<int>{200}));
  assert(kiosk->step().status == ReadStatus::Retry);
  assert(h.sleeps.size() == 1);
  assert(kiosk->step().status == ReadStatus::EndOfInput);
}

static void test_text_mode_until_eof() {
  Harness h;
  std::istringstream in("12345 6\n+\n  7+\n8\n\n");
  auto kiosk = h.make(std::make_unique<LineActionSource>(in));
  kiosk->run();
  assert(h.sink->writes.size() == 1);
  assert(h.logged("committed 12345"));
  assert(h.logged("printed 3 lines, total=12360"));
  assert(h.logged("nothing to print") == false);
  auto lines = split_lines(h.sink->writes[0]);
  assert(lines[5].substr(19) == "12345");
  assert(lines[6].substr(23) == "7");
  assert(lines[7].substr(23) == "8");
}

static void test_nothing_to_print_and_failure() {
  Harness h;
  std::istringstream in("\n9+\n\n");
  auto kiosk = h.make(std::make_unique<LineActionSource>(in));
  h.sink->fail = true;
  kiosk->run();
  assert(h.logged("nothing to print"));
  assert(h.logged("print failed: paper jam"));
  assert(h.logged("discarded 1 lines, total=9"));
  assert(kiosk->last_receipt().empty());
  assert(kiosk->session().committed().empty());
}

static void test_enter_commits_pending_buffer() {
  Harness h;
  SourceResult line;
  line.status = ReadStatus::Event;
  line.actions = {KeyAction::make_digit('4'), KeyAction::make_digit('2'), KeyAction::print_and_reset()};
  auto kiosk = h.make(std::make_unique<ScriptedSource>(std::vector<SourceResult>{line}));
  StepResult r = kiosk->step();
  assert((r.events == std::vector<SessionEvent>{SessionEvent::DigitBuffered, SessionEvent::DigitBuffered,
                                                SessionEvent::Committed, SessionEvent::Printed}));
  assert((h.log_lines == std::vector<std::string>{"[bonbon] committed 42", "[bonbon] printed 1 lines, total=42"}));
  assert(h.sink->writes.size() == 1);

  // Enter with an empty buffer reports no commit of its own
  Harness e;
  SourceResult enter;
  enter.status = ReadStatus::Event;
  enter.actions = {KeyAction::print_and_reset()};
  auto idle = e.make(std::make_unique<ScriptedSource>(std::vector<SourceResult>{enter}));
  r = idle->step();
  assert((r.events == std::vector<SessionEvent>{SessionEvent::NothingToPrint}));
  assert(!e.logged("committed 0"));
}

static void test_stream_sink_framing() {
  std::ostringstream out;
  StreamSink sink(out, 6);
  std::string msg;
  assert(sink.write("abc", msg));
  assert(out.str() == "\nabc\n\n\n\n\n\n");
  assert(frame_receipt("x", 0) == "\nx");
}

int main() {
  test_evdev_flow();
  test_read_error_backoff();
  test_text_mode_until_eof();
  test_nothing_to_print_and_failure();
  test_enter_commits_pending_buffer();
  test_stream_sink_framing();
  return 0;
}
