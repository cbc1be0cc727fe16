#include "action_source.hpp"
#include "byte_source.hpp"
#include "kiosk.hpp"
#include "log.hpp"
#include "ncurses_terminal.hpp"
#include "output_sink.hpp"
#include "settings.hpp"
#include "terminal.hpp"
#include "word_source.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <unistd.h>

static const char* env_lookup(const char* name) { return std::getenv(name); }

static bool load_settings(int argc, char** argv, Settings& s, bool& help) {
  CliOptions cli;
  std::string msg;
  if (!parse_cli(argc, argv, cli, msg)) {
    std::cerr << "bonbon: " << msg << "\n" << usage_text(argv[0]);
    return false;
  }
  help = cli.help;
  SettingsLoader loader(s);
  std::optional<std::filesystem::path> rc = cli.rc_path ? cli.rc_path : default_rc_path(env_lookup);
  std::error_code ec;
  if (rc && (cli.rc_path || std::filesystem::exists(*rc, ec))) {
    std::vector<std::string> warnings;
    if (!loader.load_rc(*rc, warnings, msg)) {
      std::cerr << "bonbon: " << msg << "\n";
      return false;
    }
    for (const auto& w : warnings) std::cerr << "bonbon: " << w << "\n";
  }
  loader.apply_env(env_lookup);
  loader.apply_cli(cli);
  return true;
}

int main(int argc, char** argv) {
  Settings settings;
  bool help = false;
  if (!load_settings(argc, argv, settings, help)) return 1;
  if (help) { std::cout << usage_text(argv[0]); return 0; }

  Logger log;
  log.set_verbose(settings.verbose);
  uint32_t seed = settings.seed ? *settings.seed : std::random_device{}();
  auto words = std::make_unique<RandomWordSource>(seed);

  std::string msg;
  std::unique_ptr<IOutputSink> sink;
  if (!settings.printer_dev.empty()) {
    sink = DeviceSink::open(settings.printer_dev, settings.feed_lines, msg);
    if (!sink) { std::cerr << "bonbon: cannot open printer device: " << msg << "\n"; return 1; }
  }

  if (!settings.keyboard_dev.empty()) {
    auto bytes = FdByteSource::open(settings.keyboard_dev, msg);
    if (!bytes) { std::cerr << "bonbon: cannot open keyboard device: " << msg << "\n"; return 1; }
    if (!sink) sink = std::make_unique<StreamSink>(std::cout, settings.feed_lines);
    auto source = std::make_unique<EventActionSource>(std::move(bytes), log, settings.keyboard_dev);
    Kiosk kiosk(std::move(source), std::move(sink), std::move(words), log, settings);
    kiosk.announce();
    kiosk.run();
    return 0;
  }

  bool interactive = ::isatty(STDIN_FILENO) && ::isatty(STDOUT_FILENO);
  if (settings.plain || !interactive) {
    if (!sink) sink = std::make_unique<StreamSink>(std::cout, settings.feed_lines);
    std::ostream* prompt = interactive ? &std::cout : nullptr;
    auto source = std::make_unique<LineActionSource>(std::cin, prompt);
    Kiosk kiosk(std::move(source), std::move(sink), std::move(words), log, settings);
    kiosk.announce();
    kiosk.run();
    return 0;
  }

  Terminal term;
  NcursesTerminal nterm;
  Kiosk* active = nullptr;
  auto source = std::make_unique<TerminalActionSource>(nterm, [&active]{
    return active ? active->prompt() : PromptPosition{};
  });
  if (!sink) sink = std::make_unique<ScreenSink>();
  Kiosk kiosk(std::move(source), std::move(sink), std::move(words), log, settings);
  active = &kiosk;
  log.set_sink([&kiosk](const std::string& line){ kiosk.set_message(line); });
  kiosk.attach_screen(&nterm);
  kiosk.announce();
  kiosk.run();
  return 0;
}
