#include "settings.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <charconv>
#include <sstream>

static bool parse_int(const std::string& s, int lo, int hi, int& out) {
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) return false;
  if (v < lo || v > hi) return false;
  out = v;
  return true;
}

static bool parse_seed(const std::string& s, uint32_t& out) {
  uint32_t v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) return false;
  out = v;
  return true;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

SettingsLoader::SettingsLoader(Settings& s) : s_(s) {
  register_settings();
}

void SettingsLoader::register_settings() {
  registry_.register_command("set keyboard", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1) { msg = "set keyboard: use set keyboard <path>"; return false; }
    s_.keyboard_dev = args[0];
    return true;
  });
  registry_.register_command("set printer", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1) { msg = "set printer: use set printer <path>"; return false; }
    s_.printer_dev = args[0];
    return true;
  });
  registry_.register_command("set feed", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_int(args[0], 0, 64, s_.feed_lines)) { msg = "set feed: use set feed <0-64>"; return false; }
    return true;
  });
  registry_.register_command("set idle_ms", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_int(args[0], 0, 10000, s_.idle_ms)) { msg = "set idle_ms: use set idle_ms <0-10000>"; return false; }
    return true;
  });
  registry_.register_command("set error_ms", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_int(args[0], 0, 60000, s_.error_ms)) { msg = "set error_ms: use set error_ms <0-60000>"; return false; }
    return true;
  });
  registry_.register_command("set verbose", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { s_.verbose = true; return true; }
    if (args[0] == "on") { s_.verbose = true; return true; }
    if (args[0] == "off") { s_.verbose = false; return true; }
    msg = "set verbose: use set verbose on|off";
    return false;
  });
  registry_.register_command("set seed", [this](const std::vector<std::string>& args, std::string& msg){
    uint32_t v = 0;
    if (args.size() != 1 || !parse_seed(args[0], v)) { msg = "set seed: use set seed <number>"; return false; }
    s_.seed = v;
    return true;
  });
}

bool SettingsLoader::apply_rc_line(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown command: " + cmd; return false; }
  std::string name = args[0];
  std::vector<std::string> subargs;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    std::string value = name.substr(eq + 1);
    name = name.substr(0, eq);
    if (!value.empty()) subargs.push_back(value);
  }
  for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
  return registry_.execute("set " + name, subargs, msg);
}

bool SettingsLoader::load_rc(const std::filesystem::path& path, std::vector<std::string>& warnings, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!apply_rc_line(lines[i], m)) {
      warnings.push_back(path.filename().string() + ":" + std::to_string(i + 1) + ": " + m);
    }
  }
  return true;
}

void SettingsLoader::apply_env(const EnvLookup& lookup) {
  if (const char* kbd = lookup("KBD_DEV"); kbd && *kbd) s_.keyboard_dev = kbd;
  if (const char* prn = lookup("PRINTER_DEV"); prn && *prn) s_.printer_dev = prn;
}

void SettingsLoader::apply_cli(const CliOptions& cli) {
  if (cli.keyboard_dev) s_.keyboard_dev = *cli.keyboard_dev;
  if (cli.printer_dev) s_.printer_dev = *cli.printer_dev;
  if (cli.seed) s_.seed = cli.seed;
  if (cli.verbose) s_.verbose = true;
  if (cli.plain) s_.plain = true;
}

std::optional<std::filesystem::path> default_rc_path(const SettingsLoader::EnvLookup& lookup) {
  const char* home = lookup("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / BON_RC_NAME;
}

bool parse_cli(int argc, char** argv, CliOptions& out, std::string& msg) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](const char* name, std::string& v) {
      if (i + 1 >= argc) { msg = std::string(name) + " needs a value"; return false; }
      v = argv[++i];
      return true;
    };
    std::string v;
    if (a == "--kbd") { if (!value("--kbd", v)) return false; out.keyboard_dev = v; }
    else if (a == "--printer") { if (!value("--printer", v)) return false; out.printer_dev = v; }
    else if (a == "--rc") { if (!value("--rc", v)) return false; out.rc_path = std::filesystem::path(v); }
    else if (a == "--seed") {
      if (!value("--seed", v)) return false;
      uint32_t seed = 0;
      if (!parse_seed(v, seed)) { msg = "--seed: invalid number: " + v; return false; }
      out.seed = seed;
    }
    else if (a == "--verbose" || a == "-v") out.verbose = true;
    else if (a == "--plain") out.plain = true;
    else if (a == "--help" || a == "-h") out.help = true;
    else { msg = "unknown option: " + a; return false; }
  }
  return true;
}

std::string usage_text(const char* prog) {
  std::string p = prog ? prog : "bonbon";
  return "usage: " + p + " [--kbd PATH] [--printer PATH] [--rc PATH] [--seed N] [--plain] [--verbose]\n"
         "  --kbd PATH      read key events from an evdev device (else: text lines)\n"
         "  --printer PATH  write receipts to a raw printer device (else: screen/stdout)\n"
         "  --rc PATH       settings file (default: ~/" BON_RC_NAME ")\n"
         "  --seed N        fixed seed for label selection\n"
         "  --plain         text mode without the curses screen\n"
         "  --verbose       log every key event\n"
         "env: KBD_DEV, PRINTER_DEV\n";
}
