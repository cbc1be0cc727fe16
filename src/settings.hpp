#pragma once
/*
 * Settings
 *
 * Purpose: runtime configuration for the kiosk (devices, feed, delays, verbosity).
 * Layers: defaults < rc file (~/.bonbonrc) < environment (KBD_DEV, PRINTER_DEV) < command line.
 */
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"

struct Settings {
  std::string keyboard_dev;  // empty: text line mode
  std::string printer_dev;   // empty: screen or stdout
  int feed_lines = BON_FEED_LINES;
  int idle_ms = BON_IDLE_DELAY_MS;
  int error_ms = BON_ERROR_DELAY_MS;
  bool verbose = false;
  bool plain = false;
  std::optional<uint32_t> seed;
};

struct CliOptions {
  std::optional<std::string> keyboard_dev;
  std::optional<std::string> printer_dev;
  std::optional<std::filesystem::path> rc_path;
  std::optional<uint32_t> seed;
  bool verbose = false;
  bool plain = false;
  bool help = false;
};

bool parse_cli(int argc, char** argv, CliOptions& out, std::string& msg);
std::string usage_text(const char* prog);

class SettingsLoader {
public:
  using EnvLookup = std::function<const char*(const char*)>;

  explicit SettingsLoader(Settings& s);
  // One rc line; comments and blanks are accepted silently.
  bool apply_rc_line(const std::string& line, std::string& msg);
  // Bad lines become warnings; only an unreadable file fails.
  bool load_rc(const std::filesystem::path& path, std::vector<std::string>& warnings, std::string& msg);
  void apply_env(const EnvLookup& lookup);
  void apply_cli(const CliOptions& cli);
private:
  void register_settings();
  Settings& s_;
  CommandRegistry registry_;
};

std::optional<std::filesystem::path> default_rc_path(const SettingsLoader::EnvLookup& lookup);
