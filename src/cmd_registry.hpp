#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands ("set feed 6").
 * Design: map name → handler (args vector, msg); the loader tokenizes and routes.
 */
#include <string>
#include <utility>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  // false when the name is unknown or the handler rejected its arguments; msg says why.
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second(args, msg);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
