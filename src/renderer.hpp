#pragma once
/*
 * Renderer
 *
 * Purpose: draw the kiosk screen (title, session state, prompt, status, last receipt).
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless apart from where it last placed the prompt.
 */
#include <cstdint>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "action_source.hpp"

struct KioskView {
  std::string input_label;
  std::string output_label;
  std::string buffer;
  std::vector<uint64_t> committed;
  uint64_t running_total = 0;
  std::string message;
  std::vector<std::string> last_receipt;
};

class Renderer {
public:
  void render(ITerminal& term, const KioskView& view);
  PromptPosition prompt() const { return prompt_; }
private:
  PromptPosition prompt_;
};
