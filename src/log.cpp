#include "log.hpp"
#include <iostream>

Logger::Logger()
  : sink_([](const std::string& line){ std::cerr << line << std::endl; }) {}

void Logger::info(const std::string& text) const {
  if (sink_) sink_("[bonbon] " + text);
}
