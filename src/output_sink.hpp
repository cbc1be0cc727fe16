#pragma once
/*
 * OutputSink
 *
 * Purpose: where a finished receipt goes (raw printer device, text stream, kiosk screen).
 * Contract: write() takes the formatter's text as-is; framing/paper feed is the sink's choice.
 */
#include <memory>
#include <utility>
#include <ostream>
#include <string>
#include "posix_fd.hpp"

class IOutputSink {
public:
  virtual ~IOutputSink() = default;
  virtual bool write(const std::string& receipt, std::string& msg) = 0;
  virtual std::string describe() const = 0;
};

// "\n" + receipt + feed_lines newlines, so the tear-off edge clears the text.
std::string frame_receipt(const std::string& receipt, int feed_lines);

class DeviceSink : public IOutputSink {
public:
  DeviceSink(UniqueFd fd, std::string path, int feed_lines);
  static std::unique_ptr<DeviceSink> open(const std::string& path, int feed_lines, std::string& msg);
  bool write(const std::string& receipt, std::string& msg) override;
  std::string describe() const override { return path_; }
private:
  UniqueFd fd_;
  std::string path_;
  int feed_lines_;
};

class StreamSink : public IOutputSink {
public:
  StreamSink(std::ostream& out, int feed_lines, std::string label = "STDOUT")
    : out_(out), feed_lines_(feed_lines), label_(std::move(label)) {}
  bool write(const std::string& receipt, std::string& msg) override;
  std::string describe() const override { return label_; }
private:
  std::ostream& out_;
  int feed_lines_;
  std::string label_;
};

// Curses mode without a printer. Accepts every receipt and keeps nothing: Kiosk stores
// the formatted lines of each successful print and the Renderer draws them as the preview.
class ScreenSink : public IOutputSink {
public:
  bool write(const std::string&, std::string&) override { return true; }
  std::string describe() const override { return "screen"; }
};
