#include "output_sink.hpp"

std::string frame_receipt(const std::string& receipt, int feed_lines) {
  std::string s;
  s.reserve(receipt.size() + 1 + static_cast<size_t>(feed_lines > 0 ? feed_lines : 0));
  s.push_back('\n');
  s += receipt;
  if (feed_lines > 0) s.append(static_cast<size_t>(feed_lines), '\n');
  return s;
}

DeviceSink::DeviceSink(UniqueFd fd, std::string path, int feed_lines)
  : fd_(std::move(fd)), path_(std::move(path)), feed_lines_(feed_lines) {}

std::unique_ptr<DeviceSink> DeviceSink::open(const std::string& path, int feed_lines, std::string& msg) {
  UniqueFd fd = UniqueFd::open_path(path, O_WRONLY, msg);
  if (!fd.valid()) return nullptr;
  return std::make_unique<DeviceSink>(std::move(fd), path, feed_lines);
}

bool DeviceSink::write(const std::string& receipt, std::string& msg) {
  std::string bytes = frame_receipt(receipt, feed_lines_);
  return write_all(fd_.get(), bytes.data(), bytes.size(), msg);
}

bool StreamSink::write(const std::string& receipt, std::string& msg) {
  out_ << frame_receipt(receipt, feed_lines_);
  out_.flush();
  if (!out_) { msg = "write failed: " + label_; return false; }
  return true;
}
