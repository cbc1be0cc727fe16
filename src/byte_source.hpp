#pragma once
/*
 * ByteSource
 *
 * Purpose: abstract raw byte input (evdev fd, in-memory replay) for the event decoder.
 * Contract: read_some returns Event with count > 0 when bytes arrived,
 *           NoEventYet on end-of-stream/EAGAIN, Retry on EINTR, DecodeError otherwise.
 */
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"
#include "posix_fd.hpp"

struct ReadChunk {
  ReadStatus status = ReadStatus::NoEventYet;
  size_t count = 0;
  std::string error;
};

class IByteSource {
public:
  virtual ~IByteSource() = default;
  virtual ReadChunk read_some(unsigned char* out, size_t n) = 0;
};

class FdByteSource : public IByteSource {
public:
  explicit FdByteSource(UniqueFd fd) : fd_(std::move(fd)) {}
  static std::unique_ptr<FdByteSource> open(const std::string& path, std::string& msg);
  ReadChunk read_some(unsigned char* out, size_t n) override;
  int fd() const { return fd_.get(); }
private:
  UniqueFd fd_;
};

class MemoryByteSource : public IByteSource {
public:
  MemoryByteSource() = default;
  explicit MemoryByteSource(std::vector<unsigned char> bytes) : data_(std::move(bytes)) {}
  void append(const unsigned char* p, size_t n) { data_.insert(data_.end(), p, p + n); }
  ReadChunk read_some(unsigned char* out, size_t n) override;
  size_t remaining() const { return data_.size() - pos_; }
private:
  std::vector<unsigned char> data_;
  size_t pos_ = 0;
};
