#include "byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

std::unique_ptr<FdByteSource> FdByteSource::open(const std::string& path, std::string& msg) {
  UniqueFd fd = UniqueFd::open_path(path, O_RDONLY, msg);
  if (!fd.valid()) return nullptr;
  return std::make_unique<FdByteSource>(std::move(fd));
}

ReadChunk FdByteSource::read_some(unsigned char* out, size_t n) {
  ReadChunk c;
  ssize_t r = ::read(fd_.get(), out, n);
  if (r > 0) { c.status = ReadStatus::Event; c.count = static_cast<size_t>(r); return c; }
  if (r == 0) { c.status = ReadStatus::NoEventYet; return c; }
  if (errno == EINTR) { c.status = ReadStatus::Retry; return c; }
  if (errno == EAGAIN || errno == EWOULDBLOCK) { c.status = ReadStatus::NoEventYet; return c; }
  c.status = ReadStatus::DecodeError;
  c.error = std::strerror(errno);
  return c;
}

ReadChunk MemoryByteSource::read_some(unsigned char* out, size_t n) {
  ReadChunk c;
  size_t k = std::min(n, data_.size() - pos_);
  if (k == 0) { c.status = ReadStatus::NoEventYet; return c; }
  std::memcpy(out, data_.data() + pos_, k);
  pos_ += k;
  c.status = ReadStatus::Event;
  c.count = k;
  return c;
}
