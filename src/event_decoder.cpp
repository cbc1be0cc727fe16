#include "event_decoder.hpp"
#include <array>

static uint16_t le16(const unsigned char* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t le32(const unsigned char* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::optional<RawEvent> decode_event(std::span<const unsigned char> record) {
  if (record.size() != kEventRecordSize) return std::nullopt;
  const unsigned char* p = record.data() + 16; // skip sec + usec
  RawEvent ev;
  ev.type = le16(p);
  ev.code = le16(p + 2);
  ev.value = static_cast<int32_t>(le32(p + 4));
  return ev;
}

DecodeResult EventDecoder::read_next(IByteSource& src) {
  DecodeResult res;
  std::array<unsigned char, kEventRecordSize> buf{};
  size_t got = 0;
  while (got < buf.size()) {
    ReadChunk c = src.read_some(buf.data() + got, buf.size() - got);
    switch (c.status) {
      case ReadStatus::Event:
        got += c.count;
        break;
      case ReadStatus::Retry:
        if (got == 0) { res.status = ReadStatus::Retry; return res; }
        break;
      case ReadStatus::NoEventYet:
      case ReadStatus::EndOfInput:
        if (got == 0) { res.status = ReadStatus::NoEventYet; return res; }
        res.status = ReadStatus::DecodeError;
        res.error = "short read: " + std::to_string(got) + " of " + std::to_string(kEventRecordSize) + " bytes";
        return res;
      case ReadStatus::DecodeError:
        res.status = ReadStatus::DecodeError;
        res.error = c.error;
        return res;
    }
  }
  auto ev = decode_event(buf);
  if (!ev) { res.status = ReadStatus::DecodeError; res.error = "bad record"; return res; }
  res.status = ReadStatus::Event;
  res.event = *ev;
  return res;
}
