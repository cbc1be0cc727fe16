#pragma once
/*
 * EventDecoder
 *
 * Purpose: decode Linux input_event records (64-bit userspace) into RawEvent.
 * Layout: int64 sec | int64 usec | uint16 type | uint16 code | int32 value, little-endian, 24 bytes.
 * Note: timestamps are read past and dropped.
 */
#include <optional>
#include <span>
#include <string>
#include "types.hpp"
#include "byte_source.hpp"
#include "config.hpp"

struct DecodeResult {
  ReadStatus status = ReadStatus::NoEventYet;
  RawEvent event;
  std::string error;
};

constexpr size_t kEventRecordSize = BON_EVENT_RECORD_SIZE;

std::optional<RawEvent> decode_event(std::span<const unsigned char> record);

class EventDecoder {
public:
  // Reads one full record; a record cut short by end-of-stream is a DecodeError.
  DecodeResult read_next(IByteSource& src);
};
