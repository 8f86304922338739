/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_COMMON_DEFS_H
#define BYTECMP_COMMON_DEFS_H

#include <cstdint>
#include <string>

#include "src/common/blocking_queue.h"
#include "src/common/error.h"

namespace bytecmp {
namespace common {

const std::string STDIN_NAME = "-";
constexpr int64_t CHANNEL_CAPACITY = 8192;              // events
constexpr int64_t READ_BUFFER_SIZE_BYTES = 64 * 1024;  // 64KB
constexpr int32_t MIN_READER_THREADS = 2;

constexpr int EXIT_EQUAL = 0;
constexpr int EXIT_DIFFER = 1;
constexpr int EXIT_TROUBLE = 2;

enum ReportMode {
  Report_DEFAULT = 0,
  Report_QUIET,
  Report_LINE,
  Report_LONG,
};

enum EventType {
  Event_BYTE = 0,
  Event_END,
  Event_ERROR,
};

enum CompareResult {
  Result_EQUAL = 0,
  Result_DIFFER,
  Result_ERROR,
};

struct ByteEvent final {
  EventType type = Event_END;
  uint8_t value = 0;
  int32_t err = 0;  // errno when type is Event_ERROR

  static ByteEvent Byte(uint8_t value) {
    ByteEvent event;
    event.type = Event_BYTE;
    event.value = value;
    return event;
  }

  static ByteEvent End() { return ByteEvent(); }

  static ByteEvent Error(int32_t err) {
    ByteEvent event;
    event.type = Event_ERROR;
    event.err = err;
    return event;
  }
};

using ByteChannel = BlockingQueue<ByteEvent>;

struct CompareOptions final {
  std::string names[2];
  int64_t offsets[2] = {0, 0};
  ReportMode mode = Report_DEFAULT;

  std::string ToString() const {
    std::string content;
    content.append("source1: ");
    content.append(names[0]);
    content.append(", ");

    content.append("source2: ");
    content.append(names[1]);
    content.append(", ");

    content.append("offset1: ");
    content.append(std::to_string(offsets[0]));
    content.append(", ");

    content.append("offset2: ");
    content.append(std::to_string(offsets[1]));
    content.append(", ");

    content.append("mode: ");
    content.append(std::to_string(mode));
    return content;
  }
};

inline int ToExitCode(CompareResult result) {
  switch (result) {
    case Result_EQUAL:
      return EXIT_EQUAL;
    case Result_DIFFER:
      return EXIT_DIFFER;
    default:
      return EXIT_TROUBLE;
  }
}

}  // namespace common
}  // namespace bytecmp

#endif  // BYTECMP_COMMON_DEFS_H
