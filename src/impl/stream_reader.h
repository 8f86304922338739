/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_IMPL_STREAM_READER_H
#define BYTECMP_IMPL_STREAM_READER_H

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <string>

#include "src/common/defs.h"

namespace bytecmp {
namespace impl {

// Emits the bytes of one source, starting at its offset, onto a bounded
// channel. Exactly one terminal event (END or ERROR) follows the last byte.
class StreamReader final {
 public:
  StreamReader(const std::string& name, const int64_t offset,
               const uint32_t channel_capacity,
               const uint32_t read_buffer_size);
  ~StreamReader();

  StreamReader(const StreamReader&) = delete;
  StreamReader& operator=(const StreamReader&) = delete;

  // "-" means standard input
  int32_t Open();

  // runs on a pool thread until the source is drained or the channel closed
  int32_t Run();

  // wakes a reader blocked on a full channel
  void Cancel() { channel_.Close(); }

  common::ByteChannel* Channel() { return &channel_; }
  int64_t Offset() const { return offset_; }
  int64_t EmittedBytes() const { return emitted_bytes_.load(); }

 private:
  int32_t Seek();
  ssize_t ReadSome(char* buf, size_t size);
  bool Emit(const common::ByteEvent& event) { return channel_.PushBack(event); }

  const std::string name_;
  const int64_t offset_;
  const uint32_t read_buffer_size_;
  int fd_ = -1;
  bool own_fd_ = false;
  common::ByteChannel channel_;
  std::atomic<int64_t> emitted_bytes_ = 0;
};

}  // namespace impl
}  // namespace bytecmp

#endif  // BYTECMP_IMPL_STREAM_READER_H
