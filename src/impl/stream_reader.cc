/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/impl/stream_reader.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include "glog/logging.h"

namespace bytecmp {
namespace impl {

StreamReader::StreamReader(const std::string& name, const int64_t offset,
                           const uint32_t channel_capacity,
                           const uint32_t read_buffer_size)
    : name_(name),
      offset_(offset),
      read_buffer_size_(read_buffer_size),
      channel_(channel_capacity) {}

StreamReader::~StreamReader() {
  if (own_fd_ && fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

int32_t StreamReader::Open() {
  if (name_ == common::STDIN_NAME) {
    fd_ = STDIN_FILENO;
    own_fd_ = false;
    return Err_Success;
  }

  fd_ = open(name_.c_str(), O_RDONLY);
  if (fd_ < 0) {
    int32_t err = errno;
    LOG(ERROR) << "Failed to open " << name_ << ": " << std::strerror(err);
    if (err == EACCES || err == ENOENT) {
      return Err_File_permission_or_not_exists;
    }
    return Err_File_open_error;
  }
  own_fd_ = true;
  return Err_Success;
}

ssize_t StreamReader::ReadSome(char* buf, size_t size) {
  while (true) {
    ssize_t n = read(fd_, buf, size);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    return n;
  }
}

int32_t StreamReader::Seek() {
  if (offset_ <= 0) {
    return Err_Success;
  }

  if (lseek(fd_, offset_, SEEK_SET) >= 0) {
    return Err_Success;
  }

  if (errno != ESPIPE) {
    int32_t err = errno;
    VLOG(1) << "seek " << name_ << " to " << offset_
            << " error: " << std::strerror(err);
    Emit(common::ByteEvent::Error(err));
    return Err_File_seek_error;
  }

  VLOG(1) << name_ << " not seekable, skip " << offset_ << " bytes by reading";
  std::vector<char> buffer(read_buffer_size_);
  int64_t remaining = offset_;
  while (remaining > 0) {
    size_t want = static_cast<size_t>(
        std::min<int64_t>(remaining, static_cast<int64_t>(buffer.size())));
    ssize_t n = ReadSome(buffer.data(), want);
    if (n < 0) {
      int32_t err = errno;
      Emit(common::ByteEvent::Error(err));
      return Err_File_read_error;
    }
    if (n == 0) {
      break;
    }
    remaining -= n;
  }
  return Err_Success;
}

int32_t StreamReader::Run() {
  VLOG(1) << "reader start: " << name_ << ", offset: " << offset_;
  if (fd_ < 0) {
    Emit(common::ByteEvent::Error(EBADF));
    return Err_File_read_error;
  }

  int32_t ret = Seek();
  if (ret != Err_Success) {
    return ret;
  }

  std::vector<char> buffer(read_buffer_size_);
  while (true) {
    ssize_t n = ReadSome(buffer.data(), buffer.size());
    if (n < 0) {
      int32_t err = errno;
      VLOG(1) << "reader " << name_ << " error after " << EmittedBytes()
              << " bytes: " << std::strerror(err);
      Emit(common::ByteEvent::Error(err));
      return Err_File_read_error;
    }

    if (n == 0) {
      VLOG(1) << "reader " << name_ << " reach end, emitted " << EmittedBytes()
              << " bytes";
      return Emit(common::ByteEvent::End()) ? Err_Success : Err_Canceled;
    }

    for (ssize_t i = 0; i < n; ++i) {
      if (!Emit(common::ByteEvent::Byte(static_cast<uint8_t>(buffer[i])))) {
        VLOG(1) << "reader " << name_ << " canceled";
        return Err_Canceled;
      }
    }
    emitted_bytes_ += n;
  }
}

}  // namespace impl
}  // namespace bytecmp
