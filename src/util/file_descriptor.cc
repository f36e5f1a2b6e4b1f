/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "file_descriptor.hh"

#include <fcntl.h>

#include <iostream>
#include <stdexcept>
#include "exception.hh"

using namespace std;

FileDescriptor::FileDescriptor(const int fd)
  : fd_(fd)
{
  /* set close-on-exec flag so our file descriptors
     aren't passed on to unrelated children */
  CheckSystemCall("fcntl", fcntl(fd_, F_SETFD, FD_CLOEXEC));
}

FileDescriptor::FileDescriptor(FileDescriptor && other)
  : fd_(other.fd_)
{
  /* mark other file descriptor as inactive */
  other.fd_ = -1;
}

FileDescriptor & FileDescriptor::operator=(FileDescriptor && other)
{
  if (this != &other) {
    if (fd_ >= 0) {
      close();
    }

    fd_ = other.fd_;
    other.fd_ = -1;
  }

  return *this;
}

void FileDescriptor::close()
{
  if (fd_ < 0) { /* has already been moved away or closed */
    return;
  }

  CheckSystemCall("close", ::close(fd_));

  fd_ = -1;
}

FileDescriptor::~FileDescriptor()
{
  try {
    close();
  } catch (const exception & e) { /* don't throw from destructor */
    print_exception("FileDescriptor", e);
  }
}

void FileDescriptor::write(const string_view & buffer)
{
  auto it = buffer.begin();

  while (it != buffer.end()) {
    const ssize_t bytes_written = CheckSystemCall(
      "write", ::write(fd_, &*it, buffer.end() - it));

    if (bytes_written == 0) {
      throw runtime_error("write returned 0");
    }

    it += bytes_written;
  }
}

uint64_t FileDescriptor::seek(const int64_t offset, const int whence)
{
  const off_t ret = lseek(fd_, offset, whence);
  if (ret < 0) {
    throw unix_error("lseek");
  }

  return ret;
}

uint64_t FileDescriptor::curr_offset()
{
  return seek(0, SEEK_CUR);
}
