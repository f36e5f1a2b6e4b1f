/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#ifndef FILE_DESCRIPTOR_HH
#define FILE_DESCRIPTOR_HH

#include <cstdint>
#include <string>
#include <string_view>
#include <unistd.h>

/* Unix file descriptors (log files) */
class FileDescriptor
{
private:
  int fd_;

public:
  /* construct from fd number */
  FileDescriptor(const int fd);

  /* move constructor */
  FileDescriptor(FileDescriptor && other);

  /* move assignment */
  FileDescriptor & operator=(FileDescriptor && other);

  /* close method throws exception on failure */
  void close();

  /* destructor tries to close, but catches exception */
  virtual ~FileDescriptor();

  /* accessors */
  const int & fd_num() const { return fd_; }

  /* write the whole buffer */
  void write(const std::string_view & buffer);

  /* manipulate file offset */
  uint64_t seek(const int64_t offset, const int whence);
  uint64_t curr_offset();

  /* forbid copying FileDescriptor objects or assigning them */
  FileDescriptor(const FileDescriptor & other) = delete;
  const FileDescriptor & operator=(const FileDescriptor & other) = delete;
};

#endif /* FILE_DESCRIPTOR_HH */
