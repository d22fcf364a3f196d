#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <streambuf>
#include "bucket/download_stream.hpp"
#include "bucket/upload_stream.hpp"

namespace gridfs::bucket {

// Unbuffered streambuf forwarding every byte straight to an UploadStream
class UploadStreambuf : public std::streambuf {
public:
  explicit UploadStreambuf(std::shared_ptr<UploadStream> stream);

protected:
  int_type overflow(int_type ch) override;
  std::streamsize xsputn(const char* s, std::streamsize n) override;

private:
  std::shared_ptr<UploadStream> stream_;
};

// Unbuffered streambuf pulling bytes from a DownloadStream on demand
class DownloadStreambuf : public std::streambuf {
public:
  explicit DownloadStreambuf(std::shared_ptr<DownloadStream> stream);

protected:
  int_type underflow() override;
  int_type uflow() override;
  std::streamsize xsgetn(char* s, std::streamsize n) override;
  std::streamsize showmanyc() override;

private:
  std::shared_ptr<DownloadStream> stream_;
};

// std::ostream over a shared UploadStream. Errors raised by the stream are
// rethrown from the ostream calls. Several handles may share one stream;
// closing any of them closes it once.
class UploadHandle : public std::ostream {
public:
  explicit UploadHandle(std::shared_ptr<UploadStream> stream);

  void close();
  const std::shared_ptr<UploadStream>& stream() const { return stream_; }

private:
  std::shared_ptr<UploadStream> stream_;
  UploadStreambuf buf_;
};

// std::istream over a shared DownloadStream, usable with std::getline,
// std::copy through istreambuf_iterator, operator>> and the like.
class DownloadHandle : public std::istream {
public:
  explicit DownloadHandle(std::shared_ptr<DownloadStream> stream);

  void close();
  const std::shared_ptr<DownloadStream>& stream() const { return stream_; }

private:
  std::shared_ptr<DownloadStream> stream_;
  DownloadStreambuf buf_;
};

} // namespace gridfs::bucket
