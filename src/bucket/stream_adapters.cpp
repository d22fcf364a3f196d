#include "bucket/stream_adapters.hpp"
#include <boost/log/trivial.hpp>

namespace gridfs::bucket {

//==============================================
// UPLOAD STREAMBUF
//==============================================

UploadStreambuf::UploadStreambuf(std::shared_ptr<UploadStream> stream)
  : stream_(std::move(stream)) {
  if (!stream_) {
    throw UsageError("upload adapter needs a stream");
  }
}

UploadStreambuf::int_type UploadStreambuf::overflow(int_type ch) {
  if (traits_type::eq_int_type(ch, traits_type::eof())) {
    return traits_type::not_eof(ch);
  }
  char c = traits_type::to_char_type(ch);
  stream_->write(&c, 1);
  return ch;
}

std::streamsize UploadStreambuf::xsputn(const char* s, std::streamsize n) {
  if (n <= 0) {
    return 0;
  }
  stream_->write(s, static_cast<std::size_t>(n));
  return n;
}


//==============================================
// DOWNLOAD STREAMBUF
//==============================================

DownloadStreambuf::DownloadStreambuf(std::shared_ptr<DownloadStream> stream)
  : stream_(std::move(stream)) {
  if (!stream_) {
    throw UsageError("download adapter needs a stream");
  }
}

DownloadStreambuf::int_type DownloadStreambuf::underflow() {
  return stream_->peek();
}

DownloadStreambuf::int_type DownloadStreambuf::uflow() {
  return stream_->getc();
}

std::streamsize DownloadStreambuf::xsgetn(char* s, std::streamsize n) {
  if (n <= 0) {
    return 0;
  }
  return static_cast<std::streamsize>(stream_->read_into(s, static_cast<std::size_t>(n)));
}

std::streamsize DownloadStreambuf::showmanyc() {
  return stream_->eof() ? -1 : 0;
}


//==============================================
// HANDLES
//==============================================

UploadHandle::UploadHandle(std::shared_ptr<UploadStream> stream)
  : std::ostream(nullptr)
  , stream_(stream)
  , buf_(std::move(stream)) {
  rdbuf(&buf_);
  exceptions(std::ios::badbit);
}

void UploadHandle::close() {
  if (stream_->closed()) {
    BOOST_LOG_TRIVIAL(debug) << "Upload handle: Stream for file " << stream_->id().to_string()
                             << " already closed";
    return;
  }
  stream_->close();
}

DownloadHandle::DownloadHandle(std::shared_ptr<DownloadStream> stream)
  : std::istream(nullptr)
  , stream_(stream)
  , buf_(std::move(stream)) {
  rdbuf(&buf_);
  exceptions(std::ios::badbit);
}

void DownloadHandle::close() {
  if (stream_->closed()) {
    BOOST_LOG_TRIVIAL(debug) << "Download handle: Stream for file " << stream_->file().id.to_string()
                             << " already closed";
    return;
  }
  stream_->close();
}

} // namespace gridfs::bucket
