#include "row_cursor/file_source.hpp"
#include <cerrno>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <sys/types.h>
#include <vector>

namespace rc {

struct FileSource::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  std::vector<char> buf;
  std::size_t begin{0};     // next unread byte in buf
  std::size_t end{0};       // one past the last valid byte in buf
  std::uint64_t device_pos{0}; // file offset of buf[end]
  std::uint64_t reads{0};

  std::uint64_t logical_pos() const { return device_pos - (end - begin); }

  void drop_window() { begin = end = 0; }

  std::string_view fill(std::error_code& ec) {
    ec.clear();
    if (begin < end) return std::string_view(buf.data() + begin, end - begin);

    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    ++reads;
    if (n == 0 && std::ferror(f)) {
      ec = std::error_code(errno, std::generic_category());
      std::clearerr(f);
      return {};
    }
    begin = 0;
    end = n;
    device_pos += n;
    return std::string_view(buf.data(), n);
  }

  std::uint64_t reposition(std::int64_t target, std::error_code& ec) {
    if (target < 0) {
      ec = std::make_error_code(std::errc::invalid_argument);
      return logical_pos();
    }
    ec.clear();
    const std::uint64_t t = static_cast<std::uint64_t>(target);
    const std::uint64_t window_start = device_pos - end;

    // Inside the current window: move the read head, keep the buffer.
    if (t >= window_start && t <= device_pos) {
      begin = static_cast<std::size_t>(t - window_start);
      return t;
    }

    if (::fseeko(f, static_cast<off_t>(t), SEEK_SET) != 0) {
      ec = std::error_code(errno, std::generic_category());
      return logical_pos();
    }
    device_pos = t;
    drop_window();
    return t;
  }

  std::uint64_t seek(SeekFrom pos, std::error_code& ec) {
    switch (pos.whence) {
      case SeekFrom::Whence::Start:
        return reposition(pos.offset, ec);
      case SeekFrom::Whence::Current:
        return reposition(offset_from(logical_pos(), pos.offset), ec);
      case SeekFrom::Whence::End:
        break;
    }

    if (::fseeko(f, 0, SEEK_END) != 0) {
      ec = std::error_code(errno, std::generic_category());
      return logical_pos();
    }
    off_t size = ::ftello(f);
    if (size < 0) {
      ec = std::error_code(errno, std::generic_category());
      return logical_pos();
    }
    // The device now sits at EOF; resync before touching the window.
    device_pos = static_cast<std::uint64_t>(size);
    drop_window();
    return reposition(offset_from(static_cast<std::uint64_t>(size), pos.offset), ec);
  }
};

FileSource::FileSource(Impl* impl) : p_(impl) {}

FileSource::~FileSource() {
  if (p_->f) std::fclose(p_->f);
  delete p_;
}

std::unique_ptr<FileSource> FileSource::open(const std::string& path, std::error_code& ec) {
  return open(path, ec, Config{});
}

std::unique_ptr<FileSource> FileSource::open(const std::string& path, std::error_code& ec,
                                             Config cfg) {
  if (cfg.chunk_bytes == 0) throw std::invalid_argument("chunk_bytes == 0");

  // Everything that can throw happens before the file handle exists.
  auto impl = std::make_unique<Impl>();
  impl->path = path;
  impl->cfg = cfg;
  impl->buf.resize(cfg.chunk_bytes);
  std::unique_ptr<FileSource> src(new FileSource(impl.get()));
  impl.release();

  src->p_->f = std::fopen(path.c_str(), "rb");
  if (!src->p_->f) {
    ec = std::error_code(errno, std::generic_category());
    return nullptr;
  }
  ec.clear();
  return src;
}

std::string_view FileSource::fill_buf(std::error_code& ec) { return p_->fill(ec); }

void FileSource::consume(std::size_t amt) {
  p_->begin = (amt >= p_->end - p_->begin) ? p_->end : p_->begin + amt;
}

std::uint64_t FileSource::seek(SeekFrom pos, std::error_code& ec) { return p_->seek(pos, ec); }

const std::string& FileSource::path() const noexcept { return p_->path; }
std::uint64_t FileSource::device_reads() const noexcept { return p_->reads; }

}
