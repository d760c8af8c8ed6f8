#pragma once
#include "row_cursor/source.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace rc {

// Seekable source over a file opened with stdio, read in fixed-size chunks.
class FileSource : public SeekableSource {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB device reads
  };

  // Returns nullptr and sets `ec` to the errno of fopen on failure.
  // Throws std::invalid_argument when cfg.chunk_bytes == 0; a buffer that cannot
  // be allocated throws before the file is opened.
  static std::unique_ptr<FileSource> open(const std::string& path, std::error_code& ec);
  static std::unique_ptr<FileSource> open(const std::string& path, std::error_code& ec,
                                          Config cfg);

  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::string_view fill_buf(std::error_code& ec) override;
  void consume(std::size_t amt) override;
  std::uint64_t seek(SeekFrom pos, std::error_code& ec) override;

  const std::string& path() const noexcept;
  std::uint64_t device_reads() const noexcept;

private:
  struct Impl;
  explicit FileSource(Impl* impl);
  Impl* p_;
};

}
