#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace rc {

// Tiny wrapper around cpp-httplib serving rows of the files under `data_root`:
//   GET /                          index of files
//   GET /rows/<file>?row=N&count=K raw rows starting at row N (or ?byte=N)
//   GET /stats/<file>              JSON cursor report, totals discovered
class RowServer {
public:
  struct Config {
    std::string data_root   = "data";
    std::string index_title = "Row Cursor";
    std::string host = "0.0.0.0";
    int port = 8080;                  // 0 = pick a free port
    char separator = '\n';
    std::uint64_t granularity = 1024;
    std::size_t chunk_bytes = 64 * 1024;
    std::size_t default_rows = 100;
    std::size_t max_rows_per_request = 10000;
    bool log_requests = true;         // one line per request on stderr
  };

  explicit RowServer(Config cfg);
  ~RowServer();
  RowServer(const RowServer&) = delete;
  RowServer& operator=(const RowServer&) = delete;

  // Non-blocking bind; returns false on bind error.
  bool start();

  // Blocking run (alternative); returns when server stops.
  int run();

  // Serve on an already bound socket until stop().
  bool listen_after_start();

  // Stop if running.
  void stop();

  // Port actually bound (after start()).
  int port() const noexcept;

private:
  struct Impl;
  Impl* p_;
};

}
