#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "row_cursor/cached_row_cursor.hpp"
#include "row_cursor/file_source.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_rows(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "rc_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    // Uneven widths so byte and row offsets do not line up.
    for (size_t c = 0; c < cols + (r % 3); ++c) {
      out << (r%10) << "." << (c*37%1000);
      if (c+1<cols + (r % 3)) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  std::size_t seeks = 2'000;
  std::vector<std::uint64_t> granularities{1, 16, 256, 4096};
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--file") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--seeks") a.seeks = std::stoull(val);
    else if (key=="--granularity") a.granularities = {std::stoull(val)};
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: rc_bench_seek [--file=path] [--rows=N] [--cols=M] [--seeks=K] [--granularity=G]\n"
        "If the path is omitted, a synthetic file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_granularity(const std::string& path, std::uint64_t g, std::size_t seeks) {
  std::error_code ec;
  auto src = rc::FileSource::open(path, ec);
  if (!src) { std::cerr << "open failed: " << ec.message() << "\n"; std::exit(2); }
  rc::CachedRowCursor cur(std::move(src), '\n', g);

  auto t0 = clk::now();
  cur.scan_to_end(ec);
  auto t1 = clk::now();
  if (ec) { std::cerr << "scan failed: " << ec.message() << "\n"; std::exit(3); }
  const std::uint64_t total = *cur.total_rows();
  const auto cold = cur.stats();

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<std::uint64_t> pick(0, total ? total - 1 : 0);
  std::string row;
  auto t2 = clk::now();
  for (std::size_t i = 0; i < seeks; ++i) {
    cur.set_row_position(pick(rng), ec);
    row.clear();
    cur.read_row(row, ec);
    if (ec) { std::cerr << "seek failed: " << ec.message() << "\n"; std::exit(3); }
  }
  auto t3 = clk::now();

  const double scan_s = std::chrono::duration<double>(t1-t0).count();
  const double seek_s = std::chrono::duration<double>(t3-t2).count();
  const auto warm = cur.stats();
  std::cout << "  g=" << g
            << ": rows=" << total
            << " samples=" << cur.cache().size()
            << " scan=" << scan_s << "s"
            << "  seeks/s=" << (seeks/seek_s)
            << "  rows rescanned/seek=" << double(warm.rows_scanned - cold.rows_scanned) / seeks
            << "\n";
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_rows(a.rows, a.cols);
  std::cout << "[seek] file=" << path << " seeks=" << a.seeks << "\n";
  for (auto g : a.granularities) {
    if (g == 0) continue;
    bench_granularity(path, g, a.seeks);
  }
  return 0;
}
