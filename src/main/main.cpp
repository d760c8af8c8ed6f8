#include "row_cursor/cached_row_cursor.hpp"
#include "row_cursor/file_source.hpp"
#include "row_cursor/forward_row_reader.hpp"
#include "row_cursor/metrics.hpp"
#include "row_cursor/path_utils.hpp"
#include "row_cursor/report_json.hpp"

#if defined(RC_ENABLE_SERVER) && RC_ENABLE_SERVER
  #include "row_cursor/row_server.hpp"
  #define RC_HAS_SERVER 1
#else
  #define RC_HAS_SERVER 0
#endif

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

enum Exit { kOk = 0, kUsage = 1, kOpen = 2, kIo = 3 };

struct Cli {
  std::string file;
  char separator = '\n';
  std::uint64_t granularity = 1024;
  std::size_t chunk_bytes = 64 * 1024;
  std::optional<std::uint64_t> row;
  std::optional<std::uint64_t> byte;
  std::optional<std::uint64_t> tail;
  std::uint64_t count = 10;
  std::string stats_path;
  bool serve = false;
  int port = 8080;
  std::string data_root = "data";
  bool bad = false;
};

void usage(std::ostream& o) {
  o <<
    "Usage: row-cursor [--sep=C] [--granularity=N] [--chunk-bytes=N]\n"
    "                  [--row=N | --byte=N | --tail=N] [--count=N] [--stats=PATH] FILE\n"
    "       row-cursor [--sep=C] [--row=N] [--count=N] -      (stdin, forward only)\n"
    "       row-cursor --serve [--port=N] [--data-root=DIR] [--sep=C] [--granularity=N]\n";
}

bool to_u64(const std::string& s, std::uint64_t* out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
  return !s.empty() && ec == std::errc() && ptr == s.data() + s.size();
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_u = [&](const char* pfx, std::uint64_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      if (!to_u64(a.substr(std::string(pfx).size()), out)) {
        std::cerr << "[cursor] bad value: " << a << "\n";
        c.bad = true;
      }
      return true;
    };
    auto eat_opt = [&](const char* pfx, std::optional<std::uint64_t>* out){
      std::uint64_t v = 0;
      if (!eat_u(pfx, &v)) return false;
      *out = v;
      return true;
    };

    std::string sval;
    std::uint64_t uval = 0;
    if (eat("--sep=", &sval)) {
      auto sep = rc::parse_separator(sval);
      if (!sep) { std::cerr << "[cursor] bad separator: " << sval << "\n"; c.bad = true; }
      else c.separator = *sep;
      continue;
    }
    if (eat_u("--granularity=", &c.granularity)) continue;
    if (eat_u("--chunk-bytes=", &uval)) { c.chunk_bytes = static_cast<std::size_t>(uval); continue; }
    if (eat_opt("--row=", &c.row)) continue;
    if (eat_opt("--byte=", &c.byte)) continue;
    if (eat_opt("--tail=", &c.tail)) continue;
    if (eat_u("--count=", &c.count)) continue;
    if (eat("--stats=", &c.stats_path)) continue;
    if (eat_u("--port=", &uval)) { c.port = static_cast<int>(uval); continue; }
    if (eat("--data-root=", &c.data_root)) continue;
    if (a == "--serve") { c.serve = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a == "-") { c.file = a; continue; }
    if (a.rfind("--", 0) == 0) { std::cerr << "[cursor] unknown option: " << a << "\n"; c.bad = true; continue; }
    c.file = a;
  }

  int modes = (c.row ? 1 : 0) + (c.byte ? 1 : 0) + (c.tail ? 1 : 0);
  if (modes > 1) { std::cerr << "[cursor] --row, --byte and --tail are exclusive\n"; c.bad = true; }
  if (c.granularity == 0) { std::cerr << "[cursor] --granularity must be > 0\n"; c.bad = true; }
  if (c.chunk_bytes == 0) { std::cerr << "[cursor] --chunk-bytes must be > 0\n"; c.bad = true; }
  if (!c.serve && c.file.empty()) c.bad = true;
  if (c.file == "-" && (c.byte || c.tail || !c.stats_path.empty())) {
    std::cerr << "[cursor] stdin supports only --row and --count\n";
    c.bad = true;
  }
  return c;
}

// Positions the cursor as requested on the command line.
void position_cursor(const Cli& cli, rc::CachedRowCursor& cur, std::error_code& ec) {
  if (cli.byte) {
    cur.seek(rc::SeekFrom::start(*cli.byte), ec);
  } else if (cli.tail) {
    cur.scan_to_end(ec);
    if (ec) return;
    const std::uint64_t total = *cur.total_rows();
    cur.set_row_position(total > *cli.tail ? total - *cli.tail : 0, ec);
  } else {
    cur.seek_row(rc::SeekFrom::start(cli.row.value_or(0)), ec);
  }
}

int print_rows(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  rc::MetricsRegistry metrics;

  metrics.start_stage("open");
  std::error_code ec;
  auto src = rc::FileSource::open(cli.file, ec, rc::FileSource::Config{cli.chunk_bytes});
  if (!src) {
    std::cerr << "[cursor] open failed: " << cli.file << ": " << ec.message() << "\n";
    return kOpen;
  }
  rc::CachedRowCursor cur(std::move(src), rc::CachedRowCursor::Config{cli.separator, cli.granularity});
  metrics.end_stage("open");

  metrics.start_stage("seek");
  position_cursor(cli, cur, ec);
  metrics.end_stage("seek");
  if (ec) {
    std::cerr << "[cursor] seek failed: " << ec.message() << "\n";
    return kIo;
  }

  metrics.start_stage("emit");
  std::string row;
  for (std::uint64_t i = 0; i < cli.count; ++i) {
    row.clear();
    std::size_t n = cur.read_row(row, ec);
    if (ec) {
      std::cerr << "[cursor] read failed at byte " << cur.position() << ": " << ec.message() << "\n";
      return kIo;
    }
    if (n == 0) break;
    std::cout.write(row.data(), static_cast<std::streamsize>(row.size()));
    metrics.add_row(n);
  }
  std::cout.flush();
  metrics.end_stage("emit");

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  if (!cli.stats_path.empty()) {
    std::error_code fec;
    std::uint64_t size = std::filesystem::file_size(cli.file, fec);
    rc::CursorReport r = rc::make_report(cur, cli.file, fec ? 0 : size);
    r.run = metrics.snapshot(wall_ms);

    std::filesystem::path out(cli.stats_path);
    if (!rc::ensure_parent_dirs(out)) {
      std::cerr << "[cursor] cannot create directory for " << out << "\n";
      return kIo;
    }
    std::ofstream js(out, std::ios::binary);
    const std::string body = rc::ReportJsonWriter::to_json(r);
    js.write(body.data(), static_cast<std::streamsize>(body.size()));
    if (!js) {
      std::cerr << "[cursor] failed to write " << out << "\n";
      return kIo;
    }
  }

  std::cerr << "[cursor] ok: " << cli.file << " rows " << cur.row_position()
            << " byte " << cur.position() << " (" << wall_ms << " ms)\n";
  return kOk;
}

// Pipes cannot seek: skip rows on the way instead of using the index.
int print_stdin_rows(const Cli& cli) {
  std::error_code ec;
  auto src = rc::FileSource::open("/dev/stdin", ec, rc::FileSource::Config{cli.chunk_bytes});
  if (!src) {
    std::cerr << "[cursor] open failed: stdin: " << ec.message() << "\n";
    return kOpen;
  }
  rc::ForwardRowReader rd(std::move(src), cli.separator);

  rd.skip_rows(cli.row.value_or(0), ec);
  std::string row;
  for (std::uint64_t i = 0; !ec && i < cli.count; ++i) {
    row.clear();
    if (rd.read_row(row, ec) == 0) break;
    std::cout.write(row.data(), static_cast<std::streamsize>(row.size()));
  }
  std::cout.flush();
  if (ec) {
    std::cerr << "[cursor] read failed at byte " << rd.position() << ": " << ec.message() << "\n";
    return kIo;
  }
  return kOk;
}

int serve(const Cli& cli) {
#if RC_HAS_SERVER
  rc::RowServer::Config cfg;
  cfg.port = cli.port;
  cfg.data_root = cli.data_root;
  cfg.separator = cli.separator;
  cfg.granularity = cli.granularity;
  cfg.chunk_bytes = cli.chunk_bytes;

  rc::RowServer server(cfg);
  std::cerr << "[serve] " << cfg.data_root << " on port " << cfg.port << "\n";
  if (server.run() != 0) {
    std::cerr << "[serve] failed to start on port " << cfg.port << "\n";
    return kIo;
  }
  return kOk;
#else
  (void)cli;
  std::cerr << "[serve] built without the HTTP server\n";
  return kUsage;
#endif
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.bad) {
    usage(std::cerr);
    return kUsage;
  }
  if (cli.serve) return serve(cli);
  return cli.file == "-" ? print_stdin_rows(cli) : print_rows(cli);
}
