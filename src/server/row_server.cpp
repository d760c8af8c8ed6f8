#include "row_cursor/row_server.hpp"
#include "row_cursor/cursor_registry.hpp"
#include "row_cursor/path_utils.hpp"
#include "row_cursor/report_json.hpp"
#include <httplib.h>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rc {

static std::optional<std::uint64_t> param_u64(const httplib::Request& req, const char* key) {
  if (!req.has_param(key)) return std::nullopt;
  const std::string v = req.get_param_value(key);
  std::uint64_t out = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  if (ec != std::errc() || ptr != v.data() + v.size() || v.empty()) return std::nullopt;
  return out;
}

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;";  break;
      case '<': out += "&lt;";   break;
      case '>': out += "&gt;";   break;
      case '"': out += "&quot;"; break;
      default:  out += c;        break;
    }
  }
  return out;
}

static void fail(httplib::Response& res, int status, const std::string& msg) {
  res.status = status;
  res.set_content(msg + "\n", "text/plain; charset=utf-8");
}

struct RowServer::Impl {
  Config cfg;
  CursorRegistry registry;
  httplib::Server svr;
  int bound_port{-1};

  explicit Impl(Config c)
    : cfg(std::move(c)),
      registry(CachedRowCursor::Config{cfg.separator, cfg.granularity},
               FileSource::Config{cfg.chunk_bytes}) {}

  std::string index_html() const {
    auto items = list_regular_files(cfg.data_root);
    const std::string title = html_escape(cfg.index_title);
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += title + "</title></head><body><h1>" + title + "</h1><ul>";
    for (auto& raw : items) {
      const std::string s = html_escape(raw);
      html += "<li><a href=\"/rows/" + s + "\">" + s + "</a> (<a href=\"/stats/" + s + "\">stats</a>)</li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Resolves <file> under data_root and hands back its cursor entry, or fills `res`.
  std::shared_ptr<CursorRegistry::Entry> entry_for(const std::string& rel, httplib::Response& res) {
    if (rel.find("..") != std::string::npos) { fail(res, 400, "bad path"); return nullptr; }
    auto target = resolve_under(cfg.data_root, rel);
    if (!target) { fail(res, 403, "outside data root"); return nullptr; }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*target, ec)) { fail(res, 404, "no such file"); return nullptr; }

    auto entry = registry.acquire(target->string(), ec);
    if (!entry) {
      fail(res, ec == std::errc::no_such_file_or_directory ? 404 : 500, ec.message());
      return nullptr;
    }
    return entry;
  }

  void serve_rows(const httplib::Request& req, httplib::Response& res) {
    const bool by_row = req.has_param("row");
    const bool by_byte = req.has_param("byte");
    if (by_row && by_byte) { fail(res, 400, "use either row or byte"); return; }

    std::uint64_t start = 0;
    if (by_row || by_byte) {
      auto v = param_u64(req, by_row ? "row" : "byte");
      if (!v) { fail(res, 400, "malformed position"); return; }
      start = *v;
    }
    std::size_t count = cfg.default_rows;
    if (req.has_param("count")) {
      auto v = param_u64(req, "count");
      if (!v) { fail(res, 400, "malformed count"); return; }
      count = static_cast<std::size_t>(std::min<std::uint64_t>(*v, cfg.max_rows_per_request));
    }

    auto entry = entry_for(req.matches[1].str(), res);
    if (!entry) return;

    std::lock_guard<std::mutex> lk(entry->mu);
    CachedRowCursor& cur = entry->cursor;
    std::error_code ec;
    if (by_byte) cur.seek(SeekFrom::start(start), ec);
    else         cur.seek_row(SeekFrom::start(start), ec);
    if (ec) { fail(res, 500, ec.message()); return; }

    const std::uint64_t row_start = cur.row_position();
    const std::uint64_t byte_start = cur.position();

    std::string body;
    for (std::size_t i = 0; i < count; ++i) {
      if (cur.read_row(body, ec) == 0 || ec) break;
    }
    if (ec) { fail(res, 500, ec.message()); return; }

    res.set_header("X-Row-Start", std::to_string(row_start));
    res.set_header("X-Row-End", std::to_string(cur.row_position()));
    res.set_header("X-Byte-Start", std::to_string(byte_start));
    res.set_header("X-Byte-End", std::to_string(cur.position()));
    res.set_content(body, "text/plain; charset=utf-8");
  }

  void serve_stats(const httplib::Request& req, httplib::Response& res) {
    auto entry = entry_for(req.matches[1].str(), res);
    if (!entry) return;

    std::lock_guard<std::mutex> lk(entry->mu);
    std::error_code ec;
    entry->cursor.scan_to_end(ec);
    if (ec) { fail(res, 500, ec.message()); return; }

    CursorReport r = make_report(entry->cursor, req.matches[1].str(), entry->file_size);
    res.set_content(ReportJsonWriter::to_json(r), "application/json; charset=utf-8");
  }

  void routes() {
    // Index
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get(R"(/rows/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_rows(req, res);
    });

    svr.Get(R"(/stats/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_stats(req, res);
    });

    if (cfg.log_requests) {
      svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[serve] " << req.method << " " << req.path << " -> " << res.status << "\n";
      });
    }
  }
};

RowServer::RowServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
RowServer::~RowServer() { delete p_; }

bool RowServer::start() {
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
    return p_->bound_port > 0;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->bound_port = p_->cfg.port;
  return true;
}

int RowServer::run() {
  if (!start()) return -1;
  return listen_after_start() ? 0 : -1;
}

bool RowServer::listen_after_start() { return p_->svr.listen_after_bind(); }
void RowServer::stop() { p_->svr.stop(); }
int RowServer::port() const noexcept { return p_->bound_port; }

}
