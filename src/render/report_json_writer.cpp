#include "row_cursor/report_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>
#include <utility>

namespace rc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void opt(std::ostringstream& o, const std::optional<std::uint64_t>& v){
  if (v) o << *v; else o << "null";
}

CursorReport make_report(const CachedRowCursor& c, std::string filename, std::uint64_t file_size) {
  CursorReport r;
  r.filename = std::move(filename);
  r.file_size = file_size;
  r.separator = static_cast<unsigned char>(c.separator());
  r.granularity = c.granularity();
  r.byte_position = c.position();
  r.row_position = c.row_position();
  r.total_length = c.total_length();
  r.total_rows = c.total_rows();
  r.cache_samples = c.cache().size();
  const auto& last = *c.cache().rbegin();
  r.last_sample_row = last.first;
  r.last_sample_byte = last.second;
  r.scan = c.stats();
  return r;
}

std::string ReportJsonWriter::to_json(const CursorReport& r) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":"; esc(o, r.filename); o << ",";
  o << "\"file_size\":" << r.file_size << ",";
  o << "\"separator\":" << r.separator << ",";
  o << "\"granularity\":" << r.granularity << ",";
  o << "\"byte_position\":" << r.byte_position << ",";
  o << "\"row_position\":" << r.row_position << ",";
  o << "\"total_length\":"; opt(o, r.total_length); o << ",";
  o << "\"total_rows\":";   opt(o, r.total_rows);   o << ",";

  o << "\"cache\":{"
    << "\"samples\":"     << r.cache_samples    << ","
    << "\"last_row\":"    << r.last_sample_row  << ","
    << "\"last_byte\":"   << r.last_sample_byte
    << "},";

  o << "\"scan\":{"
    << "\"rows_scanned\":"  << r.scan.rows_scanned  << ","
    << "\"bytes_scanned\":" << r.scan.bytes_scanned << ","
    << "\"repositions\":"   << r.scan.repositions
    << "},";

  o << "\"rows_emitted\":" << r.run.rows_emitted << ",";
  o << "\"bytes_emitted\":" << r.run.bytes_emitted << ",";
  o << "\"wall_time_ms\":" << safe_num(r.run.wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(r.run.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<r.run.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, r.run.stages[i].name);
    o << ",\"duration_us\":" << r.run.stages[i].duration_us << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
