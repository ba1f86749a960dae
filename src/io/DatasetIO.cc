#include "neymanplr/io/DatasetIO.hh"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace neymanplr {

namespace {

inline bool is_comment_or_empty(const std::string& s) {
  for (char c : s) { if (!std::isspace(static_cast<unsigned char>(c))) return c == '#'; }
  return true;
}

// "1.0, 2.0" or "1.0 2.0" -> {1, 2}; false if any cell is not a number
bool parse_row(std::string line, std::vector<double>& out) {
  out.clear();
  for (char& c : line) if (c == ',' || c == ';' || c == '\t') c = ' ';
  std::istringstream ss(line);
  std::string cell;
  while (ss >> cell) {
    std::size_t used = 0;
    double v = 0.0;
    try { v = std::stod(cell, &used); }
    catch (const std::invalid_argument&) { return false; }
    catch (const std::out_of_range&) { return false; }
    if (used != cell.size()) return false;
    out.push_back(v);
  }
  return !out.empty();
}

// "0.5, 1.2  # 3" -> features "0.5, 1.2", source 3; a trailing comment that
// is not an integer leaves the source at -1
std::string split_source(const std::string& line, int& source) {
  source = -1;
  const auto hash = line.find('#');
  if (hash == std::string::npos) return line;
  std::istringstream tail(line.substr(hash + 1));
  int s = 0;
  std::string rest;
  if (tail >> s && !(tail >> rest)) source = s;
  return line.substr(0, hash);
}

} // namespace

Dataset LoadDatasetCSV(const std::string& path, int ndim) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open dataset: " + path);

  Dataset data;
  std::string line;
  std::vector<double> row;
  bool first_row = true;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (is_comment_or_empty(line)) continue;
    int source = -1;
    if (!parse_row(split_source(line, source), row)) {
      if (first_row) { first_row = false; continue; }   // header
      throw std::runtime_error(path + ":" + std::to_string(lineno) + ": not a numeric row");
    }
    first_row = false;
    if (ndim <= 0) ndim = static_cast<int>(row.size());
    if (static_cast<int>(row.size()) != ndim) {
      std::ostringstream os;
      os << path << ":" << lineno << ": expected " << ndim << " feature(s), got " << row.size();
      throw std::runtime_error(os.str());
    }
    Event ev;
    ev.x = row;
    ev.source = source;
    data.push_back(std::move(ev));
  }
  return data;
}

void WriteDatasetCSV(const std::string& path, const Dataset& data, bool with_source) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("cannot write dataset: " + path);

  out << "# " << data.size() << " events" << (with_source ? ", trailing comment: source index" : "") << "\n";
  out << std::setprecision(10);
  for (const auto& ev : data) {
    for (std::size_t a = 0; a < ev.x.size(); ++a) {
      if (a) out << ",";
      out << ev.x[a];
    }
    if (with_source) out << "  # " << ev.source;
    out << "\n";
  }
  if (!out) throw std::runtime_error("write failed: " + path);
}

} // namespace neymanplr
