#include "neymanplr/templates/TemplateStore.hh"

#include <TFile.h>
#include <TH1.h>
#include <TH2.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace neymanplr {

namespace {

inline bool is_comment_or_empty(const std::string& s) {
  for (char c : s) { if (c == '#') return true; if (!std::isspace(static_cast<unsigned char>(c))) return false; }
  return true;
}

inline void trim(std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
  s = s.substr(i, j - i);
}

inline bool split_line(const std::string& line, double& a, double& b) {
  // try comma first
  {
    std::stringstream ss(line);
    std::string s0, s1;
    if (std::getline(ss, s0, ',') && std::getline(ss, s1, ',')) {
      trim(s0); trim(s1);
      try { a = std::stod(s0); b = std::stod(s1); return true; }
      catch (const std::invalid_argument&) {}
      catch (const std::out_of_range&) {}
    }
  }
  // fallback: whitespace
  {
    std::stringstream ss(line);
    if (ss >> a >> b) return true;
  }
  return false;
}

// "# norm = 12.5" -> 12.5; a norm line whose value is not a double throws
inline bool parse_norm_comment(const std::string& line, const std::string& name, double& norm) {
  const auto pos = line.find("norm");
  if (line.find('#') == std::string::npos || pos == std::string::npos) return false;
  const auto eq = line.find('=', pos);
  if (eq == std::string::npos) return false;
  std::string v = line.substr(eq + 1);
  trim(v);
  try { norm = std::stod(v); return true; }
  catch (const std::invalid_argument&) {}
  catch (const std::out_of_range&) {}
  throw std::runtime_error("template '" + name + "': bad norm value '" + v + "'");
}

std::vector<double> axis_edges(const TAxis& ax) {
  const int n = ax.GetNbins();
  std::vector<double> e(static_cast<size_t>(n) + 1);
  for (int i = 1; i <= n + 1; ++i) e[static_cast<size_t>(i - 1)] = ax.GetBinLowEdge(i);
  return e;
}

} // namespace

TemplateStore::TemplateStore(std::string base_dir, std::string root_file)
: base_dir_(std::move(base_dir)), root_file_(std::move(root_file)) {}

TemplatePtr TemplateStore::Get(const std::string& name) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = cache_.find(name);
    if (it != cache_.end()) return it->second;
  }

  // load outside the lock
  TemplatePtr t = Load_(name);

  std::lock_guard<std::mutex> lk(mtx_);
  auto it = cache_.find(name);
  if (it != cache_.end()) return it->second;   // someone else loaded it
  cache_.emplace(name, t);
  return t;
}

bool TemplateStore::Has(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return cache_.count(name) > 0;
}

void TemplateStore::Put(TemplatePtr tmpl) {
  if (!tmpl) throw std::invalid_argument("TemplateStore::Put: null template");
  std::lock_guard<std::mutex> lk(mtx_);
  cache_[tmpl->name()] = std::move(tmpl);
}

std::vector<std::string> TemplateStore::Names() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<std::string> out;
  for (const auto& kv : cache_) out.push_back(kv.first);
  return out;
}

TemplatePtr TemplateStore::Load_(const std::string& name) const {
  if (!root_file_.empty()) {
    const auto path = (fs::path(base_dir_) / root_file_).string();
    return LoadFromRootFile_(name, path);
  }
  const auto csv = (fs::path(base_dir_) / (name + ".csv")).string();
  return LoadCSV(name, csv);
}

TemplatePtr TemplateStore::LoadFromRootFile_(const std::string& name,
                                             const std::string& path) const {
  std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "READ"));
  if (!f || f->IsZombie())
    throw std::runtime_error("template '" + name + "': cannot open " + path);

  auto* h = dynamic_cast<TH1*>(f->Get(name.c_str()));
  if (!h)
    throw std::runtime_error("template '" + name + "': no TH1/TH2 with that key in " + path);

  auto t = FromHistogram(name, *h);
  f->Close();
  return t;
}

TemplatePtr TemplateStore::FromHistogram(const std::string& name, const TH1& h) {
  if (h.GetDimension() > 2)
    throw std::runtime_error("template '" + name + "': only 1D and 2D histograms are supported");

  std::vector<std::vector<double>> edges;
  std::vector<double> w;

  if (h.GetDimension() == 1) {
    edges.push_back(axis_edges(*h.GetXaxis()));
    const int nx = h.GetNbinsX();
    w.reserve(static_cast<size_t>(nx));
    for (int ix = 1; ix <= nx; ++ix) w.push_back(h.GetBinContent(ix));
  } else {
    edges.push_back(axis_edges(*h.GetXaxis()));
    edges.push_back(axis_edges(*h.GetYaxis()));
    const int nx = h.GetNbinsX();
    const int ny = h.GetNbinsY();
    w.reserve(static_cast<size_t>(nx) * static_cast<size_t>(ny));
    for (int iy = 1; iy <= ny; ++iy)
      for (int ix = 1; ix <= nx; ++ix)
        w.push_back(h.GetBinContent(ix, iy));
  }

  try {
    return std::make_shared<const Template>(name, std::move(edges), std::move(w));
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(e.what());
  }
}

TemplatePtr TemplateStore::LoadCSV(const std::string& name, const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("template '" + name + "': cannot open " + path);

  std::vector<double> x, dens;
  double norm = 1.0;
  std::string line;
  bool saw_header = false;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    if (is_comment_or_empty(line)) { parse_norm_comment(line, name, norm); continue; }
    double a = 0, b = 0;
    if (!split_line(line, a, b)) {
      if (!saw_header) { saw_header = true; continue; }   // skip header row
      throw std::runtime_error("template '" + name + "': malformed line in " + path + ": " + line);
    }
    saw_header = true;
    x.push_back(a);
    dens.push_back(b);
  }
  if (x.size() < 2)
    throw std::runtime_error("template '" + name + "': need at least two points in " + path);

  // bin centers -> edges at the midpoints, outer edges mirrored
  std::vector<double> edges(x.size() + 1);
  for (size_t i = 1; i < x.size(); ++i) edges[i] = 0.5 * (x[i-1] + x[i]);
  edges.front() = x.front() - (edges[1] - x.front());
  edges.back()  = x.back()  + (x.back() - edges[x.size() - 1]);

  std::vector<double> w(x.size());
  for (size_t i = 0; i < x.size(); ++i) w[i] = dens[i] * (edges[i+1] - edges[i]);

  try {
    return std::make_shared<const Template>(name, std::vector<std::vector<double>>{edges},
                                            std::move(w), norm);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string(e.what()) + " (" + path + ")");
  }
}

} // namespace neymanplr
