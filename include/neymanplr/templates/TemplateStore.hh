#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "neymanplr/templates/Template.hh"

class TH1;

namespace neymanplr {

using TemplatePtr = std::shared_ptr<const Template>;

/**
 * Loads named density templates from a base directory and caches them.
 *
 * Lookup order for Get(name):
 *   1. templates registered with Put(),
 *   2. key `name` (TH1 or TH2) in the ROOT file `<base_dir>/<root_file>`,
 *      when a ROOT file is configured,
 *   3. `<base_dir>/<name>.csv` (1D: columns x, density; optional
 *      "# norm = <value>" comment line).
 *
 * Safe to share between threads; loaded templates are immutable.
 */
class TemplateStore {
public:
  explicit TemplateStore(std::string base_dir, std::string root_file = {});

  /// Throws std::runtime_error naming the template if it cannot be loaded.
  TemplatePtr Get(const std::string& name);

  bool Has(const std::string& name) const;
  void Put(TemplatePtr tmpl);
  std::vector<std::string> Names() const;

  const std::string& base_dir() const noexcept { return base_dir_; }

  /// Convert a ROOT histogram (TH1 or TH2); norm = integral of bin contents.
  static TemplatePtr FromHistogram(const std::string& name, const TH1& h);

  /// Parse a 1D CSV template.
  static TemplatePtr LoadCSV(const std::string& name, const std::string& path);

private:
  TemplatePtr Load_(const std::string& name) const;
  TemplatePtr LoadFromRootFile_(const std::string& name, const std::string& path) const;

  std::string base_dir_;
  std::string root_file_;

  mutable std::mutex                 mtx_;
  std::map<std::string, TemplatePtr> cache_;
};

} // namespace neymanplr
