#pragma once
#include <string>

#include "neymanplr/core/Dataset.hh"

namespace neymanplr {

/// Read events from a text file: one event per line, features separated by
/// commas or whitespace, '#' comments and one optional header row skipped.
/// An integer trailing comment on an event line ("1.5, 2.0  # 1") is read as
/// the event's source index.
/// Every event must have `ndim` features (ndim <= 0: take it from the first).
Dataset LoadDatasetCSV(const std::string& path, int ndim = 0);

/// Write events as comma-separated features; with `with_source` each line
/// ends in a "# <source index>" comment, so the file still loads as features.
void WriteDatasetCSV(const std::string& path, const Dataset& data, bool with_source = false);

} // namespace neymanplr
