#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "catalog/catalog.hpp"

namespace bookcat {
namespace catalog {

// JSON mapping of a record: {"Book": ..., "Author": ..., "Genre": ...}
void to_json(nlohmann::json& j, const Record& record);
void from_json(const nlohmann::json& j, Record& record);

class Exporter {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Exporter(const std::filesystem::path& export_dir);


  // ---- EXPORT OPERATIONS ----
  // Writes every record of the catalog to a timestamped JSON file and returns
  // its path. Throws ExportError on any I/O failure; the catalog is read only.
  std::filesystem::path export_catalog(const Catalog& catalog) const;
  // Parses a file written by export_catalog back into records
  static std::vector<Record> read_export(const std::filesystem::path& path);
  // books_export_<YYYYMMDD_HHMMSS>.json for the given local time
  static std::string export_filename(std::time_t when);

  const std::filesystem::path& export_dir() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path export_dir_;

  static constexpr int INDENT = 2;

  void ensure_export_dir() const;
};

} // namespace catalog
} // namespace bookcat
