#include "catalog/exporter.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace bookcat {
namespace catalog {

//==============================================
// JSON MAPPING
//==============================================

void to_json(nlohmann::json& j, const Record& record) {
  j = nlohmann::json::object();
  for (Field field : ALL_FIELDS) {
    j[field_name(field)] = field_value(record, field);
  }
}

void from_json(const nlohmann::json& j, Record& record) {
  for (Field field : ALL_FIELDS) {
    j.at(field_name(field)).get_to(field_value(record, field));
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Exporter::Exporter(const std::filesystem::path& export_dir) : export_dir_(export_dir) {
  BOOST_LOG_TRIVIAL(debug) << "Exporter: Export directory set to: " << export_dir_.string();
}


//==============================================
// EXPORT OPERATIONS
//==============================================

std::filesystem::path Exporter::export_catalog(const Catalog& catalog) const {
  ensure_export_dir();

  std::filesystem::path file_path = export_dir_ / export_filename(std::time(nullptr));
  BOOST_LOG_TRIVIAL(info) << "Exporter: Exporting " << catalog.size() << " record(s) to " << file_path.string();

  // Serialize first so a record that cannot be encoded leaves no file behind
  std::string content;
  try {
    nlohmann::json document = catalog.records();
    content = document.dump(INDENT);
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Exporter: Cannot encode catalog: " << e.what();
    throw ExportError(std::string("cannot encode catalog as JSON: ") + e.what());
  }

  std::ofstream file(file_path, std::ios::out | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Exporter: Failed to open " << file_path.string();
    throw ExportError("cannot open " + file_path.string() + " for writing");
  }

  file << content << '\n';
  file.close();
  if (file.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Exporter: Failed to write " << file_path.string();
    throw ExportError("failed to write " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Exporter: Export complete: " << file_path.string();
  return file_path;
}

std::vector<Record> Exporter::read_export(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "Exporter: Reading export file " << path.string();

  std::ifstream file(path);
  if (!file) {
    throw ExportError("cannot open " + path.string() + " for reading");
  }

  try {
    nlohmann::json document = nlohmann::json::parse(file);
    if (!document.is_array()) {
      throw ExportError(path.string() + " does not contain a list of books");
    }
    return document.get<std::vector<Record>>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Exporter: Malformed export file " << path.string() << ": " << e.what();
    throw ExportError("malformed export file " + path.string() + ": " + e.what());
  }
}

std::string Exporter::export_filename(std::time_t when) {
  std::tm local_time{};
  localtime_r(&when, &local_time);

  std::ostringstream name;
  name << "books_export_" << std::put_time(&local_time, "%Y%m%d_%H%M%S") << ".json";
  return name.str();
}

const std::filesystem::path& Exporter::export_dir() const {
  return export_dir_;
}

void Exporter::ensure_export_dir() const {
  if (export_dir_.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(export_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Exporter: Cannot create " << export_dir_.string() << ": " << ec.message();
    throw ExportError("cannot create directory " + export_dir_.string() + ": " + ec.message());
  }
}

} // namespace catalog
} // namespace bookcat
