#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "catalog/record.hpp"
#include "catalog/catalog_error.hpp"

namespace bookcat {
namespace catalog {

// Record hit together with its 0-based position in the catalog
struct Match {
  std::size_t index;
  Record record;
};

// Receives (1-based number, record) pairs while listing
using EntryVisitor = std::function<void(std::size_t, const Record&)>;

class Catalog {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Catalog();


  // ---- MUTATIONS ----
  // Appends a record; values are trimmed and the title must not be empty
  CatalogStatus add(const std::string& title, const std::string& author, const std::string& genre);
  // Overwrites one field of the record at index, by user-facing field name
  CatalogStatus edit(std::size_t index, const std::string& field, const std::string& new_value);
  CatalogStatus edit(std::size_t index, Field field, const std::string& new_value);
  // Removes the record at index only when confirmation reads "YES"
  CatalogStatus remove(std::size_t index, const std::string& confirmation);


  // ---- QUERIES ----
  // Visits every record in insertion order, returns false if there is nothing to visit
  bool list_all(const EntryVisitor& visit) const;
  // Case-insensitive substring match against titles only
  std::vector<Match> find_by_title_substring(const std::string& query) const;
  // Case-insensitive substring match against "title author genre"
  std::vector<Record> search_combined(const std::string& query) const;
  // Case-insensitive substring match against genres only
  std::vector<Record> search_by_genre(const std::string& query) const;


  // ---- ACCESSORS ----
  std::size_t size() const;
  bool empty() const;
  const Record& at(std::size_t index) const;
  const std::vector<Record>& records() const;

private:
  // ---- PARAMETERS ----
  std::vector<Record> records_;

  // Throws CatalogError if index is not a valid position
  void verify_index(std::size_t index) const;
};

} // namespace catalog
} // namespace bookcat
