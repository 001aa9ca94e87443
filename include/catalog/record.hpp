#pragma once

#include <array>
#include <optional>
#include <string>

namespace bookcat {
namespace catalog {

// One catalog entry. Position in the catalog is its only identity.
struct Record {
  std::string title;
  std::string author;
  std::string genre;
};

bool operator==(const Record& lhs, const Record& rhs);
bool operator!=(const Record& lhs, const Record& rhs);

// Closed set of editable fields
enum class Field {
  TITLE,
  AUTHOR,
  GENRE
};

// Display order used by edit prompts and the export file
constexpr std::array<Field, 3> ALL_FIELDS = {Field::TITLE, Field::AUTHOR, Field::GENRE};


// ---- FIELD NAMES ----
// User-facing name of a field ("Book", "Author", "Genre")
const char* field_name(Field field);
// Exact, case-sensitive lookup of a user-facing field name
std::optional<Field> field_from_name(const std::string& name);


// ---- FIELD ACCESSORS ----
const std::string& field_value(const Record& record, Field field);
std::string& field_value(Record& record, Field field);

} // namespace catalog
} // namespace bookcat
