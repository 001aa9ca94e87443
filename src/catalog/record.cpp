#include "catalog/record.hpp"

namespace bookcat {
namespace catalog {

bool operator==(const Record& lhs, const Record& rhs) {
  return lhs.title == rhs.title
    && lhs.author == rhs.author
    && lhs.genre == rhs.genre;
}

bool operator!=(const Record& lhs, const Record& rhs) {
  return !(lhs == rhs);
}


//==============================================
// FIELD NAMES
//==============================================

const char* field_name(Field field) {
  switch (field) {
    case Field::TITLE: return "Book";
    case Field::AUTHOR: return "Author";
    case Field::GENRE: return "Genre";
    default: return "Unknown";
  }
}

std::optional<Field> field_from_name(const std::string& name) {
  for (Field field : ALL_FIELDS) {
    if (name == field_name(field)) {
      return field;
    }
  }
  return std::nullopt;
}


//==============================================
// FIELD ACCESSORS
//==============================================

const std::string& field_value(const Record& record, Field field) {
  switch (field) {
    case Field::AUTHOR: return record.author;
    case Field::GENRE: return record.genre;
    case Field::TITLE:
    default: return record.title;
  }
}

std::string& field_value(Record& record, Field field) {
  switch (field) {
    case Field::AUTHOR: return record.author;
    case Field::GENRE: return record.genre;
    case Field::TITLE:
    default: return record.title;
  }
}

} // namespace catalog
} // namespace bookcat
