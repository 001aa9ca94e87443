#include "catalog/catalog.hpp"
#include "utils/text.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace bookcat {
namespace catalog {

namespace {

const char* CONFIRMATION_TOKEN = "YES";

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Catalog::Catalog() {
  BOOST_LOG_TRIVIAL(debug) << "Catalog: Created empty catalog";
}


//==============================================
// MUTATIONS
//==============================================

CatalogStatus Catalog::add(const std::string& title, const std::string& author, const std::string& genre) {
  Record record{utils::trim(title), utils::trim(author), utils::trim(genre)};

  if (record.title.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Catalog: Rejected record with empty title";
    return CatalogStatus::EMPTY_TITLE;
  }

  records_.push_back(std::move(record));
  BOOST_LOG_TRIVIAL(info) << "Catalog: Added '" << records_.back().title
    << "', catalog size is now " << records_.size();
  return CatalogStatus::SUCCESS;
}

CatalogStatus Catalog::edit(std::size_t index, const std::string& field, const std::string& new_value) {
  auto parsed = field_from_name(field);
  if (!parsed) {
    BOOST_LOG_TRIVIAL(warning) << "Catalog: Unknown field name: " << field;
    return CatalogStatus::INVALID_FIELD;
  }
  return edit(index, *parsed, new_value);
}

CatalogStatus Catalog::edit(std::size_t index, Field field, const std::string& new_value) {
  verify_index(index);

  std::string value = utils::trim(new_value);
  if (value.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Catalog: Empty value for field " << field_name(field)
      << " at index " << index << ", nothing changed";
    return CatalogStatus::NO_CHANGE;
  }

  std::string& target = field_value(records_[index], field);
  BOOST_LOG_TRIVIAL(info) << "Catalog: Field " << field_name(field) << " at index " << index
    << " changed from '" << target << "' to '" << value << "'";
  target = std::move(value);
  return CatalogStatus::SUCCESS;
}

CatalogStatus Catalog::remove(std::size_t index, const std::string& confirmation) {
  verify_index(index);

  if (utils::to_upper(utils::trim(confirmation)) != CONFIRMATION_TOKEN) {
    BOOST_LOG_TRIVIAL(info) << "Catalog: Removal of index " << index << " not confirmed";
    return CatalogStatus::NOT_CONFIRMED;
  }

  BOOST_LOG_TRIVIAL(info) << "Catalog: Removing '" << records_[index].title << "' at index " << index;
  records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(index));
  return CatalogStatus::SUCCESS;
}


//==============================================
// QUERIES
//==============================================

bool Catalog::list_all(const EntryVisitor& visit) const {
  if (records_.empty()) {
    return false;
  }
  for (std::size_t i = 0; i < records_.size(); ++i) {
    visit(i + 1, records_[i]);
  }
  return true;
}

std::vector<Match> Catalog::find_by_title_substring(const std::string& query) const {
  std::vector<Match> matches;
  for (std::size_t i = 0; i < records_.size(); ++i) {
    if (utils::contains_ignore_case(records_[i].title, query)) {
      matches.push_back({i, records_[i]});
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Catalog: Title query '" << query << "' matched " << matches.size() << " record(s)";
  return matches;
}

std::vector<Record> Catalog::search_combined(const std::string& query) const {
  std::vector<Record> results;
  for (const auto& record : records_) {
    std::string combined = record.title + " " + record.author + " " + record.genre;
    if (utils::contains_ignore_case(combined, query)) {
      results.push_back(record);
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Catalog: Combined query '" << query << "' matched " << results.size() << " record(s)";
  return results;
}

std::vector<Record> Catalog::search_by_genre(const std::string& query) const {
  std::vector<Record> results;
  for (const auto& record : records_) {
    if (utils::contains_ignore_case(record.genre, query)) {
      results.push_back(record);
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Catalog: Genre query '" << query << "' matched " << results.size() << " record(s)";
  return results;
}


//==============================================
// ACCESSORS
//==============================================

std::size_t Catalog::size() const {
  return records_.size();
}

bool Catalog::empty() const {
  return records_.empty();
}

const Record& Catalog::at(std::size_t index) const {
  verify_index(index);
  return records_[index];
}

const std::vector<Record>& Catalog::records() const {
  return records_;
}

void Catalog::verify_index(std::size_t index) const {
  if (index >= records_.size()) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: Index " << index << " out of range (size " << records_.size() << ")";
    throw CatalogError("Catalog: Index " + std::to_string(index) + " out of range");
  }
}

} // namespace catalog
} // namespace bookcat
