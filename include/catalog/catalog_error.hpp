#ifndef BOOKCAT_CATALOG_ERROR_HPP
#define BOOKCAT_CATALOG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bookcat {
namespace catalog {

// Outcome of a catalog mutation that the user can trigger with bad input
enum class CatalogStatus {
    SUCCESS = 0,
    EMPTY_TITLE,
    INVALID_FIELD,
    NO_CHANGE,
    NOT_CONFIRMED
};

inline const char* catalog_status_to_string(CatalogStatus status) {
    switch (status) {
        case CatalogStatus::SUCCESS: return "Success";
        case CatalogStatus::EMPTY_TITLE: return "Empty title";
        case CatalogStatus::INVALID_FIELD: return "Invalid field";
        case CatalogStatus::NO_CHANGE: return "No change";
        case CatalogStatus::NOT_CONFIRMED: return "Not confirmed";
        default: return "Undefined status";
    }
}

class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& message)
        : std::runtime_error(message) {}
};

class ExportError : public CatalogError {
public:
    explicit ExportError(const std::string& message)
        : CatalogError("Export error: " + message) {}
};

} // namespace catalog
} // namespace bookcat

#endif // BOOKCAT_CATALOG_ERROR_HPP
