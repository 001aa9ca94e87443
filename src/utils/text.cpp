#include "utils/text.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/generator.hpp>
#include <boost/log/trivial.hpp>

namespace bookcat {
namespace utils {

//==============================================
// WHITESPACE AND CASE
//==============================================

std::string trim(const std::string& value) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

  auto first = std::find_if_not(value.begin(), value.end(), is_space);
  auto last = std::find_if_not(value.rbegin(), value.rend(), is_space).base();

  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

namespace {

std::string ascii_transform(const std::string& value, bool upper) {
  std::string result(value);
  std::transform(result.begin(), result.end(), result.begin(),
    [upper](unsigned char c) { return static_cast<char>(upper ? std::toupper(c) : std::tolower(c)); });
  return result;
}

} // namespace

const std::locale& text_locale() {
  static const std::locale locale = boost::locale::generator()("en_US.UTF-8");
  return locale;
}

std::string to_lower(const std::string& value) {
  try {
    return boost::locale::to_lower(value, text_locale());
  } catch (const boost::locale::conv::conversion_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Text: Not valid UTF-8, lowering ASCII only: " << e.what();
    return ascii_transform(value, false);
  }
}

std::string to_upper(const std::string& value) {
  try {
    return boost::locale::to_upper(value, text_locale());
  } catch (const boost::locale::conv::conversion_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Text: Not valid UTF-8, raising ASCII only: " << e.what();
    return ascii_transform(value, true);
  }
}

std::string fold_case(const std::string& value) {
  try {
    return boost::locale::fold_case(value, text_locale());
  } catch (const boost::locale::conv::conversion_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Text: Not valid UTF-8, folding ASCII only: " << e.what();
    return ascii_transform(value, false);
  }
}


//==============================================
// MATCHING
//==============================================

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
  return fold_case(haystack).find(fold_case(needle)) != std::string::npos;
}


//==============================================
// PARSING
//==============================================

std::optional<long> parse_integer(const std::string& value) {
  std::string text = trim(value);
  if (text.empty()) {
    return std::nullopt;
  }

  // from_chars does not accept an explicit plus sign
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  if (*begin == '+') {
    ++begin;
    if (begin == end || *begin == '-') {
      return std::nullopt;
    }
  }

  long result = 0;
  auto [ptr, ec] = std::from_chars(begin, end, result);
  if (ptr != end) {
    return std::nullopt;
  }
  if (ec == std::errc::result_out_of_range) {
    return *begin == '-' ? std::numeric_limits<long>::min() : std::numeric_limits<long>::max();
  }
  if (ec != std::errc()) {
    return std::nullopt;
  }
  return result;
}

std::optional<std::size_t> to_selection(long choice, std::size_t count) {
  if (choice < 1 || static_cast<unsigned long>(choice) > count) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(choice - 1);
}

} // namespace utils
} // namespace bookcat
