#ifndef BOOKCAT_LOGGER_HPP
#define BOOKCAT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <optional>
#include <string>

namespace bookcat::logging {

using severity_level = boost::log::trivial::severity_level;

// Routes BOOST_LOG_TRIVIAL output into log_file (truncated on start) so that
// the interactive console only carries the menu.
void init_logging(const std::string& log_file = "bookcat.log",
                  severity_level min_level = boost::log::trivial::info);

// Drops every record below level
void set_log_level(severity_level level);

void enable_logging();
void disable_logging();

// Accepts trace, debug, info, warning, error, fatal
std::optional<severity_level> parse_log_level(const std::string& name);

} // namespace bookcat::logging

#endif // BOOKCAT_LOGGER_HPP
