#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace bookcat::logging {

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
        backend->auto_flush(true);

        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);

        namespace expr = boost::log::expressions;
        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << boost::log::trivial::severity << "] "
                << expr::smessage
        );

        boost::log::core::get()->add_sink(sink);
        boost::log::add_common_attributes();

        set_log_level(min_level);
        enable_logging();

        BOOST_LOG_TRIVIAL(info) << "Logging system initialized with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

std::optional<severity_level> parse_log_level(const std::string& name) {
    severity_level level = boost::log::trivial::info;
    if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
        return std::nullopt;
    }
    return level;
}

} // namespace bookcat::logging
