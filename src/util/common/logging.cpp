// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace gauss::logging {
    null_stream::null_stream() : std::ostream(nullptr) {}

    sink::sink(bool use_stdout, std::unique_ptr<std::ostream> logfile)
        : m_stdout(use_stdout),
          m_logfile(std::move(logfile)) {}

    void sink::write(const std::string& statement) {
        const std::lock_guard<std::mutex> lock(m_stream_mut);
        if(m_stdout) {
            std::cout << statement;
        }
        *m_logfile << statement;
    }

    void sink::set_stdout_enabled(bool stdout_enabled) {
        const std::lock_guard<std::mutex> lock(m_stream_mut);
        m_stdout = stdout_enabled;
    }

    void sink::set_logfile(std::unique_ptr<std::ostream> logfile) {
        const std::lock_guard<std::mutex> lock(m_stream_mut);
        m_logfile = std::move(logfile);
    }

    log::log(log_level level,
             bool use_stdout,
             std::unique_ptr<std::ostream> logfile)
        : m_loglevel(level),
          m_sink(std::make_shared<sink>(use_stdout, std::move(logfile))) {}

    log::log(derived_tag /* unused */,
             log_level level,
             std::shared_ptr<sink> out,
             std::string tag)
        : m_loglevel(level),
          m_sink(std::move(out)),
          m_tag(std::move(tag)) {}

    void log::set_stdout_enabled(bool stdout_enabled) {
        m_sink->set_stdout_enabled(stdout_enabled);
    }

    void log::set_logfile(std::unique_ptr<std::ostream> logfile) {
        m_sink->set_logfile(std::move(logfile));
    }

    void log::set_loglevel(log_level level) {
        m_loglevel = level;
    }

    void log::flush() {
        std::cout << std::flush;
    }

    auto log::tagged(const std::string& tag) const -> std::shared_ptr<log> {
        auto full_tag = m_tag.empty() ? tag : m_tag + "/" + tag;
        return std::make_shared<log>(derived_tag{},
                                     m_loglevel,
                                     m_sink,
                                     std::move(full_tag));
    }

    auto log::get_log_level() const -> log_level {
        return m_loglevel;
    }

    auto log::to_string(log_level level) -> std::string {
        switch(level) {
            case log_level::trace:
                return "[TRACE]";
            case log_level::debug:
                return "[DEBUG]";
            case log_level::info:
                return "[INFO ]";
            case log_level::warn:
                return "[WARN ]";
            case log_level::error:
                return "[ERROR]";
            case log_level::fatal:
                return "[FATAL]";
        }
        return "[?????]";
    }

    void log::write_log_prefix(std::stringstream& ss, log_level level) const {
        const auto now = std::chrono::system_clock::now();
        const auto now_t = std::chrono::system_clock::to_time_t(now);
        constexpr auto ms_per_s = 1000;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                      % ms_per_s;
        auto tm_buf = std::tm();
        gmtime_r(&now_t, &tm_buf);
        ss << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "."
           << std::setfill('0') << std::setw(3) << ms.count() << "] "
           << to_string(level);
        if(!m_tag.empty()) {
            ss << " [" << m_tag << "]";
        }
    }

    auto parse_loglevel(const std::string& level) -> std::optional<log_level> {
        if(level == "TRACE") {
            return log_level::trace;
        }
        if(level == "DEBUG") {
            return log_level::debug;
        }
        if(level == "INFO") {
            return log_level::info;
        }
        if(level == "WARN") {
            return log_level::warn;
        }
        if(level == "ERROR") {
            return log_level::error;
        }
        if(level == "FATAL") {
            return log_level::fatal;
        }
        return std::nullopt;
    }
}
