// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#ifndef GAUSS_BRIDGE_SRC_COMMON_LOGGING_H_
#define GAUSS_BRIDGE_SRC_COMMON_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace gauss::logging {
    /// No-op stream destination for log output.
    class null_stream : public std::ostream {
      public:
        /// Constructor. Sets the instance's stream buffer to nullptr.
        null_stream();

        template<typename T>
        auto operator<<(const T& /* unused */) -> null_stream& {
            return *this;
        }
    };

    /// Set of possible log levels. Used to configure \ref log. Each level
    /// implies that the logger should output messages at that level or
    /// greater.
    enum class log_level : uint8_t {
        /// Fine-grained, fully verbose operating information.
        trace,
        /// Diagnostic information.
        debug,
        /// General information about the state of the system.
        info,
        /// Potentially unintended, unexpected, or undesirable behavior
        warn,
        /// Serious, critical errors.
        error,
        /// Only fatal errors.
        fatal
    };

    /// Output destinations shared between a root logger and the tagged
    /// loggers derived from it.
    class sink {
      public:
        /// Constructor.
        /// \param use_stdout indicates if statements go to stdout.
        /// \param logfile stream receiving a copy of every statement.
        explicit sink(bool use_stdout, std::unique_ptr<std::ostream> logfile);

        /// Writes a fully formatted statement to all destinations.
        /// \param statement text to write, including the trailing newline.
        void write(const std::string& statement);

        /// Enables or disables printing to stdout.
        void set_stdout_enabled(bool stdout_enabled);

        /// Replaces the logfile destination.
        void set_logfile(std::unique_ptr<std::ostream> logfile);

      private:
        std::mutex m_stream_mut{};
        bool m_stdout{true};
        std::unique_ptr<std::ostream> m_logfile;
    };

    /// Generalized logging class. Supports logging to stdout or an output file
    /// at a specified log level. Loggers derived with \ref tagged share the
    /// destinations of their parent and prefix each statement with a tag,
    /// so that statements from the two chains of a deployment can be told
    /// apart.
    class log {
        struct derived_tag {};

      public:
        /// \brief Creates a new log instance.
        ///
        /// By default, logs to stdout and a \ref null_stream.
        /// \param level the log level (and above) to print to the logger(s).
        /// \param use_stdout indicates if the logger should print to stdout.
        /// \param logfile a pointer to a logfile stream.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile
                     = std::make_unique<null_stream>());

        /// Constructs a logger derived by \ref tagged. Callable only from
        /// within this class.
        log(derived_tag /* unused */,
            log_level level,
            std::shared_ptr<sink> out,
            std::string tag);

        /// Enables or disables printing the log output to stdout.
        /// \param stdout_enabled true if the log should print to stdout.
        void set_stdout_enabled(bool stdout_enabled);

        /// Changes the logfile output to another destination.
        /// \param logfile the stream to which to write log output.
        void set_logfile(std::unique_ptr<std::ostream> logfile);

        /// Changes the log level threshold.
        /// \param level anything for this log level and more severe will
        ///              be logged to the configured outputs.
        void set_loglevel(log_level level);

        /// Flushes the log buffer.
        static void flush();

        /// Returns a logger that writes to the same destinations at the same
        /// level, prefixing each statement with the given tag.
        /// \param tag text identifying the component, e.g. "chain:137".
        /// \return tagged logger.
        [[nodiscard]] auto tagged(const std::string& tag) const
            -> std::shared_ptr<log>;

        /// Writes the argument list to the trace log level.
        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log_statement(log_level::trace,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the debug log level.
        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log_statement(log_level::debug,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the info log level.
        template<typename... Targs>
        void info(Targs&&... args) {
            write_log_statement(log_level::info, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the warn log level.
        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log_statement(log_level::warn, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the error log level.
        template<typename... Targs>
        void error(Targs&&... args) {
            write_log_statement(log_level::error,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the fatal log level. Calls exit to
        /// terminate the program.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write_log_statement(log_level::fatal,
                                std::forward<Targs>(args)...);
            flush();
            std::exit(EXIT_FAILURE);
        }

        /// Returns the current log level of the logger.
        /// \returns the current log level.
        [[nodiscard]] auto get_log_level() const -> log_level;

      private:
        log_level m_loglevel{};
        std::shared_ptr<sink> m_sink;
        std::string m_tag;

        auto static to_string(log_level level) -> std::string;
        void write_log_prefix(std::stringstream& ss, log_level level) const;
        template<typename... Targs>
        void write_log_statement(log_level level, Targs&&... args) {
            if(m_loglevel <= level) {
                std::stringstream ss;
                write_log_prefix(ss, level);
                ((ss << " " << args), ...);
                ss << "\n";
                m_sink->write(ss.str());
            }
        }
    };

    /// \brief Parses a capitalized string into a log level.
    ///
    /// Possible input values: TRACE, DEBUG, INFO, WARN, ERROR, and FATAL.
    /// \param level string corresponding to a log level.
    /// \return the log level, or std::nullopt if the input does not correspond
    ///         to a known log level.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;
}

#endif // GAUSS_BRIDGE_SRC_COMMON_LOGGING_H_
