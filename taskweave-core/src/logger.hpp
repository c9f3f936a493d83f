/**
 * @file logger.hpp
 * @brief Process-wide structured logger used by every engine component
 *
 * Each entry is one line, either a flat JSON object or "[LEVEL] message k=v".
 * Fields bound in the calling thread's PropagationContext (correlation_id,
 * trace_id, conversation_id, ...) are merged into every entry; explicit fields
 * passed to the call take precedence. Values under secret-looking keys
 * (token, secret, password, api_key) are masked before they are written.
 */

#ifndef TASKWEAVE_LOGGER_HPP
#define TASKWEAVE_LOGGER_HPP

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <fstream>

namespace taskweave {

/// Severity of a log entry; entries below LoggerConfig::min_level are dropped
enum class LogLevel {
    DEBUG,   ///< Stage timings, routing decisions, retry scheduling
    INFO,    ///< Work unit lifecycle, breaker transitions, startup/shutdown
    WARN,    ///< Recovered failures (state load, cost write, contract violations)
    ERROR    ///< Failed work units, startup validation errors
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/// Unknown names map to INFO
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

struct LoggerConfig {
    LogLevel min_level;
    bool enable_console;             ///< Writes to stderr
    bool enable_file;                ///< Appends to log_file_path
    std::string log_file_path;
    bool enable_json;                ///< false selects the plain "[LEVEL] message" form
    bool include_context;            ///< Merge ambient PropagationContext fields

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("taskweave.log"),
          enable_json(true),
          include_context(true) {}
};

/**
 * @brief Singleton sink shared by all TaskEngine instances in the process
 *
 * All entries emitted from a thread carry that thread's ambient correlation
 * fields, so a request can be followed across worker threads and queued tasks
 * as long as the context was propagated.
 *
 * Usage Example:
 *   @code
 *   LoggerConfig quiet;
 *   quiet.enable_console = false;
 *   quiet.min_level = LogLevel::WARN;
 *   Logger::get_instance().configure(quiet);
 *
 *   Logger::get_instance()
 *       .log_info("coordinator", "Work unit completed", {{"work_unit_id", id}});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /// Replaces the active settings; reopens the log file when file output is on
    void configure(const LoggerConfig& config);

    /**
     * @brief Emit an entry with explicit level and fields
     *
     * Fields override ambient context keys with the same name.
     */
    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& fields = {});

    void log_debug(const std::string& component, const std::string& message,
                   const std::map<std::string, std::string>& fields = {});
    void log_info(const std::string& component, const std::string& message,
                  const std::map<std::string, std::string>& fields = {});
    void log_warning(const std::string& component, const std::string& message,
                     const std::map<std::string, std::string>& fields = {});
    void log_error(const std::string& component, const std::string& message,
                   const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Log a state transition of a component (lifecycle, breaker, work unit)
     *
     * @param component Component name
     * @param subject Identifier of the thing that changed state
     * @param old_state Previous state name
     * @param new_state New state name
     */
    void log_state_transition(
        const std::string& component,
        const std::string& subject,
        const std::string& old_state,
        const std::string& new_state
    );

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    /**
     * @brief Format fields as a flat JSON object (all values as strings)
     */
    std::string format_json(const std::map<std::string, std::string>& fields) const;

    /**
     * @brief Mask a secret value, keeping the first and last 4 characters
     */
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    std::string get_timestamp() const;
    static bool is_secret_key(const std::string& key);
    void write_output(const std::string& output);
};

} // namespace taskweave

#endif // TASKWEAVE_LOGGER_HPP
