/**
 * @file logger.cpp
 * @brief Line formatting, context merging and masking for Logger
 */

#include "logger.hpp"
#include "context_propagator.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace taskweave {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_() {}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

namespace {

std::map<std::string, std::string> with_component(const std::map<std::string, std::string>& fields,
                                                  const std::string& component) {
    auto tagged = fields;
    tagged["component"] = component;
    return tagged;
}

} // anonymous namespace

void Logger::log_debug(const std::string& component, const std::string& message,
                       const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, with_component(fields, component));
}

void Logger::log_info(const std::string& component, const std::string& message,
                      const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, with_component(fields, component));
}

void Logger::log_warning(const std::string& component, const std::string& message,
                         const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARN, message, with_component(fields, component));
}

void Logger::log_error(const std::string& component, const std::string& message,
                       const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERROR, message, with_component(fields, component));
}

void Logger::log_state_transition(
    const std::string& component,
    const std::string& subject,
    const std::string& old_state,
    const std::string& new_state
) {
    log(LogLevel::DEBUG, "State transition", {
        {"event", "state_transition"},
        {"component", component},
        {"subject", subject},
        {"old_state", old_state},
        {"new_state", new_state}
    });
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    LoggerConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
    }
    if (level < config.min_level) {
        return;
    }

    std::map<std::string, std::string> entry;
    if (config.include_context) {
        const PropagationToken& ambient = ContextPropagator::current();
        if (!ambient.correlation_id.empty()) {
            entry["correlation_id"] = ambient.correlation_id;
        }
        if (!ambient.trace_id.empty()) {
            entry["trace_id"] = ambient.trace_id;
        }
        for (const auto& [key, value] : ambient.fields) {
            entry[key] = value;
        }
    }
    for (const auto& [key, value] : fields) {
        entry[key] = value;
    }
    for (auto& [key, value] : entry) {
        if (is_secret_key(key)) {
            value = mask_token(value);
        }
    }

    std::string output;

    if (config.enable_json) {
        entry["timestamp"] = get_timestamp();
        entry["level"] = level_to_string(level);
        entry["message"] = message;
        output = format_json(entry);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!entry.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : entry) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

std::string Logger::mask_token(const std::string& token) {
    if (token.size() <= 8) {
        return "***";
    }
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

bool Logger::is_secret_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("token") != std::string::npos ||
           lower.find("secret") != std::string::npos ||
           lower.find("password") != std::string::npos ||
           lower.find("api_key") != std::string::npos;
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    nlohmann::json line(fields);
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace taskweave
