// EN: Implementation of the Logger class. NDJSON lines are built with nlohmann::json so that
//     narratives and file names coming from bank exports are escaped correctly.
// FR: Implémentation de la classe Logger. Les lignes NDJSON sont construites avec nlohmann::json
//     pour que les libellés et noms de fichiers issus des relevés soient correctement échappés.

#include "infrastructure/logging/logger.hpp"

#include "model/calendar_date.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace FIN {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// EN: Destructor ensures all logs are flushed.
// FR: Le destructeur assure que tous les logs sont vidés.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
    }
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!log_file_->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        log_file_.reset();
        console_output_ = true;
        return false;
    }
    console_output_ = false;
    return true;
}

void Logger::resetOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
        log_file_->close();
        log_file_.reset();
    }
    console_output_ = true;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.clear();
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= current_level_;
}

// EN: The entry is formatted outside the lock; only the sink write is serialized.
// FR: L'entrée est formatée hors du verrou ; seule l'écriture est sérialisée.
void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const Metadata& metadata) {
    LogEntry entry{std::chrono::system_clock::now(), level, message, {}, module, currentThreadId(), metadata};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        for (const auto& [key, value] : global_metadata_) {
            entry.metadata.emplace(key, value);
        }
    }

    const std::string line = formatAsNDJSON(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        *log_file_ << line << '\n';
    } else if (console_output_) {
        std::cerr << line << '\n';
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    }
    if (console_output_) {
        std::cerr.flush();
    }
}

// EN: 128 random bits printed as 8-4-4-4-12 hex groups.
// FR: 128 bits aléatoires affichés en groupes hexa 8-4-4-4-12.
std::string Logger::generateCorrelationId() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    const uint64_t high = engine();
    const uint64_t low = engine();

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32), static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF), static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buffer;
}

std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::json line;
    line["timestamp"] = formatTimestamp(entry.timestamp);
    line["level"] = levelToString(entry.level);
    line["message"] = entry.message;
    line["module"] = entry.module;
    line["thread_id"] = entry.thread_id;
    if (!entry.correlation_id.empty()) {
        line["correlation_id"] = entry.correlation_id;
    }
    for (const auto& [key, value] : entry.metadata) {
        // EN: Reserved keys are never overwritten by metadata.
        // FR: Les clés réservées ne sont jamais écrasées par les métadonnées.
        if (!line.contains(key)) {
            line[key] = value;
        }
    }
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

std::string Logger::currentThreadId() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

} // namespace FIN
