// EN: Thread-safe NDJSON logger shared by the ingestion pipeline, detectors and CLI.
// FR: Logger NDJSON thread-safe partagé par le pipeline d'ingestion, les détecteurs et la CLI.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace FIN {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse a level name ("debug", "INFO", "warning"...). Returns nullopt for unknown names.
// FR: Parse un nom de niveau ("debug", "INFO", "warning"...). Retourne nullopt si inconnu.
std::optional<LogLevel> parseLogLevel(const std::string& name);

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    using Metadata = std::unordered_map<std::string, std::string>;

    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        Metadata metadata;
    };

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Redirect output to a file (console output is disabled while a file is open).
    // FR: Redirige la sortie vers un fichier (la console est désactivée tant qu'un fichier est ouvert).
    bool setOutputFile(const std::string& filename);

    // EN: Close the log file and go back to stderr.
    // FR: Ferme le fichier de log et revient à stderr.
    void resetOutput();

    void setCorrelationId(const std::string& correlation_id);
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    // EN: Cheap check used by the LOG_* macros so disabled levels never build their message.
    // FR: Test peu coûteux utilisé par les macros LOG_* pour ne pas construire les messages désactivés.
    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& module, const std::string& message,
             const Metadata& metadata = {});

    void flush();

    // EN: Generate a new correlation ID (UUID-like format), one per CLI invocation.
    // FR: Génère un nouvel ID de corrélation (format UUID), un par invocation CLI.
    std::string generateCorrelationId();

    // EN: Format an entry as one NDJSON line (exposed for tests).
    // FR: Formate une entrée en une ligne NDJSON (exposé pour les tests).
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string currentThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    Metadata global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define FIN_LOG_AT(level, module, message, metadata)                       \
    do {                                                                   \
        FIN::Logger& fin_logger_ = FIN::Logger::getInstance();             \
        if (fin_logger_.isEnabled(level)) {                                \
            fin_logger_.log(level, module, message, metadata);             \
        }                                                                  \
    } while (0)

#define LOG_DEBUG(module, message) FIN_LOG_AT(FIN::LogLevel::DEBUG, module, message, FIN::Logger::Metadata{})
#define LOG_INFO(module, message) FIN_LOG_AT(FIN::LogLevel::INFO, module, message, FIN::Logger::Metadata{})
#define LOG_WARN(module, message) FIN_LOG_AT(FIN::LogLevel::WARN, module, message, FIN::Logger::Metadata{})
#define LOG_ERROR(module, message) FIN_LOG_AT(FIN::LogLevel::ERROR, module, message, FIN::Logger::Metadata{})

#define LOG_DEBUG_META(module, message, metadata) FIN_LOG_AT(FIN::LogLevel::DEBUG, module, message, metadata)
#define LOG_INFO_META(module, message, metadata) FIN_LOG_AT(FIN::LogLevel::INFO, module, message, metadata)
#define LOG_WARN_META(module, message, metadata) FIN_LOG_AT(FIN::LogLevel::WARN, module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) FIN_LOG_AT(FIN::LogLevel::ERROR, module, message, metadata)

} // namespace FIN
