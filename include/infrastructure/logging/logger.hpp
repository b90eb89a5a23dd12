#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

namespace SSD {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    // EN: Set the minimum log level.
    // FR: Définit le niveau de log minimum.
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    bool setOutputFile(const std::string& filename);

    // EN: Redirect console output (defaults to std::cerr so stdout stays free for progress display).
    //     The stream is not owned: it must outlive every log call, or be reset with nullptr before it dies.
    // FR: Redirige la sortie console (std::cerr par défaut pour laisser stdout à l'affichage de progression).
    //     Le flux n'est pas possédé : il doit survivre à chaque log, ou être remis à nullptr avant sa fin.
    void setConsoleStream(std::ostream* stream);
    void setConsoleOutput(bool enabled);

    // EN: Set correlation ID for all subsequent log entries.
    // FR: Définit l'ID de corrélation pour toutes les entrées suivantes.
    void setCorrelationId(const std::string& correlation_id);

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    // EN: Flush all pending log entries to output.
    // FR: Vide toutes les entrées en attente vers la sortie.
    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format log entry as a single NDJSON line (exposed for tests).
    // FR: Formate l'entrée de log en une ligne NDJSON (exposé pour les tests).
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);

    // EN: Parse "DEBUG", "info", "Warn"... Returns false on unknown names.
    // FR: Parse "DEBUG", "info", "Warn"... Retourne false pour les noms inconnus.
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    std::ostream* console_stream_ = nullptr;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define SSD_LOG_DEBUG(module, message) SSD::Logger::getInstance().debug(module, message)
#define SSD_LOG_INFO(module, message) SSD::Logger::getInstance().info(module, message)
#define SSD_LOG_WARN(module, message) SSD::Logger::getInstance().warn(module, message)
#define SSD_LOG_ERROR(module, message) SSD::Logger::getInstance().error(module, message)

#define SSD_LOG_DEBUG_META(module, message, metadata) SSD::Logger::getInstance().debug(module, message, metadata)
#define SSD_LOG_INFO_META(module, message, metadata) SSD::Logger::getInstance().info(module, message, metadata)
#define SSD_LOG_WARN_META(module, message, metadata) SSD::Logger::getInstance().warn(module, message, metadata)
#define SSD_LOG_ERROR_META(module, message, metadata) SSD::Logger::getInstance().error(module, message, metadata)

} // namespace SSD
