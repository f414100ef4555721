// EN: Thread-safe NDJSON logger used by every consolidator module.
// FR: Logger NDJSON thread-safe utilisé par tous les modules du consolidateur.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace SHC {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse a level name ("debug", "INFO", ...). Returns nullopt for unknown names.
// FR: Parse un nom de niveau ("debug", "INFO", ...). Retourne nullopt si inconnu.
std::optional<LogLevel> parseLogLevel(const std::string& name);

// EN: Singleton logger writing one JSON object per line, with a per-cycle correlation ID.
// FR: Logger singleton écrivant un objet JSON par ligne, avec un ID de corrélation par cycle.
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

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Append log lines to a file instead of stdout. Returns false if the file cannot be opened.
    // FR: Ajoute les lignes de log à un fichier au lieu de stdout. Retourne false si ouverture impossible.
    bool setOutputFile(const std::string& filename);

    // EN: Return to console output and close any open log file.
    // FR: Revient à la sortie console et ferme le fichier de log éventuel.
    void resetOutput();

    void setCorrelationId(const std::string& correlation_id);

    void log(LogLevel level, const std::string& module, const std::string& message,
             const Metadata& metadata = {});

    void debug(const std::string& module, const std::string& message, const Metadata& metadata = {});
    void info(const std::string& module, const std::string& message, const Metadata& metadata = {});
    void warn(const std::string& module, const std::string& message, const Metadata& metadata = {});
    void error(const std::string& module, const std::string& message, const Metadata& metadata = {});

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Serialize an entry as a single NDJSON line (no trailing newline).
    // FR: Sérialise une entrée en une ligne NDJSON (sans saut de ligne final).
    static std::string formatAsNDJSON(const LogEntry& entry);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);

    static std::string levelToString(LogLevel level);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string currentThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(module, message) SHC::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) SHC::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) SHC::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) SHC::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) SHC::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) SHC::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) SHC::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) SHC::Logger::getInstance().error(module, message, metadata)

} // namespace SHC
