#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QMap>
#include <QThread>
#include <QVariant>
#include <QList>

// Define the logger_global macro for export/import
#if defined(_MSC_VER) || defined(WIN64) || defined(_WIN64) || defined(__WIN64__) || defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define DECL_EXPORT __declspec(dllexport)
#  define DECL_IMPORT __declspec(dllimport)
#else
#  define DECL_EXPORT     __attribute__((visibility("default")))
#  define DECL_IMPORT     __attribute__((visibility("default")))
#endif

#if defined(LOGGER_LIBRARY)
#  define LOGGER_EXPORT DECL_EXPORT
#else
#  define LOGGER_EXPORT DECL_IMPORT
#endif

/**
 * @brief A single log record as shown in the log panel
 */
struct LOGGER_EXPORT LogEntry {
    QString timestamp;  ///< Local time, hh:mm:ss.zzz
    QString level;      ///< DEBUG, INFO, WARNING, ERROR or FATAL
    QString message;
    QString target;     ///< Cleaned up source (Class::method:line)
};

/**
 * @brief Singleton logger class that provides thread-safe logging functionality
 *
 * This class implements a thread-safe logging system with support for different log levels,
 * console output, and file output. Every record is also published through entryLogged()
 * and kept in a bounded buffer so a UI can show recent activity.
 */
class LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Log levels supported by the logger
    */
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< General informational messages
        Warning,  ///< Warning messages for potentially harmful situations
        Error,    ///< Error messages for serious problems
        Fatal     ///< Critical errors that may cause program termination
    };
    Q_ENUM(LogLevel)

    /**
     * @brief Gets the singleton instance of the logger
    * @return Pointer to the Logger instance
    */
    static Logger* instance();

    /**
     * @brief Sets the output log file path and enables file output
     * @param filePath The full path to the log file
     * @return True if the file could be opened
     */
    bool setLogFile(const QString& filePath);
    /**
     * @brief Closes the log file, records are no longer written to disk
     */
    void disableFileOutput();
    /**
     * @brief Sets the minimum log level for message filtering
     * @param level The minimum LogLevel to output
     */
    void setLogLevel(LogLevel level);
    /**
     * @brief Enables or disables console output
     * @param enable True to enable console output, false to disable
     * @return The new console output state
     */
    bool enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function or class name
     * @param line The source line, -1 if unknown
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message with key-value pairs
     * @param level The log level
     * @param data The key-value pairs to log
     * @param source The source function or class name
     * @param line The source line, -1 if unknown
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source = QString(), int line = -1);

    /**
     * @brief Returns the most recent records, oldest first
     */
    QList<LogEntry> recentEntries() const;
    void clearEntries();

    /**
     * @brief Sets how many records recentEntries() keeps
     */
    void setMaxEntries(int maxEntries);

    LogLevel getLogLevel() const;
    QString getLogFilePath() const;
    bool isConsoleOutputEnabled() const;
    bool isFileOutputEnabled() const;

    static QString logLevelToString(LogLevel level);

signals:
    /**
     * @brief Emitted for every record that passes the level filter
     *
     * May be emitted from any thread; connect with a queued connection
     * when the receiver is not thread-safe.
     */
    void entryLogged(const QString& timestamp, const QString& level,
                     const QString& message, const QString& target);

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    static Logger* m_instance;
    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    mutable QMutex m_mutex;
    QString m_logFilePath;
    QList<LogEntry> m_entries;
    int m_maxEntries;

    /**
     * @brief Turns Q_FUNC_INFO output into Class::method[:line]
     */
    static QString cleanSource(const QString& source, int line);
    QString formatLogMessage(LogLevel level, const QString& message, const QString& target);
    /**
     * @brief Writes a message to the log file
     * @param message The formatted message to write
     */
    void writeToLog(const QString& message);
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)

// Macro for logging with data
#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
