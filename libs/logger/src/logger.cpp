#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

// Initialize static member to nullptr
Logger* Logger::m_instance = nullptr;

// Double-checked locking for thread safety
Logger* Logger::instance() {
    if (m_instance == nullptr) {
        static QMutex mutex;
        QMutexLocker locker(&mutex);

        // Check again after locking
        if (m_instance == nullptr) {
            m_instance = new Logger();
        }
    }
    return m_instance;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
    , m_logFilePath("")
    , m_maxEntries(1000)
{
    // File output stays off until a path is configured
}

Logger::~Logger() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    QDir().mkpath(QFileInfo(filePath).absolutePath());

    m_logFilePath = filePath;
    m_logFile.setFileName(filePath);
    bool opened = m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);

    if (opened) {
        m_logStream.setDevice(&m_logFile);
        // Use direct logging without going through log() to avoid potential recursion
        writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), ""));
    } else {
        qWarning() << "Failed to open log file:" << filePath;
    }
    return opened;
}

void Logger::disableFileOutput() {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen()) {
        writeToLog(formatLogMessage(Info, "Log file closed", ""));
        m_logStream.flush();
        m_logFile.close();
    }
    m_logStream.setDevice(nullptr);
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(logLevelToString(level)), ""));
}

bool Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
    return m_consoleOutput;
}

void Logger::debug(const QString& message, const QString& source, int line) {
    log(Debug, message, source, line);
}

void Logger::info(const QString& message, const QString& source, int line) {
    log(Info, message, source, line);
}

void Logger::warning(const QString& message, const QString& source, int line) {
    log(Warning, message, source, line);
}

void Logger::error(const QString& message, const QString& source, int line) {
    log(Error, message, source, line);
}

void Logger::fatal(const QString& message, const QString& source, int line) {
    log(Fatal, message, source, line);
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    // Build everything outside the lock to minimize lock time
    LogEntry entry;
    entry.timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    entry.level = logLevelToString(level);
    entry.message = message;
    entry.target = cleanSource(source, line);
    QString formattedMessage = formatLogMessage(level, message, entry.target);

    {
        QMutexLocker locker(&m_mutex);
        writeToLog(formattedMessage);

        m_entries.append(entry);
        while (m_entries.size() > m_maxEntries) {
            m_entries.removeFirst();
        }

        if (m_consoleOutput) {
            switch (level) {
                case Debug:
                    qDebug().noquote() << formattedMessage;
                    break;
                case Info:
                    qInfo().noquote() << formattedMessage;
                    break;
                case Warning:
                    qWarning().noquote() << formattedMessage;
                    break;
                case Error:
                case Fatal:
                    qCritical().noquote() << formattedMessage;
                    break;
            }
        }
    }

    emit entryLogged(entry.timestamp, entry.level, entry.message, entry.target);
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    QStringList logParts;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        logParts.append(QString("%1: %2").arg(it.key(), it.value().toString()));
    }

    log(level, logParts.join(", "), source, line);
}

QList<LogEntry> Logger::recentEntries() const {
    QMutexLocker locker(&m_mutex);
    return m_entries;
}

void Logger::clearEntries() {
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}

void Logger::setMaxEntries(int maxEntries) {
    QMutexLocker locker(&m_mutex);
    m_maxEntries = qMax(1, maxEntries);
    while (m_entries.size() > m_maxEntries) {
        m_entries.removeFirst();
    }
}

QString Logger::logLevelToString(LogLevel level) {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
        default:      return "UNKNOWN";
    }
}

QString Logger::cleanSource(const QString& source, int line) {
    if (source.isEmpty()) {
        return QString();
    }

    // Drop the parameter list
    QString sourceInfo = source;
    int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }

    // GCC prefixes the return type ("bool Foo::bar"), MSVC adds __cdecl
    sourceInfo.replace("__cdecl ", "");
    int spacePos = sourceInfo.lastIndexOf(' ');
    if (spacePos >= 0) {
        sourceInfo = sourceInfo.mid(spacePos + 1);
    }
    if (sourceInfo.startsWith('*') || sourceInfo.startsWith('&')) {
        sourceInfo = sourceInfo.mid(1);
    }

    // Constructors read better as ClassName::constructor
    QStringList parts = sourceInfo.split("::");
    if (parts.size() >= 2 && parts[parts.size() - 2] == parts[parts.size() - 1]) {
        sourceInfo = parts[parts.size() - 2] + "::constructor";
    }

    if (line >= 0) {
        sourceInfo += QString(":%1").arg(line);
    }
    return sourceInfo;
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& target) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString pid = QString::number(QCoreApplication::applicationPid());
    QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()));
    QString levelStr = logLevelToString(level);

    if (target.isEmpty()) {
        return QString("[%1] [%2] [PID:%3] [TID:%4] %5")
            .arg(timestamp, levelStr, pid, threadId, message);
    }
    return QString("[%1] [%2] [PID:%3] [TID:%4] [%5] %6")
        .arg(timestamp, levelStr, pid, threadId, target, message);
}

void Logger::writeToLog(const QString& message) {
    // Always called with m_mutex held
    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
    }
}

Logger::LogLevel Logger::getLogLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString Logger::getLogFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

bool Logger::isConsoleOutputEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_consoleOutput;
}

bool Logger::isFileOutputEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_logFile.isOpen();
}
