#include "ProcessLockService.h"
#include "logger/logger.h"
#include "../core/CoreTypes.h"

namespace {
constexpr int DefaultCommandTimeoutMs = 2000;
}

QString LockCommand::toString() const
{
    return (QStringList() << program << arguments).join(' ');
}

ProcessLockService::ProcessLockService(QObject *parent)
    : LockService(parent)
    , m_commands(defaultLockCommands())
    , m_process(nullptr)
    , m_commandTimeout(DefaultCommandTimeoutMs)
    , m_totalTimeout(SnapLockTimings::LockCommandBudgetMs)
    , m_requestId(0)
    , m_commandIndex(-1)
{
    m_commandTimer.setSingleShot(true);
    connect(&m_commandTimer, &QTimer::timeout, this, &ProcessLockService::handleCommandTimeout);
}

ProcessLockService::~ProcessLockService()
{
    discardProcess();
}

QList<LockCommand> ProcessLockService::defaultLockCommands()
{
    QList<LockCommand> commands;
#if defined(Q_OS_WIN)
    commands << LockCommand{ "rundll32.exe", { "user32.dll,LockWorkStation" } };
#elif defined(Q_OS_MACOS)
    commands << LockCommand{ "pmset", { "displaysleepnow" } };
#else
    commands << LockCommand{ "loginctl", { "lock-session" } }
             << LockCommand{ "xdg-screensaver", { "lock" } }
             << LockCommand{ "dm-tool", { "lock" } }
             << LockCommand{ "gnome-screensaver-command", { "-l" } };
#endif
    return commands;
}

void ProcessLockService::setLockCommands(const QList<LockCommand>& commands)
{
    m_commands = commands;
}

QList<LockCommand> ProcessLockService::lockCommands() const
{
    return m_commands;
}

void ProcessLockService::setCommandTimeout(int msecs)
{
    m_commandTimeout = msecs;
}

void ProcessLockService::setTotalTimeout(int msecs)
{
    m_totalTimeout = msecs;
}

bool ProcessLockService::isLocking() const
{
    return m_commandIndex >= 0;
}

void ProcessLockService::lock(quint64 requestId)
{
    if (m_process) {
        LOG_WARNING(QString("Lock request %1 superseded by %2").arg(m_requestId).arg(requestId));
        m_commandTimer.stop();
        discardProcess();
    }

    m_requestId = requestId;
    m_commandIndex = -1;
    m_errors.clear();

    if (m_commands.isEmpty()) {
        LOG_ERROR("No lock command configured");
        QMetaObject::invokeMethod(this, [this, requestId]() {
            emit lockFinished(requestId, false, "No lock command configured");
        }, Qt::QueuedConnection);
        return;
    }

    LOG_INFO(QString("Locking session (request %1)").arg(requestId));
    m_elapsed.start();
    startNextCommand();
}

void ProcessLockService::abort(quint64 requestId)
{
    if (!isLocking() || requestId != m_requestId) {
        return;
    }

    LOG_WARNING(QString("Lock request %1 aborted").arg(requestId));
    m_commandTimer.stop();
    discardProcess();
    m_commandIndex = -1;
    m_errors.clear();
}

void ProcessLockService::startNextCommand()
{
    ++m_commandIndex;
    if (m_commandIndex >= m_commands.size()) {
        finish(false, m_errors.join("; "));
        return;
    }

    const int remaining = m_totalTimeout - static_cast<int>(m_elapsed.elapsed());
    if (remaining <= 0) {
        m_errors << QString("lock commands exceeded %1 ms").arg(m_totalTimeout);
        finish(false, m_errors.join("; "));
        return;
    }

    const LockCommand& command = m_commands.at(m_commandIndex);
    LOG_DEBUG(QString("Trying lock command: %1").arg(command.toString()));

    m_process = new QProcess(this);
    connect(m_process, &QProcess::finished, this, &ProcessLockService::handleProcessFinished);
    connect(m_process, &QProcess::errorOccurred, this, &ProcessLockService::handleProcessError);

    m_commandTimer.start(qMin(m_commandTimeout, remaining));
    // May report FailedToStart before returning, m_process is not used past here
    m_process->start(command.program, command.arguments);
}

void ProcessLockService::handleProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (sender() != m_process) {
        return;
    }

    m_commandTimer.stop();
    const QString program = m_commands.at(m_commandIndex).program;
    discardProcess();

    if (exitStatus == QProcess::NormalExit && exitCode == 0) {
        LOG_INFO(QString("Session locked with %1").arg(program));
        finish(true, QString());
        return;
    }

    if (exitStatus == QProcess::CrashExit) {
        m_errors << QString("%1 crashed").arg(program);
    } else {
        m_errors << QString("%1 exited with code %2").arg(program).arg(exitCode);
    }
    LOG_WARNING(m_errors.last());
    startNextCommand();
}

void ProcessLockService::handleProcessError(QProcess::ProcessError error)
{
    // Crashes are also reported through finished()
    if (sender() != m_process || error != QProcess::FailedToStart) {
        return;
    }

    m_commandTimer.stop();
    m_errors << QString("%1 failed to start: %2")
                    .arg(m_commands.at(m_commandIndex).program, m_process->errorString());
    LOG_WARNING(m_errors.last());
    discardProcess();
    startNextCommand();
}

void ProcessLockService::handleCommandTimeout()
{
    if (!m_process) {
        return;
    }

    m_errors << QString("%1 timed out").arg(m_commands.at(m_commandIndex).program);
    LOG_WARNING(m_errors.last());
    discardProcess();
    startNextCommand();
}

void ProcessLockService::finish(bool success, const QString& error)
{
    m_commandIndex = -1;
    if (!success) {
        LOG_ERROR(QString("Failed to lock session: %1").arg(error));
    }
    emit lockFinished(m_requestId, success, error);
}

void ProcessLockService::discardProcess()
{
    if (!m_process) {
        return;
    }

    QProcess* process = m_process;
    m_process = nullptr;
    process->disconnect(this);
    if (process->state() != QProcess::NotRunning) {
        process->kill();
        process->waitForFinished(1000);
    }
    process->deleteLater();
}
