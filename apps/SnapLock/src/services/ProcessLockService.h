#ifndef PROCESSLOCKSERVICE_H
#define PROCESSLOCKSERVICE_H

#include "LockService.h"
#include <QProcess>
#include <QTimer>
#include <QElapsedTimer>
#include <QStringList>
#include <QList>

struct LockCommand
{
    QString program;
    QStringList arguments;

    QString toString() const;
};

/**
 * Locks the session by running platform lock commands in order until one
 * exits with status 0. Each command gets a bounded amount of time before the
 * next one is tried, and the whole list shares a total budget. lockFinished()
 * reports failure once the list or the budget is exhausted.
 */
class ProcessLockService : public LockService
{
    Q_OBJECT
public:
    explicit ProcessLockService(QObject *parent = nullptr);
    ~ProcessLockService() override;

    void lock(quint64 requestId) override;
    void abort(quint64 requestId) override;
    bool isLocking() const;

    void setLockCommands(const QList<LockCommand>& commands);
    QList<LockCommand> lockCommands() const;
    static QList<LockCommand> defaultLockCommands();

    void setCommandTimeout(int msecs);
    void setTotalTimeout(int msecs);

private slots:
    void handleProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void handleProcessError(QProcess::ProcessError error);
    void handleCommandTimeout();

private:
    void startNextCommand();
    void finish(bool success, const QString& error);
    void discardProcess();

    QList<LockCommand> m_commands;
    QProcess* m_process;
    QTimer m_commandTimer;
    QElapsedTimer m_elapsed;
    int m_commandTimeout;
    int m_totalTimeout;
    quint64 m_requestId;
    int m_commandIndex;
    QStringList m_errors;
};

#endif // PROCESSLOCKSERVICE_H
