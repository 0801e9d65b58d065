#ifndef LOCKSERVICE_H
#define LOCKSERVICE_H

#include <QObject>

class LockService : public QObject
{
    Q_OBJECT
public:
    explicit LockService(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~LockService() {}

    virtual void lock(quint64 requestId) = 0;
    // Drops the request without reporting it. Unknown ids are ignored.
    virtual void abort(quint64 requestId) { Q_UNUSED(requestId); }

signals:
    void lockFinished(quint64 requestId, bool success, const QString& error);
};

#endif // LOCKSERVICE_H
