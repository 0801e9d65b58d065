#ifndef CAPTURESERVICE_H
#define CAPTURESERVICE_H

#include <QObject>
#include "../core/CoreTypes.h"

// Takes one still image per request. Completion is reported through exactly
// one of captureFinished() / captureFailed() carrying the request id.
class CaptureService : public QObject
{
    Q_OBJECT
public:
    explicit CaptureService(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~CaptureService() {}

    virtual void capture(const CaptureRequest& request) = 0;
    // Requester gave up waiting; release whatever the request still holds
    virtual void abort(quint64 requestId) { Q_UNUSED(requestId); }

signals:
    void captureFinished(quint64 requestId, const QString& filePath);
    void captureFailed(quint64 requestId, const QString& error);
};

#endif // CAPTURESERVICE_H
