#ifndef CAMERACAPTURESERVICE_H
#define CAMERACAPTURESERVICE_H

#include "CaptureService.h"
#include <QStringList>
#include <QCamera>
#include <QImageCapture>
#include <QMediaCaptureSession>

class CameraCaptureService : public CaptureService
{
    Q_OBJECT
public:
    explicit CameraCaptureService(QObject *parent = nullptr);
    ~CameraCaptureService() override;

    void capture(const CaptureRequest& request) override;
    void abort(quint64 requestId) override;

    // "<index>: <description>" for each video input, index usable as camera id
    static QStringList availableCameras();
    static QString captureFileName(const QDateTime& time);

private slots:
    void handleReadyForCapture(bool ready);
    void handleImageSaved(int id, const QString& fileName);
    void handleCaptureError(int id, QImageCapture::Error error, const QString& errorString);
    void handleCameraError(QCamera::Error error, const QString& errorString);

private:
    void failLater(quint64 requestId, const QString& error);
    void finish(bool success, const QString& detail);
    void releaseCamera();

    QCamera* m_camera;
    QImageCapture* m_imageCapture;
    QMediaCaptureSession* m_session;
    quint64 m_requestId;
    QString m_filePath;
    bool m_captureIssued;
};

#endif // CAMERACAPTURESERVICE_H
