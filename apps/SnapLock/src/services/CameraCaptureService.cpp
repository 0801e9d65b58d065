#include "CameraCaptureService.h"
#include "logger/logger.h"
#include <QMediaDevices>
#include <QCameraDevice>
#include <QStandardPaths>
#include <QDateTime>
#include <QDir>

CameraCaptureService::CameraCaptureService(QObject *parent)
    : CaptureService(parent)
    , m_camera(nullptr)
    , m_imageCapture(nullptr)
    , m_session(nullptr)
    , m_requestId(0)
    , m_captureIssued(false)
{
}

CameraCaptureService::~CameraCaptureService()
{
    releaseCamera();
}

QStringList CameraCaptureService::availableCameras()
{
    QStringList cameras;
    const QList<QCameraDevice> devices = QMediaDevices::videoInputs();
    for (int i = 0; i < devices.size(); ++i) {
        cameras << QString("%1: %2").arg(i).arg(devices.at(i).description());
    }
    return cameras;
}

QString CameraCaptureService::captureFileName(const QDateTime& time)
{
    return QString("snaplock_capture_%1.jpg").arg(time.toString("yyyyMMdd_HHmmss"));
}

void CameraCaptureService::capture(const CaptureRequest& request)
{
    if (m_camera) {
        failLater(request.requestId,
                  QString("Capture %1 is still in progress").arg(m_requestId));
        return;
    }

    const QList<QCameraDevice> devices = QMediaDevices::videoInputs();
    if (request.cameraId < 0 || request.cameraId >= devices.size()) {
        failLater(request.requestId,
                  QString("Camera %1 is not available (%2 camera(s) found)")
                      .arg(request.cameraId).arg(devices.size()));
        return;
    }

    QString directory = request.savePath;
    if (directory.isEmpty()) {
        directory = QStandardPaths::writableLocation(QStandardPaths::DesktopLocation);
    }

    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(".")) {
        failLater(request.requestId, QString("Cannot create directory %1").arg(directory));
        return;
    }

    m_requestId = request.requestId;
    m_filePath = dir.filePath(captureFileName(QDateTime::currentDateTime()));
    m_captureIssued = false;

    LOG_INFO(QString("Capturing from camera %1 (%2) to %3")
                 .arg(request.cameraId)
                 .arg(devices.at(request.cameraId).description(), m_filePath));

    m_camera = new QCamera(devices.at(request.cameraId), this);
    m_imageCapture = new QImageCapture(this);
    m_session = new QMediaCaptureSession(this);
    m_session->setCamera(m_camera);
    m_session->setImageCapture(m_imageCapture);

    connect(m_imageCapture, &QImageCapture::readyForCaptureChanged,
            this, &CameraCaptureService::handleReadyForCapture);
    connect(m_imageCapture, &QImageCapture::imageSaved,
            this, &CameraCaptureService::handleImageSaved);
    connect(m_imageCapture, &QImageCapture::errorOccurred,
            this, &CameraCaptureService::handleCaptureError);
    connect(m_camera, &QCamera::errorOccurred,
            this, &CameraCaptureService::handleCameraError);

    m_camera->start();
}

void CameraCaptureService::abort(quint64 requestId)
{
    if (m_camera && requestId == m_requestId) {
        LOG_WARNING(QString("Capture %1 aborted").arg(requestId));
        releaseCamera();
    }
}

void CameraCaptureService::handleReadyForCapture(bool ready)
{
    if (!ready || m_captureIssued || !m_imageCapture) {
        return;
    }

    m_captureIssued = true;
    if (m_imageCapture->captureToFile(m_filePath) < 0) {
        finish(false, QString("Capture request rejected: %1").arg(m_imageCapture->errorString()));
    }
}

void CameraCaptureService::handleImageSaved(int id, const QString& fileName)
{
    Q_UNUSED(id);
    finish(true, fileName);
}

void CameraCaptureService::handleCaptureError(int id, QImageCapture::Error error, const QString& errorString)
{
    Q_UNUSED(id);
    if (error == QImageCapture::NoError) {
        return;
    }
    finish(false, QString("Image capture error: %1").arg(errorString));
}

void CameraCaptureService::handleCameraError(QCamera::Error error, const QString& errorString)
{
    if (error == QCamera::NoError) {
        return;
    }
    finish(false, QString("Camera error: %1").arg(errorString));
}

void CameraCaptureService::failLater(quint64 requestId, const QString& error)
{
    LOG_WARNING(error);
    QMetaObject::invokeMethod(this, [this, requestId, error]() {
        emit captureFailed(requestId, error);
    }, Qt::QueuedConnection);
}

void CameraCaptureService::finish(bool success, const QString& detail)
{
    if (!m_camera) {
        return;
    }

    const quint64 requestId = m_requestId;
    releaseCamera();

    if (success) {
        LOG_INFO(QString("Photo saved to %1").arg(detail));
        emit captureFinished(requestId, detail);
    } else {
        LOG_WARNING(detail);
        emit captureFailed(requestId, detail);
    }
}

void CameraCaptureService::releaseCamera()
{
    if (!m_camera) {
        return;
    }

    // Signals may still be on the stack, so objects go through deleteLater
    m_camera->disconnect(this);
    m_imageCapture->disconnect(this);
    m_camera->stop();
    m_session->deleteLater();
    m_imageCapture->deleteLater();
    m_camera->deleteLater();
    m_session = nullptr;
    m_imageCapture = nullptr;
    m_camera = nullptr;
}
