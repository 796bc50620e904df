module;
#include <QDebug>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QTimer>
#include <limits>
#include <optional>

module rasta.core.transferunit;

import rasta.utils.download_utils;

namespace utils = rasta::utils;

TransferUnit::TransferUnit(const DownloadRequest& request,
                           const QString& destinationPath,
                           TransferSourceFactory* factory,
                           RateLimiter* globalLimiter,
                           ProgressBus* bus,
                           CheckpointStore* checkpoints,
                           const TransferOptions& options,
                           QObject* parent)
    : QObject(parent),
    m_request(request),
    m_path(utils::normalizeFilePath(destinationPath)),
    m_factory(factory),
    m_globalLimiter(globalLimiter),
    m_bus(bus),
    m_checkpoints(checkpoints),
    m_options(options)
{
    m_partPath = utils::partialFilePath(m_path);
    m_options.chunkSize = qMax<qint64>(1, m_options.chunkSize);
    m_taskLimiter = new RateLimiter(qMax<qint64>(0, request.speedLimit), 1000, this);
    if (request.expectedSize > 0) m_state.totalBytes = request.expectedSize;

    m_stallTimer.setSingleShot(true);
    connect(&m_stallTimer, &QTimer::timeout, this, [this] {
        if (m_state.status != TransferStatus::Connecting
            && m_state.status != TransferStatus::Downloading) return;
        if (m_waitingQuota) return;
        failAttempt(m_generation, TransferError::make(
            ErrorKind::Timeout,
            QStringLiteral("No data for %1 ms").arg(m_options.attemptTimeoutMs)));
    });
}

TransferUnit::~TransferUnit()
{
    stopAttempt();
}

double TransferUnit::currentSpeed() const
{
    return m_taskLimiter->currentSpeed();
}

double TransferUnit::averageSpeed() const
{
    const qint64 activeMs = m_activeMs + (m_activeTimer.isValid() ? m_activeTimer.elapsed() : 0);
    if (activeMs <= 0) return 0.0;
    return m_receivedBytes * 1000.0 / activeMs;
}

int TransferUnit::eta() const
{
    if (m_state.status == TransferStatus::Completed) return 0;
    if (m_state.totalBytes <= 0) return -1;
    const qint64 remaining = qMax<qint64>(0, m_state.totalBytes - m_state.bytesTransferred);
    double speed = m_state.status == TransferStatus::Downloading ? currentSpeed() : 0.0;
    if (speed <= 0.0) speed = averageSpeed();
    if (speed <= 0.0) return -1;
    return static_cast<int>(qMin<double>(remaining / speed, std::numeric_limits<int>::max()));
}

qint64 TransferUnit::speedLimit() const
{
    return m_taskLimiter->speedLimit();
}

void TransferUnit::setSpeedLimit(qint64 bytesPerSecond)
{
    m_taskLimiter->setSpeedLimit(bytesPerSecond);
}

void TransferUnit::appendLog(const QString& line)
{
    if (line.trimmed().isEmpty()) return;
    m_logLines.append(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz "))
                      + line);
    while (m_logLines.size() > m_logLimit) {
        m_logLines.removeFirst();
    }
    emit logLinesChanged();
}

TransferEvent TransferUnit::makeEvent(bool withError) const
{
    TransferEvent event;
    event.taskId = m_request.id;
    event.status = m_state.status;
    event.bytesTransferred = m_state.bytesTransferred;
    event.totalBytes = m_state.totalBytes;
    event.speed = m_state.status == TransferStatus::Downloading ? currentSpeed() : 0.0;
    event.averageSpeed = averageSpeed();
    event.eta = eta();
    event.attempt = m_state.attempt;
    if (withError) event.error = m_state.lastError;
    return event;
}

bool TransferUnit::transitionTo(TransferStatus next)
{
    const TransferStatus current = m_state.status;
    if (!canTransition(current, next)) {
        qWarning() << "Illegal transition" << statusString(current) << "->" << statusString(next)
                   << "for" << m_request.id;
        appendLog(QStringLiteral("Illegal transition %1 -> %2")
                      .arg(statusString(current), statusString(next)));
        return false;
    }
    if (current == TransferStatus::Downloading && m_activeTimer.isValid()) {
        m_activeMs += m_activeTimer.elapsed();
        m_activeTimer.invalidate();
    }
    m_state.status = next;
    if (next == TransferStatus::Downloading) m_activeTimer.start();
    emit statusChanged(next);
    return true;
}

void TransferUnit::publishStatus(bool withError)
{
    if (m_bus) m_bus->publish(makeEvent(withError));
}

void TransferUnit::start()
{
    if (m_state.status != TransferStatus::Queued) {
        qWarning() << "start() ignored for" << m_request.id << "in" << statusName();
        return;
    }
    m_restarted = false;
    m_state.lastError = TransferError();
    // A resumed pause continues the same attempt; only failures open a new one.
    m_state.attempt = m_state.failures + 1;
    if (!transitionTo(TransferStatus::Connecting)) return;
    appendLog(QStringLiteral("Start attempt %1: %2").arg(m_state.attempt).arg(m_request.url.toString()));
    publishStatus();
    openAttempt();
}

void TransferUnit::openAttempt()
{
    stopAttempt();
    const quint64 generation = m_generation;

    m_offset = 0;
    m_validator.clear();
    m_lengthKnown = false;
    std::optional<Checkpoint> checkpoint = m_checkpoints
        ? m_checkpoints->loadVerified(m_path, m_partPath)
        : std::nullopt;
    if (checkpoint) {
        m_offset = checkpoint->bytesWritten;
        m_validator = checkpoint->fingerprint;
        if (checkpoint->totalBytes >= 0) m_state.totalBytes = checkpoint->totalBytes;
    } else if (!m_ignoreResumeHint && m_request.resumeOffset > 0
               && utils::partialFileSize(m_path) >= m_request.resumeOffset) {
        m_offset = m_request.resumeOffset;
    }

    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        failAttempt(generation, TransferError::make(
            ErrorKind::Destination,
            QStringLiteral("Cannot create directory %1").arg(info.absolutePath())));
        return;
    }

    m_file = new QFile(m_partPath, this);
    QIODevice::OpenMode mode = QIODevice::ReadWrite;
    if (m_offset == 0) mode |= QIODevice::Truncate;
    if (!m_file->open(mode)) {
        const QString reason = m_file->errorString();
        failAttempt(generation, TransferError::make(
            ErrorKind::Destination,
            QStringLiteral("Cannot open output file %1: %2").arg(m_partPath, reason)));
        return;
    }
    if (m_offset > 0) {
        if (m_file->size() > m_offset && !m_file->resize(m_offset)) {
            failAttempt(generation, TransferError::make(
                ErrorKind::Destination,
                QStringLiteral("Cannot truncate %1: %2").arg(m_partPath, m_file->errorString())));
            return;
        }
        if (!m_file->seek(m_offset)) {
            failAttempt(generation, TransferError::make(
                ErrorKind::Destination,
                QStringLiteral("Cannot seek %1: %2").arg(m_partPath, m_file->errorString())));
            return;
        }
        appendLog(QStringLiteral("Resume at %1 bytes").arg(m_offset));
    }
    m_state.bytesTransferred = m_offset;

    TransferSource* source = m_factory ? m_factory->create(m_request.url, this) : nullptr;
    if (!source) {
        failAttempt(generation, TransferError::make(
            ErrorKind::InvalidRequest,
            QStringLiteral("Unsupported URL: %1").arg(m_request.url.toString())));
        return;
    }
    m_source = source;

    connect(source, &TransferSource::metaDataReady, this, [this, generation](const SourceMetaData& meta) {
        onMetaData(generation, meta);
    });
    connect(source, &TransferSource::readyRead, this, [this, generation] {
        pump(generation);
    });
    connect(source, &TransferSource::finished, this, [this, generation] {
        pump(generation);
    });
    connect(source, &TransferSource::failed, this, [this, generation](const TransferError& error) {
        failAttempt(generation, error);
    });

    SourceRequest sourceRequest;
    sourceRequest.url = m_request.url;
    sourceRequest.offset = m_offset;
    sourceRequest.validator = m_validator;
    sourceRequest.headers = m_request.headers;
    sourceRequest.cookieHeader = m_request.cookieHeader;
    sourceRequest.proxy = m_request.proxy.isEmpty() ? m_options.defaultProxy : m_request.proxy;
    sourceRequest.userAgent = m_options.userAgent;
    sourceRequest.readBufferSize = m_options.chunkSize * qMax(1, m_options.readAheadChunks);

    armStallTimer();
    source->open(sourceRequest);
}

void TransferUnit::onMetaData(quint64 generation, const SourceMetaData& meta)
{
    if (generation != m_generation || m_state.status != TransferStatus::Connecting) return;
    armStallTimer();
    if (meta.httpStatus > 0) {
        appendLog(QStringLiteral("Connected: HTTP %1 at offset %2").arg(meta.httpStatus).arg(m_offset));
    }

    if (m_offset > 0) {
        if (!meta.rangeAccepted) {
            // The body starts at byte zero: keep the stream, drop what we had.
            if (!m_file->resize(0) || !m_file->seek(0)) {
                failAttempt(generation, TransferError::make(
                    ErrorKind::Destination,
                    QStringLiteral("Cannot truncate %1: %2").arg(m_partPath, m_file->errorString())));
                return;
            }
            if (m_checkpoints) m_checkpoints->remove(m_path);
            qInfo() << "Resume not supported for" << m_request.id << "- restarted from 0";
            appendLog(QStringLiteral("Resume not supported; restarted"));
            m_offset = 0;
            m_state.bytesTransferred = 0;
        } else {
            const bool fingerprintChanged = !m_validator.isEmpty() && !meta.fingerprint.isEmpty()
                                            && meta.fingerprint != m_validator;
            const bool lengthChanged = meta.totalBytes >= 0
                                       && ((m_state.totalBytes >= 0 && meta.totalBytes != m_state.totalBytes)
                                           || m_offset > meta.totalBytes);
            if (fingerprintChanged || lengthChanged) {
                restartFromZero(QStringLiteral("Remote content changed; restarting from 0"));
                return;
            }
        }
    }

    m_fingerprint = meta.fingerprint;
    m_lengthKnown = meta.totalBytes >= 0;
    if (meta.totalBytes >= 0) {
        m_state.totalBytes = meta.totalBytes;
    } else if (m_request.expectedSize <= 0) {
        m_state.totalBytes = -1;
    }

    if (!transitionTo(TransferStatus::Downloading)) return;
    publishStatus();
    saveCheckpoint();
    pump(generation);
}

void TransferUnit::pump(quint64 generation)
{
    if (generation != m_generation || m_state.status != TransferStatus::Downloading) return;
    if (m_waitingQuota || !m_source) return;
    if (m_cancelRequested) {
        finishCancel();
        return;
    }

    const qint64 available = m_source->bytesAvailable();
    if (available <= 0) {
        if (m_source->atEnd()) finishStream();
        return;
    }

    const qint64 size = qMin(available, m_options.chunkSize);
    m_waitingQuota = true;
    m_stallTimer.stop();

    QPointer<RateLimiter> global = m_globalLimiter;
    m_taskLimiter->acquireAsync(size, this, [this, generation, size, global] {
        if (generation != m_generation) return;
        if (global) {
            global->acquireAsync(size, this, [this, generation, size] {
                writeChunk(generation, size);
            });
        } else {
            writeChunk(generation, size);
        }
    });
}

void TransferUnit::writeChunk(quint64 generation, qint64 size)
{
    if (generation != m_generation) return;
    m_waitingQuota = false;
    if (m_cancelRequested) {
        finishCancel();
        return;
    }
    if (m_state.status != TransferStatus::Downloading || !m_source || !m_file) return;

    const QByteArray data = m_source->read(size);
    if (!data.isEmpty()) {
        const qint64 written = m_file->write(data);
        if (written != data.size() || !m_file->flush()) {
            failAttempt(generation, TransferError::make(
                ErrorKind::Destination,
                QStringLiteral("Write failed on %1: %2").arg(m_partPath, m_file->errorString())));
            return;
        }
        m_state.bytesTransferred += written;
        m_receivedBytes += written;
        saveCheckpoint();
        emit progress(m_state.bytesTransferred, m_state.totalBytes);
        if (m_bus) m_bus->publishProgress(makeEvent());
    }

    armStallTimer();
    pump(generation);
}

void TransferUnit::finishStream()
{
    const quint64 generation = m_generation;
    m_stallTimer.stop();

    const qint64 total = m_state.totalBytes;
    if (m_lengthKnown && m_state.bytesTransferred != total) {
        if (m_state.bytesTransferred < total) {
            failAttempt(generation, TransferError::make(
                ErrorKind::TransientNetwork,
                QStringLiteral("Connection closed after %1 of %2 bytes")
                    .arg(m_state.bytesTransferred).arg(total)));
        } else {
            failAttempt(generation, TransferError::make(
                ErrorKind::SourceExhausted,
                QStringLiteral("Received %1 bytes, expected %2")
                    .arg(m_state.bytesTransferred).arg(total)));
        }
        return;
    }

    if (m_file) {
        m_file->close();
        m_file->deleteLater();
        m_file = nullptr;
    }
    if (utils::fileExistsPath(m_path) && !QFile::remove(m_path)) {
        failAttempt(generation, TransferError::make(
            ErrorKind::Destination,
            QStringLiteral("Cannot replace %1").arg(m_path)));
        return;
    }
    if (!QFile::rename(m_partPath, m_path)) {
        failAttempt(generation, TransferError::make(
            ErrorKind::Destination,
            QStringLiteral("Cannot rename %1 to %2").arg(m_partPath, m_path)));
        return;
    }
    stopAttempt();
    if (m_checkpoints && !m_checkpoints->remove(m_path)) {
        qWarning() << "Cannot remove checkpoint for" << m_path;
    }

    m_state.totalBytes = m_state.bytesTransferred;
    if (!transitionTo(TransferStatus::Completed)) return;
    qInfo() << "Completed" << m_request.id << m_path << m_state.bytesTransferred << "bytes";
    appendLog(QStringLiteral("Completed: %1 bytes").arg(m_state.bytesTransferred));
    publishStatus();
    if (m_bus) m_bus->forget(m_request.id);
    emit completed();
}

void TransferUnit::failAttempt(quint64 generation, const TransferError& error)
{
    if (generation != m_generation) return;
    if (m_state.status != TransferStatus::Connecting && m_state.status != TransferStatus::Downloading) return;

    if (error.kind == ErrorKind::Cancelled || m_cancelRequested) {
        finishCancel();
        return;
    }
    if (error.kind == ErrorKind::SourceExhausted && !m_restarted) {
        restartFromZero(QStringLiteral("Resume rejected (%1); restarting from 0").arg(error.message));
        return;
    }

    stopAttempt();
    m_state.lastError = error;
    ++m_state.failures;
    qWarning() << "Attempt" << m_state.attempt << "of" << m_request.id << "failed:"
               << errorKindName(error.kind) << error.message;
    appendLog(QStringLiteral("Attempt %1 failed: %2 %3")
                  .arg(m_state.attempt).arg(errorKindName(error.kind), error.message));
    if (!transitionTo(TransferStatus::Failed)) return;
    emit attemptFailed(error);
}

void TransferUnit::restartFromZero(const QString& reason)
{
    stopAttempt();
    m_restarted = true;
    m_ignoreResumeHint = true;
    if (m_checkpoints) m_checkpoints->remove(m_path);
    if (QFile::exists(m_partPath) && !QFile::remove(m_partPath)) {
        qWarning() << "Cannot remove partial file" << m_partPath;
    }
    m_state.bytesTransferred = 0;
    m_state.totalBytes = m_request.expectedSize > 0 ? m_request.expectedSize : -1;
    m_fingerprint.clear();
    qInfo() << m_request.id << reason;
    appendLog(reason);

    if (m_state.status == TransferStatus::Downloading) {
        if (!transitionTo(TransferStatus::Connecting)) return;
        publishStatus();
    }
    openAttempt();
}

void TransferUnit::pause()
{
    const TransferStatus s = m_state.status;
    if (s != TransferStatus::Queued && s != TransferStatus::Connecting
        && s != TransferStatus::Downloading && s != TransferStatus::Failed) return;

    stopAttempt();
    if (!transitionTo(TransferStatus::Paused)) return;
    qDebug() << "Pause requested for" << m_path;
    appendLog(QStringLiteral("Paused at %1 bytes").arg(m_state.bytesTransferred));
    publishStatus();
}

void TransferUnit::requeue()
{
    if (m_state.status != TransferStatus::Paused && m_state.status != TransferStatus::Failed) return;
    if (!transitionTo(TransferStatus::Queued)) return;
    if (m_state.lastError.isError()) {
        appendLog(QStringLiteral("Retry scheduled after %1").arg(errorKindName(m_state.lastError.kind)));
    } else {
        appendLog(QStringLiteral("Resumed"));
    }
    publishStatus();
}

void TransferUnit::cancel(bool deletePartial)
{
    if (isTerminal(m_state.status)) return;
    m_cancelRequested = true;
    m_deletePartial = m_deletePartial || deletePartial;
    QPointer<TransferUnit> self(this);
    QTimer::singleShot(0, this, [self] {
        if (self) self->finishCancel();
    });
}

void TransferUnit::finishCancel()
{
    if (isTerminal(m_state.status)) return;
    stopAttempt();
    if (m_deletePartial) {
        if (QFile::exists(m_partPath) && !QFile::remove(m_partPath)) {
            qWarning() << "Cannot remove partial file" << m_partPath;
        }
        if (m_checkpoints) m_checkpoints->remove(m_path);
    }
    m_state.lastError = TransferError();
    if (!transitionTo(TransferStatus::Cancelled)) return;
    appendLog(m_deletePartial ? QStringLiteral("Cancelled; partial data removed")
                              : QStringLiteral("Cancelled; partial data kept"));
    publishStatus();
    if (m_bus) m_bus->forget(m_request.id);
    emit cancelled();
}

void TransferUnit::giveUp()
{
    if (m_state.status != TransferStatus::Failed) return;
    qWarning() << "Giving up on" << m_request.id << "after" << m_state.attempt << "attempt(s):"
               << errorKindName(m_state.lastError.kind) << m_state.lastError.message;
    appendLog(QStringLiteral("Failed: %1").arg(m_state.lastError.message));
    publishStatus(true);
    if (m_bus) m_bus->forget(m_request.id);
}

void TransferUnit::stopAttempt()
{
    ++m_generation;
    m_waitingQuota = false;
    m_stallTimer.stop();
    if (m_source) {
        TransferSource* source = m_source.data();
        source->disconnect(this);
        source->abort();
        source->deleteLater();
        m_source = nullptr;
    }
    if (m_file) {
        m_file->flush();
        m_file->close();
        m_file->deleteLater();
        m_file = nullptr;
    }
}

void TransferUnit::saveCheckpoint()
{
    if (!m_checkpoints) return;
    Checkpoint cp;
    cp.path = m_path;
    cp.url = m_request.url;
    cp.bytesWritten = m_state.bytesTransferred;
    cp.totalBytes = m_state.totalBytes;
    cp.fingerprint = m_fingerprint;
    cp.updatedAt = QDateTime::currentMSecsSinceEpoch();
    if (!m_checkpoints->save(cp)) {
        qWarning() << "Cannot persist checkpoint for" << m_path;
    }
}

void TransferUnit::armStallTimer()
{
    if (m_options.attemptTimeoutMs <= 0) return;
    m_stallTimer.start(m_options.attemptTimeoutMs);
}
