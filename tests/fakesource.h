#ifndef RASTA_TESTS_FAKESOURCE_H
#define RASTA_TESTS_FAKESOURCE_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>
#include <QUrl>

#ifndef Q_MOC_RUN
import rasta.core.transfersource;
#endif

/**
 * @brief Failure injected into one attempt of a fake resource.
 */
struct FakeFailure {
    qint64 afterBytes = 0;                          //!< Bytes served before failing.
    ErrorKind kind = ErrorKind::TransientNetwork;   //!< Reported error kind.
    int httpStatus = 0;                             //!< Reported status.
    qint64 retryAfterMs = -1;                       //!< Retry-After hint.
    bool closeEarly = false;                        //!< End the stream cleanly instead of failing.
};

/**
 * @brief Scripted in-memory resource.
 */
struct FakeResource {
    QByteArray data;                                //!< Full content.
    bool supportsRange = true;                      //!< Honor non-zero offsets.
    bool reportLength = true;                       //!< Report the total length.
    QString fingerprint = QStringLiteral("\"v1\""); //!< Served validator.
    QList<FakeFailure> failures;                    //!< One entry per attempt, consumed in order.
    qint64 pieceSize = 4096;                        //!< Bytes delivered per tick.
    int tickMs = 0;                                 //!< Delay between deliveries.
    bool stall = false;                             //!< Never answer.
};

class FakeSourceFactory;

/**
 * @brief TransferSource serving a FakeResource from memory.
 */
class FakeTransferSource : public TransferSource {
public:
    FakeTransferSource(FakeSourceFactory* factory, const FakeResource& resource,
                       const FakeFailure* failure, QObject* parent)
        : TransferSource(parent), m_factory(factory), m_resource(resource)
    {
        if (failure) {
            m_failure = *failure;
            m_hasFailure = true;
        }
        m_timer.setSingleShot(true);
        connect(&m_timer, &QTimer::timeout, this, [this] { deliver(); });
    }
    ~FakeTransferSource() override { release(); }

    void open(const SourceRequest& request) override;

    qint64 bytesAvailable() const override { return m_buffer.size(); }

    QByteArray read(qint64 maxSize) override
    {
        const QByteArray out = m_buffer.left(maxSize);
        m_buffer.remove(0, out.size());
        if (m_buffer.isEmpty() && m_delivered) scheduleEnd();
        return out;
    }

    bool atEnd() const override { return m_finished && m_buffer.isEmpty(); }

    void abort() override
    {
        m_aborted = true;
        m_timer.stop();
        release();
    }

    const SourceRequest& request() const { return m_request; }

private:
    void deliver()
    {
        if (m_aborted) return;
        if (m_position < m_end) {
            const qint64 n = qMin(m_resource.pieceSize, m_end - m_position);
            m_buffer.append(m_resource.data.mid(m_position, n));
            m_position += n;
            emit readyRead();
        }
        if (m_position < m_end) {
            m_timer.start(m_resource.tickMs);
            return;
        }
        m_delivered = true;
        if (m_buffer.isEmpty()) scheduleEnd();
    }

    void scheduleEnd()
    {
        if (m_endScheduled || m_aborted) return;
        m_endScheduled = true;
        QPointer<FakeTransferSource> self(this);
        QTimer::singleShot(0, this, [self] {
            if (self) self->end();
        });
    }

    void end();
    void release();

    FakeSourceFactory* m_factory = nullptr;
    FakeResource m_resource;
    FakeFailure m_failure;
    bool m_hasFailure = false;
    SourceRequest m_request;
    QByteArray m_buffer;
    qint64 m_position = 0;
    qint64 m_end = 0;
    bool m_delivered = false;
    bool m_endScheduled = false;
    bool m_finished = false;
    bool m_aborted = false;
    bool m_released = false;
    QTimer m_timer;
};

/**
 * @brief Factory recording every attempt made against its resources.
 */
class FakeSourceFactory : public TransferSourceFactory {
public:
    void setResource(const QUrl& url, const FakeResource& resource)
    {
        m_resources.insert(url.toString(), resource);
    }

    TransferSource* create(const QUrl& url, QObject* parent) override
    {
        auto it = m_resources.find(url.toString());
        if (it == m_resources.end()) return nullptr;
        const FakeFailure* failure = nullptr;
        FakeFailure next;
        if (!it->failures.isEmpty()) {
            next = it->failures.takeFirst();
            failure = &next;
        }
        ++m_created;
        return new FakeTransferSource(this, *it, failure, parent);
    }

    void opened(const SourceRequest& request)
    {
        m_offsets[request.url.toString()].append(request.offset);
        m_validators[request.url.toString()].append(request.validator);
        ++m_open;
        m_maxOpen = qMax(m_maxOpen, m_open);
    }

    void closed() { --m_open; }

    QList<qint64> offsets(const QUrl& url) const { return m_offsets.value(url.toString()); }
    QList<QString> validators(const QUrl& url) const { return m_validators.value(url.toString()); }
    int opens(const QUrl& url) const { return static_cast<int>(m_offsets.value(url.toString()).size()); }
    int openCount() const { return m_open; }
    int maxOpenCount() const { return m_maxOpen; }
    int created() const { return m_created; }

private:
    QHash<QString, FakeResource> m_resources;
    QHash<QString, QList<qint64>> m_offsets;
    QHash<QString, QList<QString>> m_validators;
    int m_open = 0;
    int m_maxOpen = 0;
    int m_created = 0;
};

inline void FakeTransferSource::open(const SourceRequest& request)
{
    m_request = request;
    m_factory->opened(request);
    if (m_resource.stall) return;

    const qint64 size = m_resource.data.size();
    QPointer<FakeTransferSource> self(this);
    QTimer::singleShot(0, this, [self, request, size] {
        if (!self || self->m_aborted) return;
        if (self->m_hasFailure && self->m_failure.afterBytes == 0 && !self->m_failure.closeEarly) {
            self->end();
            return;
        }
        const bool ranged = request.offset > 0 && self->m_resource.supportsRange;
        if (ranged && request.offset >= size) {
            TransferError error = TransferError::make(ErrorKind::SourceExhausted,
                                                      QStringLiteral("Range Not Satisfiable"), 416);
            self->release();
            emit self->failed(error);
            return;
        }
        SourceMetaData meta;
        meta.rangeAccepted = ranged;
        meta.totalBytes = self->m_resource.reportLength ? size : -1;
        meta.fingerprint = self->m_resource.fingerprint;
        meta.httpStatus = ranged ? 206 : 200;
        self->m_position = ranged ? request.offset : 0;
        self->m_end = size;
        if (self->m_hasFailure) {
            self->m_end = qMin(size, self->m_position + self->m_failure.afterBytes);
        }
        emit self->metaDataReady(meta);
        if (self && !self->m_aborted) self->deliver();
    });
}

inline void FakeTransferSource::end()
{
    if (m_aborted || m_finished) return;
    m_finished = true;
    release();
    if (m_hasFailure && !m_failure.closeEarly) {
        TransferError error = TransferError::make(m_failure.kind,
                                                  QStringLiteral("Injected failure"),
                                                  m_failure.httpStatus);
        error.retryAfterMs = m_failure.retryAfterMs;
        emit failed(error);
        return;
    }
    emit finished();
}

inline void FakeTransferSource::release()
{
    if (m_released || !m_factory) return;
    if (m_request.url.isEmpty()) return;
    m_released = true;
    m_factory->closed();
}

#endif // RASTA_TESTS_FAKESOURCE_H
