/*!
 * @file        transfersource.cppm
 * @brief       Protocol-agnostic byte source consumed by transfer units.
 * @details     A TransferSource opens a remote resource at a byte offset,
 *              reports what the remote side actually served (range accepted,
 *              complete length, fingerprint) and then streams bytes on demand.
 *              Data is pulled by the consumer with read(); a source must not
 *              buffer unboundedly ahead of the consumer.
 *
 *              Signal order for one open():
 *              - metaDataReady once, before any readyRead
 *              - readyRead zero or more times
 *              - exactly one of finished or failed
 *
 *              Sources are created per attempt by a TransferSourceFactory and
 *              owned by the transfer unit through QObject parenting.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

#ifndef Q_MOC_RUN
export module rasta.core.transfersource;
export import rasta.core.transfererror;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Parameters of one open() call.
 */
RASTA_MODULE_EXPORT struct SourceRequest {
    QUrl url;                       //!< Resource URL.
    qint64 offset = 0;              //!< First byte wanted.
    QString validator;              //!< Fingerprint the offset belongs to (If-Range).
    QStringList headers;            //!< Extra "Name: value" headers, forwarded verbatim.
    QString cookieHeader;           //!< Cookie header value.
    QUrl proxy;                     //!< Proxy URL, empty for none.
    QString userAgent;              //!< User-Agent value.
    qint64 readBufferSize = 0;      //!< Read-ahead bound in bytes, 0 for the source default.
};

/**
 * @brief What the remote side served for an open() call.
 */
RASTA_MODULE_EXPORT struct SourceMetaData {
    bool rangeAccepted = false;     //!< Bytes start at the requested offset.
    qint64 totalBytes = -1;         //!< Complete resource length, -1 if unknown.
    QString fingerprint;            //!< ETag, else Last-Modified, empty if none.
    int httpStatus = 0;             //!< Protocol status, 0 when not applicable.
};

/**
 * @brief Abstract pull-based byte source.
 */
RASTA_MODULE_EXPORT class TransferSource : public QObject {

    Q_OBJECT

public:
    explicit TransferSource(QObject* parent = nullptr) : QObject(parent) {}
    ~TransferSource() override = default;

    /**
     * @brief Start fetching the resource.
     * @param request Open parameters.
     */
    virtual void open(const SourceRequest& request) = 0;

    //!< @brief Bytes that read() can return without waiting.
    virtual qint64 bytesAvailable() const = 0;

    /**
     * @brief Take up to @p maxSize buffered bytes.
     * @param maxSize Upper bound.
     * @return Data, possibly empty.
     */
    virtual QByteArray read(qint64 maxSize) = 0;

    //!< @brief True once finished() was emitted and the buffer is drained.
    virtual bool atEnd() const = 0;

    //!< @brief Stop the transfer; no further signals are emitted.
    virtual void abort() = 0;

signals:
    /**
     * @brief Emitted once the response headers are known.
     * @param meta What was served.
     */
    void metaDataReady(const SourceMetaData& meta);

    //!< @brief Emitted when new data can be read.
    void readyRead();

    //!< @brief Emitted when the remote stream ended without error.
    void finished();

    /**
     * @brief Emitted when the attempt failed.
     * @param error Classified error.
     */
    void failed(const TransferError& error);
};

/**
 * @brief Creates one source per attempt.
 */
RASTA_MODULE_EXPORT class TransferSourceFactory {
public:
    virtual ~TransferSourceFactory() = default;

    /**
     * @brief Create a source for @p url.
     * @param url Resource URL, used to pick a protocol binding.
     * @param parent Owner of the returned source.
     * @return New source, or nullptr if the scheme is not supported.
     */
    virtual TransferSource* create(const QUrl& url, QObject* parent) = 0;
};

#include "transfersource.moc"
