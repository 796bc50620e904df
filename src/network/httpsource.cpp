module;
#include <QDebug>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSslError>

module rasta.network.httpsource;

import rasta.utils.download_utils;

namespace utils = rasta::utils;

ErrorKind classifyNetworkError(QNetworkReply::NetworkError error, int httpStatus)
{
    if (error == QNetworkReply::NoError) return ErrorKind::None;
    if (error == QNetworkReply::OperationCanceledError) return ErrorKind::Cancelled;
    if (httpStatus >= 400) return classifyHttpStatus(httpStatus);

    switch (error) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ProxyTimeoutError:
        return ErrorKind::Timeout;
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ContentReSendError:
    case QNetworkReply::InternalServerError:
    case QNetworkReply::ServiceUnavailableError:
    case QNetworkReply::UnknownServerError:
        return ErrorKind::TransientNetwork;
    case QNetworkReply::AuthenticationRequiredError:
    case QNetworkReply::ContentAccessDenied:
    case QNetworkReply::ProxyAuthenticationRequiredError:
        return ErrorKind::Auth;
    case QNetworkReply::ContentNotFoundError:
    case QNetworkReply::ContentGoneError:
    case QNetworkReply::ContentOperationNotPermittedError:
    case QNetworkReply::ContentConflictError:
    case QNetworkReply::ProtocolUnknownError:
    case QNetworkReply::ProtocolInvalidOperationError:
    case QNetworkReply::TooManyRedirectsError:
    case QNetworkReply::InsecureRedirectError:
        return ErrorKind::InvalidRequest;
    default:
        return ErrorKind::Unknown;
    }
}

QNetworkProxy proxyFromUrl(const QUrl& url)
{
    if (url.isEmpty() || !url.isValid() || url.host().isEmpty()) {
        return QNetworkProxy(QNetworkProxy::NoProxy);
    }
    const bool socks = url.scheme().startsWith(QStringLiteral("socks"), Qt::CaseInsensitive);
    const auto type = socks ? QNetworkProxy::Socks5Proxy : QNetworkProxy::HttpProxy;
    const int port = url.port(socks ? 1080 : 8080);
    return QNetworkProxy(type, url.host(), static_cast<quint16>(port), url.userName(), url.password());
}

HttpTransferSource::HttpTransferSource(QNetworkAccessManager* manager, QObject* parent)
    : TransferSource(parent),
    m_manager(manager)
{
}

HttpTransferSource::~HttpTransferSource()
{
    m_done = true;
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
    }
}

void HttpTransferSource::applyNetworkOptions(QNetworkRequest& req, const SourceRequest& request)
{
    if (!request.cookieHeader.isEmpty()) {
        req.setRawHeader("Cookie", request.cookieHeader.toUtf8());
    }
    for (const QString& headerLine : request.headers) {
        const int sep = headerLine.indexOf(':');
        if (sep <= 0) continue;
        const QString key = headerLine.left(sep).trimmed();
        const QString value = headerLine.mid(sep + 1).trimmed();
        if (key.isEmpty()) continue;
        const QString lower = key.toLower();
        if (lower == "range" || lower == "if-range") continue;
        req.setRawHeader(key.toUtf8(), value.toUtf8());
    }
}

void HttpTransferSource::open(const SourceRequest& request)
{
    QNetworkAccessManager* manager = m_manager.data();
    if (!request.proxy.isEmpty()) {
        m_ownManager = new QNetworkAccessManager(this);
        m_ownManager->setProxy(proxyFromUrl(request.proxy));
        manager = m_ownManager;
    }
    if (!manager) {
        fail(TransferError::make(ErrorKind::Unknown, QStringLiteral("No network manager")));
        return;
    }
    if (!request.url.isValid() || request.url.host().isEmpty()) {
        fail(TransferError::make(ErrorKind::InvalidRequest,
                                 QStringLiteral("Invalid URL: %1").arg(request.url.toString())));
        return;
    }

    QNetworkRequest req(request.url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("User-Agent", request.userAgent.isEmpty() ? QByteArray("rasta/1.0")
                                                               : request.userAgent.toUtf8());
    m_offset = qMax<qint64>(0, request.offset);
    if (m_offset > 0) {
        req.setRawHeader("Range", QByteArray("bytes=") + QByteArray::number(m_offset) + "-");
        if (!request.validator.isEmpty()) {
            req.setRawHeader("If-Range", request.validator.toUtf8());
        }
    }
    applyNetworkOptions(req, request);

    QNetworkReply* reply = manager->get(req);
    if (request.readBufferSize > 0) reply->setReadBufferSize(request.readBufferSize);
    m_reply = reply;

    connect(reply, &QNetworkReply::metaDataChanged, this, &HttpTransferSource::onMetaDataChanged);
    connect(reply, &QNetworkReply::readyRead, this, [this] {
        if (m_done || !m_metaSent) return;
        emit readyRead();
    });
    connect(reply, &QNetworkReply::finished, this, &HttpTransferSource::onReplyFinished);
#if QT_CONFIG(ssl)
    connect(reply, &QNetworkReply::sslErrors, this, [](const QList<QSslError>& errors) {
        qWarning() << "GET SSL errors:" << errors;
    });
#endif
}

void HttpTransferSource::onMetaDataChanged()
{
    if (m_done || m_metaSent || !m_reply) return;
    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 0 || (status >= 300 && status < 400)) return;

    const ErrorKind kind = classifyHttpStatus(status);
    if (kind != ErrorKind::None) {
        TransferError error = TransferError::make(
            kind,
            QStringLiteral("HTTP %1 %2").arg(status).arg(
                m_reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString()),
            status);
        error.retryAfterMs = utils::parseRetryAfter(m_reply->rawHeader("Retry-After"));
        fail(error);
        return;
    }

    SourceMetaData meta;
    meta.httpStatus = status;
    if (status == 206) {
        const utils::ContentRange range = utils::parseContentRange(m_reply->rawHeader("Content-Range"));
        if (!range.valid || range.first != m_offset) {
            fail(TransferError::make(ErrorKind::SourceExhausted,
                                     QStringLiteral("Unexpected Content-Range: %1")
                                         .arg(QString::fromLatin1(m_reply->rawHeader("Content-Range"))),
                                     status));
            return;
        }
        meta.rangeAccepted = true;
        meta.totalBytes = range.total;
    } else {
        meta.rangeAccepted = m_offset == 0;
        const QVariant length = m_reply->header(QNetworkRequest::ContentLengthHeader);
        meta.totalBytes = length.isValid() ? length.toLongLong() : -1;
    }

    const QByteArray etag = m_reply->rawHeader("ETag");
    const QByteArray lastMod = m_reply->rawHeader("Last-Modified");
    if (!etag.isEmpty()) {
        meta.fingerprint = QString::fromUtf8(etag);
    } else if (!lastMod.isEmpty()) {
        meta.fingerprint = QString::fromUtf8(lastMod);
    }

    m_metaSent = true;
    emit metaDataReady(meta);
    if (m_reply && m_reply->bytesAvailable() > 0) emit readyRead();
}

void HttpTransferSource::onReplyFinished()
{
    if (m_done || !m_reply) return;
    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QNetworkReply::NetworkError err = m_reply->error();
    if (err != QNetworkReply::NoError) {
        TransferError error = TransferError::make(classifyNetworkError(err, status),
                                                  m_reply->errorString(), status);
        error.retryAfterMs = utils::parseRetryAfter(m_reply->rawHeader("Retry-After"));
        fail(error);
        return;
    }
    if (!m_metaSent) {
        // Replies without usable headers (e.g. non-HTTP schemes) still publish metadata.
        onMetaDataChanged();
        if (m_done) return;
        if (!m_metaSent) {
            m_metaSent = true;
            SourceMetaData meta;
            meta.rangeAccepted = m_offset == 0;
            emit metaDataReady(meta);
        }
    }
    m_finished = true;
    emit finished();
}

void HttpTransferSource::fail(const TransferError& error)
{
    if (m_done) return;
    m_done = true;
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }
    emit failed(error);
}

qint64 HttpTransferSource::bytesAvailable() const
{
    return m_reply ? m_reply->bytesAvailable() : 0;
}

QByteArray HttpTransferSource::read(qint64 maxSize)
{
    if (!m_reply || maxSize <= 0) return QByteArray();
    return m_reply->read(maxSize);
}

bool HttpTransferSource::atEnd() const
{
    return m_finished && bytesAvailable() == 0;
}

void HttpTransferSource::abort()
{
    if (m_done) return;
    m_done = true;
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }
}

TransferSource* HttpSourceFactory::create(const QUrl& url, QObject* parent)
{
    const QString scheme = url.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")) return nullptr;
    return new HttpTransferSource(&m_manager, parent);
}

void HttpSourceFactory::setDefaultProxy(const QUrl& proxy)
{
    m_manager.setProxy(proxyFromUrl(proxy));
}
