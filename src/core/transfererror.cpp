module;
#include <QString>

module rasta.core.transfererror;

TransferError TransferError::make(ErrorKind kind, const QString& message, int httpStatus)
{
    TransferError error;
    error.kind = kind;
    error.message = message;
    error.httpStatus = httpStatus;
    return error;
}

bool isRetryable(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::TransientNetwork:
    case ErrorKind::RateLimited:
    case ErrorKind::Timeout:
        return true;
    default:
        return false;
    }
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return QStringLiteral("None");
    case ErrorKind::TransientNetwork: return QStringLiteral("TransientNetwork");
    case ErrorKind::RateLimited: return QStringLiteral("RateLimited");
    case ErrorKind::Timeout: return QStringLiteral("Timeout");
    case ErrorKind::Auth: return QStringLiteral("Auth");
    case ErrorKind::InvalidRequest: return QStringLiteral("InvalidRequest");
    case ErrorKind::Destination: return QStringLiteral("Destination");
    case ErrorKind::SourceExhausted: return QStringLiteral("SourceExhausted");
    case ErrorKind::Cancelled: return QStringLiteral("Cancelled");
    case ErrorKind::Unknown: return QStringLiteral("Unknown");
    }
    return QStringLiteral("Unknown");
}

ErrorKind errorKindFromName(const QString& name)
{
    static const ErrorKind kinds[] = {
        ErrorKind::None, ErrorKind::TransientNetwork, ErrorKind::RateLimited,
        ErrorKind::Timeout, ErrorKind::Auth, ErrorKind::InvalidRequest,
        ErrorKind::Destination, ErrorKind::SourceExhausted, ErrorKind::Cancelled,
        ErrorKind::Unknown
    };
    for (ErrorKind kind : kinds) {
        if (errorKindName(kind).compare(name, Qt::CaseInsensitive) == 0) return kind;
    }
    return ErrorKind::Unknown;
}

ErrorKind classifyHttpStatus(int status)
{
    if (status >= 200 && status < 300) return ErrorKind::None;
    switch (status) {
    case 401:
    case 403:
    case 407:
        return ErrorKind::Auth;
    case 408:
        return ErrorKind::Timeout;
    case 416:
        return ErrorKind::SourceExhausted;
    case 429:
        return ErrorKind::RateLimited;
    default:
        break;
    }
    if (status >= 500 && status < 600) return ErrorKind::TransientNetwork;
    if (status >= 400 && status < 500) return ErrorKind::InvalidRequest;
    return ErrorKind::Unknown;
}

