/*!
 * @file        transfererror.cppm
 * @brief       Error taxonomy shared by sources, transfer units and the retry policy.
 * @details     Every low-level failure (HTTP status, socket error, file error)
 *              is classified into an ErrorKind before it reaches the retry
 *              policy. The kind decides whether a failed attempt is retried,
 *              restarted from zero or reported as final.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rasta.core.transfererror;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Classified failure category.
 *
 * TransientNetwork, RateLimited and Timeout are retryable.
 * Auth, InvalidRequest, Destination and Unknown are final.
 * SourceExhausted means the stored offset or fingerprint no longer matches
 * the remote resource and the transfer must restart from zero.
 * Cancelled is never reported as a failure.
 */
RASTA_MODULE_EXPORT enum class ErrorKind {
    None,               //!< No error.
    TransientNetwork,   //!< Connection reset, DNS hiccup, 5xx.
    RateLimited,        //!< Server asked to slow down (429).
    Timeout,            //!< Request or stall timeout.
    Auth,               //!< 401/403/407 or credential failure.
    InvalidRequest,     //!< Malformed URL or other 4xx.
    Destination,        //!< Local write, rename or open failure.
    SourceExhausted,    //!< Range/fingerprint mismatch, restart from zero.
    Cancelled,          //!< Cooperative cancellation.
    Unknown             //!< Anything not classified above.
};

/**
 * @brief Classified error carried by events and attempt results.
 */
RASTA_MODULE_EXPORT struct TransferError {
    ErrorKind kind = ErrorKind::None;   //!< Error category.
    QString message;                    //!< Human-readable detail.
    int httpStatus = 0;                 //!< HTTP status if any, else 0.
    qint64 retryAfterMs = -1;           //!< Server Retry-After hint, -1 if none.

    //!< @brief True when this value carries an error.
    bool isError() const { return kind != ErrorKind::None; }

    //!< @brief Build an error of the given kind.
    static TransferError make(ErrorKind kind, const QString& message, int httpStatus = 0);
};

/**
 * @brief Whether a failed attempt of this kind may be retried.
 * @param kind Error kind.
 * @return true for TransientNetwork, RateLimited and Timeout.
 */
RASTA_MODULE_EXPORT bool isRetryable(ErrorKind kind);

/**
 * @brief Stable name for logs, events and persisted state.
 * @param kind Error kind.
 * @return Name such as "TransientNetwork".
 */
RASTA_MODULE_EXPORT QString errorKindName(ErrorKind kind);

/**
 * @brief Inverse of errorKindName().
 * @param name Kind name.
 * @return Matching kind, or ErrorKind::Unknown for unrecognized names.
 */
RASTA_MODULE_EXPORT ErrorKind errorKindFromName(const QString& name);

/**
 * @brief Classify an HTTP status code.
 * @param status HTTP status.
 * @return ErrorKind::None for 2xx, otherwise the mapped kind.
 */
RASTA_MODULE_EXPORT ErrorKind classifyHttpStatus(int status);
