/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for download paths, URLs and HTTP headers.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the engine components. These utilities handle path
 *              normalization, partial-file naming, filename inference and the
 *              parsing of the few HTTP header values the engine relies on
 *              (Content-Range, Retry-After, Content-Disposition).
 *
 *              All helpers are side-effect free except where noted and are safe
 *              to call from any thread.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QByteArray>
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rasta.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

RASTA_MODULE_EXPORT namespace rasta::utils {

/**
 * @brief Parsed value of a `Content-Range: bytes a-b/total` header.
 */
struct ContentRange {
    qint64 first = -1;      //!< First byte position, -1 if absent.
    qint64 last = -1;       //!< Last byte position, -1 if absent.
    qint64 total = -1;      //!< Complete length, -1 if unknown ("*").
    bool valid = false;     //!< Whether the header could be parsed.
};

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Returns the key used for per-path mutual exclusion.
 *
 * The key is the absolute, cleaned path so that two spellings of the same
 * destination map to the same lock.
 *
 * @param path Destination path.
 * @return Canonical comparison key.
 */
QString pathKey(const QString& path);

/**
 * @brief Returns the temporary file a transfer writes into before finalization.
 * @param filePath Final destination path.
 * @return Partial file path (`<path>.part`).
 */
QString partialFilePath(const QString& filePath);

/**
 * @brief Size of the partial file on disk.
 * @param filePath Final destination path.
 * @return Size of `<path>.part`, or 0 when it does not exist.
 */
qint64 partialFileSize(const QString& filePath);

/**
 * @brief Decodes a URL query string value.
 *
 * Handles standard percent-decoding and converts '+' characters into spaces,
 * as commonly used in application/x-www-form-urlencoded data.
 *
 * @param value Encoded query value.
 * @return Decoded string.
 */
QString decodeQueryValue(const QString& value);

/**
 * @brief Extracts a filename from a Content-Disposition header value.
 *
 * @param value Raw Content-Disposition header value.
 * @return Extracted filename, or an empty string if none could be determined.
 */
QString filenameFromDisposition(const QString& value);

/**
 * @brief Infers a filename from a URL.
 *
 * Looks at signed-URL disposition parameters and a `filename` query item
 * before falling back to the last path component.
 *
 * @param url Source URL.
 * @return Inferred filename string.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Removes characters that are not allowed in file names.
 * @param name Candidate file name.
 * @return Sanitized name, never containing path separators.
 */
QString sanitizeFileName(const QString& name);

/**
 * @brief Resolves the final destination file for a request.
 *
 * When @p destination is an existing directory (or ends with a separator),
 * the file name is taken from @p suggestedName, else inferred from @p url.
 * Otherwise @p destination is returned normalized.
 *
 * @param destination Requested destination path or directory.
 * @param suggestedName Extractor-provided file name or subpath, may be empty.
 * @param url Source URL.
 * @return Destination file path, or an empty string if no name can be derived.
 */
QString resolveDestination(const QString& destination, const QString& suggestedName, const QUrl& url);

/**
 * @brief Parses a Content-Range response header.
 * @param value Raw header value.
 * @return Parsed range; `valid` is false on malformed input.
 */
ContentRange parseContentRange(const QByteArray& value);

/**
 * @brief Parses a Retry-After header (delta-seconds or HTTP-date).
 * @param value Raw header value.
 * @return Delay in milliseconds, or -1 when absent or malformed.
 */
qint64 parseRetryAfter(const QByteArray& value);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

} // namespace rasta::utils
