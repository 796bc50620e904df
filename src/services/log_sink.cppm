/*!
 * @file        log_sink.cppm
 * @brief       Process-wide sink for Qt log messages.
 * @details     LogSink installs a Qt message handler that filters messages by a
 *              minimum level, prefixes them with a timestamp and the level name,
 *              writes them to stderr and, if configured, appends them to a log
 *              file. The last lines are also kept in memory so a front-end can
 *              show them without reading the file back.
 *
 *              The sink is shared by the whole process and all members are
 *              thread-safe.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rasta.services.log_sink;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Filtering, timestamping message handler with an in-memory ring.
 */
RASTA_MODULE_EXPORT class LogSink {
public:
    //!< @brief Lines kept in memory.
    static constexpr int kMaxLines = 2000;

    /**
     * @brief Install the handler.
     * @param minimumLevel Messages below this level are dropped.
     * @param filePath Log file to append to, empty for none.
     * @return false if the log file could not be opened (the handler is installed anyway).
     */
    static bool install(QtMsgType minimumLevel = QtInfoMsg, const QString& filePath = QString());

    //!< @brief Restore the handler that was active before install().
    static void uninstall();

    /**
     * @brief Change the minimum level.
     * @param level Lowest level that is still recorded.
     */
    static void setMinimumLevel(QtMsgType level);

    static QtMsgType minimumLevel();

    /**
     * @brief Switch the log file.
     * @param path File to append to, empty to disable file output.
     * @return false if the file could not be opened.
     */
    static bool setLogFile(const QString& path);

    //!< @brief Write to stderr as well (on by default).
    static void setEchoToStderr(bool enabled);

    /**
     * @brief Map a level name ("debug", "info", "warning", "critical").
     * @param name Level name, case-insensitive.
     * @return Matching level, QtInfoMsg for unknown names.
     */
    static QtMsgType levelFromName(const QString& name);

    /**
     * @brief Rank of a level, debug lowest.
     * @param type Qt message type.
     * @return 0 for debug up to 4 for fatal.
     */
    static int severity(QtMsgType type);

    /**
     * @brief Format one line.
     * @param type Qt message type.
     * @param message Message text.
     * @param when Timestamp.
     * @return "[yyyy-MM-dd HH:mm:ss.zzz] LEVEL message".
     */
    static QString formatLine(QtMsgType type, const QString& message, const QDateTime& when);

    //!< @brief Copy of the in-memory lines, oldest first.
    static QStringList lines();

    //!< @brief Number of lines in memory.
    static int lineCount();

    //!< @brief Drop the in-memory lines (file and stderr are not affected).
    static void clear();
};
