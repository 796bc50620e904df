/*!
 * @file        engineconfig.cppm
 * @brief       Engine configuration values and their persistence.
 * @details     EngineConfig gathers every tunable of the download engine with
 *              its default. Values are read from and written to QSettings,
 *              either the application's native settings or an INI file, and
 *              are clamped into valid ranges after every load.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QSettings>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module rasta.core.engineconfig;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Tunables of the download engine.
 */
RASTA_MODULE_EXPORT struct EngineConfig {
    int concurrencyLimit = 3;               //!< Max active transfers.
    qint64 globalSpeedLimit = 0;            //!< Aggregate bytes/sec, 0 = unlimited.
    qint64 perTaskSpeedLimit = 0;           //!< Default per-task bytes/sec, 0 = unlimited.
    int maxRetries = 3;                     //!< Retries after the first attempt.
    qint64 retryBaseDelayMs = 1000;         //!< First retry delay.
    qint64 retryMaxDelayMs = 30000;         //!< Retry delay cap.
    qint64 chunkSize = 8192;                //!< Bytes per write.
    QString checkpointDir;                  //!< Checkpoint directory.
    int attemptTimeoutMs = 30000;           //!< Stall timeout per attempt, 0 disables.
    int progressIntervalMs = 250;           //!< Progress event spacing per task.
    QString userAgent = QStringLiteral("rasta/1.0");  //!< User-Agent header.
    QUrl defaultProxy;                      //!< Proxy used when a request has none.
    QString sessionFile;                    //!< Queue persistence file, empty disables.
    QString logLevel = QStringLiteral("info");  //!< Minimum log level.
    QString logFile;                        //!< Log file, empty for stderr only.

    //!< @brief Smallest accepted chunk size.
    static constexpr qint64 kMinChunkSize = 1024;

    //!< @brief Largest accepted chunk size.
    static constexpr qint64 kMaxChunkSize = 16 * 1024 * 1024;

    //!< @brief Default checkpoint directory under the application data location.
    static QString defaultCheckpointDir();

    //!< @brief Bring every value into its valid range.
    void clamp();

    /**
     * @brief Read values from @p settings; missing keys keep their defaults.
     * @param settings Source settings.
     * @return Clamped configuration.
     */
    static EngineConfig load(QSettings& settings);

    /**
     * @brief Read from an INI file, or from native settings when @p path is empty.
     * @param path INI file path.
     * @return Clamped configuration.
     */
    static EngineConfig loadFile(const QString& path);

    /**
     * @brief Write values to @p settings.
     * @param settings Target settings.
     */
    void save(QSettings& settings) const;

    /**
     * @brief Write to an INI file, or to native settings when @p path is empty.
     * @param path INI file path.
     * @return true if the settings were written without error.
     */
    bool saveFile(const QString& path) const;
};
