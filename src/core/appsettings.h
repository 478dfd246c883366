#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QVariant>
#include <QSettings>
#include <QSet>
#include <QString>


enum class LogCategory {
    APP,
    TRANSFER,
    MKVTOOLNIX,
    NETWORK,
    DEBUG
};

QString logCategoryName(LogCategory category);
bool logCategoryFromName(const QString &name, LogCategory *out);

/**
 * @brief Typed run configuration.
 *
 * Raw values (ON/OFF switches, numbers as strings) are parsed once in load();
 * the pipeline only ever reads the typed getters.
 */
class AppSettings
{
public:
    AppSettings();

    bool load(const QString &iniPath, QString *errorOut = nullptr);

    static bool parseSwitch(const QVariant &value, bool defaultValue);

    QString remoteUrl() const;
    void setRemoteUrl(const QString &url);
    QString remoteUser() const;
    void setRemoteUser(const QString &user);
    QString remotePassword() const;
    void setRemotePassword(const QString &password);
    QString remoteRoot() const;
    void setRemoteRoot(const QString &path);

    QString localRoot() const;
    void setLocalRoot(const QString &path);
    QString localTemp() const;
    void setLocalTemp(const QString &path);
    QString catalogPath() const;
    void setCatalogPath(const QString &path);
    QString groupsPath() const;
    void setGroupsPath(const QString &path);
    QString mkvmergePath() const;
    void setMkvmergePath(const QString &path);
    QString mkvextractPath() const;
    void setMkvextractPath(const QString &path);

    bool moveLocal() const;
    void setMoveLocal(bool enabled);
    bool rename() const;
    void setRename(bool enabled);
    bool saveOriginalName() const;
    void setSaveOriginalName(bool enabled);
    bool saveInfo() const;
    void setSaveInfo(bool enabled);
    bool deleteRemote() const;
    void setDeleteRemote(bool enabled);
    int itemConcurrency() const;
    void setItemConcurrency(int count);

    bool useChunks() const;
    void setUseChunks(bool enabled);
    int chunkCount() const;
    void setChunkCount(int count);
    qint64 bufferSize() const;
    void setBufferSize(qint64 bytes);
    int maxRetries() const;
    void setMaxRetries(int retries);

    bool standardReplacements() const;
    void setStandardReplacements(bool enabled);
    int subtitleTrackId() const;
    void setSubtitleTrackId(int id);
    QString subtitleLanguage() const;
    void setSubtitleLanguage(const QString &language);
    QString subtitleTrackName() const;
    void setSubtitleTrackName(const QString &name);

    QString logFile() const;
    void setLogFile(const QString &path);
    QSet<LogCategory> enabledLogCategories() const;
    void setEnabledLogCategories(const QSet<LogCategory> &categories);

private:
    QString m_remoteUrl;
    QString m_remoteUser;
    QString m_remotePassword;
    QString m_remoteRoot;
    QString m_localRoot;
    QString m_localTemp;
    QString m_catalogPath;
    QString m_groupsPath;
    QString m_mkvmergePath;
    QString m_mkvextractPath;
    bool m_moveLocal;
    bool m_rename;
    bool m_saveOriginalName;
    bool m_saveInfo;
    bool m_deleteRemote;
    int m_itemConcurrency;
    bool m_useChunks;
    int m_chunkCount;
    qint64 m_bufferSize;
    int m_maxRetries;
    bool m_standardReplacements;
    int m_subtitleTrackId;
    QString m_subtitleLanguage;
    QString m_subtitleTrackName;
    QString m_logFile;
    QSet<LogCategory> m_enabledLogCategories;
};

#endif // APPSETTINGS_H
