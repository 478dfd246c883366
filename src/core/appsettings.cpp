#include "appsettings.h"
#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QStringList>


static QString executableName(const QString &baseName) {
#ifdef Q_OS_WIN
    return baseName + ".exe";
#else
    return baseName;
#endif
}

static QString findExecutablePath(const QString &exeName) {
    // 1. tools/ next to the binary
    const QString kAppDir = QCoreApplication::applicationDirPath();
    QString candidate = QDir(kAppDir).filePath("tools/" + exeName);
    if (QFileInfo::exists(candidate)) {
        return QDir::toNativeSeparators(candidate);
    }

    // 2. next to the binary
    candidate = QDir(kAppDir).filePath(exeName);
    if (QFileInfo::exists(candidate)) {
        return QDir::toNativeSeparators(candidate);
    }

    // 3. PATH
    QString path = QStandardPaths::findExecutable(exeName);
    if (!path.isEmpty()) {
        return QDir::toNativeSeparators(path);
    }

    // 4. Bare name, the process launch reports the failure
    return exeName;
}

/**
 * @brief Load a tool path from settings, re-detecting if the stored path no longer exists.
 */
static QString loadToolPath(const QSettings &settings, const QString &key, const QString &exeName) {
    QString stored = settings.value(key).toString();
    if (!stored.isEmpty() && QFileInfo::exists(stored)) {
        return stored;
    }
    return findExecutablePath(exeName);
}

QString logCategoryName(LogCategory category) {
    switch (category) {
    case LogCategory::APP:
        return "APP";
    case LogCategory::TRANSFER:
        return "TRANSFER";
    case LogCategory::MKVTOOLNIX:
        return "MKVTOOLNIX";
    case LogCategory::NETWORK:
        return "NETWORK";
    case LogCategory::DEBUG:
        return "DEBUG";
    }
    return "APP";
}

bool logCategoryFromName(const QString &name, LogCategory *out) {
    static const LogCategory kAll[] = {LogCategory::APP, LogCategory::TRANSFER, LogCategory::MKVTOOLNIX,
                                       LogCategory::NETWORK, LogCategory::DEBUG};
    const QString upper = name.trimmed().toUpper();
    for (LogCategory category : kAll) {
        if (logCategoryName(category) == upper) {
            if (out) *out = category;
            return true;
        }
    }
    return false;
}

AppSettings::AppSettings()
    : m_remoteRoot("/"),
    m_moveLocal(false),
    m_rename(true),
    m_saveOriginalName(true),
    m_saveInfo(false),
    m_deleteRemote(false),
    m_itemConcurrency(5),
    m_useChunks(true),
    m_chunkCount(3),
    m_bufferSize(1024 * 1024),
    m_maxRetries(3),
    m_standardReplacements(true),
    m_subtitleTrackId(-1),
    m_subtitleLanguage("eng"),
    m_subtitleTrackName("SeriesFetch Fixed")
{
    m_mkvmergePath = executableName("mkvmerge");
    m_mkvextractPath = executableName("mkvextract");
    m_enabledLogCategories = {LogCategory::APP, LogCategory::TRANSFER, LogCategory::MKVTOOLNIX, LogCategory::NETWORK};
}

bool AppSettings::parseSwitch(const QVariant &value, bool defaultValue) {
    if (!value.isValid() || value.isNull()) {
        return defaultValue;
    }
    const QString text = value.toString().trimmed().toUpper();
    if (text == "ON" || text == "TRUE" || text == "1" || text == "YES") {
        return true;
    }
    if (text == "OFF" || text == "FALSE" || text == "0" || text == "NO") {
        return false;
    }
    return defaultValue;
}

bool AppSettings::load(const QString &iniPath, QString *errorOut) {
    if (!QFileInfo::exists(iniPath)) {
        if (errorOut) *errorOut = QString("Config file not found: %1").arg(iniPath);
        return false;
    }

    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (errorOut) *errorOut = QString("Config file is not a valid INI file: %1").arg(iniPath);
        return false;
    }

    const QDir configDir = QFileInfo(iniPath).absoluteDir();
    const QString kAppDir = QCoreApplication::applicationDirPath();

    m_remoteUrl = settings.value("remote/url").toString().trimmed();
    m_remoteUser = settings.value("remote/user").toString();
    m_remotePassword = settings.value("remote/password").toString();
    m_remoteRoot = settings.value("remote/root", "/").toString().trimmed();

    m_localRoot = settings.value("paths/localRoot").toString().trimmed();
    if (m_localRoot.isEmpty()) {
        if (errorOut) *errorOut = "paths/localRoot is not set";
        return false;
    }
    m_localTemp = settings.value("paths/localTemp", QDir(kAppDir).filePath("temp")).toString().trimmed();
    m_catalogPath = configDir.absoluteFilePath(settings.value("paths/catalog", "serieslist.txt").toString().trimmed());
    const QString groups = settings.value("paths/groups").toString().trimmed();
    m_groupsPath = groups.isEmpty() ? QString() : configDir.absoluteFilePath(groups);
    m_mkvmergePath = loadToolPath(settings, "paths/mkvmerge", executableName("mkvmerge"));
    m_mkvextractPath = loadToolPath(settings, "paths/mkvextract", executableName("mkvextract"));

    m_moveLocal = parseSwitch(settings.value("general/moveLocal"), false);
    m_rename = parseSwitch(settings.value("general/rename"), true);
    m_saveOriginalName = parseSwitch(settings.value("general/saveOriginalName"), true);
    m_saveInfo = parseSwitch(settings.value("general/saveInfo"), false);
    m_deleteRemote = parseSwitch(settings.value("general/deleteRemote"), false);
    m_itemConcurrency = qMax(1, settings.value("general/itemConcurrency", 5).toInt());

    m_useChunks = parseSwitch(settings.value("transfer/useChunks"), true);
    m_chunkCount = qMax(1, settings.value("transfer/chunks", 3).toInt());
    m_bufferSize = qMax<qint64>(4096, settings.value("transfer/bufferSize", 1024 * 1024).toLongLong());
    m_maxRetries = qMax(0, settings.value("transfer/maxRetries", 3).toInt());

    m_standardReplacements = parseSwitch(settings.value("subtitles/standardReplacements"), true);
    m_subtitleTrackId = settings.value("subtitles/trackId", -1).toInt();
    m_subtitleLanguage = settings.value("subtitles/language", "eng").toString().trimmed();
    m_subtitleTrackName = settings.value("subtitles/trackName", "SeriesFetch Fixed").toString().trimmed();

    m_logFile = settings.value("logging/file", QDir(kAppDir).filePath("seriesfetch.log")).toString().trimmed();

    // QSettings splits comma separated values into a string list
    const QStringList categoryNames = settings.value("logging/enabledCategories").toStringList();
    if (!categoryNames.isEmpty()) {
        m_enabledLogCategories.clear();
        for (const QString &name : categoryNames) {
            LogCategory category;
            if (logCategoryFromName(name, &category)) {
                m_enabledLogCategories.insert(category);
            }
        }
    }
    m_enabledLogCategories.insert(LogCategory::APP);

    return true;
}

QString AppSettings::remoteUrl() const { return m_remoteUrl; }
void AppSettings::setRemoteUrl(const QString &url) { m_remoteUrl = url; }
QString AppSettings::remoteUser() const { return m_remoteUser; }
void AppSettings::setRemoteUser(const QString &user) { m_remoteUser = user; }
QString AppSettings::remotePassword() const { return m_remotePassword; }
void AppSettings::setRemotePassword(const QString &password) { m_remotePassword = password; }
QString AppSettings::remoteRoot() const { return m_remoteRoot; }
void AppSettings::setRemoteRoot(const QString &path) { m_remoteRoot = path; }
QString AppSettings::localRoot() const { return m_localRoot; }
void AppSettings::setLocalRoot(const QString &path) { m_localRoot = path; }
QString AppSettings::localTemp() const { return m_localTemp; }
void AppSettings::setLocalTemp(const QString &path) { m_localTemp = path; }
QString AppSettings::catalogPath() const { return m_catalogPath; }
void AppSettings::setCatalogPath(const QString &path) { m_catalogPath = path; }
QString AppSettings::groupsPath() const { return m_groupsPath; }
void AppSettings::setGroupsPath(const QString &path) { m_groupsPath = path; }
QString AppSettings::mkvmergePath() const { return m_mkvmergePath; }
void AppSettings::setMkvmergePath(const QString &path) { m_mkvmergePath = path; }
QString AppSettings::mkvextractPath() const { return m_mkvextractPath; }
void AppSettings::setMkvextractPath(const QString &path) { m_mkvextractPath = path; }
bool AppSettings::moveLocal() const { return m_moveLocal; }
void AppSettings::setMoveLocal(bool enabled) { m_moveLocal = enabled; }
bool AppSettings::rename() const { return m_rename; }
void AppSettings::setRename(bool enabled) { m_rename = enabled; }
bool AppSettings::saveOriginalName() const { return m_saveOriginalName; }
void AppSettings::setSaveOriginalName(bool enabled) { m_saveOriginalName = enabled; }
bool AppSettings::saveInfo() const { return m_saveInfo; }
void AppSettings::setSaveInfo(bool enabled) { m_saveInfo = enabled; }
bool AppSettings::deleteRemote() const { return m_deleteRemote; }
void AppSettings::setDeleteRemote(bool enabled) { m_deleteRemote = enabled; }
int AppSettings::itemConcurrency() const { return m_itemConcurrency; }
void AppSettings::setItemConcurrency(int count) { m_itemConcurrency = qMax(1, count); }
bool AppSettings::useChunks() const { return m_useChunks; }
void AppSettings::setUseChunks(bool enabled) { m_useChunks = enabled; }
int AppSettings::chunkCount() const { return m_chunkCount; }
void AppSettings::setChunkCount(int count) { m_chunkCount = qMax(1, count); }
qint64 AppSettings::bufferSize() const { return m_bufferSize; }
void AppSettings::setBufferSize(qint64 bytes) { m_bufferSize = qMax<qint64>(1, bytes); }
int AppSettings::maxRetries() const { return m_maxRetries; }
void AppSettings::setMaxRetries(int retries) { m_maxRetries = qMax(0, retries); }
bool AppSettings::standardReplacements() const { return m_standardReplacements; }
void AppSettings::setStandardReplacements(bool enabled) { m_standardReplacements = enabled; }
int AppSettings::subtitleTrackId() const { return m_subtitleTrackId; }
void AppSettings::setSubtitleTrackId(int id) { m_subtitleTrackId = id; }
QString AppSettings::subtitleLanguage() const { return m_subtitleLanguage; }
void AppSettings::setSubtitleLanguage(const QString &language) { m_subtitleLanguage = language; }
QString AppSettings::subtitleTrackName() const { return m_subtitleTrackName; }
void AppSettings::setSubtitleTrackName(const QString &name) { m_subtitleTrackName = name; }
QString AppSettings::logFile() const { return m_logFile; }
void AppSettings::setLogFile(const QString &path) { m_logFile = path; }
QSet<LogCategory> AppSettings::enabledLogCategories() const { return m_enabledLogCategories; }
void AppSettings::setEnabledLogCategories(const QSet<LogCategory> &categories) { m_enabledLogCategories = categories; }
