#include "daemon/config_dir_watcher.hpp"

#include <chrono>

#include <QDir>
#include <QFileInfo>

#include "common/logging.hpp"

namespace nettrack {

ConfigDirWatcher::ConfigDirWatcher(const QString &directory, QObject *parent)
    : QObject(parent)
    , m_directory(QDir::cleanPath(directory))
{
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &ConfigDirWatcher::handlePathChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &ConfigDirWatcher::handlePathChanged);
}

bool ConfigDirWatcher::start()
{
    if (!QFileInfo(m_directory).isDir()) {
        NTLOG_INFO(QStringLiteral("ConfigDirWatcher"),
                   QStringLiteral("start"),
                   QStringLiteral("config_dir_missing"),
                   QStringLiteral("not_a_directory"),
                   m_directory,
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return false;
    }
    if (!m_watcher.directories().contains(m_directory)
        && !m_watcher.addPath(m_directory)) {
        return false;
    }
    refreshWatchedFiles();
    return true;
}

QStringList ConfigDirWatcher::watchedPaths() const
{
    return m_watcher.directories() + m_watcher.files();
}

void ConfigDirWatcher::refreshWatchedFiles()
{
    const QStringList current = m_watcher.files();
    QStringList wanted;
    const QFileInfoList entries =
        QDir(m_directory).entryInfoList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QFileInfo &entry : entries) {
        wanted.push_back(entry.absoluteFilePath());
    }

    for (const QString &path : current) {
        if (!wanted.contains(path)) {
            m_watcher.removePath(path);
        }
    }
    for (const QString &path : wanted) {
        if (!current.contains(path)) {
            m_watcher.addPath(path);
        }
    }
}

void ConfigDirWatcher::handlePathChanged(const QString &path)
{
    refreshWatchedFiles();
    // Saving by rename drops the watch on the replaced file.
    if (QFileInfo::exists(path) && !m_watcher.files().contains(path)
        && path != m_directory) {
        m_watcher.addPath(path);
    }

    ChangeEvent event;
    event.source = ChangeSource::ConfigDirectory;
    event.timestamp = std::chrono::system_clock::now();
    event.detail = path.toStdString();

    NTLOG_DEBUG(QStringLiteral("ConfigDirWatcher"),
                QStringLiteral("handlePathChanged"),
                QStringLiteral("config_changed"),
                QStringLiteral("filesystem_event"),
                path,
                logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    emit changeDetected(event);
}

} // namespace nettrack
