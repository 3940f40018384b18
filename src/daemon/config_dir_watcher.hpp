#pragma once

#include <QFileSystemWatcher>
#include <QObject>
#include <QString>

#include "common/metatypes.hpp"
#include "common/models.hpp"

namespace nettrack {

// Watches a configuration directory and the files directly inside it.
// Emits one config-directory-change event per detected modification.
class ConfigDirWatcher : public QObject
{
    Q_OBJECT
public:
    explicit ConfigDirWatcher(const QString &directory, QObject *parent = nullptr);

    // False if the directory does not exist or cannot be watched.
    bool start();

    const QString &directory() const
    {
        return m_directory;
    }

    QStringList watchedPaths() const;

signals:
    void changeDetected(const nettrack::ChangeEvent &event);

private slots:
    void handlePathChanged(const QString &path);

private:
    void refreshWatchedFiles();

    QString m_directory;
    QFileSystemWatcher m_watcher;
};

} // namespace nettrack
