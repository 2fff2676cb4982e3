/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "daemon_configuration.h"
#include "../logging_categories.h"

#include <QDir>
#include <QFile>
#include <QStandardPaths>

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

namespace {
// Accepted range for DisconnectGraceWindow
constexpr int MIN_GRACE_WINDOW_MS = 500;
constexpr int MAX_GRACE_WINDOW_MS = 60000;
} // namespace

DaemonConfiguration::DaemonConfiguration(const QString &configName, QObject *parent)
    : ConfigurationProvider(parent)
    , m_config(KSharedConfig::openConfig(configName, KConfig::SimpleConfig))
    , m_configGroup(m_config->group(QString::fromLatin1(ConfigKeys::LEDGER_GROUP)))
    , m_fileWatcher(new QFileSystemWatcher(this))
{
    m_configPath = QDir::isAbsolutePath(configName)
        ? configName
        : QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QLatin1Char('/') + configName;

    qCDebug(DaemonConfigurationLog) << "Watching config file:" << m_configPath;

    if (QFile::exists(m_configPath)) {
        m_fileWatcher->addPath(m_configPath);
    } else {
        qCDebug(DaemonConfigurationLog) << "Config file does not exist yet, using defaults";
    }

    connect(m_fileWatcher, &QFileSystemWatcher::fileChanged,
            this, &DaemonConfiguration::onConfigFileChanged);
}

void DaemonConfiguration::reload()
{
    m_config->reparseConfiguration();
    m_configGroup = m_config->group(QString::fromLatin1(ConfigKeys::LEDGER_GROUP));

    qCDebug(DaemonConfigurationLog) << "Reloaded, derivation:" << derivationConfig()
                                    << "grace window:" << disconnectGraceWindowMs() << "ms";

    Q_EMIT configurationChanged();
}

DerivationScheme DaemonConfiguration::derivationScheme() const
{
    const QString stored = readConfigEntry(ConfigKeys::DERIVATION,
                                           QString::fromLatin1(ConfigKeys::DEFAULT_DERIVATION));
    bool ok = false;
    const DerivationScheme scheme = derivationSchemeFromString(stored, &ok);
    if (!ok) {
        qCWarning(DaemonConfigurationLog) << "Unknown derivation scheme" << stored << "- falling back to live";
    }
    return scheme;
}

int DaemonConfiguration::liveAccountLimit() const
{
    const int limit = readConfigEntry(ConfigKeys::LIVE_ACCOUNT_LIMIT, ConfigKeys::DEFAULT_LIVE_ACCOUNT_LIMIT);
    return qMax(0, limit);
}

int DaemonConfiguration::disconnectGraceWindowMs() const
{
    const int window = readConfigEntry(ConfigKeys::DISCONNECT_GRACE_WINDOW,
                                       ConfigKeys::DEFAULT_DISCONNECT_GRACE_WINDOW_MS);
    return qBound(MIN_GRACE_WINDOW_MS, window, MAX_GRACE_WINDOW_MS);
}

QString DaemonConfiguration::configPath() const
{
    return m_configPath;
}

void DaemonConfiguration::onConfigFileChanged(const QString &path)
{
    qCDebug(DaemonConfigurationLog) << "Config file changed:" << path;

    reload();

    // Editors replace the file on save, which drops it from the watch list
    if (!m_fileWatcher->files().contains(path) && QFile::exists(path)) {
        m_fileWatcher->addPath(path);
    }
}

} // namespace Daemon
} // namespace LedgerSigner
