/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "config/configuration_provider.h"
#include "config/configuration_keys.h"
#include <QString>
#include <KSharedConfig>
#include <KConfigGroup>
#include <QFileSystemWatcher>

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief KConfig-backed configuration source
 *
 * Reads the [Ledger] group of ledgersignerrc and reloads it whenever the
 * file changes on disk, emitting configurationChanged() after each reload.
 */
class DaemonConfiguration : public Shared::ConfigurationProvider
{
    Q_OBJECT

public:
    /**
     * @brief Opens configuration
     * @param configName File name under the generic config location,
     *        or an absolute path
     * @param parent Parent QObject
     */
    explicit DaemonConfiguration(const QString &configName = QString::fromLatin1(Shared::ConfigKeys::CONFIG_FILE),
                                 QObject *parent = nullptr);

    void reload() override;

    Shared::DerivationScheme derivationScheme() const override;
    int liveAccountLimit() const override;
    int disconnectGraceWindowMs() const override;

    /**
     * @brief Path of the watched configuration file
     */
    QString configPath() const;

private Q_SLOTS:
    void onConfigFileChanged(const QString &path);

private:
    KSharedConfig::Ptr m_config;
    KConfigGroup m_configGroup;
    QFileSystemWatcher *m_fileWatcher;
    QString m_configPath;

    template<typename T>
    T readConfigEntry(const char *key, const T &defaultValue) const {
        return m_configGroup.readEntry(key, defaultValue);
    }
};

} // namespace Daemon
} // namespace LedgerSigner
