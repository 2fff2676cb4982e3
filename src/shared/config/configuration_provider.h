/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "types/derivation.h"

#include <QObject>
#include <QString>

namespace LedgerSigner {
namespace Shared {

/**
 * @brief Read access to the signer configuration with change notification
 *
 * Components depend on this abstraction instead of KConfig so tests can
 * drive configuration changes directly (see MockConfigurationProvider).
 *
 * configurationChanged() is emitted synchronously from reload() and from
 * any setter of a concrete implementation; listeners re-read the values
 * they care about.
 */
class ConfigurationProvider : public QObject
{
    Q_OBJECT

public:
    explicit ConfigurationProvider(QObject *parent = nullptr);
    ~ConfigurationProvider() override;

    /**
     * @brief Re-reads configuration from storage and emits configurationChanged()
     */
    virtual void reload() = 0;

    /**
     * @brief Gets the global derivation scheme
     */
    virtual DerivationScheme derivationScheme() const = 0;

    /**
     * @brief Gets the number of accounts derived under the Live scheme
     */
    virtual int liveAccountLimit() const = 0;

    /**
     * @brief Gets the reconnection grace window
     * @return Milliseconds a detached signer is kept before final removal
     */
    virtual int disconnectGraceWindowMs() const = 0;

    /**
     * @brief Gets the effective derivation pair signers should carry
     *
     * Convenience combining derivationScheme() and liveAccountLimit(),
     * normalized with DerivationConfig::effective().
     */
    DerivationConfig derivationConfig() const;

Q_SIGNALS:
    /**
     * @brief Emitted after any configuration value may have changed
     */
    void configurationChanged();
};

} // namespace Shared
} // namespace LedgerSigner
