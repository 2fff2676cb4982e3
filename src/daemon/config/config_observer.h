/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "config_subscription.h"

#include <QObject>

namespace LedgerSigner {
namespace Shared {
class ConfigurationProvider;
}

namespace Daemon {

class SignerRegistry;

/**
 * @brief Pushes global derivation settings into every known signer
 *
 * On each configurationChanged() the effective (scheme, accountLimit)
 * pair is computed once and applied to all handles in the registry.
 * Only handles whose stored pair differs are re-derived, so repeated
 * notifications with unchanged values do not touch any device.
 */
class ConfigObserver : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs observer
     * @param registry Registry to walk on changes (not owned, must outlive the observer)
     * @param parent Parent QObject
     */
    explicit ConfigObserver(SignerRegistry *registry, QObject *parent = nullptr);
    ~ConfigObserver() override;

    /**
     * @brief Subscribes to @p provider
     *
     * A previous subscription is replaced. Does not apply the current
     * configuration by itself.
     */
    void start(Shared::ConfigurationProvider *provider);

    /**
     * @brief Unsubscribes (safe when never started)
     */
    void stop();

    [[nodiscard]] bool isActive() const;

    /**
     * @brief Applies the provider's current configuration to all signers
     * @return Number of signers that were re-derived
     */
    int applyConfiguration();

Q_SIGNALS:
    /**
     * @brief Emitted after a change notification was processed
     * @param rederivedCount Signers whose configuration actually changed
     */
    void configurationApplied(int rederivedCount);

private:
    SignerRegistry *m_registry;
    Shared::ConfigurationProvider *m_provider = nullptr;
    ConfigSubscription m_subscription;
};

} // namespace Daemon
} // namespace LedgerSigner
