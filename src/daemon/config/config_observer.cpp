/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "config_observer.h"
#include "config/configuration_provider.h"
#include "../logging_categories.h"
#include "../registry/signer_registry.h"
#include "../signer/signer_handle.h"

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

ConfigObserver::ConfigObserver(SignerRegistry *registry, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
{
}

ConfigObserver::~ConfigObserver() = default;

void ConfigObserver::start(ConfigurationProvider *provider)
{
    if (!provider) {
        qCWarning(ConfigObserverLog) << "start() without configuration provider";
        return;
    }

    m_provider = provider;
    m_subscription = ConfigSubscription::observe(provider, [this]() {
        const int count = applyConfiguration();
        Q_EMIT configurationApplied(count);
    });

    qCDebug(ConfigObserverLog) << "Observing configuration changes";
}

void ConfigObserver::stop()
{
    if (!m_subscription.isActive()) {
        return;
    }

    m_subscription.remove();
    m_provider = nullptr;
    qCDebug(ConfigObserverLog) << "Stopped observing configuration changes";
}

bool ConfigObserver::isActive() const
{
    return m_subscription.isActive();
}

int ConfigObserver::applyConfiguration()
{
    if (!m_provider || !m_registry) {
        return 0;
    }

    const DerivationConfig config = m_provider->derivationConfig();

    int rederived = 0;
    const auto signers = m_registry->signers();
    for (SignerHandle *signer : signers) {
        if (signer->applyDerivation(config)) {
            signer->deriveAddresses();
            ++rederived;
        }
    }

    qCDebug(ConfigObserverLog) << "Applied" << config << "- re-derived" << rederived
                               << "of" << signers.size() << "signers";
    return rederived;
}

} // namespace Daemon
} // namespace LedgerSigner
