/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "configuration_provider.h"

namespace LedgerSigner {
namespace Shared {

ConfigurationProvider::ConfigurationProvider(QObject *parent)
    : QObject(parent)
{
}

// Out-of-line destructor anchors the vtable for MOC
ConfigurationProvider::~ConfigurationProvider() = default;

DerivationConfig ConfigurationProvider::derivationConfig() const
{
    DerivationConfig config;
    config.scheme = derivationScheme();
    config.accountLimit = liveAccountLimit();
    return config.effective();
}

} // namespace Shared
} // namespace LedgerSigner
