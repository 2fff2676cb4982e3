/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "derivation.h"

#include <KLocalizedString>
#include <QDebugStateSaver>

namespace LedgerSigner {
namespace Shared {

DerivationConfig DerivationConfig::effective() const
{
    DerivationConfig normalized;
    normalized.scheme = scheme;
    normalized.accountLimit = (scheme == DerivationScheme::Live && accountLimit > 0) ? accountLimit : 0;
    return normalized;
}

QString derivationSchemeToString(DerivationScheme scheme)
{
    switch (scheme) {
    case DerivationScheme::Live:
        return QStringLiteral("live");
    case DerivationScheme::Legacy:
        return QStringLiteral("legacy");
    case DerivationScheme::Standard:
        return QStringLiteral("standard");
    case DerivationScheme::Testnet:
        return QStringLiteral("testnet");
    default:
        return QStringLiteral("live");
    }
}

DerivationScheme derivationSchemeFromString(const QString &schemeStr, bool *ok)
{
    const QString lower = schemeStr.trimmed().toLower();

    if (ok) {
        *ok = true;
    }

    if (lower == QStringLiteral("live")) {
        return DerivationScheme::Live;
    }
    if (lower == QStringLiteral("legacy")) {
        return DerivationScheme::Legacy;
    }
    if (lower == QStringLiteral("standard")) {
        return DerivationScheme::Standard;
    }
    if (lower == QStringLiteral("testnet")) {
        return DerivationScheme::Testnet;
    }

    if (ok) {
        *ok = false;
    }
    return DerivationScheme::Live;
}

QString derivationSchemeName(DerivationScheme scheme)
{
    switch (scheme) {
    case DerivationScheme::Live:
        return i18nc("@label Derivation scheme", "Ledger Live");
    case DerivationScheme::Legacy:
        return i18nc("@label Derivation scheme", "Legacy");
    case DerivationScheme::Standard:
        return i18nc("@label Derivation scheme", "Standard");
    case DerivationScheme::Testnet:
        return i18nc("@label Derivation scheme", "Testnet");
    default:
        return i18nc("@label Unknown derivation scheme", "Unknown");
    }
}

} // namespace Shared
} // namespace LedgerSigner

QDebug operator<<(QDebug debug, const LedgerSigner::Shared::DerivationConfig &config)
{
    const QDebugStateSaver saver(debug);
    debug.nospace() << "DerivationConfig(" << LedgerSigner::Shared::derivationSchemeToString(config.scheme)
                    << ", " << config.accountLimit << ')';
    return debug;
}
