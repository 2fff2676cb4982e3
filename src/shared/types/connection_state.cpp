/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "connection_state.h"

#include <KLocalizedString>

namespace LedgerSigner {
namespace Shared {

QString connectionStateToString(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:
        return QStringLiteral("disconnected");
    case ConnectionState::Opening:
        return QStringLiteral("opening");
    case ConnectionState::Connected:
        return QStringLiteral("connected");
    case ConnectionState::Locked:
        return QStringLiteral("locked");
    case ConnectionState::Errored:
        return QStringLiteral("errored");
    default:
        return QStringLiteral("disconnected");
    }
}

ConnectionState connectionStateFromString(const QString &stateStr)
{
    const QString lower = stateStr.toLower();

    if (lower == QStringLiteral("opening")) {
        return ConnectionState::Opening;
    }
    if (lower == QStringLiteral("connected")) {
        return ConnectionState::Connected;
    }
    if (lower == QStringLiteral("locked")) {
        return ConnectionState::Locked;
    }
    if (lower == QStringLiteral("errored") || lower == QStringLiteral("error")) {
        return ConnectionState::Errored;
    }

    return ConnectionState::Disconnected;
}

QString connectionStateName(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:
        return i18nc("@label Signer connection state", "Disconnected");
    case ConnectionState::Opening:
        return i18nc("@label Signer connection state - operation in progress", "Connecting...");
    case ConnectionState::Connected:
        return i18nc("@label Signer connection state", "Connected");
    case ConnectionState::Locked:
        return i18nc("@label Signer connection state - device locked", "Locked");
    case ConnectionState::Errored:
        return i18nc("@label Signer connection state - error occurred", "Error");
    default:
        return i18nc("@label Signer connection state unknown", "Unknown");
    }
}

bool isConnectionUsable(ConnectionState state)
{
    return state == ConnectionState::Connected;
}

} // namespace Shared
} // namespace LedgerSigner
