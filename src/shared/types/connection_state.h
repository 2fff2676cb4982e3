/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <QMetaType>

namespace LedgerSigner {
namespace Shared {

/**
 * @brief Connection states of a signer handle
 *
 * State transitions:
 * - Disconnected → Opening (open() started)
 * - Opening → Connected (open() and connect() succeeded)
 * - Connected ⇄ Locked (device locked/unlocked by the user)
 * - Any state → Errored (transport failure)
 * - Any state → Disconnected (detach, disconnect() or close())
 */
enum class ConnectionState : uint8_t {
    Disconnected = 0x00,  ///< Not connected (initial, detached or closed)
    Opening = 0x01,       ///< open()/connect() sequence in progress
    Connected = 0x02,     ///< Ready for derivation and signing
    Locked = 0x03,        ///< Connected but locked on the device
    Errored = 0xFF        ///< Transport reported a failure
};

/**
 * @brief Converts state to its programmatic name
 * @return "disconnected", "opening", "connected", "locked" or "errored"
 */
QString connectionStateToString(ConnectionState state);

/**
 * @brief Parses programmatic state name (case-insensitive)
 * @return Parsed state, ConnectionState::Disconnected if unknown
 */
ConnectionState connectionStateFromString(const QString &stateStr);

/**
 * @brief Gets localized state name for display
 */
QString connectionStateName(ConnectionState state);

/**
 * @brief Checks if the signer can serve derivation requests
 * @return true only for ConnectionState::Connected
 */
[[nodiscard]] bool isConnectionUsable(ConnectionState state);

} // namespace Shared
} // namespace LedgerSigner

Q_DECLARE_METATYPE(LedgerSigner::Shared::ConnectionState)
