/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

namespace LedgerSigner {
namespace Shared {
namespace ConfigKeys {

/**
 * @brief Configuration file, group and key names
 *
 * IMPORTANT: Do not change these values as they are persisted in user configuration files.
 */

constexpr const char *CONFIG_FILE = "ledgersignerrc";
constexpr const char *LEDGER_GROUP = "Ledger";

// Derivation settings
constexpr const char *DERIVATION = "Derivation";
constexpr const char *LIVE_ACCOUNT_LIMIT = "LiveAccountLimit";

// Hot-plug settings
constexpr const char *DISCONNECT_GRACE_WINDOW = "DisconnectGraceWindow";

// Defaults
constexpr const char *DEFAULT_DERIVATION = "live";
constexpr int DEFAULT_LIVE_ACCOUNT_LIMIT = 5;
constexpr int DEFAULT_DISCONNECT_GRACE_WINDOW_MS = 5000;

} // namespace ConfigKeys
} // namespace Shared
} // namespace LedgerSigner
