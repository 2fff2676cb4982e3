/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QLoggingCategory>

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief Qt Logging Categories for the Ledger signer subsystem
 *
 * Control via environment:
 *   QT_LOGGING_RULES="ledgersigner.daemon.*=true"
 */

// Orchestration
Q_DECLARE_LOGGING_CATEGORY(LedgerSignerAdapterLog)
Q_DECLARE_LOGGING_CATEGORY(AttachDetachControllerLog)

// Signer lifecycle
Q_DECLARE_LOGGING_CATEGORY(SignerHandleLog)
Q_DECLARE_LOGGING_CATEGORY(SignerRegistryLog)
Q_DECLARE_LOGGING_CATEGORY(DisconnectionTrackerLog)

// Configuration
Q_DECLARE_LOGGING_CATEGORY(ConfigObserverLog)
Q_DECLARE_LOGGING_CATEGORY(DaemonConfigurationLog)

// Platform
Q_DECLARE_LOGGING_CATEGORY(UdevMonitorLog)

} // namespace Daemon
} // namespace LedgerSigner
