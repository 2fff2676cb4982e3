/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logging_categories.h"

namespace LedgerSigner {
namespace Daemon {

// Orchestration
Q_LOGGING_CATEGORY(LedgerSignerAdapterLog, "ledgersigner.daemon.adapter", QtWarningMsg)
Q_LOGGING_CATEGORY(AttachDetachControllerLog, "ledgersigner.daemon.controller", QtWarningMsg)

// Signer lifecycle
Q_LOGGING_CATEGORY(SignerHandleLog, "ledgersigner.daemon.signer", QtWarningMsg)
Q_LOGGING_CATEGORY(SignerRegistryLog, "ledgersigner.daemon.registry", QtWarningMsg)
Q_LOGGING_CATEGORY(DisconnectionTrackerLog, "ledgersigner.daemon.disconnections", QtWarningMsg)

// Configuration
Q_LOGGING_CATEGORY(ConfigObserverLog, "ledgersigner.daemon.config.observer", QtWarningMsg)
Q_LOGGING_CATEGORY(DaemonConfigurationLog, "ledgersigner.daemon.config", QtWarningMsg)

// Platform
Q_LOGGING_CATEGORY(UdevMonitorLog, "ledgersigner.daemon.udev", QtWarningMsg)

} // namespace Daemon
} // namespace LedgerSigner
