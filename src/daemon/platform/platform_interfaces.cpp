/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_enumerator.h"
#include "hotplug_monitor.h"

namespace LedgerSigner {
namespace Daemon {

// Out-of-line destructors anchor the vtables

DeviceEnumerator::~DeviceEnumerator() = default;

HotplugMonitor::HotplugMonitor(QObject *parent)
    : QObject(parent)
{
}

HotplugMonitor::~HotplugMonitor() = default;

} // namespace Daemon
} // namespace LedgerSigner
