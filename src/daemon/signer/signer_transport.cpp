/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "signer_transport.h"

namespace LedgerSigner {
namespace Daemon {

SignerTransport::SignerTransport(QObject *parent)
    : QObject(parent)
{
}

SignerTransport::~SignerTransport() = default;

} // namespace Daemon
} // namespace LedgerSigner
