/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ledger_model.h"

#include <KLocalizedString>

namespace LedgerSigner {
namespace Shared {

namespace {

LedgerModel modelFromFamily(quint8 family)
{
    switch (family) {
    case 0x00:
        return LedgerModel::Blue;
    case 0x01:
        return LedgerModel::NanoS;
    case 0x04:
        return LedgerModel::NanoX;
    case 0x05:
        return LedgerModel::NanoSPlus;
    case 0x06:
        return LedgerModel::Stax;
    case 0x07:
        return LedgerModel::Flex;
    default:
        return LedgerModel::Unknown;
    }
}

} // namespace

LedgerModel identifyLedgerModel(quint16 productId)
{
    // Legacy product ids carry the family number directly
    const LedgerModel legacy = modelFromFamily(static_cast<quint8>(productId));
    if (productId <= 0x00FF && legacy != LedgerModel::Unknown) {
        return legacy;
    }

    // Current firmware: family in the upper byte (0x00 Blue, 0x10 Nano S, 0x40 Nano X, ...)
    const quint8 upper = static_cast<quint8>(productId >> 8);
    if ((upper & 0x0F) != 0) {
        return LedgerModel::Unknown;
    }
    return modelFromFamily(static_cast<quint8>(upper >> 4));
}

QString ledgerModelId(LedgerModel model)
{
    switch (model) {
    case LedgerModel::Blue:
        return QStringLiteral("blue");
    case LedgerModel::NanoS:
        return QStringLiteral("nanoS");
    case LedgerModel::NanoX:
        return QStringLiteral("nanoX");
    case LedgerModel::NanoSPlus:
        return QStringLiteral("nanoSP");
    case LedgerModel::Stax:
        return QStringLiteral("stax");
    case LedgerModel::Flex:
        return QStringLiteral("flex");
    case LedgerModel::Unknown:
    default:
        return QStringLiteral("unknown");
    }
}

QString ledgerModelName(LedgerModel model)
{
    switch (model) {
    case LedgerModel::Blue:
        return i18nc("@label Device model name", "Ledger Blue");
    case LedgerModel::NanoS:
        return i18nc("@label Device model name", "Ledger Nano S");
    case LedgerModel::NanoX:
        return i18nc("@label Device model name", "Ledger Nano X");
    case LedgerModel::NanoSPlus:
        return i18nc("@label Device model name", "Ledger Nano S Plus");
    case LedgerModel::Stax:
        return i18nc("@label Device model name", "Ledger Stax");
    case LedgerModel::Flex:
        return i18nc("@label Device model name", "Ledger Flex");
    case LedgerModel::Unknown:
    default:
        return i18nc("@label Unknown device model", "Ledger device");
    }
}

} // namespace Shared
} // namespace LedgerSigner
