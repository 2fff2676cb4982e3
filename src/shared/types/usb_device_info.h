/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <QList>
#include <QMetaType>

namespace LedgerSigner {
namespace Shared {

/**
 * @brief Raw USB hot-plug event payload
 *
 * Carries the descriptor fields of the usb_device that appeared or
 * disappeared. Bus number and address are informational (logging only).
 */
struct UsbDeviceDescriptor {
    quint16 vendorId{0};
    quint16 productId{0};
    int busNumber{-1};
    int deviceAddress{-1};
};

/**
 * @brief One HID interface reported by platform enumeration
 *
 * path is the platform device node (hidraw node on Linux).
 */
struct HidDeviceInfo {
    QString path;
    quint16 vendorId{0};
    quint16 productId{0};

    bool operator==(const HidDeviceInfo &other) const {
        return path == other.path && vendorId == other.vendorId && productId == other.productId;
    }
};

} // namespace Shared
} // namespace LedgerSigner

Q_DECLARE_METATYPE(LedgerSigner::Shared::UsbDeviceDescriptor)
Q_DECLARE_METATYPE(LedgerSigner::Shared::HidDeviceInfo)
