/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <cstdint>

namespace LedgerSigner {
namespace Shared {

/// USB vendor id assigned to Ledger SAS
constexpr quint16 LEDGER_USB_VENDOR_ID = 0x2c97;

/**
 * @brief Ledger device families
 *
 * Identified from the USB product id:
 * - Legacy firmware reports a small product id equal to the family
 *   number (0x0000 Blue, 0x0001 Nano S, 0x0004 Nano X, ...).
 * - Current firmware encodes the family in the upper byte and the
 *   enabled USB interfaces in the lower byte (0x1011 = Nano S with
 *   HID+U2F+WebUSB). The upper byte is stable across app switches.
 */
enum class LedgerModel : uint8_t {
    Unknown = 0x00,
    Blue = 0x01,
    NanoS = 0x02,
    NanoX = 0x03,
    NanoSPlus = 0x04,
    Stax = 0x05,
    Flex = 0x06
};

/**
 * @brief Identifies the device family from a USB product id
 * @param productId USB idProduct of a Ledger device
 * @return Detected model, LedgerModel::Unknown for unrecognized ids
 */
LedgerModel identifyLedgerModel(quint16 productId);

/**
 * @brief Gets the stable model identifier
 *
 * Identifiers are used to correlate detach events with known signers,
 * so they must not depend on the locale.
 *
 * @return "blue", "nanoS", "nanoX", "nanoSP", "stax", "flex" or "unknown"
 */
QString ledgerModelId(LedgerModel model);

/**
 * @brief Gets localized model name for display (e.g. "Ledger Nano X")
 */
QString ledgerModelName(LedgerModel model);

/**
 * @brief Checks if a USB vendor id belongs to the Ledger family
 */
[[nodiscard]] constexpr bool isLedgerVendor(quint16 vendorId)
{
    return vendorId == LEDGER_USB_VENDOR_ID;
}

} // namespace Shared
} // namespace LedgerSigner
