/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "device_enumerator.h"

#include <optional>

struct udev;
struct udev_device;

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief Linux enumeration of Ledger hidraw nodes through libudev
 *
 * Reports interface 0 of each Ledger device (the APDU channel); the
 * U2F interface exposed by the same device is skipped.
 */
class UdevDeviceEnumerator : public DeviceEnumerator
{
public:
    UdevDeviceEnumerator();
    ~UdevDeviceEnumerator() override;

    UdevDeviceEnumerator(const UdevDeviceEnumerator &) = delete;
    UdevDeviceEnumerator &operator=(const UdevDeviceEnumerator &) = delete;

    QList<Shared::HidDeviceInfo> listConnectedDevices() const override;

    /**
     * @brief Describes a hidraw device if it is a Ledger APDU interface
     * @param device hidraw udev device (sysfs must still be present)
     * @return Device info, std::nullopt for foreign or secondary interfaces
     */
    static std::optional<Shared::HidDeviceInfo> describeHidraw(udev_device *device);

    /**
     * @brief Parses a sysfs/uevent hexadecimal id ("2c97")
     * @return Parsed id, std::nullopt if malformed
     */
    static std::optional<quint16> parseHexId(const char *value);

private:
    udev *m_udev = nullptr;
};

} // namespace Daemon
} // namespace LedgerSigner
