/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "udev_device_enumerator.h"
#include "../logging_categories.h"
#include "types/ledger_model.h"

#include <QString>
#include <algorithm>

extern "C" {
#include <libudev.h>
}

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

namespace {
// APDU channel; interface 1 is U2F
constexpr int LEDGER_APDU_INTERFACE = 0;
} // namespace

UdevDeviceEnumerator::UdevDeviceEnumerator()
    : m_udev(udev_new())
{
    if (!m_udev) {
        qCCritical(UdevMonitorLog) << "Failed to create udev context - enumeration disabled";
    }
}

UdevDeviceEnumerator::~UdevDeviceEnumerator()
{
    if (m_udev) {
        udev_unref(m_udev);
        m_udev = nullptr;
    }
}

QList<HidDeviceInfo> UdevDeviceEnumerator::listConnectedDevices() const
{
    QList<HidDeviceInfo> devices;

    if (!m_udev) {
        return devices;
    }

    udev_enumerate *const enumerate = udev_enumerate_new(m_udev);
    if (!enumerate) {
        qCWarning(UdevMonitorLog) << "Failed to create udev enumeration";
        return devices;
    }

    udev_enumerate_add_match_subsystem(enumerate, "hidraw");
    udev_enumerate_scan_devices(enumerate);

    udev_list_entry *entry = nullptr;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate)) {
        udev_device *const device = udev_device_new_from_syspath(m_udev, udev_list_entry_get_name(entry));
        if (!device) {
            continue;
        }

        if (const auto info = describeHidraw(device)) {
            devices.append(*info);
        }
        udev_device_unref(device);
    }

    udev_enumerate_unref(enumerate);

    std::sort(devices.begin(), devices.end(), [](const HidDeviceInfo &a, const HidDeviceInfo &b) {
        return a.path < b.path;
    });

    qCDebug(UdevMonitorLog) << "Enumerated" << devices.size() << "Ledger HID interfaces";
    return devices;
}

std::optional<HidDeviceInfo> UdevDeviceEnumerator::describeHidraw(udev_device *device)
{
    if (!device) {
        return std::nullopt;
    }

    const char *const devnode = udev_device_get_devnode(device);
    if (!devnode) {
        return std::nullopt;
    }

    // Parents are owned by the child device, no unref
    udev_device *const usbDevice = udev_device_get_parent_with_subsystem_devtype(device, "usb", "usb_device");
    if (!usbDevice) {
        return std::nullopt;
    }

    const auto vendorId = parseHexId(udev_device_get_sysattr_value(usbDevice, "idVendor"));
    const auto productId = parseHexId(udev_device_get_sysattr_value(usbDevice, "idProduct"));
    if (!vendorId || !productId || !isLedgerVendor(*vendorId)) {
        return std::nullopt;
    }

    udev_device *const usbInterface = udev_device_get_parent_with_subsystem_devtype(device, "usb", "usb_interface");
    if (usbInterface) {
        const auto interfaceNumber = parseHexId(udev_device_get_sysattr_value(usbInterface, "bInterfaceNumber"));
        if (interfaceNumber && *interfaceNumber != LEDGER_APDU_INTERFACE) {
            return std::nullopt;
        }
    }

    HidDeviceInfo info;
    info.path = QString::fromLocal8Bit(devnode);
    info.vendorId = *vendorId;
    info.productId = *productId;
    return info;
}

std::optional<quint16> UdevDeviceEnumerator::parseHexId(const char *value)
{
    if (!value) {
        return std::nullopt;
    }

    bool ok = false;
    const uint parsed = QString::fromLatin1(value).trimmed().toUInt(&ok, 16);
    if (!ok || parsed > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<quint16>(parsed);
}

} // namespace Daemon
} // namespace LedgerSigner
