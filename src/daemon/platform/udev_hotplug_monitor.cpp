/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "udev_hotplug_monitor.h"
#include "udev_device_enumerator.h"
#include "../logging_categories.h"

#include <KLocalizedString>
#include <QSocketNotifier>
#include <QStringList>

extern "C" {
#include <libudev.h>
}

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

namespace {

int intProperty(udev_device *device, const char *key)
{
    const char *const value = udev_device_get_property_value(device, key);
    if (!value) {
        return -1;
    }
    bool ok = false;
    const int parsed = QString::fromLatin1(value).toInt(&ok);
    return ok ? parsed : -1;
}

} // namespace

UdevHotplugMonitor::UdevHotplugMonitor(QObject *parent)
    : HotplugMonitor(parent)
{
}

UdevHotplugMonitor::~UdevHotplugMonitor()
{
    stop();
}

Result<void> UdevHotplugMonitor::start()
{
    if (isRunning()) {
        qCDebug(UdevMonitorLog) << "Already running";
        return Result<void>::success();
    }

    m_udev = udev_new();
    if (!m_udev) {
        return Result<void>::error(i18n("Failed to create udev context"));
    }

    m_monitor = udev_monitor_new_from_netlink(m_udev, "udev");
    if (!m_monitor) {
        stop();
        return Result<void>::error(i18n("Failed to create udev monitor"));
    }

    udev_monitor_filter_add_match_subsystem_devtype(m_monitor, "usb", "usb_device");
    udev_monitor_filter_add_match_subsystem_devtype(m_monitor, "hidraw", nullptr);

    if (udev_monitor_enable_receiving(m_monitor) < 0) {
        stop();
        return Result<void>::error(i18n("Failed to enable udev event reception"));
    }

    const int fd = udev_monitor_get_fd(m_monitor);
    m_notifier = new QSocketNotifier(fd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &UdevHotplugMonitor::onMonitorReadable);

    qCInfo(UdevMonitorLog) << "Listening for USB hot-plug events on fd" << fd;
    return Result<void>::success();
}

void UdevHotplugMonitor::stop()
{
    if (m_notifier) {
        m_notifier->setEnabled(false);
        delete m_notifier;
        m_notifier = nullptr;
    }

    if (m_monitor) {
        udev_monitor_unref(m_monitor);
        m_monitor = nullptr;
    }

    if (m_udev) {
        udev_unref(m_udev);
        m_udev = nullptr;
        qCDebug(UdevMonitorLog) << "Stopped";
    }
}

bool UdevHotplugMonitor::isRunning() const
{
    return m_notifier != nullptr;
}

std::optional<UsbDeviceDescriptor> UdevHotplugMonitor::parseProductProperty(const QString &product)
{
    const QStringList parts = product.split(QLatin1Char('/'));
    if (parts.size() < 2) {
        return std::nullopt;
    }

    bool vendorOk = false;
    bool productOk = false;
    const uint vendorId = parts.at(0).toUInt(&vendorOk, 16);
    const uint productId = parts.at(1).toUInt(&productOk, 16);
    if (!vendorOk || !productOk || vendorId > 0xFFFF || productId > 0xFFFF) {
        return std::nullopt;
    }

    UsbDeviceDescriptor descriptor;
    descriptor.vendorId = static_cast<quint16>(vendorId);
    descriptor.productId = static_cast<quint16>(productId);
    return descriptor;
}

void UdevHotplugMonitor::onMonitorReadable()
{
    if (!m_monitor) {
        return;
    }

    // Drain everything queued on the socket
    while (udev_device *const device = udev_monitor_receive_device(m_monitor)) {
        handleDevice(device);
        udev_device_unref(device);
    }
}

void UdevHotplugMonitor::handleDevice(udev_device *device)
{
    const char *const actionRaw = udev_device_get_action(device);
    const char *const subsystemRaw = udev_device_get_subsystem(device);
    if (!actionRaw || !subsystemRaw) {
        return;
    }

    const QLatin1String action(actionRaw);
    const QLatin1String subsystem(subsystemRaw);

    if (subsystem == QLatin1String("hidraw") && action == QLatin1String("add")) {
        const auto info = UdevDeviceEnumerator::describeHidraw(device);
        if (!info) {
            return;
        }

        UsbDeviceDescriptor descriptor;
        descriptor.vendorId = info->vendorId;
        descriptor.productId = info->productId;

        qCDebug(UdevMonitorLog) << "hidraw node added:" << info->path;
        Q_EMIT deviceAttached(descriptor);
        return;
    }

    if (subsystem == QLatin1String("usb") && action == QLatin1String("remove")) {
        const char *const product = udev_device_get_property_value(device, "PRODUCT");
        if (!product) {
            return;
        }

        auto descriptor = parseProductProperty(QString::fromLatin1(product));
        if (!descriptor) {
            qCDebug(UdevMonitorLog) << "Ignoring usb remove with malformed PRODUCT:" << product;
            return;
        }
        descriptor->busNumber = intProperty(device, "BUSNUM");
        descriptor->deviceAddress = intProperty(device, "DEVNUM");

        qCDebug(UdevMonitorLog) << "usb_device removed:" << product;
        Q_EMIT deviceDetached(*descriptor);
    }
}

} // namespace Daemon
} // namespace LedgerSigner
