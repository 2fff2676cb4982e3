/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ledger_signer_adapter.h"
#include "../config/config_observer.h"
#include "../logging_categories.h"
#include "../platform/device_enumerator.h"
#include "../platform/hotplug_monitor.h"
#include "../platform/udev_device_enumerator.h"
#include "../platform/udev_hotplug_monitor.h"
#include "../signer/signer_handle.h"

#include <KLocalizedString>

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

LedgerSignerAdapter::LedgerSignerAdapter(std::unique_ptr<DeviceEnumerator> enumerator,
                                         std::unique_ptr<HotplugMonitor> monitor,
                                         SignerTransportFactory transportFactory,
                                         ConfigurationProvider *config,
                                         ReconnectionPolicy policy,
                                         QObject *parent)
    : QObject(parent)
    , m_enumerator(std::move(enumerator))
    , m_monitor(std::move(monitor))
    , m_config(config)
    , m_controller(new AttachDetachController(m_enumerator.get(), std::move(transportFactory), config, policy, this))
    , m_observer(new ConfigObserver(m_controller->registry(), this))
{
    connect(m_controller, &AttachDetachController::signerAdded, this, &LedgerSignerAdapter::signerAdded);
    connect(m_controller, &AttachDetachController::signerUpdated, this, &LedgerSignerAdapter::signerUpdated);
    connect(m_controller, &AttachDetachController::signerRemoved, this, &LedgerSignerAdapter::signerRemoved);
    connect(m_controller, &AttachDetachController::attachUnresolved, this, &LedgerSignerAdapter::attachUnresolved);
}

LedgerSignerAdapter::~LedgerSignerAdapter()
{
    close();
}

std::unique_ptr<LedgerSignerAdapter> LedgerSignerAdapter::createDefault(SignerTransportFactory transportFactory,
                                                                        ConfigurationProvider *config,
                                                                        QObject *parent)
{
    return std::make_unique<LedgerSignerAdapter>(std::make_unique<UdevDeviceEnumerator>(),
                                                 std::make_unique<UdevHotplugMonitor>(),
                                                 std::move(transportFactory),
                                                 config,
                                                 ReconnectionPolicy::platformDefault(),
                                                 parent);
}

Result<void> LedgerSignerAdapter::open()
{
    if (m_open) {
        return Result<void>::success();
    }

    if (!m_monitor) {
        return Result<void>::error(i18n("No hot-plug monitor available"));
    }

    m_observer->start(m_config);

    connect(m_monitor.get(), &HotplugMonitor::deviceAttached, this, &LedgerSignerAdapter::onDeviceAttached);
    connect(m_monitor.get(), &HotplugMonitor::deviceDetached, this, &LedgerSignerAdapter::onDeviceDetached);

    const auto started = m_monitor->start();
    if (started.isError()) {
        qCWarning(LedgerSignerAdapterLog) << "Cannot watch USB devices:" << started.error();
        QObject::disconnect(m_monitor.get(), nullptr, this, nullptr);
        m_observer->stop();
        return started;
    }

    m_open = true;
    qCInfo(LedgerSignerAdapterLog) << "Ledger signer adapter opened";

    scanConnectedDevices();
    return Result<void>::success();
}

void LedgerSignerAdapter::close()
{
    if (!m_open) {
        return;
    }
    m_open = false;

    m_monitor->stop();
    QObject::disconnect(m_monitor.get(), nullptr, this, nullptr);
    m_observer->stop();
    m_controller->shutdown();

    qCInfo(LedgerSignerAdapterLog) << "Ledger signer adapter closed";
}

bool LedgerSignerAdapter::isOpen() const
{
    return m_open;
}

bool LedgerSignerAdapter::reload(const QString &signerId)
{
    SignerHandle *signer = m_controller->registry()->lookupById(signerId);
    if (!signer) {
        qCWarning(LedgerSignerAdapterLog) << "Reload requested for unknown signer" << signerId;
        return false;
    }
    return m_controller->reload(signer->devicePath());
}

QList<SignerHandle *> LedgerSignerAdapter::signers() const
{
    return m_controller->signers();
}

AttachDetachController *LedgerSignerAdapter::controller() const
{
    return m_controller;
}

void LedgerSignerAdapter::onDeviceAttached(const UsbDeviceDescriptor &descriptor)
{
    if (!AttachDetachController::supportsDevice(descriptor)) {
        return;
    }
    m_controller->handleAttach(descriptor);
}

void LedgerSignerAdapter::onDeviceDetached(const UsbDeviceDescriptor &descriptor)
{
    if (!AttachDetachController::supportsDevice(descriptor)) {
        return;
    }
    m_controller->handleDetach(descriptor);
}

void LedgerSignerAdapter::scanConnectedDevices()
{
    if (!m_enumerator) {
        return;
    }

    const auto devices = m_enumerator->listConnectedDevices();
    qCDebug(LedgerSignerAdapterLog) << "Initial scan found" << devices.size() << "Ledger HID nodes";

    for (const auto &device : devices) {
        UsbDeviceDescriptor descriptor;
        descriptor.vendorId = device.vendorId;
        descriptor.productId = device.productId;
        onDeviceAttached(descriptor);
    }
}

} // namespace Daemon
} // namespace LedgerSigner
