/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "attach_detach_controller.h"
#include "config/configuration_provider.h"
#include "../infrastructure/disconnection_tracker.h"
#include "../logging_categories.h"
#include "../platform/device_enumerator.h"
#include "../signer/signer_handle.h"

#include <QSet>
#include <QStringList>

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

ReconnectionPolicy ReconnectionPolicy::platformDefault()
{
    ReconnectionPolicy policy;
#ifdef Q_OS_WIN
    policy.trackDisconnections = false;
#endif
    return policy;
}

AttachDetachController::AttachDetachController(DeviceEnumerator *enumerator,
                                               SignerTransportFactory transportFactory,
                                               ConfigurationProvider *config,
                                               ReconnectionPolicy policy,
                                               QObject *parent)
    : QObject(parent)
    , m_enumerator(enumerator)
    , m_transportFactory(std::move(transportFactory))
    , m_config(config)
    , m_policy(policy)
    , m_tracker(new DisconnectionTracker(this))
{
    connect(m_tracker, &DisconnectionTracker::disconnectionExpired,
            this, &AttachDetachController::onDisconnectionExpired);

    qCDebug(AttachDetachControllerLog) << "Controller created, disconnection tracking:"
                                       << m_policy.trackDisconnections;
}

AttachDetachController::~AttachDetachController()
{
    // Remaining handles are released by the registry without notifications
    m_tracker->clear();
}

void AttachDetachController::handleAttach(const UsbDeviceDescriptor &descriptor)
{
    const LedgerModel model = identifyLedgerModel(descriptor.productId);
    qCDebug(AttachDetachControllerLog) << "Attach:" << ledgerModelId(model)
                                       << "product:" << Qt::hex << descriptor.productId;

    QString resolvedPath;
    if (const auto newPath = findNewPath(model)) {
        resolvedPath = *newPath;
    } else if (const auto pending = m_tracker->claim()) {
        qCDebug(AttachDetachControllerLog) << "No new path, claimed pending disconnection of"
                                           << pending->devicePath;
        resolvedPath = pending->devicePath;
    } else {
        qCWarning(AttachDetachControllerLog) << "Unresolvable attach of" << ledgerModelId(model)
                                             << "- no new path and no pending disconnection";
        Q_EMIT attachUnresolved(descriptor);
        return;
    }

    SignerHandle *signer = m_registry.lookupByPath(resolvedPath);

    if (!signer) {
        // Same device back under another path
        if (const auto pending = m_tracker->claimForModel(ledgerModelId(model))) {
            SignerHandle *moved = m_registry.lookupByPath(pending->devicePath);
            if (moved) {
                const auto result = m_registry.updatePath(moved, resolvedPath);
                if (result.isError()) {
                    qCCritical(AttachDetachControllerLog) << "Aborting attach:" << result.error();
                    removeSigner(moved);
                    return;
                }
                signer = moved;
            }
        }
    }

    if (signer) {
        qCInfo(AttachDetachControllerLog) << "Signer" << signer->id() << "reattached at" << resolvedPath;
    } else {
        signer = createSigner(resolvedPath, model);
        if (!signer) {
            return;
        }
    }

    signer->applyDerivation(currentDerivation());
    signer->openAndConnect();
}

void AttachDetachController::handleDetach(const UsbDeviceDescriptor &descriptor)
{
    const LedgerModel model = identifyLedgerModel(descriptor.productId);

    SignerHandle *signer = findDetachedSigner(model);
    if (!signer) {
        qCDebug(AttachDetachControllerLog) << "Detach of" << ledgerModelId(model) << "matches no signer";
        return;
    }

    qCInfo(AttachDetachControllerLog) << "Signer" << signer->id() << "detached from" << signer->devicePath();

    signer->disconnectDevice();

    if (m_policy.trackDisconnections) {
        m_tracker->recordDisconnection(signer->devicePath(), signer->modelId(), graceWindowMs());
    } else {
        removeSigner(signer);
    }
}

bool AttachDetachController::reload(const QString &devicePath)
{
    SignerHandle *signer = m_registry.lookupByPath(devicePath);
    if (!signer) {
        qCWarning(AttachDetachControllerLog) << "Reload requested for unknown path" << devicePath;
        return false;
    }

    signer->applyDerivation(currentDerivation());
    signer->reconnect();
    return true;
}

void AttachDetachController::shutdown()
{
    qCDebug(AttachDetachControllerLog) << "Shutting down with" << m_registry.size() << "signers,"
                                       << m_tracker->pendingCount() << "pending";

    m_tracker->clear();

    const auto all = m_registry.signers();
    for (SignerHandle *signer : all) {
        removeSigner(signer);
    }
}

bool AttachDetachController::supportsDevice(const UsbDeviceDescriptor &descriptor)
{
    return isLedgerVendor(descriptor.vendorId);
}

QList<SignerHandle *> AttachDetachController::signers() const
{
    return m_registry.signers();
}

SignerRegistry *AttachDetachController::registry()
{
    return &m_registry;
}

DisconnectionTracker *AttachDetachController::tracker() const
{
    return m_tracker;
}

ReconnectionPolicy AttachDetachController::policy() const
{
    return m_policy;
}

std::optional<QString> AttachDetachController::findNewPath(LedgerModel model) const
{
    if (!m_enumerator) {
        return std::nullopt;
    }

    QStringList freePaths;
    QStringList matchingPaths;
    const auto devices = m_enumerator->listConnectedDevices();
    for (const auto &device : devices) {
        if (m_registry.lookupByPath(device.path)) {
            continue;
        }
        freePaths.append(device.path);
        if (identifyLedgerModel(device.productId) == model) {
            matchingPaths.append(device.path);
        }
    }

    if (freePaths.isEmpty()) {
        return std::nullopt;
    }
    if (freePaths.size() == 1) {
        return freePaths.first();
    }

    QStringList candidates = matchingPaths.isEmpty() ? freePaths : matchingPaths;
    candidates.sort();

    qCInfo(AttachDetachControllerLog) << "Ambiguous attach:" << freePaths.size() << "new paths"
                                      << freePaths << "- using" << candidates.first();
    return candidates.first();
}

SignerHandle *AttachDetachController::findDetachedSigner(LedgerModel model) const
{
    QSet<QString> visiblePaths;
    if (m_enumerator) {
        const auto devices = m_enumerator->listConnectedDevices();
        for (const auto &device : devices) {
            visiblePaths.insert(device.path);
        }
    }

    const auto all = m_registry.signers();
    for (SignerHandle *signer : all) {
        if (signer->model() != model) {
            continue;
        }
        if (visiblePaths.contains(signer->devicePath()) || m_tracker->isPending(signer->devicePath())) {
            continue;
        }
        return signer;
    }
    return nullptr;
}

SignerHandle *AttachDetachController::createSigner(const QString &devicePath, LedgerModel model)
{
    if (!m_transportFactory) {
        qCCritical(AttachDetachControllerLog) << "No transport factory, cannot create signer for" << devicePath;
        return nullptr;
    }

    auto transport = m_transportFactory(devicePath, model);
    if (!transport) {
        qCWarning(AttachDetachControllerLog) << "Transport factory declined" << devicePath;
        return nullptr;
    }

    auto handle = std::make_unique<SignerHandle>(m_registry.allocateId(), devicePath, model, std::move(transport));

    // On failure the orphan handle is destroyed, releasing its transport
    const auto inserted = m_registry.insert(std::move(handle));
    if (inserted.isError()) {
        qCCritical(AttachDetachControllerLog) << "Aborting attach:" << inserted.error();
        return nullptr;
    }

    SignerHandle *signer = inserted.value();
    wireSigner(signer);

    qCInfo(AttachDetachControllerLog) << "New signer" << signer->id() << ledgerModelId(model) << "at" << devicePath;
    Q_EMIT signerAdded(signer);
    return signer;
}

void AttachDetachController::wireSigner(SignerHandle *signer)
{
    connect(signer, &SignerHandle::updated, this, [this, signer]() {
        Q_EMIT signerUpdated(signer);
    });
    connect(signer, &SignerHandle::errorOccurred, this, [this, signer](const QString &) {
        Q_EMIT signerUpdated(signer);
    });
    connect(signer, &SignerHandle::locked, this, [this, signer]() {
        Q_EMIT signerUpdated(signer);
    });
    connect(signer, &SignerHandle::unlocked, this, [signer]() {
        signer->connectDevice();
    });
    connect(signer, &SignerHandle::closed, this, [this, signer]() {
        onSignerClosed(signer);
    });
}

void AttachDetachController::removeSigner(SignerHandle *signer)
{
    std::unique_ptr<SignerHandle> owned = m_registry.remove(signer);
    if (!owned) {
        return;
    }

    m_tracker->cancel(owned->devicePath());

    // close() reports through onSignerClosed()
    owned->close();
    owned.release()->deleteLater();
}

void AttachDetachController::onSignerClosed(SignerHandle *signer)
{
    const QString signerId = signer->id();

    // Closed from the device side while still registered
    if (m_registry.contains(signer)) {
        std::unique_ptr<SignerHandle> owned = m_registry.remove(signer);
        m_tracker->cancel(owned->devicePath());
        owned.release()->deleteLater();
    }

    qCInfo(AttachDetachControllerLog) << "Signer" << signerId << "removed";
    Q_EMIT signerRemoved(signerId);
}

void AttachDetachController::onDisconnectionExpired(const QString &devicePath)
{
    SignerHandle *signer = m_registry.lookupByPath(devicePath);
    if (!signer) {
        return;
    }

    qCInfo(AttachDetachControllerLog) << "Signer" << signer->id() << "did not return within the grace window";
    removeSigner(signer);
}

DerivationConfig AttachDetachController::currentDerivation() const
{
    if (!m_config) {
        return DerivationConfig{}.effective();
    }
    return m_config->derivationConfig();
}

int AttachDetachController::graceWindowMs() const
{
    if (m_policy.graceWindowMs > 0) {
        return m_policy.graceWindowMs;
    }
    if (m_config) {
        return m_config->disconnectGraceWindowMs();
    }
    return DisconnectionTracker::DEFAULT_GRACE_WINDOW_MS;
}

} // namespace Daemon
} // namespace LedgerSigner
