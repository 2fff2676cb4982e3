/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "signer_registry.h"
#include "../signer/signer_handle.h"
#include "../logging_categories.h"

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

SignerRegistry::SignerRegistry() = default;

SignerRegistry::~SignerRegistry() = default;

QString SignerRegistry::allocateId()
{
    return QStringLiteral("S%1").arg(++m_lastId);
}

SignerHandle *SignerRegistry::lookupByPath(const QString &devicePath) const
{
    const auto it = m_byPath.find(devicePath);
    return it != m_byPath.end() ? it->second.get() : nullptr;
}

SignerHandle *SignerRegistry::lookupById(const QString &id) const
{
    for (SignerHandle *const handle : m_order) {
        if (handle->id() == id) {
            return handle;
        }
    }
    return nullptr;
}

Result<SignerHandle *> SignerRegistry::insert(std::unique_ptr<SignerHandle> handle)
{
    if (!handle) {
        return Result<SignerHandle *>::error(QStringLiteral("Cannot register a null signer"));
    }

    const QString path = handle->devicePath();
    if (m_byPath.find(path) != m_byPath.end()) {
        const QString error = QStringLiteral("DuplicatePathError: %1 already registered for signer %2 (rejected %3)")
                                  .arg(path, m_byPath.at(path)->id(), handle->id());
        qCCritical(SignerRegistryLog) << error;
        return Result<SignerHandle *>::error(error);
    }

    SignerHandle *const raw = handle.get();
    m_byPath.emplace(path, std::move(handle));
    m_order.append(raw);

    qCDebug(SignerRegistryLog) << "Registered signer" << raw->id() << "at" << path
                               << "total:" << m_order.size();
    return Result<SignerHandle *>::success(raw);
}

std::unique_ptr<SignerHandle> SignerRegistry::remove(SignerHandle *handle)
{
    if (!handle) {
        return nullptr;
    }

    const auto it = m_byPath.find(handle->devicePath());
    if (it == m_byPath.end() || it->second.get() != handle) {
        qCDebug(SignerRegistryLog) << "remove(): signer" << handle->id() << "not registered";
        return nullptr;
    }

    std::unique_ptr<SignerHandle> owned = std::move(it->second);
    m_byPath.erase(it);
    m_order.removeOne(owned.get());

    qCDebug(SignerRegistryLog) << "Unregistered signer" << owned->id() << "remaining:" << m_order.size();
    return owned;
}

Result<void> SignerRegistry::updatePath(SignerHandle *handle, const QString &newPath)
{
    if (!contains(handle)) {
        return Result<void>::error(QStringLiteral("Signer is not registered"));
    }

    const QString oldPath = handle->devicePath();
    if (oldPath == newPath) {
        return Result<void>::success();
    }

    if (m_byPath.find(newPath) != m_byPath.end()) {
        const QString error = QStringLiteral("DuplicatePathError: cannot move signer %1 to %2, held by signer %3")
                                  .arg(handle->id(), newPath, m_byPath.at(newPath)->id());
        qCCritical(SignerRegistryLog) << error;
        return Result<void>::error(error);
    }

    auto node = m_byPath.extract(oldPath);
    handle->setDevicePath(newPath);
    node.key() = newPath;
    m_byPath.insert(std::move(node));

    qCDebug(SignerRegistryLog) << "Re-keyed signer" << handle->id() << oldPath << "->" << newPath;
    return Result<void>::success();
}

QList<SignerHandle *> SignerRegistry::signers() const
{
    return m_order;
}

QStringList SignerRegistry::knownPaths() const
{
    QStringList paths;
    paths.reserve(m_order.size());
    for (const SignerHandle *const handle : m_order) {
        paths.append(handle->devicePath());
    }
    return paths;
}

bool SignerRegistry::contains(const SignerHandle *handle) const
{
    if (!handle) {
        return false;
    }
    const auto it = m_byPath.find(handle->devicePath());
    return it != m_byPath.end() && it->second.get() == handle;
}

int SignerRegistry::size() const
{
    return static_cast<int>(m_order.size());
}

bool SignerRegistry::isEmpty() const
{
    return m_order.isEmpty();
}

} // namespace Daemon
} // namespace LedgerSigner
