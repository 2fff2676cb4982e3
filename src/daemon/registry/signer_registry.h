/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <memory>
#include <unordered_map>

namespace LedgerSigner {
namespace Daemon {

class SignerHandle;

/**
 * @brief Owns every known SignerHandle, indexed by device path
 *
 * Invariants:
 * - at most one handle per device path
 * - ids from allocateId() are never reused within the process
 *
 * Not thread-safe: only touched from the controller's event loop.
 * Mutations have no side effects besides membership; the caller decides
 * when to close() a removed handle.
 */
class SignerRegistry
{
public:
    SignerRegistry();
    ~SignerRegistry();

    SignerRegistry(const SignerRegistry &) = delete;
    SignerRegistry &operator=(const SignerRegistry &) = delete;

    /**
     * @brief Reserves the next signer id ("S1", "S2", ...)
     */
    QString allocateId();

    /**
     * @brief Finds the handle registered at @p devicePath
     * @return Handle or nullptr if absent
     */
    SignerHandle *lookupByPath(const QString &devicePath) const;

    /**
     * @brief Finds the handle with the given id
     * @return Handle or nullptr if absent
     */
    SignerHandle *lookupById(const QString &id) const;

    /**
     * @brief Takes ownership of @p handle
     * @return Registered handle, or a DuplicatePathError if another handle
     *         already holds its path (the registry is left unchanged and
     *         @p handle is destroyed)
     */
    Shared::Result<SignerHandle *> insert(std::unique_ptr<SignerHandle> handle);

    /**
     * @brief Releases ownership of @p handle
     * @return The handle, or nullptr if it was not registered
     */
    std::unique_ptr<SignerHandle> remove(SignerHandle *handle);

    /**
     * @brief Re-keys a registered handle to @p newPath
     * @return DuplicatePathError if @p newPath is held by another handle,
     *         error if @p handle is not registered
     */
    Shared::Result<void> updatePath(SignerHandle *handle, const QString &newPath);

    /**
     * @brief Gets all handles in insertion order
     */
    QList<SignerHandle *> signers() const;

    /**
     * @brief Gets the device paths currently owned by handles
     */
    QStringList knownPaths() const;

    [[nodiscard]] bool contains(const SignerHandle *handle) const;
    [[nodiscard]] int size() const;
    [[nodiscard]] bool isEmpty() const;

private:
    struct QStringHash {
        std::size_t operator()(const QString &key) const noexcept {
            return qHash(key);
        }
    };

    std::unordered_map<QString, std::unique_ptr<SignerHandle>, QStringHash> m_byPath;  ///< devicePath → handle
    QList<SignerHandle *> m_order;  ///< Insertion order for deterministic iteration
    quint64 m_lastId = 0;
};

} // namespace Daemon
} // namespace LedgerSigner
