/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <utility>

namespace LedgerSigner {
namespace Shared {

/**
 * @brief Value-or-error return type used across the signer subsystem
 *
 * Holds either a value of type T or a human-readable error message.
 * An empty error message means success.
 *
 * @tparam T Type of the value carried on success
 *
 * Usage:
 * @code
 * Result<SignerHandle*> inserted = registry.insert(std::move(handle));
 * if (inserted.isError()) {
 *     qCCritical(SignerRegistryLog) << inserted.error();
 *     return;
 * }
 * wireSignals(inserted.value());
 * @endcode
 */
template<typename T>
class Result {
public:
    /**
     * @brief Creates a successful result
     * @param value Value to carry
     */
    static Result success(T value) {
        return Result(std::move(value), QString());
    }

    /**
     * @brief Creates a failed result
     * @param errorMessage Description of the failure (must not be empty)
     */
    static Result error(const QString &errorMessage) {
        return Result(T(), errorMessage);
    }

    bool isSuccess() const {
        return m_error.isEmpty();
    }

    bool isError() const {
        return !m_error.isEmpty();
    }

    /**
     * @brief Gets the carried value
     * @warning Only valid when isSuccess() is true
     */
    T value() const {
        Q_ASSERT(isSuccess());
        return m_value;
    }

    /**
     * @brief Gets the value, or @p defaultValue on failure
     */
    T valueOr(const T &defaultValue) const {
        return isSuccess() ? m_value : defaultValue;
    }

    /**
     * @brief Gets the error message (empty on success)
     */
    QString error() const {
        return m_error;
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    Result(T value, QString error)
        : m_value(std::move(value))
        , m_error(std::move(error))
    {
    }

    T m_value;
    QString m_error;
};

/**
 * @brief Result for operations that only succeed or fail
 *
 * Transport operations (open, connect, disconnect) and registry
 * mutations report through this specialization.
 *
 * @code
 * const auto result = registry.updatePath(handle, newPath);
 * if (!result) {
 *     qCCritical(AttachDetachControllerLog) << result.error();
 * }
 * @endcode
 */
template<>
class Result<void> {
public:
    static Result success() {
        return Result(QString());
    }

    static Result error(const QString &errorMessage) {
        return Result(errorMessage);
    }

    bool isSuccess() const {
        return m_error.isEmpty();
    }

    bool isError() const {
        return !m_error.isEmpty();
    }

    QString error() const {
        return m_error;
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    explicit Result(QString error)
        : m_error(std::move(error))
    {
    }

    QString m_error;
};

} // namespace Shared
} // namespace LedgerSigner
