/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QMetaObject>
#include <functional>

namespace LedgerSigner {
namespace Shared {
class ConfigurationProvider;
}

namespace Daemon {

/**
 * @brief Scoped subscription to configuration changes
 *
 * Invokes the callback synchronously each time the provider emits
 * configurationChanged(). The connection is removed by remove() or, at
 * the latest, by the destructor. Move-only.
 *
 * @code
 * m_subscription = ConfigSubscription::observe(config, [this]() { onChanged(); });
 * ...
 * m_subscription.remove();  // or let it go out of scope
 * @endcode
 */
class ConfigSubscription
{
public:
    using Callback = std::function<void()>;

    ConfigSubscription() = default;
    ~ConfigSubscription();

    ConfigSubscription(ConfigSubscription &&other) noexcept;
    ConfigSubscription &operator=(ConfigSubscription &&other) noexcept;

    ConfigSubscription(const ConfigSubscription &) = delete;
    ConfigSubscription &operator=(const ConfigSubscription &) = delete;

    /**
     * @brief Subscribes @p callback to @p provider changes
     * @return Active subscription, or an inactive one if provider is null
     */
    [[nodiscard]] static ConfigSubscription observe(Shared::ConfigurationProvider *provider, Callback callback);

    /**
     * @brief Cancels the subscription (no-op when inactive)
     */
    void remove();

    [[nodiscard]] bool isActive() const;

private:
    explicit ConfigSubscription(QMetaObject::Connection connection);

    QMetaObject::Connection m_connection;
};

} // namespace Daemon
} // namespace LedgerSigner
