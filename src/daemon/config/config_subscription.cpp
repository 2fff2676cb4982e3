/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "config_subscription.h"
#include "config/configuration_provider.h"

#include <QObject>
#include <utility>

namespace LedgerSigner {
namespace Daemon {

ConfigSubscription::ConfigSubscription(QMetaObject::Connection connection)
    : m_connection(std::move(connection))
{
}

ConfigSubscription::~ConfigSubscription()
{
    remove();
}

ConfigSubscription::ConfigSubscription(ConfigSubscription &&other) noexcept
    : m_connection(std::exchange(other.m_connection, QMetaObject::Connection()))
{
}

ConfigSubscription &ConfigSubscription::operator=(ConfigSubscription &&other) noexcept
{
    if (this != &other) {
        remove();
        m_connection = std::exchange(other.m_connection, QMetaObject::Connection());
    }
    return *this;
}

ConfigSubscription ConfigSubscription::observe(Shared::ConfigurationProvider *provider, Callback callback)
{
    if (!provider || !callback) {
        return {};
    }

    return ConfigSubscription(QObject::connect(provider, &Shared::ConfigurationProvider::configurationChanged,
                                               provider, std::move(callback), Qt::DirectConnection));
}

void ConfigSubscription::remove()
{
    if (m_connection) {
        QObject::disconnect(m_connection);
    }
    m_connection = QMetaObject::Connection();
}

bool ConfigSubscription::isActive() const
{
    return static_cast<bool>(m_connection);
}

} // namespace Daemon
} // namespace LedgerSigner
