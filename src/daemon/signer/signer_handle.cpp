/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "signer_handle.h"
#include "../logging_categories.h"

#include <KLocalizedString>
#include <QFutureWatcher>

namespace LedgerSigner {
namespace Daemon {
using namespace LedgerSigner::Shared;

SignerHandle::SignerHandle(const QString &id,
                           const QString &devicePath,
                           LedgerModel model,
                           std::unique_ptr<SignerTransport> transport,
                           QObject *parent)
    : QObject(parent)
    , m_id(id)
    , m_devicePath(devicePath)
    , m_model(model)
    , m_transport(std::move(transport))
{
    qCDebug(SignerHandleLog) << "Created signer" << m_id << "at" << m_devicePath
                             << "model:" << ledgerModelId(m_model);

    if (!m_transport) {
        qCCritical(SignerHandleLog) << "Signer" << m_id << "created without transport";
        return;
    }

    connect(m_transport.get(), &SignerTransport::updated,
            this, &SignerHandle::updated);
    connect(m_transport.get(), &SignerTransport::errorOccurred,
            this, &SignerHandle::onTransportError);
    connect(m_transport.get(), &SignerTransport::locked,
            this, &SignerHandle::onTransportLocked);
    connect(m_transport.get(), &SignerTransport::unlocked,
            this, &SignerHandle::unlocked);
    connect(m_transport.get(), &SignerTransport::closed,
            this, &SignerHandle::close);
}

SignerHandle::~SignerHandle()
{
    if (m_transport) {
        // No signals back into a half-destroyed handle
        QObject::disconnect(m_transport.get(), nullptr, this, nullptr);
        if (!m_closed) {
            qCDebug(SignerHandleLog) << "Releasing transport of unclosed signer" << m_id;
            m_transport->close();
        }
    }
}

QString SignerHandle::id() const
{
    return m_id;
}

QString SignerHandle::devicePath() const
{
    return m_devicePath;
}

LedgerModel SignerHandle::model() const
{
    return m_model;
}

QString SignerHandle::modelId() const
{
    return ledgerModelId(m_model);
}

DerivationConfig SignerHandle::derivation() const
{
    return m_derivation;
}

DerivationScheme SignerHandle::derivationScheme() const
{
    return m_derivation.scheme;
}

int SignerHandle::accountLimit() const
{
    return m_derivation.accountLimit;
}

ConnectionState SignerHandle::state() const
{
    return m_state;
}

QString SignerHandle::lastError() const
{
    return m_lastError;
}

bool SignerHandle::isClosed() const
{
    return m_closed;
}

bool SignerHandle::applyDerivation(const DerivationConfig &config)
{
    const DerivationConfig effective = config.effective();
    if (effective == m_derivation) {
        return false;
    }

    qCDebug(SignerHandleLog) << "Signer" << m_id << "derivation" << m_derivation << "->" << effective;
    m_derivation = effective;
    return true;
}

void SignerHandle::openAndConnect()
{
    if (m_closed || !m_transport) {
        qCWarning(SignerHandleLog) << "openAndConnect() on closed signer" << m_id;
        return;
    }

    ++m_sequence;
    setState(ConnectionState::Opening);

    watch(m_transport->open(m_devicePath), QStringLiteral("open"), [this](const Result<void> &result) {
        if (result.isError()) {
            setErrorState(i18n("Could not open %1: %2", m_devicePath, result.error()));
            return;
        }
        startConnect();
    });
}

void SignerHandle::connectDevice()
{
    if (m_closed || !m_transport) {
        qCWarning(SignerHandleLog) << "connectDevice() on closed signer" << m_id;
        return;
    }

    ++m_sequence;
    setState(ConnectionState::Opening);
    startConnect();
}

void SignerHandle::disconnectDevice()
{
    if (m_closed || !m_transport) {
        return;
    }

    ++m_sequence;
    setState(ConnectionState::Disconnected);

    watch(m_transport->disconnectDevice(), QStringLiteral("disconnect"), [this](const Result<void> &result) {
        if (result.isError()) {
            qCDebug(SignerHandleLog) << "Disconnect of" << m_id << "reported:" << result.error();
        }
    });
}

void SignerHandle::reconnect()
{
    if (m_closed || !m_transport) {
        qCWarning(SignerHandleLog) << "reconnect() on closed signer" << m_id;
        return;
    }

    qCInfo(SignerHandleLog) << "Reconnecting signer" << m_id << "at" << m_devicePath;

    ++m_sequence;
    setState(ConnectionState::Opening);

    watch(m_transport->disconnectDevice(), QStringLiteral("disconnect"), [this](const Result<void> &disconnected) {
        if (disconnected.isError()) {
            qCWarning(SignerHandleLog) << "Disconnect before reconnect failed for" << m_id
                                       << "error:" << disconnected.error() << "- opening anyway";
        }

        watch(m_transport->open(m_devicePath), QStringLiteral("open"), [this](const Result<void> &opened) {
            if (opened.isError()) {
                setErrorState(i18n("Could not open %1: %2", m_devicePath, opened.error()));
                return;
            }
            startConnect();
        });
    });
}

void SignerHandle::close()
{
    if (m_closed) {
        return;
    }

    qCDebug(SignerHandleLog) << "Closing signer" << m_id;

    m_closed = true;
    ++m_sequence;

    if (m_state != ConnectionState::Disconnected) {
        m_state = ConnectionState::Disconnected;
        Q_EMIT stateChanged(m_state);
    }

    if (m_transport) {
        m_transport->close();
    }

    Q_EMIT closed();
}

void SignerHandle::deriveAddresses()
{
    if (m_closed || !m_transport) {
        return;
    }

    if (!isConnectionUsable(m_state)) {
        qCDebug(SignerHandleLog) << "Signer" << m_id << "is" << connectionStateToString(m_state)
                                 << "- derivation deferred to next connect";
        return;
    }

    qCDebug(SignerHandleLog) << "Deriving addresses for" << m_id << "with" << m_derivation;
    m_transport->deriveAddresses(m_derivation);
}

void SignerHandle::setDevicePath(const QString &devicePath)
{
    if (devicePath == m_devicePath) {
        return;
    }

    qCInfo(SignerHandleLog) << "Signer" << m_id << "moved from" << m_devicePath << "to" << devicePath;
    m_devicePath = devicePath;
}

void SignerHandle::setState(ConnectionState state)
{
    if (state == m_state) {
        return;
    }

    qCDebug(SignerHandleLog) << "Signer" << m_id << "state" << connectionStateToString(m_state)
                             << "->" << connectionStateToString(state);

    m_state = state;
    if (state != ConnectionState::Errored) {
        m_lastError.clear();
    }

    Q_EMIT stateChanged(m_state);
    Q_EMIT updated();
}

void SignerHandle::setErrorState(const QString &error)
{
    qCWarning(SignerHandleLog) << "Signer" << m_id << "error:" << error;

    m_lastError = error;
    if (m_state != ConnectionState::Errored) {
        m_state = ConnectionState::Errored;
        Q_EMIT stateChanged(m_state);
    }

    Q_EMIT errorOccurred(error);
}

void SignerHandle::watch(const QFuture<Result<void>> &future,
                         const QString &operation,
                         std::function<void(const Result<void> &)> onFinished)
{
    const quint64 sequence = m_sequence;

    auto *watcher = new QFutureWatcher<Result<void>>(this);
    connect(watcher, &QFutureWatcher<Result<void>>::finished,
            this, [this, watcher, sequence, operation, onFinished = std::move(onFinished)]() {
        watcher->deleteLater();

        if (m_closed || sequence != m_sequence) {
            qCDebug(SignerHandleLog) << "Ignoring stale" << operation << "completion for" << m_id;
            return;
        }

        if (watcher->isCanceled() || watcher->future().resultCount() == 0) {
            onFinished(Result<void>::error(i18n("Operation '%1' was cancelled", operation)));
            return;
        }

        onFinished(watcher->result());
    });
    watcher->setFuture(future);
}

void SignerHandle::startConnect()
{
    watch(m_transport->connectDevice(), QStringLiteral("connect"), [this](const Result<void> &result) {
        if (result.isError()) {
            setErrorState(i18n("Could not connect to %1: %2", ledgerModelName(m_model), result.error()));
            return;
        }

        setState(ConnectionState::Connected);
        deriveAddresses();
    });
}

void SignerHandle::onTransportError(const QString &error)
{
    if (m_closed) {
        return;
    }
    setErrorState(error);
}

void SignerHandle::onTransportLocked()
{
    if (m_closed) {
        return;
    }
    setState(ConnectionState::Locked);
    Q_EMIT locked();
}

} // namespace Daemon
} // namespace LedgerSigner
