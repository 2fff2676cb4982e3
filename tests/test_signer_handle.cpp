/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "daemon/signer/signer_handle.h"
#include "mocks/mock_signer_transport.h"

#include <QtTest>
#include <QSignalSpy>

using namespace LedgerSigner::Daemon;
using namespace LedgerSigner::Shared;

/**
 * @brief Tests for SignerHandle
 *
 * Verifies the connection state machine, error propagation, derivation
 * deferral, stale completion handling and close() idempotence.
 */
class TestSignerHandle : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testInitialState();

    // Connection sequence
    void testOpenAndConnect_Success();
    void testOpenAndConnect_OpenFails();
    void testOpenAndConnect_ConnectFails();
    void testConnectDevice_AfterLock();

    // Derivation
    void testApplyDerivation_ReportsChange();
    void testDeriveAddresses_DeferredUntilConnected();

    // Disconnect / reconnect
    void testDisconnect_StaleOpenIgnored();
    void testReconnect_CyclesTransport();
    void testReconnect_DisconnectFailureContinues();

    // Transport signals
    void testTransportLocked_MovesToLocked();
    void testTransportError_MovesToErrored();
    void testTransportClosed_ClosesHandle();

    // Close
    void testClose_Idempotent();
    void testClose_OperationsIgnored();
    void testDestructor_ReleasesUnclosedTransport();

private:
    std::unique_ptr<SignerHandle> m_handle;
    MockSignerTransport *m_transport = nullptr;
    std::shared_ptr<MockTransportRecord> m_record;
};

void TestSignerHandle::init()
{
    m_record = std::make_shared<MockTransportRecord>();
    auto transport = std::make_unique<MockSignerTransport>(m_record);
    m_transport = transport.get();
    m_handle = std::make_unique<SignerHandle>("S1", "/dev/hidraw1", LedgerModel::NanoX, std::move(transport));
}

void TestSignerHandle::cleanup()
{
    m_handle.reset();
    m_transport = nullptr;
}

void TestSignerHandle::testInitialState()
{
    QCOMPARE(m_handle->id(), QString("S1"));
    QCOMPARE(m_handle->devicePath(), QString("/dev/hidraw1"));
    QCOMPARE(m_handle->modelId(), QString("nanoX"));
    QCOMPARE(m_handle->state(), ConnectionState::Disconnected);
    QVERIFY(!m_handle->isClosed());
    QVERIFY(m_handle->lastError().isEmpty());
    QCOMPARE(m_record->openCount, 0);
}

void TestSignerHandle::testOpenAndConnect_Success()
{
    QSignalSpy updatedSpy(m_handle.get(), &SignerHandle::updated);
    QSignalSpy errorSpy(m_handle.get(), &SignerHandle::errorOccurred);

    m_handle->applyDerivation({DerivationScheme::Live, 3});
    m_handle->openAndConnect();
    QCOMPARE(m_handle->state(), ConnectionState::Opening);

    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);
    QCOMPARE(m_record->openCount, 1);
    QCOMPARE(m_record->openedPaths, QStringList{"/dev/hidraw1"});
    QCOMPARE(m_record->connectCount, 1);

    // Connected signer derives with its stored configuration
    QCOMPARE(m_record->deriveCount, 1);
    QCOMPARE(m_record->lastDerivation.accountLimit, 3);

    QVERIFY(updatedSpy.count() >= 2);
    QCOMPARE(errorSpy.count(), 0);
}

void TestSignerHandle::testOpenAndConnect_OpenFails()
{
    QSignalSpy errorSpy(m_handle.get(), &SignerHandle::errorOccurred);
    m_transport->setOpenError("permission denied");

    m_handle->openAndConnect();

    QTRY_COMPARE(errorSpy.count(), 1);
    QCOMPARE(m_handle->state(), ConnectionState::Errored);
    QVERIFY(m_handle->lastError().contains("permission denied"));
    QCOMPARE(m_record->connectCount, 0);
    QCOMPARE(m_record->deriveCount, 0);
}

void TestSignerHandle::testOpenAndConnect_ConnectFails()
{
    QSignalSpy errorSpy(m_handle.get(), &SignerHandle::errorOccurred);
    m_transport->setConnectError("Ethereum app not open");

    m_handle->openAndConnect();

    QTRY_COMPARE(errorSpy.count(), 1);
    QCOMPARE(m_handle->state(), ConnectionState::Errored);
    QVERIFY(errorSpy.at(0).at(0).toString().contains("Ethereum app not open"));
    QCOMPARE(m_record->connectCount, 1);
    QCOMPARE(m_record->deriveCount, 0);
}

void TestSignerHandle::testConnectDevice_AfterLock()
{
    m_handle->openAndConnect();
    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);

    m_transport->simulateLocked();
    QCOMPARE(m_handle->state(), ConnectionState::Locked);

    m_handle->connectDevice();
    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);
    QCOMPARE(m_record->openCount, 1);
    QCOMPARE(m_record->connectCount, 2);
}

void TestSignerHandle::testApplyDerivation_ReportsChange()
{
    QVERIFY(m_handle->applyDerivation({DerivationScheme::Standard, 0}));
    QVERIFY(!m_handle->applyDerivation({DerivationScheme::Standard, 0}));

    // Limit is meaningless outside Live, so this is no change either
    QVERIFY(!m_handle->applyDerivation({DerivationScheme::Standard, 9}));
    QCOMPARE(m_handle->accountLimit(), 0);

    QVERIFY(m_handle->applyDerivation({DerivationScheme::Live, 20}));
    QVERIFY(m_handle->derivationScheme() == DerivationScheme::Live);
    QCOMPARE(m_handle->accountLimit(), 20);

    // Storing never touches the device
    QCOMPARE(m_record->deriveCount, 0);
}

void TestSignerHandle::testDeriveAddresses_DeferredUntilConnected()
{
    m_handle->deriveAddresses();
    QCOMPARE(m_record->deriveCount, 0);

    m_handle->openAndConnect();
    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);
    QCOMPARE(m_record->deriveCount, 1);

    m_handle->applyDerivation({DerivationScheme::Legacy, 0});
    m_handle->deriveAddresses();
    QCOMPARE(m_record->deriveCount, 2);
    QVERIFY(m_record->lastDerivation.scheme == DerivationScheme::Legacy);
}

void TestSignerHandle::testDisconnect_StaleOpenIgnored()
{
    m_transport->setDeferred(true);

    m_handle->openAndConnect();
    QCOMPARE(m_transport->pendingCount(), 1);

    // Device vanished before open() finished
    m_handle->disconnectDevice();
    QCOMPARE(m_handle->state(), ConnectionState::Disconnected);

    QVERIFY(m_transport->completePending());  // open
    QVERIFY(m_transport->completePending());  // disconnect
    QTest::qWait(50);

    QCOMPARE(m_handle->state(), ConnectionState::Disconnected);
    QCOMPARE(m_record->connectCount, 0);
}

void TestSignerHandle::testReconnect_CyclesTransport()
{
    m_handle->openAndConnect();
    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);

    m_handle->reconnect();
    QCOMPARE(m_handle->state(), ConnectionState::Opening);

    QTRY_COMPARE(m_record->connectCount, 2);
    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);
    QCOMPARE(m_record->disconnectCount, 1);
    QCOMPARE(m_record->openCount, 2);
    QCOMPARE(m_record->deriveCount, 2);
}

void TestSignerHandle::testReconnect_DisconnectFailureContinues()
{
    QSignalSpy errorSpy(m_handle.get(), &SignerHandle::errorOccurred);
    m_transport->setDisconnectError("not connected");

    m_handle->reconnect();

    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);
    QCOMPARE(m_record->disconnectCount, 1);
    QCOMPARE(m_record->openCount, 1);
    QCOMPARE(errorSpy.count(), 0);
}

void TestSignerHandle::testTransportLocked_MovesToLocked()
{
    QSignalSpy lockedSpy(m_handle.get(), &SignerHandle::locked);

    m_handle->openAndConnect();
    QTRY_COMPARE(m_handle->state(), ConnectionState::Connected);

    m_transport->simulateLocked();
    QCOMPARE(lockedSpy.count(), 1);
    QCOMPARE(m_handle->state(), ConnectionState::Locked);

    // Locked devices do not derive
    const int derived = m_record->deriveCount;
    m_handle->deriveAddresses();
    QCOMPARE(m_record->deriveCount, derived);
}

void TestSignerHandle::testTransportError_MovesToErrored()
{
    QSignalSpy errorSpy(m_handle.get(), &SignerHandle::errorOccurred);
    QSignalSpy stateSpy(m_handle.get(), &SignerHandle::stateChanged);

    m_transport->simulateError("USB stall");

    QCOMPARE(errorSpy.count(), 1);
    QCOMPARE(m_handle->state(), ConnectionState::Errored);
    QCOMPARE(m_handle->lastError(), QString("USB stall"));
    QCOMPARE(stateSpy.count(), 1);
}

void TestSignerHandle::testTransportClosed_ClosesHandle()
{
    QSignalSpy closedSpy(m_handle.get(), &SignerHandle::closed);

    m_transport->simulateClosed();

    QCOMPARE(closedSpy.count(), 1);
    QVERIFY(m_handle->isClosed());
    QCOMPARE(m_record->closeCount, 1);
}

void TestSignerHandle::testClose_Idempotent()
{
    QSignalSpy closedSpy(m_handle.get(), &SignerHandle::closed);

    m_handle->close();
    m_handle->close();

    QCOMPARE(closedSpy.count(), 1);
    QCOMPARE(m_record->closeCount, 1);

    // Destruction of a closed handle does not close again
    m_handle.reset();
    QCOMPARE(m_record->closeCount, 1);
    QVERIFY(m_record->destroyed);
}

void TestSignerHandle::testClose_OperationsIgnored()
{
    m_handle->close();

    m_handle->openAndConnect();
    m_handle->reconnect();
    m_handle->deriveAddresses();
    QTest::qWait(20);

    QCOMPARE(m_record->openCount, 0);
    QCOMPARE(m_record->disconnectCount, 0);
    QCOMPARE(m_record->deriveCount, 0);
    QCOMPARE(m_handle->state(), ConnectionState::Disconnected);
}

void TestSignerHandle::testDestructor_ReleasesUnclosedTransport()
{
    QSignalSpy closedSpy(m_handle.get(), &SignerHandle::closed);

    m_handle.reset();

    QCOMPARE(closedSpy.count(), 0);
    QCOMPARE(m_record->closeCount, 1);
    QVERIFY(m_record->destroyed);
}

QTEST_GUILESS_MAIN(TestSignerHandle)
#include "test_signer_handle.moc"
