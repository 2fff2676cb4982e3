/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "daemon/services/ledger_signer_adapter.h"
#include "daemon/infrastructure/disconnection_tracker.h"
#include "mocks/mock_configuration_provider.h"
#include "mocks/mock_device_enumerator.h"
#include "mocks/mock_hotplug_monitor.h"
#include "mocks/mock_signer_transport.h"
#include "fixtures/test_usb_device_fixture.h"

#include <QtTest>
#include <QSignalSpy>

using namespace LedgerSigner::Daemon;
using namespace LedgerSigner::Shared;

/**
 * @brief Tests for LedgerSignerAdapter
 *
 * End-to-end through the façade: hot-plug events from a mock monitor,
 * vendor filtering, initial scan, configuration propagation and close().
 */
class TestLedgerSignerAdapter : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testOpen_StartsMonitor();
    void testOpen_ScansPresentDevices();
    void testOpen_MonitorFailure();
    void testForeignVendor_Ignored();
    void testHotplug_AppSwitchCycle();
    void testConfigurationChange_Rederives();
    void testReload_BySignerId();
    void testClose_Idempotent();

private:
    void createAdapter();

    std::unique_ptr<MockConfigurationProvider> m_config;
    std::unique_ptr<MockTransportFactory> m_factory;
    std::unique_ptr<LedgerSignerAdapter> m_adapter;
    MockDeviceEnumerator *m_enumerator = nullptr;
    MockHotplugMonitor *m_monitor = nullptr;
};

void TestLedgerSignerAdapter::init()
{
    m_config = std::make_unique<MockConfigurationProvider>();
    m_factory = std::make_unique<MockTransportFactory>();
    createAdapter();
}

void TestLedgerSignerAdapter::cleanup()
{
    m_adapter.reset();
    m_enumerator = nullptr;
    m_monitor = nullptr;
    m_factory.reset();
    m_config.reset();
}

void TestLedgerSignerAdapter::createAdapter()
{
    auto enumerator = std::make_unique<MockDeviceEnumerator>();
    auto monitor = std::make_unique<MockHotplugMonitor>();
    m_enumerator = enumerator.get();
    m_monitor = monitor.get();

    ReconnectionPolicy policy;
    policy.trackDisconnections = true;
    policy.graceWindowMs = 250;

    m_adapter = std::make_unique<LedgerSignerAdapter>(std::move(enumerator), std::move(monitor),
                                                      m_factory->factory(), m_config.get(), policy);
}

void TestLedgerSignerAdapter::testOpen_StartsMonitor()
{
    QVERIFY(!m_adapter->isOpen());

    QVERIFY(m_adapter->open().isSuccess());

    QVERIFY(m_adapter->isOpen());
    QVERIFY(m_monitor->isRunning());
    QCOMPARE(m_monitor->startCount(), 1);

    // Second open is a no-op
    QVERIFY(m_adapter->open().isSuccess());
    QCOMPARE(m_monitor->startCount(), 1);
}

void TestLedgerSignerAdapter::testOpen_ScansPresentDevices()
{
    QSignalSpy addedSpy(m_adapter.get(), &LedgerSignerAdapter::signerAdded);

    m_enumerator->plug("/dev/hidraw2", TestUsbDeviceFixture::NANO_S_PLUS);
    m_enumerator->plug("/dev/hidraw5", TestUsbDeviceFixture::NANO_X);

    QVERIFY(m_adapter->open().isSuccess());

    QCOMPARE(addedSpy.count(), 2);
    QCOMPARE(m_adapter->signers().size(), 2);

    const auto *registry = m_adapter->controller()->registry();
    QCOMPARE(registry->lookupByPath("/dev/hidraw2")->modelId(), QString("nanoSP"));
    QCOMPARE(registry->lookupByPath("/dev/hidraw5")->modelId(), QString("nanoX"));
}

void TestLedgerSignerAdapter::testOpen_MonitorFailure()
{
    m_monitor->setStartError("netlink socket unavailable");

    const auto result = m_adapter->open();

    QVERIFY(result.isError());
    QCOMPARE(result.error(), QString("netlink socket unavailable"));
    QVERIFY(!m_adapter->isOpen());

    // Events are not routed after a failed open
    m_enumerator->plug("/dev/hidraw1", TestUsbDeviceFixture::NANO_X);
    m_monitor->attach(LEDGER_USB_VENDOR_ID, TestUsbDeviceFixture::NANO_X);
    QVERIFY(m_adapter->signers().isEmpty());
}

void TestLedgerSignerAdapter::testForeignVendor_Ignored()
{
    QSignalSpy unresolvedSpy(m_adapter.get(), &LedgerSignerAdapter::attachUnresolved);
    QVERIFY(m_adapter->open().isSuccess());

    m_monitor->attach(TestUsbDeviceFixture::FOREIGN_VENDOR, 0xc52b);
    m_monitor->detach(TestUsbDeviceFixture::FOREIGN_VENDOR, 0xc52b);

    // Would be unresolved if it had reached the controller
    QCOMPARE(unresolvedSpy.count(), 0);
    QCOMPARE(m_factory->createdCount(), 0);
}

void TestLedgerSignerAdapter::testHotplug_AppSwitchCycle()
{
    QSignalSpy addedSpy(m_adapter.get(), &LedgerSignerAdapter::signerAdded);
    QSignalSpy removedSpy(m_adapter.get(), &LedgerSignerAdapter::signerRemoved);
    QVERIFY(m_adapter->open().isSuccess());

    m_enumerator->plug("/dev/hidraw1", TestUsbDeviceFixture::NANO_X);
    m_monitor->attach(LEDGER_USB_VENDOR_ID, TestUsbDeviceFixture::NANO_X);
    QCOMPARE(addedSpy.count(), 1);

    m_enumerator->unplug("/dev/hidraw1");
    m_monitor->detach(LEDGER_USB_VENDOR_ID, TestUsbDeviceFixture::NANO_X);

    m_enumerator->plug("/dev/hidraw3", TestUsbDeviceFixture::NANO_X);
    m_monitor->attach(LEDGER_USB_VENDOR_ID, TestUsbDeviceFixture::NANO_X);

    QCOMPARE(addedSpy.count(), 1);
    QCOMPARE(m_adapter->signers().size(), 1);
    QCOMPARE(m_adapter->signers().first()->id(), QString("S1"));
    QCOMPARE(m_adapter->signers().first()->devicePath(), QString("/dev/hidraw3"));

    // Device unplugged for good
    m_enumerator->unplug("/dev/hidraw3");
    m_monitor->detach(LEDGER_USB_VENDOR_ID, TestUsbDeviceFixture::NANO_X);

    QTRY_COMPARE_WITH_TIMEOUT(removedSpy.count(), 1, 2000);
    QCOMPARE(removedSpy.at(0).at(0).toString(), QString("S1"));
    QVERIFY(m_adapter->signers().isEmpty());
}

void TestLedgerSignerAdapter::testConfigurationChange_Rederives()
{
    m_config->setDerivation(DerivationScheme::Standard, 0);
    m_enumerator->plug("/dev/hidraw1", TestUsbDeviceFixture::NANO_X);
    QVERIFY(m_adapter->open().isSuccess());

    QTRY_COMPARE(m_factory->record(0)->deriveCount, 1);

    m_config->setDerivation(DerivationScheme::Live, 20);

    QCOMPARE(m_factory->record(0)->deriveCount, 2);
    QCOMPARE(m_factory->record(0)->lastDerivation.accountLimit, 20);
}

void TestLedgerSignerAdapter::testReload_BySignerId()
{
    m_enumerator->plug("/dev/hidraw1", TestUsbDeviceFixture::NANO_X);
    QVERIFY(m_adapter->open().isSuccess());
    QTRY_COMPARE(m_factory->record(0)->connectCount, 1);

    QVERIFY(m_adapter->reload("S1"));
    QTRY_COMPARE(m_factory->record(0)->connectCount, 2);

    QVERIFY(!m_adapter->reload("S42"));
}

void TestLedgerSignerAdapter::testClose_Idempotent()
{
    QSignalSpy removedSpy(m_adapter.get(), &LedgerSignerAdapter::signerRemoved);

    m_enumerator->plug("/dev/hidraw1", TestUsbDeviceFixture::NANO_X);
    QVERIFY(m_adapter->open().isSuccess());

    m_adapter->close();
    m_adapter->close();

    QVERIFY(!m_adapter->isOpen());
    QVERIFY(!m_monitor->isRunning());
    QCOMPARE(m_monitor->stopCount(), 1);
    QCOMPARE(removedSpy.count(), 1);
    QCOMPARE(m_factory->record(0)->closeCount, 1);

    // No routing and no configuration updates after close
    m_monitor->attach(LEDGER_USB_VENDOR_ID, TestUsbDeviceFixture::NANO_X);
    QCOMPARE(m_factory->createdCount(), 1);
    m_config->setDerivation(DerivationScheme::Testnet, 0);
    QVERIFY(m_adapter->signers().isEmpty());
}

QTEST_GUILESS_MAIN(TestLedgerSignerAdapter)
#include "test_ledger_signer_adapter.moc"
