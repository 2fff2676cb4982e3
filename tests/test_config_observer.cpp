/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "daemon/config/config_observer.h"
#include "daemon/config/config_subscription.h"
#include "daemon/registry/signer_registry.h"
#include "daemon/signer/signer_handle.h"
#include "mocks/mock_configuration_provider.h"
#include "mocks/mock_signer_transport.h"

#include <QtTest>
#include <QSignalSpy>

using namespace LedgerSigner::Daemon;
using namespace LedgerSigner::Shared;

/**
 * @brief Tests for ConfigObserver and ConfigSubscription
 *
 * Verifies that configuration changes re-derive exactly the signers
 * whose effective configuration changed.
 */
class TestConfigObserver : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    // ConfigSubscription
    void testSubscription_InvokesSynchronously();
    void testSubscription_RemoveStopsCallbacks();
    void testSubscription_DestructorRemoves();
    void testSubscription_NullProvider();
    void testSubscription_Move();

    // ConfigObserver
    void testStop_WithoutStart();
    void testChange_RederivesOutdatedSignersOnly();
    void testChange_Idempotent();
    void testChange_LimitIgnoredOutsideLive();
    void testStop_NoMoreUpdates();
    void testDisconnectedSigner_StoresWithoutDeriving();

private:
    SignerHandle *addConnectedSigner(const QString &path, const DerivationConfig &derivation);

    std::unique_ptr<MockConfigurationProvider> m_config;
    std::unique_ptr<SignerRegistry> m_registry;
    std::unique_ptr<ConfigObserver> m_observer;
    QList<std::shared_ptr<MockTransportRecord>> m_records;
};

void TestConfigObserver::init()
{
    m_config = std::make_unique<MockConfigurationProvider>();
    m_registry = std::make_unique<SignerRegistry>();
    m_observer = std::make_unique<ConfigObserver>(m_registry.get());
    m_records.clear();
}

void TestConfigObserver::cleanup()
{
    m_observer.reset();
    m_registry.reset();
    m_config.reset();
}

SignerHandle *TestConfigObserver::addConnectedSigner(const QString &path, const DerivationConfig &derivation)
{
    auto record = std::make_shared<MockTransportRecord>();
    m_records.append(record);

    auto handle = std::make_unique<SignerHandle>(m_registry->allocateId(), path, LedgerModel::NanoX,
                                                 std::make_unique<MockSignerTransport>(record));
    handle->applyDerivation(derivation);

    SignerHandle *signer = m_registry->insert(std::move(handle)).value();
    signer->openAndConnect();
    return signer;
}

// ========== ConfigSubscription ==========

void TestConfigObserver::testSubscription_InvokesSynchronously()
{
    int calls = 0;
    auto subscription = ConfigSubscription::observe(m_config.get(), [&calls]() {
        ++calls;
    });

    QVERIFY(subscription.isActive());
    m_config->setLiveAccountLimit(7);
    QCOMPARE(calls, 1);
}

void TestConfigObserver::testSubscription_RemoveStopsCallbacks()
{
    int calls = 0;
    auto subscription = ConfigSubscription::observe(m_config.get(), [&calls]() {
        ++calls;
    });

    subscription.remove();
    QVERIFY(!subscription.isActive());
    m_config->setLiveAccountLimit(7);
    QCOMPARE(calls, 0);

    // Second remove is harmless
    subscription.remove();
}

void TestConfigObserver::testSubscription_DestructorRemoves()
{
    int calls = 0;
    {
        auto subscription = ConfigSubscription::observe(m_config.get(), [&calls]() {
            ++calls;
        });
        m_config->reload();
    }
    m_config->reload();
    QCOMPARE(calls, 1);
}

void TestConfigObserver::testSubscription_NullProvider()
{
    auto subscription = ConfigSubscription::observe(nullptr, []() {});
    QVERIFY(!subscription.isActive());
}

void TestConfigObserver::testSubscription_Move()
{
    int calls = 0;
    ConfigSubscription target;
    {
        auto source = ConfigSubscription::observe(m_config.get(), [&calls]() {
            ++calls;
        });
        target = std::move(source);
    }

    QVERIFY(target.isActive());
    m_config->reload();
    QCOMPARE(calls, 1);
}

// ========== ConfigObserver ==========

void TestConfigObserver::testStop_WithoutStart()
{
    QVERIFY(!m_observer->isActive());
    m_observer->stop();
    QVERIFY(!m_observer->isActive());
    QCOMPARE(m_observer->applyConfiguration(), 0);
}

void TestConfigObserver::testChange_RederivesOutdatedSignersOnly()
{
    m_config->setDerivation(DerivationScheme::Standard, 0);

    addConnectedSigner("/dev/hidraw1", {DerivationScheme::Standard, 0});
    addConnectedSigner("/dev/hidraw2", {DerivationScheme::Standard, 0});
    SignerHandle *upToDate = addConnectedSigner("/dev/hidraw3", {DerivationScheme::Live, 20});

    for (const auto &record : std::as_const(m_records)) {
        QTRY_COMPARE(record->deriveCount, 1);
    }

    m_observer->start(m_config.get());
    QVERIFY(m_observer->isActive());

    QSignalSpy appliedSpy(m_observer.get(), &ConfigObserver::configurationApplied);
    m_config->setDerivation(DerivationScheme::Live, 20);

    QCOMPARE(appliedSpy.count(), 1);
    QCOMPARE(appliedSpy.at(0).at(0).toInt(), 2);

    QCOMPARE(m_records.at(0)->deriveCount, 2);
    QCOMPARE(m_records.at(1)->deriveCount, 2);
    QCOMPARE(m_records.at(2)->deriveCount, 1);

    QCOMPARE(m_records.at(0)->lastDerivation.accountLimit, 20);
    QVERIFY(m_records.at(1)->lastDerivation.scheme == DerivationScheme::Live);
    QCOMPARE(upToDate->accountLimit(), 20);
}

void TestConfigObserver::testChange_Idempotent()
{
    addConnectedSigner("/dev/hidraw1", {DerivationScheme::Standard, 0});
    QTRY_COMPARE(m_records.at(0)->deriveCount, 1);

    m_observer->start(m_config.get());
    m_config->setDerivation(DerivationScheme::Live, 20);
    QCOMPARE(m_records.at(0)->deriveCount, 2);

    m_config->setDerivation(DerivationScheme::Live, 20);
    m_config->reload();
    QCOMPARE(m_records.at(0)->deriveCount, 2);
}

void TestConfigObserver::testChange_LimitIgnoredOutsideLive()
{
    addConnectedSigner("/dev/hidraw1", {DerivationScheme::Legacy, 0});
    QTRY_COMPARE(m_records.at(0)->deriveCount, 1);

    m_observer->start(m_config.get());
    m_config->setDerivation(DerivationScheme::Legacy, 30);

    QCOMPARE(m_records.at(0)->deriveCount, 1);
}

void TestConfigObserver::testStop_NoMoreUpdates()
{
    addConnectedSigner("/dev/hidraw1", {DerivationScheme::Standard, 0});
    QTRY_COMPARE(m_records.at(0)->deriveCount, 1);

    m_observer->start(m_config.get());
    m_observer->stop();
    QVERIFY(!m_observer->isActive());

    m_config->setDerivation(DerivationScheme::Live, 20);
    QCOMPARE(m_records.at(0)->deriveCount, 1);
}

void TestConfigObserver::testDisconnectedSigner_StoresWithoutDeriving()
{
    auto record = std::make_shared<MockTransportRecord>();
    auto handle = std::make_unique<SignerHandle>(m_registry->allocateId(), "/dev/hidraw4", LedgerModel::NanoS,
                                                 std::make_unique<MockSignerTransport>(record));
    SignerHandle *signer = m_registry->insert(std::move(handle)).value();

    m_observer->start(m_config.get());
    m_config->setDerivation(DerivationScheme::Testnet, 0);

    QVERIFY(signer->derivationScheme() == DerivationScheme::Testnet);
    QCOMPARE(record->deriveCount, 0);

    // Picked up by the next connect
    signer->openAndConnect();
    QTRY_COMPARE(record->deriveCount, 1);
    QVERIFY(record->lastDerivation.scheme == DerivationScheme::Testnet);
}

QTEST_GUILESS_MAIN(TestConfigObserver)
#include "test_config_observer.moc"
