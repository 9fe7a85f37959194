// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QElapsedTimer>
#include <QSignalSpy>

#include "core/expiryscheduler.h"

using namespace Herald;

/**
 * @brief Unit tests for ExpiryScheduler
 *
 * Tests cover:
 * - Firing once with the armed revision, never before the deadline
 * - Non-positive timeouts never firing
 * - Re-arming and cancellation suppressing the old timer
 */
class TestExpiryScheduler : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    void test_schedule_firesOnceWithRevision()
    {
        ExpiryScheduler scheduler;
        QSignalSpy spy(&scheduler, &ExpiryScheduler::expired);

        QElapsedTimer elapsed;
        elapsed.start();
        scheduler.schedule(7, 3, 60);
        QVERIFY(scheduler.isScheduled(7));
        QCOMPARE(scheduler.pendingCount(), 1);

        QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
        QVERIFY(elapsed.elapsed() >= 60);
        QCOMPARE(spy.at(0).at(0).value<quint32>(), 7u);
        QCOMPARE(spy.at(0).at(1).value<quint64>(), quint64(3));
        QVERIFY(!scheduler.isScheduled(7));

        // Nothing else fires afterwards
        QTest::qWait(100);
        QCOMPARE(spy.count(), 1);
    }

    void test_schedule_nonPositiveNeverFires()
    {
        ExpiryScheduler scheduler;
        QSignalSpy spy(&scheduler, &ExpiryScheduler::expired);

        scheduler.schedule(1, 1, 0);
        scheduler.schedule(2, 1, -1);
        QCOMPARE(scheduler.pendingCount(), 0);
        QCOMPARE(scheduler.remainingMs(1), qint64(-1));

        QTest::qWait(50);
        QCOMPARE(spy.count(), 0);
    }

    void test_schedule_zeroCancelsExisting()
    {
        ExpiryScheduler scheduler;
        QSignalSpy spy(&scheduler, &ExpiryScheduler::expired);

        scheduler.schedule(1, 1, 30);
        scheduler.schedule(1, 2, 0);
        QVERIFY(!scheduler.isScheduled(1));

        QTest::qWait(100);
        QCOMPARE(spy.count(), 0);
    }

    void test_rearm_replacesOldTimer()
    {
        ExpiryScheduler scheduler;
        QSignalSpy spy(&scheduler, &ExpiryScheduler::expired);

        scheduler.schedule(5, 1, 30);
        scheduler.schedule(5, 2, 150);

        QTest::qWait(80);
        QCOMPARE(spy.count(), 0);
        QVERIFY(scheduler.remainingMs(5) > 0);

        QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
        QCOMPARE(spy.at(0).at(1).value<quint64>(), quint64(2));
    }

    void test_cancel()
    {
        ExpiryScheduler scheduler;
        QSignalSpy spy(&scheduler, &ExpiryScheduler::expired);

        scheduler.schedule(1, 1, 30);
        scheduler.schedule(2, 1, 30);
        QVERIFY(scheduler.cancel(1));
        QVERIFY(!scheduler.cancel(1));

        QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
        QCOMPARE(spy.at(0).at(0).value<quint32>(), 2u);
    }

    void test_cancelAll()
    {
        ExpiryScheduler scheduler;
        QSignalSpy spy(&scheduler, &ExpiryScheduler::expired);

        for (quint32 id = 1; id <= 5; ++id) {
            scheduler.schedule(id, 1, 20);
        }
        scheduler.cancelAll();
        QCOMPARE(scheduler.pendingCount(), 0);

        QTest::qWait(80);
        QCOMPARE(spy.count(), 0);
    }
};

QTEST_MAIN(TestExpiryScheduler)
#include "test_expiry_scheduler.moc"
