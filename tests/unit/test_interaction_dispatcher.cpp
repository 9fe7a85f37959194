// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/interactiondispatcher.h"
#include "core/notificationstore.h"

using namespace Herald;

/**
 * @brief Unit tests for InteractionDispatcher
 *
 * Tests cover:
 * - Exactly one close signal per notification
 * - Action invocation order (ActionInvoked before NotificationClosed)
 * - Resident notifications surviving action invocation
 * - Undeclared action keys and the implicit "default" key
 * - Revision-guarded closes
 */
class TestInteractionDispatcher : public QObject
{
    Q_OBJECT

private:
    static quint32 insert(NotificationStore& store, const QStringList& flatActions = {}, bool resident = false)
    {
        Notification record;
        record.appName = QStringLiteral("test");
        record.summary = QStringLiteral("summary");
        record.actions = parseActions(flatActions);
        record.hints.resident = resident;
        const auto result = store.insertOrReplace(record);
        return result ? result->record.id : 0;
    }

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Close
    // ═══════════════════════════════════════════════════════════════════════════

    void test_close_emitsOnce()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy closedSpy(&dispatcher, &InteractionDispatcher::notificationClosed);
        QSignalSpy removedSpy(&dispatcher, &InteractionDispatcher::removed);

        const quint32 id = insert(store);
        QCOMPARE(dispatcher.close(id, CloseReason::CallerClosed), Outcome::Applied);
        QCOMPARE(dispatcher.close(id, CloseReason::CallerClosed), Outcome::AlreadyGone);
        QCOMPARE(dispatcher.dismiss(id), Outcome::AlreadyGone);

        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(0).value<quint32>(), id);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::CallerClosed);
        QCOMPARE(removedSpy.at(0).at(0).value<Notification>().summary, QStringLiteral("summary"));
    }

    void test_close_unknownIdSilent()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy closedSpy(&dispatcher, &InteractionDispatcher::notificationClosed);

        QCOMPARE(dispatcher.close(42, CloseReason::CallerClosed), Outcome::AlreadyGone);
        QCOMPARE(closedSpy.count(), 0);
    }

    void test_closeIfRevision_staleIgnored()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy closedSpy(&dispatcher, &InteractionDispatcher::notificationClosed);

        const quint32 id = insert(store);
        Notification replacement;
        replacement.summary = QStringLiteral("replacement");
        store.insertOrReplace(replacement, id);

        QCOMPARE(dispatcher.closeIfRevision(id, 1, CloseReason::Expired), Outcome::AlreadyGone);
        QCOMPARE(closedSpy.count(), 0);
        QCOMPARE(dispatcher.closeIfRevision(id, 2, CloseReason::Expired), Outcome::Applied);
        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).value<CloseReason>(), CloseReason::Expired);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Actions
    // ═══════════════════════════════════════════════════════════════════════════

    void test_invokeAction_signalOrder()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);

        QStringList order;
        connect(&dispatcher, &InteractionDispatcher::actionInvoked, this, [&order](quint32, const QString& key) {
            order << QStringLiteral("action:") + key;
        });
        connect(&dispatcher, &InteractionDispatcher::notificationClosed, this, [&order](quint32, CloseReason reason) {
            order << QStringLiteral("closed:") + QString::number(static_cast<uint>(reason));
        });

        const quint32 id = insert(store, {QStringLiteral("reply"), QStringLiteral("Reply")});
        QCOMPARE(dispatcher.invokeAction(id, QStringLiteral("reply")), Outcome::Applied);
        QCOMPARE(order, (QStringList{QStringLiteral("action:reply"), QStringLiteral("closed:2")}));
        QVERIFY(!store.contains(id));
    }

    void test_invokeAction_residentStaysOpen()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy actionSpy(&dispatcher, &InteractionDispatcher::actionInvoked);
        QSignalSpy closedSpy(&dispatcher, &InteractionDispatcher::notificationClosed);

        const quint32 id = insert(store, {QStringLiteral("pause"), QStringLiteral("Pause")}, true);
        QCOMPARE(dispatcher.invokeAction(id, QStringLiteral("pause")), Outcome::Applied);
        QCOMPARE(dispatcher.invokeAction(id, QStringLiteral("pause")), Outcome::Applied);

        QCOMPARE(actionSpy.count(), 2);
        QCOMPARE(closedSpy.count(), 0);
        QVERIFY(store.contains(id));
    }

    void test_invokeAction_undeclaredKeyDropped()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy actionSpy(&dispatcher, &InteractionDispatcher::actionInvoked);

        const quint32 id = insert(store, {QStringLiteral("ok"), QStringLiteral("OK")});
        QCOMPARE(dispatcher.invokeAction(id, QStringLiteral("delete-everything")), Outcome::AlreadyGone);
        QCOMPARE(actionSpy.count(), 0);
        QVERIFY(store.contains(id));
    }

    void test_invokeAction_defaultAlwaysAccepted()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy actionSpy(&dispatcher, &InteractionDispatcher::actionInvoked);

        const quint32 id = insert(store);
        QCOMPARE(dispatcher.invokeAction(id, QStringLiteral("default")), Outcome::Applied);
        QCOMPARE(actionSpy.count(), 1);
        QCOMPARE(actionSpy.at(0).at(1).toString(), QStringLiteral("default"));
    }

    void test_invokeAction_afterCloseIgnored()
    {
        NotificationStore store;
        InteractionDispatcher dispatcher(&store);
        QSignalSpy actionSpy(&dispatcher, &InteractionDispatcher::actionInvoked);

        const quint32 id = insert(store, {QStringLiteral("ok"), QStringLiteral("OK")});
        dispatcher.close(id, CloseReason::CallerClosed);
        QCOMPARE(dispatcher.invokeAction(id, QStringLiteral("ok")), Outcome::AlreadyGone);
        QCOMPARE(actionSpy.count(), 0);
    }
};

QTEST_MAIN(TestInteractionDispatcher)
#include "test_interaction_dispatcher.moc"
