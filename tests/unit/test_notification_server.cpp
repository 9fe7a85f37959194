// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_notification_server.cpp
 * @brief End-to-end tests of the notification protocol core without a bus
 *
 * Tests cover:
 * 1. Notify: id allocation, replace semantics, body round-trip
 * 2. Close: exactly-once NotificationClosed, unknown ids, reasons
 * 3. Expiry: per-urgency defaults, never-expire, replace re-arming
 * 4. Actions: ActionInvoked ordering, resident hint, presenter dismissal
 * 5. Capabilities, server information and the markup switch
 * 6. Display limit, presenter refusal, id exhaustion, history recording
 * 7. Configured commands and the startup notification
 */

#include <QTest>
#include <QFile>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>

#include "config/settings.h"
#include "core/notificationhistory.h"
#include "core/notificationserver.h"
#include "mockpresenter.h"

using namespace Herald;

class TestNotificationServer : public QObject
{
    Q_OBJECT

private:
    static NotifyRequest request(const QString& summary, const QString& body = QString(), int timeout = 0)
    {
        NotifyRequest req;
        req.appName = QStringLiteral("test-app");
        req.summary = summary;
        req.body = body;
        req.expireTimeout = timeout;
        return req;
    }

    std::unique_ptr<Settings> m_settings;

private Q_SLOTS:

    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        m_settings = std::make_unique<Settings>(QStringLiteral("herald-server-testrc"));
        m_settings->reset();
    }

    void cleanup()
    {
        m_settings.reset();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Notify
    // ═══════════════════════════════════════════════════════════════════════════

    void test_notify_idsStartAtOne()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        QCOMPARE(server.notify(request(QStringLiteral("a"))), std::optional<quint32>(1));
        QCOMPARE(server.notify(request(QStringLiteral("b"))), std::optional<quint32>(2));
        QCOMPARE(server.activeCount(), 2);
        QCOMPARE(presenter.presented.size(), 2);
        QVERIFY(!presenter.presented.at(0).replaced);
    }

    void test_notify_replaceKeepsId()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("Downloading 10%")));
        QVERIFY(id);

        NotifyRequest update = request(QStringLiteral("Downloading 90%"));
        update.replacesId = *id;
        QCOMPARE(server.notify(update), id);

        QCOMPARE(server.activeCount(), 1);
        QCOMPARE(server.notification(*id)->summary, QStringLiteral("Downloading 90%"));
        QCOMPARE(presenter.presented.size(), 2);
        QVERIFY(presenter.presented.last().replaced);
        // Replacing is not a close
        QCOMPARE(closedSpy.count(), 0);
    }

    void test_notify_replaceUnknownIdAllocatesFresh()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        NotifyRequest req = request(QStringLiteral("x"));
        req.replacesId = 500;
        QCOMPARE(server.notify(req), std::optional<quint32>(1));
    }

    void test_notify_bodyRoundTrip_data()
    {
        QTest::addColumn<QString>("body");
        QTest::newRow("multiline") << QStringLiteral("Line one\nLine two\nLine three");
        QTest::newRow("unicode") << QStringLiteral("Stars: ★★★ Arrows: → ← ↑ ↓");
        QTest::newRow("special") << QStringLiteral("a < b && c > d \"quoted\" 'single'");
        QTest::newRow("tabs") << QStringLiteral("col1\tcol2\n\nafter blank line");
        QTest::newRow("empty") << QString();
    }

    void test_notify_bodyRoundTrip()
    {
        QFETCH(QString, body);

        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        const auto id = server.notify(request(QStringLiteral("summary"), body));
        QVERIFY(id);
        QCOMPARE(server.notification(*id)->body, body);
        QCOMPARE(presenter.presented.last().body, body);
    }

    void test_notify_displayMarkupFollowsSetting()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        const QString body = QStringLiteral("<b>bold</b> <script>x</script>");

        server.notify(request(QStringLiteral("s"), body));
        QCOMPARE(presenter.presented.last().bodyMarkup, QStringLiteral("<b>bold</b> &lt;script&gt;x&lt;/script&gt;"));

        m_settings->setBodyMarkup(false);
        server.notify(request(QStringLiteral("s"), body));
        QCOMPARE(presenter.presented.last().bodyMarkup,
                 QStringLiteral("&lt;b&gt;bold&lt;/b&gt; &lt;script&gt;x&lt;/script&gt;"));
        // Stored text is unchanged either way
        QCOMPARE(presenter.presented.last().body, body);
    }

    void test_notify_controlCharactersRemoved()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        QString summary = QStringLiteral("Hi");
        summary.append(QChar(0x0000));
        summary.append(QStringLiteral("\nthere"));

        const auto id = server.notify(request(summary, QStringLiteral("a\r\nb")));
        QVERIFY(id);
        QCOMPARE(server.notification(*id)->summary, QStringLiteral("Hi there"));
        QCOMPARE(server.notification(*id)->body, QStringLiteral("a\nb"));
    }

    void test_notify_oddActionsAccepted()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        NotifyRequest req = request(QStringLiteral("s"));
        req.actions = {QStringLiteral("ok"), QStringLiteral("OK"), QStringLiteral("orphan")};
        const auto id = server.notify(req);
        QVERIFY(id);
        QCOMPARE(presenter.presented.last().actions.size(), 1);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Close
    // ═══════════════════════════════════════════════════════════════════════════

    void test_close_emitsExactlyOnce()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("x")));
        QVERIFY(id);
        QCOMPARE(server.closeNotification(*id), Outcome::Applied);
        QCOMPARE(server.closeNotification(*id), Outcome::AlreadyGone);
        QCOMPARE(server.dismiss(*id), Outcome::AlreadyGone);

        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(0).value<quint32>(), *id);
        QCOMPARE(closedSpy.at(0).at(1).toUInt(), 3u);
        QCOMPARE(presenter.withdrawn.size(), 1);
        QCOMPARE(presenter.withdrawn.at(0).second, CloseReason::CallerClosed);
    }

    void test_close_unknownIdSilent()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        QCOMPARE(server.closeNotification(77), Outcome::AlreadyGone);
        QCOMPARE(server.closeNotification(0), Outcome::AlreadyGone);
        QCOMPARE(closedSpy.count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Expiry
    // ═══════════════════════════════════════════════════════════════════════════

    void test_expiry_closesWithExpired()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("x"), QString(), 80));
        QVERIFY(id);
        QVERIFY(server.scheduler().isScheduled(*id));

        QTRY_COMPARE_WITH_TIMEOUT(closedSpy.count(), 1, 3000);
        QCOMPARE(closedSpy.at(0).at(1).toUInt(), 1u);
        QCOMPARE(server.activeCount(), 0);
    }

    void test_expiry_zeroNeverExpires()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("x"), QString(), 0));
        QVERIFY(id);
        QVERIFY(!server.scheduler().isScheduled(*id));
        QTest::qWait(150);
        QCOMPARE(closedSpy.count(), 0);
        QCOMPARE(server.activeCount(), 1);
    }

    void test_expiry_defaultFollowsUrgency()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        m_settings->setLowTimeoutMs(1000);
        m_settings->setCriticalTimeoutMs(0);

        NotifyRequest low = request(QStringLiteral("low"), QString(), -1);
        low.hints.insert(QStringLiteral("urgency"), QVariant::fromValue<uchar>(0));
        const auto lowId = server.notify(low);

        NotifyRequest critical = request(QStringLiteral("critical"), QString(), -1);
        critical.hints.insert(QStringLiteral("urgency"), QVariant::fromValue<uchar>(2));
        const auto criticalId = server.notify(critical);

        QVERIFY(lowId && criticalId);
        QCOMPARE(server.notification(*lowId)->effectiveTimeoutMs, 1000);
        QVERIFY(server.scheduler().isScheduled(*lowId));
        QVERIFY(!server.scheduler().isScheduled(*criticalId));
        QCOMPARE(presenter.presented.last().urgency, Urgency::Critical);
    }

    void test_expiry_negativeTimeoutTreatedAsDefault()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        const auto id = server.notify(request(QStringLiteral("x"), QString(), -42));
        QVERIFY(id);
        QCOMPARE(server.notification(*id)->expireTimeoutMs, -1);
        QCOMPARE(server.notification(*id)->effectiveTimeoutMs, m_settings->normalTimeoutMs());
    }

    void test_expiry_replaceRearmsTimer()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("first"), QString(), 60));
        QVERIFY(id);

        // Replace with "never expire" before the first timer runs out
        NotifyRequest update = request(QStringLiteral("second"), QString(), 0);
        update.replacesId = *id;
        server.notify(update);

        QTest::qWait(200);
        QCOMPARE(closedSpy.count(), 0);
        QCOMPARE(server.notification(*id)->summary, QStringLiteral("second"));
    }

    void test_expiry_closeCancelsTimer()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("x"), QString(), 50));
        QVERIFY(id);
        server.closeNotification(*id);
        QVERIFY(!server.scheduler().isScheduled(*id));

        QTest::qWait(150);
        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).toUInt(), 3u);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Actions
    // ═══════════════════════════════════════════════════════════════════════════

    void test_action_defaultInvokedThenDismissed()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        QStringList events;
        connect(&server, &NotificationServer::actionInvoked, this, [&events](quint32 id, const QString& key) {
            events << QStringLiteral("action %1 %2").arg(id).arg(key);
        });
        connect(&server, &NotificationServer::notificationClosed, this, [&events](quint32 id, uint reason) {
            events << QStringLiteral("closed %1 %2").arg(id).arg(reason);
        });

        NotifyRequest req = request(QStringLiteral("Click me"));
        req.actions = {QStringLiteral("default"), QStringLiteral("Open")};
        const auto id = server.notify(req);
        QVERIFY(id);

        presenter.clickAction(*id, QStringLiteral("default"));
        QCOMPARE(events, (QStringList{QStringLiteral("action 1 default"), QStringLiteral("closed 1 2")}));
        QCOMPARE(server.activeCount(), 0);
    }

    void test_action_residentStaysActive()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy actionSpy(&server, &NotificationServer::actionInvoked);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        NotifyRequest req = request(QStringLiteral("Player"));
        req.actions = {QStringLiteral("play"), QStringLiteral("Play")};
        req.hints.insert(QStringLiteral("resident"), true);
        const auto id = server.notify(req);
        QVERIFY(id);

        presenter.clickAction(*id, QStringLiteral("play"));
        QCOMPARE(actionSpy.count(), 1);
        QCOMPARE(closedSpy.count(), 0);
        QCOMPARE(server.activeCount(), 1);
    }

    void test_action_presenterDismiss()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy actionSpy(&server, &NotificationServer::actionInvoked);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("x")));
        QVERIFY(id);
        presenter.clickDismiss(*id);
        presenter.clickDismiss(*id);

        QCOMPARE(actionSpy.count(), 0);
        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(1).toUInt(), 2u);
    }

    void test_action_afterExpiryIgnored()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy actionSpy(&server, &NotificationServer::actionInvoked);

        NotifyRequest req = request(QStringLiteral("x"), QString(), 30);
        req.actions = {QStringLiteral("ok"), QStringLiteral("OK")};
        const auto id = server.notify(req);
        QVERIFY(id);
        QTRY_COMPARE_WITH_TIMEOUT(server.activeCount(), 0, 3000);

        QCOMPARE(server.invokeAction(*id, QStringLiteral("ok")), Outcome::AlreadyGone);
        QCOMPARE(actionSpy.count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Capabilities and server information
    // ═══════════════════════════════════════════════════════════════════════════

    void test_capabilities_intersectedAndSorted()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        QCOMPARE(server.capabilities(), (QStringList{QStringLiteral("actions"), QStringLiteral("body"),
                                                     QStringLiteral("body-hyperlinks"), QStringLiteral("body-markup")}));
    }

    void test_capabilities_markupDisabled()
    {
        MockPresenter presenter;
        presenter.caps << QStringLiteral("body-images");
        NotificationServer server(m_settings.get(), &presenter);
        m_settings->setBodyMarkup(false);

        QCOMPARE(server.capabilities(), (QStringList{QStringLiteral("actions"), QStringLiteral("body")}));
    }

    void test_serverInformation()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        const ServerInformation info = server.serverInformation();
        QCOMPARE(info.name, QStringLiteral("Herald"));
        QCOMPARE(info.vendor, QStringLiteral("Herald"));
        QVERIFY(!info.version.isEmpty());
        QCOMPARE(info.specVersion, QStringLiteral("1.2"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Limits and failures
    // ═══════════════════════════════════════════════════════════════════════════

    void test_displayLimit_evictsOldest()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);
        m_settings->setDisplayLimit(2);

        server.notify(request(QStringLiteral("1")));
        server.notify(request(QStringLiteral("2")));
        const auto third = server.notify(request(QStringLiteral("3")));
        QVERIFY(third);
        // Eviction waits until the Notify call has returned
        QCOMPARE(closedSpy.count(), 0);

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(server.activeCount(), 2);
        QCOMPARE(closedSpy.at(0).at(0).value<quint32>(), 1u);
        QCOMPARE(closedSpy.at(0).at(1).toUInt(), 4u);
        QVERIFY(server.notification(*third).has_value());
    }

    void test_displayLimit_loweredAtRuntime()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        for (int i = 0; i < 4; ++i) {
            server.notify(request(QString::number(i)));
        }
        m_settings->setDisplayLimit(1);
        QCOMPARE(server.activeCount(), 1);
        QCOMPARE(server.activeNotifications().first().id, 4u);
    }

    void test_presenterRefusal_closesWithUndefined()
    {
        MockPresenter presenter;
        presenter.refuse = true;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("x")));
        QVERIFY(id);
        // The caller gets its id before NotificationClosed goes out
        QCOMPARE(closedSpy.count(), 0);

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(0).value<quint32>(), *id);
        QCOMPARE(closedSpy.at(0).at(1).toUInt(), 4u);
        QCOMPARE(server.activeCount(), 0);
    }

    void test_presenterRefusal_replacedBeforeCloseKeepsRecord()
    {
        MockPresenter presenter;
        presenter.refuse = true;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        const auto id = server.notify(request(QStringLiteral("first")));
        QVERIFY(id);
        presenter.refuse = false;
        NotifyRequest update = request(QStringLiteral("second"));
        update.replacesId = *id;
        QCOMPARE(server.notify(update), id);

        // The pending close targeted the refused revision only
        QTest::qWait(50);
        QCOMPARE(closedSpy.count(), 0);
        QCOMPARE(server.notification(*id)->summary, QStringLiteral("second"));
    }

    void test_exhaustion_rejectsNewButAllowsReplace()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter, nullptr, nullptr, 2);

        QVERIFY(server.notify(request(QStringLiteral("1"))));
        QVERIFY(server.notify(request(QStringLiteral("2"))));
        QVERIFY(!server.notify(request(QStringLiteral("3"))).has_value());

        NotifyRequest update = request(QStringLiteral("1b"));
        update.replacesId = 1;
        QCOMPARE(server.notify(update), std::optional<quint32>(1));

        server.closeNotification(2);
        QCOMPARE(server.notify(request(QStringLiteral("again"))), std::optional<quint32>(2));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // History
    // ═══════════════════════════════════════════════════════════════════════════

    void test_history_recordsButSkipsTransient()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        NotificationHistory history(dir.filePath(QStringLiteral("history.json")), 100);

        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter, &history);

        server.notify(request(QStringLiteral("kept"), QStringLiteral("body")));

        NotifyRequest transient = request(QStringLiteral("skipped"));
        transient.hints.insert(QStringLiteral("transient"), true);
        server.notify(transient);

        QCOMPARE(history.count(), 1);
        QCOMPARE(history.all().first().summary, QStringLiteral("kept"));

        m_settings->setHistoryEnabled(false);
        server.notify(request(QStringLiteral("disabled")));
        QCOMPARE(history.count(), 1);
    }

    void test_history_limitFollowsSetting()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        NotificationHistory history(dir.filePath(QStringLiteral("history.json")), 100);

        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter, &history);
        m_settings->setHistoryLimit(2);
        QCOMPARE(history.limit(), 2);

        for (int i = 0; i < 4; ++i) {
            server.notify(request(QString::number(i)));
        }
        QCOMPARE(history.count(), 2);
        QCOMPARE(history.recent(1).first().summary, QStringLiteral("3"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Commands and startup
    // ═══════════════════════════════════════════════════════════════════════════

    void test_commands_startedOnNotify()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        CommandRule critical;
        critical.name = QStringLiteral("critical");
        critical.command = QStringLiteral("touch ") + dir.path() + QStringLiteral("/critical-{id}");
        critical.urgency = Urgency::Critical;
        CommandRule any;
        any.name = QStringLiteral("any");
        any.command = QStringLiteral("touch ") + dir.path() + QStringLiteral("/any-{id}");
        m_settings->setCommandRules({critical, any});

        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);

        NotifyRequest urgent = request(QStringLiteral("disk full"));
        urgent.hints.insert(QStringLiteral("urgency"), 2);
        const auto first = server.notify(urgent);
        const auto second = server.notify(request(QStringLiteral("hello")));
        QVERIFY(first && second);

        // The shell joins the quoted {id} word onto the file name prefix
        QTRY_VERIFY(QFile::exists(dir.filePath(QStringLiteral("critical-%1").arg(*first))));
        QTRY_VERIFY(QFile::exists(dir.filePath(QStringLiteral("any-%1").arg(*first))));
        QTRY_VERIFY(QFile::exists(dir.filePath(QStringLiteral("any-%1").arg(*second))));
        QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("critical-%1").arg(*second))));
    }

    void test_startup_announcedWhenEnabled()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        NotificationHistory history(dir.filePath(QStringLiteral("history.json")), 100);

        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter, &history);

        QVERIFY(!server.announceStartup().has_value());
        QVERIFY(presenter.presented.isEmpty());

        m_settings->setStartupNotification(true);
        const auto id = server.announceStartup();
        QVERIFY(id);
        QCOMPARE(presenter.presented.size(), 1);
        QCOMPARE(presenter.presented.last().appName, QStringLiteral("Herald"));
        QVERIFY(presenter.presented.last().summary.startsWith(QStringLiteral("Herald ")));
        QVERIFY(presenter.presented.last().urgency == Urgency::Low);
        // Transient, so it never reaches the history log
        QCOMPARE(history.count(), 0);
        QVERIFY(server.notification(*id).has_value());
    }

    void test_shutdown_silent()
    {
        MockPresenter presenter;
        NotificationServer server(m_settings.get(), &presenter);
        QSignalSpy closedSpy(&server, &NotificationServer::notificationClosed);

        server.notify(request(QStringLiteral("x"), QString(), 50));
        server.shutdown();
        QTest::qWait(100);
        QCOMPARE(server.activeCount(), 0);
        QCOMPARE(closedSpy.count(), 0);
    }
};

QTEST_MAIN(TestNotificationServer)
#include "test_notification_server.moc"
