// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationserver.h"
#include "commandrunner.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include "notificationhistory.h"
#include "textsanitizer.h"
#include "version.h"

#include <QSet>
#include <algorithm>

namespace Herald {

namespace {

// Capabilities the core knows how to honor; anything else a presenter
// claims is never advertised
const QStringList& knownCapabilities()
{
    namespace Cap = Protocol::Capability;
    static const QStringList caps = {
        Cap::ActionIcons, Cap::Actions,    Cap::Body,        Cap::BodyHyperlinks, Cap::BodyImages,
        Cap::BodyMarkup,  Cap::IconStatic, Cap::Persistence, Cap::Sound,
    };
    return caps;
}

} // anonymous namespace

NotificationServer::NotificationServer(ISettings* settings, INotificationPresenter* presenter,
                                       NotificationHistory* history, QObject* parent, quint32 maxId)
    : QObject(parent)
    , m_settings(settings)
    , m_presenter(presenter)
    , m_history(history)
    , m_store(maxId)
    , m_scheduler(std::make_unique<ExpiryScheduler>())
    , m_dispatcher(std::make_unique<InteractionDispatcher>(&m_store))
{
    Q_ASSERT(m_settings);
    Q_ASSERT(m_presenter);

    // Expiry → close, only if the record was not replaced since the timer was armed
    connect(m_scheduler.get(), &ExpiryScheduler::expired, this, [this](quint32 id, quint64 revision) {
        m_dispatcher->closeIfRevision(id, revision, CloseReason::Expired);
    });

    connect(m_dispatcher.get(), &InteractionDispatcher::removed, this, &NotificationServer::onRemoved);
    connect(m_dispatcher.get(), &InteractionDispatcher::notificationClosed, this,
            [this](quint32 id, CloseReason reason) {
                Q_EMIT notificationClosed(id, static_cast<uint>(reason));
            });
    connect(m_dispatcher.get(), &InteractionDispatcher::actionInvoked, this, &NotificationServer::actionInvoked);

    connect(m_presenter, &INotificationPresenter::actionActivated, this, &NotificationServer::invokeAction);
    connect(m_presenter, &INotificationPresenter::dismissed, this, &NotificationServer::dismiss);

    if (m_history) {
        connect(m_settings, &ISettings::historyLimitChanged, m_history, [this]() {
            m_history->setLimit(m_settings->historyLimit());
        });
    }

    connect(m_settings, &ISettings::displayLimitChanged, this, [this]() {
        enforceDisplayLimit(0);
    });
}

NotificationServer::~NotificationServer()
{
    m_scheduler->cancelAll();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Notify
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<quint32> NotificationServer::notify(const NotifyRequest& request)
{
    const Notification record = buildRecord(request);

    const auto result = m_store.insertOrReplace(record, request.replacesId);
    if (!result) {
        qCWarning(lcCore) << "Rejecting notification from" << record.appName << "- no free id";
        return std::nullopt;
    }

    const Notification& stored = result->record;
    qCInfo(lcCore) << (result->replaced ? "Replaced" : "New") << "notification" << stored.id << "from"
                   << stored.appName << "urgency" << urgencyToString(stored.hints.urgency) << "timeout"
                   << stored.effectiveTimeoutMs;

    // Re-arming always cancels the previous timer, including on replace with timeout 0
    m_scheduler->schedule(stored.id, stored.revision, stored.effectiveTimeoutMs);

    recordHistory(stored);

    runCommands(stored);

    // Closes caused by this call are queued so the Notify reply reaches the
    // caller before the matching NotificationClosed
    const quint32 id = stored.id;
    if (!m_presenter || !m_presenter->present(buildDisplayRequest(stored, result->replaced))) {
        qCWarning(lcCore) << "Presenter refused notification" << id << "- closing it";
        const quint64 revision = stored.revision;
        QMetaObject::invokeMethod(
            this,
            [this, id, revision]() {
                m_dispatcher->closeIfRevision(id, revision, CloseReason::Undefined);
            },
            Qt::QueuedConnection);
        return id;
    }

    if (m_settings->displayLimit() > 0 && m_store.count() > m_settings->displayLimit()) {
        QMetaObject::invokeMethod(
            this,
            [this, id]() {
                enforceDisplayLimit(id);
            },
            Qt::QueuedConnection);
    }
    return id;
}

std::optional<quint32> NotificationServer::announceStartup()
{
    if (!m_settings->startupNotification()) {
        return std::nullopt;
    }

    NotifyRequest request;
    request.appName = QString(Protocol::ServerName);
    request.summary = QStringLiteral("%1 %2 started").arg(Protocol::ServerName, VERSION_STRING);
    request.body = QStringLiteral("Listening on %1").arg(DBus::ServiceName);
    request.hints.insert(QString(Protocol::Hint::Urgency), static_cast<int>(Urgency::Low));
    request.hints.insert(QString(Protocol::Hint::Transient), true);
    return notify(request);
}

Outcome NotificationServer::closeNotification(quint32 id)
{
    return m_dispatcher->close(id, CloseReason::CallerClosed);
}

QStringList NotificationServer::capabilities() const
{
    const QStringList offered = m_presenter ? m_presenter->capabilities() : QStringList();
    const bool markup = m_settings->bodyMarkup();

    QSet<QString> caps;
    for (const QString& cap : offered) {
        if (!knownCapabilities().contains(cap)) {
            continue;
        }
        if (!markup
            && (cap == Protocol::Capability::BodyMarkup || cap == Protocol::Capability::BodyHyperlinks
                || cap == Protocol::Capability::BodyImages)) {
            continue;
        }
        caps.insert(cap);
    }

    QStringList result(caps.cbegin(), caps.cend());
    std::sort(result.begin(), result.end());
    return result;
}

ServerInformation NotificationServer::serverInformation() const
{
    return ServerInformation{Protocol::ServerName, Protocol::ServerVendor, VERSION_STRING, Protocol::SpecVersion};
}

Outcome NotificationServer::invokeAction(quint32 id, const QString& actionKey)
{
    return m_dispatcher->invokeAction(id, TextSanitizer::sanitizeText(actionKey));
}

Outcome NotificationServer::dismiss(quint32 id)
{
    return m_dispatcher->dismiss(id);
}

std::optional<Notification> NotificationServer::notification(quint32 id) const
{
    return m_store.get(id);
}

QVector<Notification> NotificationServer::activeNotifications() const
{
    return m_store.snapshot();
}

int NotificationServer::activeCount() const
{
    return m_store.count();
}

void NotificationServer::shutdown()
{
    qCInfo(lcCore) << "Shutting down with" << m_store.count() << "active notifications";
    m_scheduler->cancelAll();
    m_store.clear();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

Notification NotificationServer::buildRecord(const NotifyRequest& request) const
{
    Notification record;
    record.appName = TextSanitizer::sanitizeSummary(request.appName, m_settings->maxSummaryLength());
    record.appIcon = TextSanitizer::sanitizeText(request.appIcon);
    record.summary = TextSanitizer::sanitizeSummary(request.summary, m_settings->maxSummaryLength());
    record.body = TextSanitizer::sanitizeText(request.body, m_settings->maxBodyLength());
    record.actions = parseActions(request.actions);
    record.hints = NotificationHints::fromVariantMap(request.hints);

    if (request.expireTimeout < -1) {
        qCDebug(lcCore) << "Negative expire_timeout" << request.expireTimeout << "treated as -1";
    }
    record.expireTimeoutMs = qMax(-1, request.expireTimeout);
    record.effectiveTimeoutMs = record.expireTimeoutMs == -1 ? m_settings->timeoutForUrgency(record.hints.urgency)
                                                             : record.expireTimeoutMs;
    return record;
}

DisplayRequest NotificationServer::buildDisplayRequest(const Notification& record, bool replaced) const
{
    DisplayRequest request;
    request.id = record.id;
    request.appName = record.appName;
    request.appIcon = record.appIcon;
    request.summary = record.summary;
    request.body = record.body;
    request.bodyMarkup = TextSanitizer::toDisplayMarkup(record.body, m_settings->bodyMarkup());
    request.actions = record.actions;
    request.hints = record.hints.toVariantMap();
    request.urgency = record.hints.urgency;
    request.timeoutMs = record.effectiveTimeoutMs;
    request.replaced = replaced;
    return request;
}

void NotificationServer::runCommands(const Notification& record)
{
    const CommandRules rules = m_settings->commandRules();
    if (rules.isEmpty()) {
        return;
    }
    const int started = CommandRunner::run(rules, record);
    if (started > 0) {
        qCDebug(lcCore) << "Started" << started << "commands for notification" << record.id;
    }
}

void NotificationServer::recordHistory(const Notification& record)
{
    if (!m_history || !m_settings->historyEnabled() || record.hints.transient) {
        return;
    }
    if (!m_history->add(HistoryEntry::fromNotification(record, record.updatedAt))) {
        qCWarning(lcCore) << "Notification" << record.id << "kept in memory only, history file not written";
    }
}

void NotificationServer::enforceDisplayLimit(quint32 newestId)
{
    const int limit = m_settings->displayLimit();
    if (limit <= 0) {
        return;
    }

    while (m_store.count() > limit) {
        const auto oldest = m_store.oldest(newestId);
        if (!oldest) {
            break;
        }
        qCInfo(lcCore) << "Display limit" << limit << "reached, closing notification" << oldest->id;
        m_dispatcher->close(oldest->id, CloseReason::Undefined);
    }
}

void NotificationServer::onRemoved(const Notification& record, CloseReason reason)
{
    m_scheduler->cancel(record.id);
    if (m_presenter) {
        m_presenter->withdraw(record.id, reason);
    }
}

} // namespace Herald
