// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "buspresenter.h"
#include "../core/logging.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace Herald {

namespace {

// Byte arrays (image-data pixels, icon_data) are replaced by their size
QJsonValue hintToJson(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::QByteArray:
        return QJsonObject{{QStringLiteral("bytes"), static_cast<qint64>(value.toByteArray().size())}};
    case QMetaType::QVariantList: {
        QJsonArray array;
        const QVariantList list = value.toList();
        for (const QVariant& item : list) {
            array.append(hintToJson(item));
        }
        return array;
    }
    case QMetaType::QVariantMap: {
        QJsonObject object;
        const QVariantMap map = value.toMap();
        for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
            object.insert(it.key(), hintToJson(it.value()));
        }
        return object;
    }
    default:
        return QJsonValue::fromVariant(value);
    }
}

} // anonymous namespace

BusPresenter::BusPresenter(ISettings* settings, QObject* parent)
    : INotificationPresenter(parent)
    , m_settings(settings)
{
    Q_ASSERT(settings);
}

BusPresenter::~BusPresenter() = default;

QStringList BusPresenter::capabilities() const
{
    return m_settings->presenterCapabilities();
}

bool BusPresenter::present(const DisplayRequest& request)
{
    if (request.id == 0) {
        qCWarning(lcPresenter) << "Refusing display request without an id";
        return false;
    }

    const QString json = QString::fromUtf8(QJsonDocument(toJson(request)).toJson(QJsonDocument::Compact));
    qCDebug(lcPresenter) << (request.replaced ? "Updating" : "Showing") << "notification" << request.id;
    Q_EMIT showRequested(request.id, json);
    return true;
}

void BusPresenter::withdraw(quint32 id, CloseReason reason)
{
    qCDebug(lcPresenter) << "Withdrawing notification" << id << closeReasonToString(reason);
    Q_EMIT withdrawRequested(id, static_cast<uint>(reason));
}

void BusPresenter::reportAction(quint32 id, const QString& actionKey)
{
    Q_EMIT actionActivated(id, actionKey);
}

void BusPresenter::reportDismissed(quint32 id)
{
    Q_EMIT dismissed(id);
}

QJsonObject BusPresenter::toJson(const DisplayRequest& request)
{
    QJsonArray actions;
    for (const NotificationAction& action : request.actions) {
        actions.append(QJsonObject{
            {QStringLiteral("key"), action.key},
            {QStringLiteral("label"), action.label},
        });
    }

    QJsonObject json;
    json[QLatin1String("id")] = static_cast<qint64>(request.id);
    json[QLatin1String("appName")] = request.appName;
    json[QLatin1String("appIcon")] = request.appIcon;
    json[QLatin1String("summary")] = request.summary;
    json[QLatin1String("body")] = request.bodyMarkup;
    json[QLatin1String("urgency")] = urgencyToString(request.urgency);
    json[QLatin1String("timeoutMs")] = request.timeoutMs;
    json[QLatin1String("replaced")] = request.replaced;
    json[QLatin1String("actions")] = actions;
    json[QLatin1String("hints")] = hintToJson(request.hints);
    return json;
}

} // namespace Herald
