// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "presenteradaptor.h"
#include "../core/logging.h"
#include "../daemon/buspresenter.h"

#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusServiceWatcher>

namespace Herald {

PresenterAdaptor::PresenterAdaptor(BusPresenter* presenter, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_presenter(presenter)
    , m_rendererWatcher(new QDBusServiceWatcher(this))
{
    Q_ASSERT(presenter);

    m_rendererWatcher->setWatchMode(QDBusServiceWatcher::WatchForUnregistration);
    connect(m_rendererWatcher, &QDBusServiceWatcher::serviceUnregistered, this, &PresenterAdaptor::releaseRenderer);

    connect(m_presenter, &BusPresenter::showRequested, this, &PresenterAdaptor::showNotification);
    connect(m_presenter, &BusPresenter::withdrawRequested, this, &PresenterAdaptor::withdrawNotification);
}

bool PresenterAdaptor::acceptSender(const QString& sender)
{
    if (sender.isEmpty()) {
        return true;
    }
    if (m_renderer.isEmpty()) {
        m_renderer = sender;
        qCInfo(lcDbus) << "Renderer attached:" << sender;
        if (calledFromDBus()) {
            m_rendererWatcher->setConnection(connection());
            m_rendererWatcher->setWatchedServices({sender});
        }
        return true;
    }
    if (sender != m_renderer) {
        qCWarning(lcDbus) << "Ignoring presenter report from" << sender << "- renderer is" << m_renderer;
        return false;
    }
    return true;
}

void PresenterAdaptor::releaseRenderer(const QString& name)
{
    if (name.isEmpty() || name != m_renderer) {
        return;
    }
    qCInfo(lcDbus) << "Renderer" << name << "left the bus";
    m_renderer.clear();
    m_rendererWatcher->setWatchedServices({});
}

QString PresenterAdaptor::callerName() const
{
    return calledFromDBus() ? message().service() : QString();
}

void PresenterAdaptor::invokeAction(uint id, const QString& actionKey)
{
    if (!acceptSender(callerName())) {
        return;
    }
    if (actionKey.isEmpty()) {
        qCWarning(lcDbus) << "invokeAction: empty action key for notification" << id;
        return;
    }
    m_presenter->reportAction(id, actionKey);
}

void PresenterAdaptor::dismiss(uint id)
{
    if (!acceptSender(callerName())) {
        return;
    }
    m_presenter->reportDismissed(id);
}

QStringList PresenterAdaptor::capabilities()
{
    return m_presenter->capabilities();
}

} // namespace Herald
