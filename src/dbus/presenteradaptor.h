// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QDBusAbstractAdaptor>
#include <QDBusContext>
#include <QObject>
#include <QString>
#include <QStringList>

class QDBusServiceWatcher;

namespace Herald {

class BusPresenter;

/**
 * @brief D-Bus adaptor for the out-of-process renderer
 *
 * Provides D-Bus interface: org.herald.Presenter
 *
 * The renderer listens for showNotification/withdrawNotification and reports
 * user interaction back through invokeAction() and dismiss().
 *
 * The first peer that reports back becomes the renderer. Reports from any
 * other unique name are ignored until that peer leaves the bus.
 */
class HERALD_EXPORT PresenterAdaptor : public QDBusAbstractAdaptor, protected QDBusContext
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.herald.Presenter")

public:
    explicit PresenterAdaptor(BusPresenter* presenter, QObject* parent = nullptr);
    ~PresenterAdaptor() override = default;

    /**
     * @brief Check a reporting peer against the attached renderer
     * @param sender Unique bus name of the caller, empty for in-process calls
     * @return true if the report should be applied
     *
     * Attaches @p sender as the renderer when none is attached yet.
     */
    bool acceptSender(const QString& sender);

    /**
     * @brief Detach @p name if it is the current renderer
     */
    void releaseRenderer(const QString& name);

    QString renderer() const
    {
        return m_renderer;
    }

public Q_SLOTS:
    void invokeAction(uint id, const QString& actionKey);
    void dismiss(uint id);
    QStringList capabilities();

Q_SIGNALS:
    /**
     * @brief Display or update a notification
     * @param notificationJson DisplayRequest serialized by BusPresenter::toJson()
     */
    void showNotification(uint id, const QString& notificationJson);
    void withdrawNotification(uint id, uint reason);

private:
    QString callerName() const;

    BusPresenter* m_presenter;
    QDBusServiceWatcher* m_rendererWatcher;
    QString m_renderer;
};

} // namespace Herald
