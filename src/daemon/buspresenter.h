// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QJsonObject>

namespace Herald {

/**
 * @brief Presenter that forwards display requests to a renderer on the bus
 *
 * The daemon itself draws nothing. Every request is serialized to JSON and
 * broadcast through PresenterAdaptor; the renderer answers with
 * reportAction()/reportDismissed() calls. Advertised capabilities come from
 * the PresenterCapabilities setting, since the renderer is not asked.
 */
class HERALD_EXPORT BusPresenter : public INotificationPresenter
{
    Q_OBJECT

public:
    explicit BusPresenter(ISettings* settings, QObject* parent = nullptr);
    ~BusPresenter() override;

    QStringList capabilities() const override;
    bool present(const DisplayRequest& request) override;
    void withdraw(quint32 id, CloseReason reason) override;

    void reportAction(quint32 id, const QString& actionKey);
    void reportDismissed(quint32 id);

    static QJsonObject toJson(const DisplayRequest& request);

Q_SIGNALS:
    void showRequested(uint id, const QString& notificationJson);
    void withdrawRequested(uint id, uint reason);

private:
    ISettings* m_settings;
};

} // namespace Herald
