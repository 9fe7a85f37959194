// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include "version.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KLocalizedString>
#include <signal.h>

using namespace Herald;

static Daemon* g_daemon = nullptr;

void signalHandler(int signal)
{
    if (signal == SIGHUP) {
        if (g_daemon) {
            QMetaObject::invokeMethod(
                g_daemon,
                []() {
                    if (g_daemon) {
                        g_daemon->reloadSettings();
                    }
                },
                Qt::QueuedConnection);
        }
        return;
    }

    if (g_daemon) {
        g_daemon->stop();
    }
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("heraldd");

    // Set up application metadata
    KAboutData aboutData(QStringLiteral("heraldd"), i18n("Herald Notification Daemon"), QString(VERSION_STRING),
                         i18n("Desktop notification server for the freedesktop.org notification protocol"),
                         KAboutLicense::GPL_V3, i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.herald.daemon"));

    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace the running notification server"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Set up signal handling for clean shutdown and settings reload
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGHUP, signalHandler);

    // Create and start daemon
    Daemon daemon;
    g_daemon = &daemon;

    if (!daemon.init(parser.isSet(replaceOption))) {
        qCCritical(Herald::lcDaemon) << "Failed to initialize daemon";
        g_daemon = nullptr;
        return 1;
    }

    QObject::connect(&daemon, &Daemon::serviceLost, &app, &QCoreApplication::quit);

    qCInfo(Herald::lcDaemon) << "Started successfully";
    daemon.start();

    int result = app.exec();

    daemon.stop();
    g_daemon = nullptr;

    return result;
}
