#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <cstdio>

#include "version.h"

#include "taskview/core/AppContext.hpp"
#include "taskview/core/AppSettings.hpp"
#include "taskview/core/Logging.hpp"
#include "taskview/core/Sanitizer.hpp"
#include "taskview/ui/terminal/TerminalProbe.hpp"
#include "taskview/ui/terminal/TerminalSession.hpp"
#include "taskview/ui/terminal/TerminalWindow.hpp"
#include "taskview/ui/terminal/TerminationSignals.hpp"
#include "taskview/ui/viewmodels/TaskListViewModel.hpp"

namespace {
void printError(const QString &text)
{
    std::fputs(taskview::core::sanitize(text).toLocal8Bit().constData(), stderr);
    std::fputc('\n', stderr);
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("TaskView"));
    QCoreApplication::setApplicationName(QStringLiteral("taskview"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskViewVersion));

    QCoreApplication app(argc, argv);

    const taskview::ui::ProbeResult probe = taskview::ui::probeTerminal();
    if (!probe.compatible) {
        printError(taskview::ui::incompatibleTerminalHelp(probe.reason));
        return 1;
    }

    QSettings settings;
    taskview::core::AppContext context(taskview::core::loadAppSettings(settings));
    if (!taskview::core::installLogFile(context.settings().logFilePath)) {
        printError(QObject::tr("Cannot open log file %1").arg(context.settings().logFilePath));
    }
    qCInfo(lcApp).noquote() << "Task View" << kTaskViewVersion << "starting";

    taskview::ui::TerminalSession session;
    if (!session.start()) {
        taskview::core::uninstallLogFile();
        printError(QObject::tr("Failed to initialize the terminal"));
        return 1;
    }

    taskview::ui::TerminationSignals termination;
    if (!termination.install()) {
        qCWarning(lcApp) << "Termination signals are not routed to the event loop";
    }
    QObject::connect(&termination, &taskview::ui::TerminationSignals::terminationRequested, &app, [&](int signalNumber) {
        qCInfo(lcApp) << "Terminated by signal" << signalNumber;
        session.restore();
        QCoreApplication::exit(1);
    });

    taskview::ui::TaskListViewModel viewModel(context.taskRepository());
    taskview::ui::TerminalWindow window(viewModel, context.errorBudget(), session);
    QObject::connect(&window, &taskview::ui::TerminalWindow::quitRequested, &app, &QCoreApplication::exit, Qt::QueuedConnection);
    window.start();

    const int status = app.exec();
    session.restore();
    qCInfo(lcApp) << "Exiting with status" << status;
    taskview::core::uninstallLogFile();
    return status;
}
