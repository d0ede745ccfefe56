#include "taskview/ui/terminal/TerminationSignals.hpp"

#include <QSocketNotifier>
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

#include "taskview/core/Logging.hpp"

namespace taskview {
namespace ui {

namespace {
int signalFds[2] = { -1, -1 };

void forwardSignal(int signalNumber)
{
    const char value = static_cast<char>(signalNumber);
    const ssize_t written = ::write(signalFds[0], &value, sizeof(value));
    static_cast<void>(written);
}

bool installHandler(int signalNumber)
{
    struct sigaction action = {};
    action.sa_handler = forwardSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return sigaction(signalNumber, &action, nullptr) == 0;
}
} // namespace

TerminationSignals::TerminationSignals(QObject *parent)
    : QObject(parent)
{
}

TerminationSignals::~TerminationSignals()
{
    if (!m_notifier) {
        return;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    ::close(signalFds[0]);
    ::close(signalFds[1]);
    signalFds[0] = -1;
    signalFds[1] = -1;
}

bool TerminationSignals::install()
{
    if (m_notifier) {
        return true;
    }
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signalFds) != 0) {
        qCWarning(lcApp) << "Could not create signal socket pair";
        return false;
    }
    m_notifier = new QSocketNotifier(signalFds[1], QSocketNotifier::Read, this);
    // activated() is overloaded since Qt 5.15.
    connect(m_notifier, SIGNAL(activated(int)), this, SLOT(handleActivated()));

    if (!installHandler(SIGINT) || !installHandler(SIGTERM)) {
        qCWarning(lcApp) << "Could not register signal handlers";
        return false;
    }
    return true;
}

void TerminationSignals::handleActivated()
{
    m_notifier->setEnabled(false);
    char value = 0;
    if (::read(signalFds[1], &value, sizeof(value)) != sizeof(value)) {
        m_notifier->setEnabled(true);
        return;
    }
    qCInfo(lcApp) << "Received signal" << static_cast<int>(value) << "- cleaning up terminal";
    emit terminationRequested(static_cast<int>(value));
    m_notifier->setEnabled(true);
}

} // namespace ui
} // namespace taskview
