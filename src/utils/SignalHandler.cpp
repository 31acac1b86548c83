#include "SignalHandler.h"
#include "utils/Logging.h"

#include <QSocketNotifier>

#include <csignal>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace CER {

int SignalHandler::s_pipe[2] = {-1, -1};

SignalHandler::SignalHandler(QObject* parent)
    : QObject(parent)
{
}

SignalHandler::~SignalHandler() {
    if (m_notifier) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        ::close(s_pipe[0]);
        ::close(s_pipe[1]);
        s_pipe[0] = s_pipe[1] = -1;
    }
}

bool SignalHandler::install() {
    if (m_notifier) {
        return true;
    }

    if (::pipe(s_pipe) != 0) {
        qCCritical(lcSupervisor) << "signal pipe:" << std::strerror(errno);
        return false;
    }
    for (int fd : s_pipe) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    m_notifier = new QSocketNotifier(s_pipe[0], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &SignalHandler::onSignalReadable);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalHandler::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &action, nullptr) != 0 || ::sigaction(SIGTERM, &action, nullptr) != 0) {
        qCCritical(lcSupervisor) << "sigaction:" << std::strerror(errno);
        return false;
    }
    return true;
}

void SignalHandler::handleSignal(int signalNumber) {
    const char value = static_cast<char>(signalNumber);
    // Async-signal-safe; a full pipe means a shutdown is already pending
    [[maybe_unused]] const ssize_t written = ::write(s_pipe[1], &value, 1);
}

void SignalHandler::onSignalReadable() {
    char value = 0;
    int last = 0;
    while (::read(s_pipe[0], &value, 1) == 1) {
        last = value;
    }
    if (last != 0) {
        qCInfo(lcSupervisor) << "received" << (last == SIGINT ? "SIGINT" : "SIGTERM");
        emit terminationRequested(last);
    }
}

} // namespace CER
