#ifndef SIGNALHANDLER_H
#define SIGNALHANDLER_H

#include <QObject>

class QSocketNotifier;

namespace CER {

/**
 * @brief Delivers SIGINT / SIGTERM into the Qt event loop
 *
 * The POSIX handler only writes the signal number to a pipe; the read
 * end is watched by a QSocketNotifier and turned into terminationRequested().
 * Only one instance may exist.
 */
class SignalHandler : public QObject {
    Q_OBJECT

public:
    explicit SignalHandler(QObject* parent = nullptr);
    ~SignalHandler() override;

    /**
     * @brief Install handlers for SIGINT and SIGTERM
     * @return false if the pipe or a handler could not be set up
     */
    bool install();

signals:
    void terminationRequested(int signalNumber);

private slots:
    void onSignalReadable();

private:
    static void handleSignal(int signalNumber);

    static int s_pipe[2];
    QSocketNotifier* m_notifier{nullptr};
};

} // namespace CER

#endif // SIGNALHANDLER_H
