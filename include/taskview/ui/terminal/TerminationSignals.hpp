#pragma once

#include <QObject>

class QSocketNotifier;

namespace taskview {
namespace ui {

// Turns SIGINT/SIGTERM into a signal on the event loop. The handler itself only
// writes the signal number into a socket pair.
class TerminationSignals : public QObject
{
    Q_OBJECT

public:
    explicit TerminationSignals(QObject *parent = nullptr);
    ~TerminationSignals() override;

    bool install();

signals:
    void terminationRequested(int signalNumber);

private slots:
    void handleActivated();

private:
    QSocketNotifier *m_notifier = nullptr;
};

} // namespace ui
} // namespace taskview
