#pragma once

#include <QObject>
#include <QTimer>

#include <functional>

namespace cw {

// PollScheduler -- runs one ingestion cycle immediately on start() and then
// every interval until stop().
//
// Lives on whichever thread it was moved to; start/stop/triggerNow are
// invokable so another thread can queue them. Cycles run on the scheduler's
// thread, so a cycle already running finishes before a queued stop lands.
class PollScheduler : public QObject {
    Q_OBJECT
public:
    // The cycle returns the number of files it visited.
    using Cycle = std::function<int()>;

    explicit PollScheduler(Cycle cycle, int intervalMs, QObject* parent = nullptr);
    ~PollScheduler() override;

    Q_INVOKABLE void start();
    Q_INVOKABLE void stop();
    Q_INVOKABLE void triggerNow();

    bool isRunning() const { return m_running; }
    int intervalMs() const { return m_pollTimer.interval(); }
    int cyclesRun() const { return m_cyclesRun; }

signals:
    void cycleCompleted(int filesScanned, qint64 elapsedMs);

private:
    void runCycle();

    Cycle m_cycle;
    QTimer m_pollTimer;
    QTimer m_kickTimer;
    bool m_running = false;
    int m_cyclesRun = 0;
};

} // namespace cw
