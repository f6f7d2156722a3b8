#include "core/indexing/poll_scheduler.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <utility>

namespace cw {

PollScheduler::PollScheduler(Cycle cycle, int intervalMs, QObject* parent)
    : QObject(parent)
    , m_cycle(std::move(cycle))
    , m_pollTimer(this)
    , m_kickTimer(this)
{
    m_pollTimer.setInterval(intervalMs > 0 ? intervalMs : 1500);
    connect(&m_pollTimer, &QTimer::timeout, this, &PollScheduler::runCycle);

    m_kickTimer.setSingleShot(true);
    m_kickTimer.setInterval(0);
    connect(&m_kickTimer, &QTimer::timeout, this, &PollScheduler::runCycle);
}

PollScheduler::~PollScheduler()
{
    stop();
}

void PollScheduler::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    LOG_INFO(cwIngest, "Polling every %d ms", m_pollTimer.interval());
    runCycle();
    m_pollTimer.start();
}

void PollScheduler::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_pollTimer.stop();
    m_kickTimer.stop();
    LOG_INFO(cwIngest, "Polling stopped after %d cycles", m_cyclesRun);
}

void PollScheduler::triggerNow()
{
    if (!m_running) {
        return;
    }
    m_kickTimer.start();
}

void PollScheduler::runCycle()
{
    if (!m_running || !m_cycle) {
        return;
    }
    QElapsedTimer timer;
    timer.start();
    const int filesScanned = m_cycle();
    ++m_cyclesRun;
    emit cycleCompleted(filesScanned, timer.elapsed());
}

} // namespace cw
