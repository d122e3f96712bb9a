#include "scheduling/QtScheduler.hpp"
#include "BeaconLogging.hpp"
#include <QTimer>
#include <algorithm>

QtScheduler::QtScheduler(QObject* parent)
    : QObject(parent) {
    m_clock.start();
}

QtScheduler::~QtScheduler() {
    for (auto& [id, pending] : m_timers) {
        pending.timer->stop();
    }
    // Timers are children of this object and go away with it.
    m_timers.clear();
}

Scheduler::TaskId QtScheduler::schedule(qint64 delayMs, Task task) {
    const TaskId id = m_nextId++;

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setTimerType(Qt::PreciseTimer);
    connect(timer, &QTimer::timeout, this, [this, id]() { fire(id); });

    m_timers.emplace(id, PendingTask{timer, std::move(task)});
    timer->start(static_cast<int>(std::max<qint64>(0, delayMs)));
    return id;
}

void QtScheduler::cancel(TaskId id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) return;

    it->second.timer->stop();
    it->second.timer->deleteLater();
    m_timers.erase(it);
}

bool QtScheduler::isPending(TaskId id) const {
    return m_timers.find(id) != m_timers.end();
}

qint64 QtScheduler::nowMs() const {
    return m_clock.elapsed();
}

void QtScheduler::fire(TaskId id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        bLog_Debug("QtScheduler: timeout for cancelled task" << id);
        return;
    }

    // Detach before running: the task may schedule or cancel other tasks.
    Task task = std::move(it->second.task);
    it->second.timer->deleteLater();
    m_timers.erase(it);

    if (task) task();
}
