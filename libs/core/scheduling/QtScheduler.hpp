/*
Beacon — QtScheduler
Role: Scheduler backed by single-shot QTimers on the Qt event loop.
Threading: Lives on the GUI thread; tasks fire from that thread's event loop.
Performance: One PreciseTimer per pending task; pending counts stay in the single digits.
Related: Scheduler.hpp.
*/
#pragma once

#include "scheduling/Scheduler.hpp"
#include <QObject>
#include <QElapsedTimer>
#include <unordered_map>

class QTimer;

class QtScheduler : public QObject, public Scheduler {
    Q_OBJECT

public:
    explicit QtScheduler(QObject* parent = nullptr);
    ~QtScheduler() override;

    TaskId schedule(qint64 delayMs, Task task) override;
    void cancel(TaskId id) override;
    bool isPending(TaskId id) const override;
    qint64 nowMs() const override;

    size_t pendingCount() const { return m_timers.size(); }

private:
    struct PendingTask {
        QTimer* timer = nullptr;
        Task task;
    };

    void fire(TaskId id);

    QElapsedTimer m_clock;
    std::unordered_map<TaskId, PendingTask> m_timers;
    TaskId m_nextId = 1;
};
