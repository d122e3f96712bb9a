#pragma once

#include "scheduling/Scheduler.hpp"
#include <map>
#include <utility>

/**
 * Scheduler on a manually advanced clock. Used by the unit tests and by
 * beacon_replay, where time comes from the recorded sample timestamps.
 */
class VirtualClockScheduler : public Scheduler {
public:
    explicit VirtualClockScheduler(qint64 startMs = 0) : m_now(startMs) {}

    TaskId schedule(qint64 delayMs, Task task) override;
    void cancel(TaskId id) override;
    bool isPending(TaskId id) const override;
    qint64 nowMs() const override { return m_now; }

    // Runs every task due at or before the target time, in due order.
    // Tasks scheduled while advancing run too if they fall inside the window.
    void advanceTo(qint64 targetMs);
    void advanceBy(qint64 deltaMs) { advanceTo(m_now + deltaMs); }

    size_t pendingCount() const { return m_tasks.size(); }

private:
    using Key = std::pair<qint64, TaskId>;  // (due time, id) keeps FIFO order for equal due times

    std::map<Key, Task> m_tasks;
    std::map<TaskId, qint64> m_dueById;
    qint64 m_now = 0;
    TaskId m_nextId = 1;
};
