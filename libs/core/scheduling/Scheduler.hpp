/*
Beacon — Scheduler
Role: Abstract source of time and of cancellable delayed tasks for the interaction core.
Inputs/Outputs: schedule() returns a TaskId; cancel() disarms it; nowMs() is a monotonic clock.
Threading: GUI thread only. Tasks run on the thread that owns the scheduler.
Integration: QtScheduler in the application, VirtualClockScheduler in tests and trace replay.
Related: QtScheduler.hpp, VirtualClockScheduler.hpp, ScheduledTask below.
*/
#pragma once

#include <QtGlobal>
#include <functional>

class Scheduler {
public:
    using TaskId = quint64;
    using Task = std::function<void()>;

    static constexpr TaskId INVALID_TASK = 0;

    virtual ~Scheduler() = default;

    virtual TaskId schedule(qint64 delayMs, Task task) = 0;
    virtual void cancel(TaskId id) = 0;
    virtual bool isPending(TaskId id) const = 0;

    // Monotonic milliseconds; only differences are meaningful.
    virtual qint64 nowMs() const = 0;
};

/**
 * Owning handle for one scheduled task. Destroying or reassigning the handle
 * cancels the task if it has not fired yet.
 */
class ScheduledTask {
public:
    ScheduledTask() = default;
    ScheduledTask(Scheduler* scheduler, Scheduler::TaskId id)
        : m_scheduler(scheduler), m_id(id) {}

    ~ScheduledTask() { cancel(); }

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    ScheduledTask(ScheduledTask&& other) noexcept
        : m_scheduler(other.m_scheduler), m_id(other.m_id) {
        other.m_scheduler = nullptr;
        other.m_id = Scheduler::INVALID_TASK;
    }

    ScheduledTask& operator=(ScheduledTask&& other) noexcept {
        if (this != &other) {
            cancel();
            m_scheduler = other.m_scheduler;
            m_id = other.m_id;
            other.m_scheduler = nullptr;
            other.m_id = Scheduler::INVALID_TASK;
        }
        return *this;
    }

    void cancel() {
        if (m_scheduler && m_id != Scheduler::INVALID_TASK) {
            m_scheduler->cancel(m_id);
        }
        m_scheduler = nullptr;
        m_id = Scheduler::INVALID_TASK;
    }

    bool isArmed() const {
        return m_scheduler && m_id != Scheduler::INVALID_TASK && m_scheduler->isPending(m_id);
    }

    Scheduler::TaskId id() const { return m_id; }

private:
    Scheduler* m_scheduler = nullptr;
    Scheduler::TaskId m_id = Scheduler::INVALID_TASK;
};
