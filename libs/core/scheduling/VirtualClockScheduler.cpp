#include "scheduling/VirtualClockScheduler.hpp"
#include <algorithm>

Scheduler::TaskId VirtualClockScheduler::schedule(qint64 delayMs, Task task) {
    const TaskId id = m_nextId++;
    const qint64 due = m_now + std::max<qint64>(0, delayMs);
    m_tasks.emplace(Key{due, id}, std::move(task));
    m_dueById.emplace(id, due);
    return id;
}

void VirtualClockScheduler::cancel(TaskId id) {
    auto it = m_dueById.find(id);
    if (it == m_dueById.end()) return;

    m_tasks.erase(Key{it->second, id});
    m_dueById.erase(it);
}

bool VirtualClockScheduler::isPending(TaskId id) const {
    return m_dueById.find(id) != m_dueById.end();
}

void VirtualClockScheduler::advanceTo(qint64 targetMs) {
    while (!m_tasks.empty()) {
        auto it = m_tasks.begin();
        const qint64 due = it->first.first;
        if (due > targetMs) break;

        const TaskId id = it->first.second;
        Task task = std::move(it->second);
        m_tasks.erase(it);
        m_dueById.erase(id);

        m_now = std::max(m_now, due);
        if (task) task();
    }
    m_now = std::max(m_now, targetMs);
}
