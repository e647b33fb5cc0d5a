#include <algorithm>

#include "tasks/task_store.hpp"
#include "util/log.hpp"

namespace tasks
{

const char *status_name(Status s)
{
    switch (s)
    {
        case Status::Pending:
            return "pending";
        case Status::Assigned:
            return "assigned";
        case Status::Done:
            return "done";
    }
    return "?";
}

bool TaskStore::load_tasks(std::vector<job::Chunk> chunks)
{
    if (!tasks_.empty())
    {
        LOG_ERROR("load_tasks: store already holds %zu tasks", tasks_.size());
        return false;
    }
    if (chunks.empty())
    {
        LOG_WARN("load_tasks: no data to process");
        return false;
    }
    if (chunks.size() > MAX_TASKS)
    {
        LOG_ERROR("load_tasks: %zu chunks exceed the %zu task limit", chunks.size(), MAX_TASKS);
        return false;
    }
    // sequence indices must be exactly 0..n-1
    std::sort(chunks.begin(), chunks.end(),
              [](const job::Chunk &a, const job::Chunk &b) { return a.seq < b.seq; });
    for (std::size_t i = 0; i < chunks.size(); i++)
    {
        if (chunks[i].seq != i)
        {
            LOG_ERROR("load_tasks: sequence gap at index %zu (seq=%zu)", i, chunks[i].seq);
            return false;
        }
    }

    tasks_.reserve(chunks.size());
    for (auto &c : chunks)
    {
        Task t;
        t.id      = static_cast<TaskId>(c.seq + 1);
        t.seq     = c.seq;
        t.payload = std::move(c.bytes);
        tasks_.push_back(std::move(t));
    }
    next_pending_ = 0;
    assigned_     = 0;
    done_         = 0;
    LOG_INFO("Created %zu tasks", tasks_.size());
    return true;
}

Task *TaskStore::find_mut(TaskId id)
{
    if (id == 0 || id > tasks_.size())
        return nullptr;
    return &tasks_[id - 1];
}

const Task *TaskStore::find(TaskId id) const
{
    if (id == 0 || id > tasks_.size())
        return nullptr;
    return &tasks_[id - 1];
}

const Task *TaskStore::get_next_task(PeerId peer, Clock::time_point now)
{
    // strict ascending scan, starting at the lowest index that can still be Pending
    for (std::size_t i = next_pending_; i < tasks_.size(); i++)
    {
        Task &t = tasks_[i];
        if (t.status != Status::Pending)
            continue;
        next_pending_   = i + 1;
        t.status        = Status::Assigned;
        t.assigned_peer = peer;
        t.assigned_at   = now;
        assigned_++;
        LOG_DEBUG("Task #%u assigned to peer #%u", t.id, (unsigned)peer);
        return &t;
    }
    next_pending_ = tasks_.size();
    LOG_DEBUG("No pending tasks available for peer #%u", (unsigned)peer);
    return nullptr;
}

bool TaskStore::submit_result(TaskId id, std::vector<std::uint8_t> bytes)
{
    Task *t = find_mut(id);
    if (!t)
    {
        LOG_WARN("submit_result: task #%u not found", id);
        return false;
    }
    if (t->status == Status::Done)
    {
        LOG_WARN("submit_result: task #%u already completed", id);
        return false;
    }
    if (bytes.size() != t->payload.size())
    {
        LOG_ERROR("submit_result: invalid result size for task #%u (got %zu, expect %zu)", id,
                  bytes.size(), t->payload.size());
        return false;
    }

    if (t->status == Status::Assigned)
        assigned_--;
    t->status = Status::Done;
    t->result = std::move(bytes);
    t->assigned_peer.reset();
    t->assigned_at.reset();
    done_++;
    log_progress();
    return true;
}

bool TaskStore::revert_to_pending(TaskId id)
{
    Task *t = find_mut(id);
    if (!t || t->status != Status::Assigned)
        return false;
    t->status = Status::Pending;
    t->assigned_peer.reset();
    t->assigned_at.reset();
    assigned_--;
    next_pending_ = std::min(next_pending_, t->seq);
    return true;
}

std::vector<Reclaimed> TaskStore::sweep_stuck(std::chrono::milliseconds timeout,
                                              Clock::time_point         now)
{
    std::vector<Reclaimed> out;
    if (assigned_ == 0)
        return out;
    for (auto &t : tasks_)
    {
        if (t.status != Status::Assigned || !t.assigned_at)
            continue;
        if (now - *t.assigned_at <= timeout)
            continue;
        const PeerId peer = t.assigned_peer.value_or(0);
        if (revert_to_pending(t.id))
        {
            LOG_INFO("Task #%u re-queued (stuck on peer #%u)", t.id, (unsigned)peer);
            out.push_back({t.id, peer});
        }
    }
    if (!out.empty())
        LOG_INFO("Re-queued %zu stuck task(s)", out.size());
    return out;
}

bool TaskStore::is_all_done() const
{
    return !tasks_.empty() && done_ == tasks_.size();
}

Counts TaskStore::counts() const
{
    Counts c;
    c.total    = tasks_.size();
    c.assigned = assigned_;
    c.done     = done_;
    c.pending  = c.total - c.assigned - c.done;
    return c;
}

void TaskStore::reset()
{
    tasks_.clear();
    tasks_.shrink_to_fit();
    next_pending_ = 0;
    assigned_     = 0;
    done_         = 0;
}

void TaskStore::log_progress() const
{
    const std::size_t total = tasks_.size();
    // info line each time completion crosses a whole percent
    const std::size_t pct  = done_ * 100 / total;
    const std::size_t prev = (done_ - 1) * 100 / total;
    if (pct != prev || done_ == total)
        LOG_INFO("Progress: %zu/%zu tasks (%zu%%)", done_, total, pct);
    else
        LOG_DEBUG("Progress: %zu/%zu tasks", done_, total);
}

}  // namespace tasks
