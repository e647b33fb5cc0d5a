#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "job/chunker.hpp"

namespace tasks
{

using TaskId = std::uint32_t;  // 1-based, protocol handle
using PeerId = std::uint16_t;
using Clock  = std::chrono::steady_clock;

// task ids travel in a 16-bit header field
inline constexpr std::size_t MAX_TASKS = 65535;

enum class Status
{
    Pending,
    Assigned,
    Done
};

const char *status_name(Status s);

struct Task
{
    TaskId                                   id{0};
    std::size_t                              seq{0};  // reassembly order, id - 1
    std::vector<std::uint8_t>                payload;
    Status                                   status{Status::Pending};
    std::optional<PeerId>                    assigned_peer;  // iff Assigned
    std::optional<Clock::time_point>         assigned_at;    // iff Assigned
    std::optional<std::vector<std::uint8_t>> result;         // iff Done
};

// task reclaimed by the sweep, with the peer that held it
struct Reclaimed
{
    TaskId id;
    PeerId peer;
};

struct Counts
{
    std::size_t total{0};
    std::size_t pending{0};
    std::size_t assigned{0};
    std::size_t done{0};
};

// Owns every task and is the only place task status changes.
// Not thread-safe: all calls must come from the dispatcher's event loop.
class TaskStore
{
  public:
    // one-time bulk load; false if already loaded, empty, too many chunks or seq gaps
    bool load_tasks(std::vector<job::Chunk> chunks);

    // First Pending task in ascending id order, now Assigned to peer. nullptr if none.
    const Task *get_next_task(PeerId peer, Clock::time_point now = Clock::now());

    // false (no mutation) for unknown id, Done task or length mismatch
    bool submit_result(TaskId id, std::vector<std::uint8_t> bytes);

    // Assigned -> Pending; false if the task is not Assigned
    bool revert_to_pending(TaskId id);

    // revert every task Assigned for longer than timeout
    std::vector<Reclaimed> sweep_stuck(std::chrono::milliseconds timeout,
                                       Clock::time_point         now = Clock::now());

    bool        is_all_done() const;
    bool        loaded() const { return !tasks_.empty(); }
    const Task *find(TaskId id) const;
    Counts      counts() const;

    // tasks in id order (== seq order by construction)
    const std::vector<Task> &tasks() const { return tasks_; }

    // drop everything; the only way tasks are destroyed
    void reset();

  private:
    Task *find_mut(TaskId id);
    void  log_progress() const;

    std::vector<Task> tasks_;             // index == id - 1
    std::size_t       next_pending_ = 0;  // no Pending task below this index
    std::size_t       assigned_     = 0;
    std::size_t       done_         = 0;
};

}  // namespace tasks
