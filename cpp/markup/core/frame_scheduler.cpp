#include "markup/core/frame_scheduler.h"
#include <algorithm>

namespace markup {

void FrameScheduler::TaskHandle::cancel() {
    if (auto task = task_.lock()) {
        task->cancelled = true;
        task->callback = nullptr;
    }
    task_.reset();
}

bool FrameScheduler::TaskHandle::active() const {
    const auto task = task_.lock();
    return task && !task->cancelled;
}

FrameScheduler::TaskHandle FrameScheduler::schedule(Callback callback, double intervalMs) {
    if (!callback) return TaskHandle();
    auto task = std::make_shared<Task>(Task{std::move(callback), intervalMs, 0.0, false, false});
    tasks_.push_back(task);
    return TaskHandle(task);
}

std::size_t FrameScheduler::tick(double nowMs) {
    // Callbacks may schedule or cancel; iterate over a stable copy.
    const std::vector<std::shared_ptr<Task>> current = tasks_;
    std::size_t ran = 0;
    for (const auto& task : current) {
        if (task->cancelled) continue;
        const bool due = !task->hasRun || task->intervalMs <= 0.0
            || (nowMs - task->lastRunMs) >= task->intervalMs;
        if (!due) continue;
        task->hasRun = true;
        task->lastRunMs = nowMs;
        // Keep the callable alive even if it cancels its own handle.
        const Callback cb = task->callback;
        cb(nowMs);
        ++ran;
    }

    tasks_.erase(
        std::remove_if(tasks_.begin(), tasks_.end(), [](const std::shared_ptr<Task>& t) {
            return t->cancelled;
        }),
        tasks_.end());
    return ran;
}

std::size_t FrameScheduler::taskCount() const {
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const std::shared_ptr<Task>& t) {
        return !t->cancelled;
    }));
}

} // namespace markup
