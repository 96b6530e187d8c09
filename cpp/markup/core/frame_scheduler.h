#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace markup {

/**
 * FrameScheduler: periodic tasks driven by the host's frame clock.
 *
 * The host calls tick() once per animation frame with a monotonic time in
 * milliseconds. Tasks run on that thread only. A task stays registered for as
 * long as its TaskHandle is alive.
 */
class FrameScheduler {
public:
    using Callback = std::function<void(double nowMs)>;

private:
    struct Task {
        Callback callback;
        double intervalMs;
        double lastRunMs;
        bool hasRun;
        bool cancelled;
    };

public:
    class TaskHandle {
    public:
        TaskHandle() = default;
        ~TaskHandle() { cancel(); }

        TaskHandle(const TaskHandle&) = delete;
        TaskHandle& operator=(const TaskHandle&) = delete;
        TaskHandle(TaskHandle&& other) noexcept : task_(std::move(other.task_)) { other.task_.reset(); }
        TaskHandle& operator=(TaskHandle&& other) noexcept {
            if (this != &other) {
                cancel();
                task_ = std::move(other.task_);
                other.task_.reset();
            }
            return *this;
        }

        void cancel();
        bool active() const;

    private:
        friend class FrameScheduler;
        explicit TaskHandle(std::weak_ptr<Task> task) : task_(std::move(task)) {}

        std::weak_ptr<Task> task_;
    };

    FrameScheduler() = default;
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    /**
     * Register a task. intervalMs <= 0 runs it on every tick; otherwise it runs
     * on the first tick and then whenever intervalMs has elapsed.
     */
    [[nodiscard]] TaskHandle schedule(Callback callback, double intervalMs = 0.0);

    /** @return Number of callbacks run */
    std::size_t tick(double nowMs);

    std::size_t taskCount() const;

private:
    std::vector<std::shared_ptr<Task>> tasks_;
};

} // namespace markup
