#pragma once

#include <cstdint>

#include <EASTL/unique_ptr.h>
#include <EASTL/vector.h>

namespace fx {
    /**
     * The status of a task after it's been ticked
     */
    enum class TaskStatus {
        /**
         * The task is waiting on a timer. Tick it again next frame
         */
        Running,

        /**
         * The task gave up without doing its thing, e.g. because the character left the node it was waiting on
         */
        Aborted,

        /**
         * The task did its thing and has nothing left to do
         */
        Completed,
    };

    /**
     * A timed piece of work that's spread out over multiple frames
     *
     * Tasks only wait on timers. They're ticked from their owner's tick, so they never run in parallel with each other
     */
    class FxTask {
    public:
        virtual ~FxTask() = default;

        virtual TaskStatus tick(float delta_time) = 0;
    };

    /**
     * Counts down a delay
     */
    class Countdown {
    public:
        explicit Countdown(float duration);

        /**
         * Advances the countdown, consuming as much of delta_time as it needs
         *
         * @return True if the countdown has elapsed. delta_time holds whatever time is left over
         */
        bool advance(float& delta_time);

        bool is_elapsed() const;

    private:
        float remaining;
    };

    /**
     * Splits frame time into fixed-length steps, like a physics update loop
     */
    class FixedStepTimer {
    public:
        explicit FixedStepTimer(float interval_in);

        /**
         * Adds delta_time to the accumulator and returns how many whole steps fit in it
         */
        uint32_t advance(float delta_time);

        float get_interval() const;

    private:
        float interval;

        float accumulated_time = 0;
    };

    /**
     * Runs a group of tasks
     */
    class FxTaskQueue {
    public:
        /**
         * Gives the task its first tick right away, so that tasks with no delay finish before this returns. If the task
         * is still running after that it's kept until it finishes
         */
        void launch(eastl::unique_ptr<FxTask> task);

        void tick(float delta_time);

        size_t num_running() const;

        /**
         * Drops every task without letting them finish. Tasks clean up after themselves when they're destroyed
         */
        void clear();

    private:
        eastl::vector<eastl::unique_ptr<FxTask>> tasks;
    };
} // fx
