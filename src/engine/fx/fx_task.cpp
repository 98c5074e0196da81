#include "fx_task.hpp"

#include <stdexcept>

namespace fx {
    Countdown::Countdown(const float duration) :
        remaining{duration} {
    }

    bool Countdown::advance(float& delta_time) {
        if(remaining <= 0) {
            return true;
        }

        if(delta_time < remaining) {
            remaining -= delta_time;
            delta_time = 0;
            return false;
        }

        delta_time -= remaining;
        remaining = 0;
        return true;
    }

    bool Countdown::is_elapsed() const {
        return remaining <= 0;
    }

    FixedStepTimer::FixedStepTimer(const float interval_in) :
        interval{interval_in} {
        if(interval <= 0) {
            throw std::invalid_argument{"Fixed step interval must be positive"};
        }
    }

    uint32_t FixedStepTimer::advance(const float delta_time) {
        accumulated_time += delta_time;

        auto num_steps = 0u;
        while(accumulated_time >= interval) {
            accumulated_time -= interval;
            num_steps++;
        }

        return num_steps;
    }

    float FixedStepTimer::get_interval() const {
        return interval;
    }

    void FxTaskQueue::launch(eastl::unique_ptr<FxTask> task) {
        if(task->tick(0) == TaskStatus::Running) {
            tasks.emplace_back(eastl::move(task));
        }
    }

    void FxTaskQueue::tick(const float delta_time) {
        auto itr = tasks.begin();
        while(itr != tasks.end()) {
            if((*itr)->tick(delta_time) != TaskStatus::Running) {
                itr = tasks.erase(itr);
            } else {
                ++itr;
            }
        }
    }

    size_t FxTaskQueue::num_running() const {
        return tasks.size();
    }

    void FxTaskQueue::clear() {
        tasks.clear();
    }
} // fx
