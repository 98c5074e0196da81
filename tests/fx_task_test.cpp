#include <gtest/gtest.h>

#include "fx/fx_task.hpp"

TEST(Countdown, CarriesLeftoverTime) {
    auto countdown = fx::Countdown{0.25f};

    auto delta_time = 0.125f;
    EXPECT_FALSE(countdown.advance(delta_time));
    EXPECT_FLOAT_EQ(delta_time, 0.f);

    delta_time = 0.5f;
    EXPECT_TRUE(countdown.advance(delta_time));
    EXPECT_FLOAT_EQ(delta_time, 0.375f);
    EXPECT_TRUE(countdown.is_elapsed());
}

TEST(Countdown, ZeroDurationIsElapsedImmediately) {
    auto countdown = fx::Countdown{0};

    auto delta_time = 0.f;
    EXPECT_TRUE(countdown.advance(delta_time));
}

TEST(FixedStepTimer, CountsWholeSteps) {
    auto timer = fx::FixedStepTimer{0.25f};

    EXPECT_EQ(timer.advance(0.125f), 0);
    EXPECT_EQ(timer.advance(0.125f), 1);
    EXPECT_EQ(timer.advance(0.75f), 3);
    EXPECT_EQ(timer.advance(0.f), 0);
}

TEST(FixedStepTimer, RejectsNonPositiveInterval) {
    EXPECT_THROW(fx::FixedStepTimer{0}, std::invalid_argument);
    EXPECT_THROW(fx::FixedStepTimer{-1}, std::invalid_argument);
}

/**
 * Finishes after it's been ticked a certain number of times, counting the first tick
 */
class CountingTask final : public fx::FxTask {
public:
    CountingTask(uint32_t& num_ticks_in, const uint32_t ticks_to_finish_in) :
        num_ticks{num_ticks_in}, ticks_to_finish{ticks_to_finish_in} {
    }

    fx::TaskStatus tick(float delta_time) override {
        num_ticks++;
        return num_ticks >= ticks_to_finish ? fx::TaskStatus::Completed : fx::TaskStatus::Running;
    }

private:
    uint32_t& num_ticks;

    uint32_t ticks_to_finish;
};

TEST(FxTaskQueue, LaunchTicksRightAway) {
    auto queue = fx::FxTaskQueue{};
    auto num_ticks = 0u;

    queue.launch(eastl::make_unique<CountingTask>(num_ticks, 1));

    EXPECT_EQ(num_ticks, 1);
    EXPECT_EQ(queue.num_running(), 0);
}

TEST(FxTaskQueue, KeepsRunningTasksUntilTheyFinish) {
    auto queue = fx::FxTaskQueue{};
    auto num_ticks = 0u;

    queue.launch(eastl::make_unique<CountingTask>(num_ticks, 3));
    EXPECT_EQ(queue.num_running(), 1);

    queue.tick(0.1f);
    EXPECT_EQ(queue.num_running(), 1);

    queue.tick(0.1f);
    EXPECT_EQ(num_ticks, 3);
    EXPECT_EQ(queue.num_running(), 0);
}

TEST(FxTaskQueue, ClearDropsTasks) {
    auto queue = fx::FxTaskQueue{};
    auto num_ticks = 0u;
    queue.launch(eastl::make_unique<CountingTask>(num_ticks, 10));

    queue.clear();
    queue.tick(0.1f);

    EXPECT_EQ(queue.num_running(), 0);
    EXPECT_EQ(num_ticks, 1);
}
