#include <gtest/gtest.h>
#include <PeriodicTask.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

class PeriodicTaskTest : public ::testing::Test {
protected:
    std::atomic<int> ticks{0};

    // Ждём, пока условие станет истинным (не дольше timeout)
    template <typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }
};

// ================================================================
// LIFECYCLE
// ================================================================

TEST_F(PeriodicTaskTest, StartStop_Basic) {
    PeriodicTask task("test");
    EXPECT_FALSE(task.isRunning());

    EXPECT_TRUE(task.start(10ms, [this]() { ticks++; }));
    EXPECT_TRUE(task.isRunning());

    EXPECT_TRUE(waitFor([this]() { return ticks.load() >= 3; }));

    task.stop();
    EXPECT_FALSE(task.isRunning());
}

TEST_F(PeriodicTaskTest, DoubleStart_SecondIsRejected) {
    PeriodicTask task("test");

    EXPECT_TRUE(task.start(50ms, [this]() { ticks++; }));
    EXPECT_FALSE(task.start(50ms, [this]() { ticks += 100; }));

    task.stop();
    EXPECT_LT(ticks.load(), 100);
}

TEST_F(PeriodicTaskTest, DoubleStop_NoOp) {
    PeriodicTask task("test");
    task.start(10ms, [this]() { ticks++; });

    task.stop();
    task.stop();
    EXPECT_FALSE(task.isRunning());
}

TEST_F(PeriodicTaskTest, Stop_DoesNotWaitForFullInterval) {
    PeriodicTask task("slow");
    task.start(std::chrono::milliseconds(60000), [this]() { ticks++; });

    auto begin = std::chrono::steady_clock::now();
    task.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 1000ms);
    EXPECT_EQ(ticks.load(), 0);
}

TEST_F(PeriodicTaskTest, NoTicksAfterStop) {
    PeriodicTask task("test");
    task.start(5ms, [this]() { ticks++; });
    ASSERT_TRUE(waitFor([this]() { return ticks.load() >= 1; }));

    task.stop();
    int afterStop = ticks.load();
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(ticks.load(), afterStop);
}

TEST_F(PeriodicTaskTest, StopFromInsideTick_TerminatesLoop) {
    PeriodicTask task("self-stop");
    task.start(5ms, [this, &task]() {
        ticks++;
        task.stop();
    });

    ASSERT_TRUE(waitFor([&task]() { return !task.isRunning(); }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(ticks.load(), 1);

    // Повторный запуск после самоостановки
    EXPECT_TRUE(task.start(5ms, [this]() { ticks++; }));
    EXPECT_TRUE(waitFor([this]() { return ticks.load() >= 2; }));
    task.stop();
}

TEST_F(PeriodicTaskTest, ThrowingTick_KeepsRunning) {
    PeriodicTask task("throwing");
    task.start(5ms, [this]() {
        ticks++;
        throw std::runtime_error("radio glitch");
    });

    EXPECT_TRUE(waitFor([this]() { return ticks.load() >= 3; }));
    task.stop();
}

TEST_F(PeriodicTaskTest, ManualTick_CountsTicks) {
    PeriodicTask task("manual");
    task.start(std::chrono::milliseconds(60000), [this]() { ticks++; });

    task.manualTick();
    task.manualTick();

    EXPECT_EQ(ticks.load(), 2);
    EXPECT_EQ(task.tickCount(), 2u);
    task.stop();
}
