#include <frogworks/error_types.h>
#include <frogworks_tray/platform/headless_tray.h>
#include <frogworks_tray/presence_task.h>
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <thread>

using namespace frogworks_tray;
using frogworks::ShutdownSignal;
using frogworks_test::wait_until;

namespace {

// Tray that refuses to come up, as a desktop without a tray host would
class BrokenTray : public HeadlessTray {
public:
    bool initialize(const std::string&, const std::string&) override { return false; }
};

// Records which threads create the tray and pump its loop
class ThreadRecordingTray : public HeadlessTray {
public:
    bool initialize(const std::string& app_name, const std::string& icon_path) override {
        init_thread = std::this_thread::get_id();
        return HeadlessTray::initialize(app_name, icon_path);
    }
    void run() override {
        run_thread = std::this_thread::get_id();
        HeadlessTray::run();
    }

    std::thread::id init_thread;
    std::thread::id run_thread;
};

struct RunningTask {
    explicit RunningTask(std::unique_ptr<HeadlessTray> headless, bool with_ping = false)
        : tray(headless.get()), task(std::move(headless)) {
        if (with_ping) {
            task.set_ping_callback([this]() {
                ++pings;
                return std::string("pong");
            });
        }
        thread = std::thread([this]() { task.run(shutdown); });
    }

    ~RunningTask() {
        shutdown.signal();
        if (thread.joinable()) thread.join();
    }

    bool menu_ready() {
        return wait_until([this]() { return tray->is_running() && !tray->menu_labels().empty(); });
    }

    HeadlessTray* tray;
    PresenceTask task;
    ShutdownSignal shutdown;
    std::atomic<int> pings{0};
    std::thread thread;
};

} // namespace

TEST(PresenceTaskTest, QuitItemSignalsShutdown) {
    RunningTask running(std::make_unique<HeadlessTray>());
    ASSERT_TRUE(running.menu_ready());

    EXPECT_TRUE(running.tray->activate(MenuText::QUIT));
    running.thread.join();

    EXPECT_TRUE(running.shutdown.is_signaled());
    EXPECT_FALSE(running.tray->is_running());
}

TEST(PresenceTaskTest, ExternalShutdownStopsTheTray) {
    RunningTask running(std::make_unique<HeadlessTray>());
    ASSERT_TRUE(running.menu_ready());

    running.shutdown.signal();
    running.thread.join();
    EXPECT_FALSE(running.tray->is_running());
}

TEST(PresenceTaskTest, MenuWithoutPingCallback) {
    RunningTask running(std::make_unique<HeadlessTray>());
    ASSERT_TRUE(running.menu_ready());

    EXPECT_EQ(running.tray->menu_labels(),
              (std::vector<std::string>{MenuText::TITLE, "-", MenuText::QUIT}));
    EXPECT_FALSE(running.tray->activate(MenuText::PING));
}

TEST(PresenceTaskTest, PingItemInvokesCallback) {
    RunningTask running(std::make_unique<HeadlessTray>(), true);
    ASSERT_TRUE(running.menu_ready());

    EXPECT_EQ(running.tray->menu_labels(),
              (std::vector<std::string>{MenuText::TITLE, MenuText::PING, "-", MenuText::QUIT}));
    EXPECT_TRUE(running.tray->activate(MenuText::PING));
    EXPECT_EQ(running.pings.load(), 1);
    EXPECT_FALSE(running.shutdown.is_signaled());
}

TEST(PresenceTaskTest, TitleIsNotClickable) {
    RunningTask running(std::make_unique<HeadlessTray>());
    ASSERT_TRUE(running.menu_ready());
    EXPECT_FALSE(running.tray->activate(MenuText::TITLE));
}

TEST(PresenceTaskTest, FailedTrayInitializationThrows) {
    PresenceTask task(std::make_unique<BrokenTray>());
    ShutdownSignal shutdown;
    EXPECT_THROW(task.run(shutdown), frogworks::FrogworksException);
}

TEST(PresenceTaskTest, MissingTrayThrows) {
    PresenceTask task(nullptr);
    ShutdownSignal shutdown;
    EXPECT_THROW(task.run(shutdown), frogworks::FrogworksException);
}

TEST(PresenceTaskTest, TrayLoopRunsOnTheInitializingThread) {
    auto recording = std::make_unique<ThreadRecordingTray>();
    ThreadRecordingTray* tray = recording.get();
    std::thread::id task_thread;
    {
        RunningTask running(std::move(recording));
        task_thread = running.thread.get_id();
        ASSERT_TRUE(running.menu_ready());
        running.shutdown.signal();
        running.thread.join();

        EXPECT_EQ(tray->init_thread, task_thread);
        EXPECT_EQ(tray->run_thread, task_thread);
    }
}

#ifndef _WIN32
TEST(TrayFactoryTest, HeadlessTrayWithoutADesktopTray) {
    auto tray = create_tray();
    ASSERT_NE(tray, nullptr);
    EXPECT_NE(dynamic_cast<HeadlessTray*>(tray.get()), nullptr);
}
#endif
