// =============================================================================
// Unit tests for ScreenToggleController (src/screen_toggle_controller.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "screen_toggle_controller.hpp"
#include "fake_tools.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace droid;
using namespace droid::fakes;

namespace {

class ScreenToggleTest : public ::testing::Test {
protected:
    void SetUp() override {
        Device d;
        d.address = "192.168.1.23";
        d.reachability = Device::Reachability::Reachable;
        registry.replace({d});
        ASSERT_TRUE(registry.select("192.168.1.23").is_ok());
    }

    DeviceRegistry registry;
    FakeBridge bridge;
    FakeLauncher launcher;
    FakeScreenSender sender;
    SessionOrchestrator sessions{registry, bridge, launcher, 5555};
    ScreenToggleController toggler{sessions, sender};
};

// Holds the first send() until released; logs "begin:on|off" / "end:on|off"
class GatedScreenSender : public ScreenToggleSender {
public:
    ToolOutcome send(bool turn_on) override {
        std::unique_lock<std::mutex> lock(mutex_);
        const std::string which = turn_on ? "on" : "off";
        events_.push_back("begin:" + which);
        ++begun_;
        cv_.notify_all();
        if (begun_ == 1) {
            cv_.wait(lock, [this] { return released_; });
        }
        events_.push_back("end:" + which);
        return ToolOutcome::success(which);
    }

    bool waitForBegin(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return begun_ >= count; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    int begun() {
        std::lock_guard<std::mutex> lock(mutex_);
        return begun_;
    }

    std::vector<std::string> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> events_;
    int begun_ = 0;
    bool released_ = false;
};

} // namespace

TEST_F(ScreenToggleTest, AlternatesOffThenOn) {
    auto started = sessions.startSession();
    ASSERT_TRUE(started.is_ok());

    auto first = toggler.toggle();
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value().screen_on);
    EXPECT_EQ(first.value().session_id, started.value().id);
    EXPECT_FALSE(sessions.session().screen_on);

    auto second = toggler.toggle();
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().screen_on);

    EXPECT_EQ(sender.sent(), (std::vector<bool>{false, true}));
}

TEST_F(ScreenToggleTest, FailedKeystrokeKeepsState) {
    ASSERT_TRUE(sessions.startSession().is_ok());
    sender.fail = true;

    auto r = toggler.toggle();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::ToggleCommand);
    EXPECT_NE(r.error().message.find("scrcpy window not found"), std::string::npos);
    EXPECT_TRUE(sessions.session().screen_on);

    // Next attempt still asks for "off"
    sender.fail = false;
    auto retry = toggler.toggle();
    ASSERT_TRUE(retry.is_ok());
    EXPECT_FALSE(retry.value().screen_on);
    EXPECT_EQ(sender.sent(), (std::vector<bool>{false, false}));
}

TEST_F(ScreenToggleTest, NoSessionSendsNothing) {
    auto r = toggler.toggle();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::SessionNotActive);
    EXPECT_TRUE(sender.sent().empty());
}

TEST_F(ScreenToggleTest, EndedSessionSendsNothing) {
    ASSERT_TRUE(sessions.startSession().is_ok());
    ASSERT_TRUE(sessions.stopSession().is_ok());

    EXPECT_TRUE(toggler.toggle().is_err());
    EXPECT_TRUE(sender.sent().empty());
}

TEST_F(ScreenToggleTest, NewSessionStartsFromScreenOn) {
    ASSERT_TRUE(sessions.startSession().is_ok());
    ASSERT_TRUE(toggler.toggle().is_ok());   // off

    auto second = sessions.startSession();
    ASSERT_TRUE(second.is_ok());
    auto r = toggler.toggle();
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().screen_on);
    EXPECT_EQ(r.value().session_id, second.value().id);
    EXPECT_EQ(sender.sent(), (std::vector<bool>{false, false}));
}

// ---------------------------------------------------------------------------
// A second toggle waits for the first one's keystroke to complete
// ---------------------------------------------------------------------------
TEST_F(ScreenToggleTest, ConcurrentTogglesAreSerialized) {
    GatedScreenSender gated;
    ScreenToggleController serial(sessions, gated);
    ASSERT_TRUE(sessions.startSession().is_ok());

    Result<SessionOrchestrator::ScreenState> first = Err(ErrorCode::Internal, "not run");
    Result<SessionOrchestrator::ScreenState> second = Err(ErrorCode::Internal, "not run");

    std::thread t1([&] { first = serial.toggle(); });
    ASSERT_TRUE(gated.waitForBegin(1, std::chrono::seconds(5)));

    std::thread t2([&] { second = serial.toggle(); });
    // The second keystroke must not start while the first is in flight
    EXPECT_FALSE(gated.waitForBegin(2, std::chrono::milliseconds(200)));
    EXPECT_EQ(gated.begun(), 1);

    gated.release();
    t1.join();
    t2.join();

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(first.value().screen_on);
    EXPECT_TRUE(second.value().screen_on);
    EXPECT_EQ(gated.events(),
              (std::vector<std::string>{"begin:off", "end:off", "begin:on", "end:on"}));
    EXPECT_TRUE(sessions.session().screen_on);
}
