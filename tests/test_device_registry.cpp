// =============================================================================
// Unit tests for DeviceRegistry (src/device_registry.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "device_registry.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace droid;

namespace {

std::vector<Device> makeDevices(const std::vector<std::string>& addrs) {
    std::vector<Device> out;
    for (const auto& a : addrs) {
        Device d;
        d.address = a;
        d.reachability = Device::Reachability::Reachable;
        out.push_back(d);
    }
    return out;
}

std::vector<std::string> addresses(const std::vector<Device>& devs) {
    std::vector<std::string> out;
    for (const auto& d : devs) out.push_back(d.address);
    return out;
}

} // namespace

TEST(DeviceRegistryTest, StartsEmpty) {
    DeviceRegistry reg;
    EXPECT_EQ(reg.deviceCount(), 0u);
    EXPECT_EQ(reg.generation(), 0u);
    EXPECT_FALSE(reg.currentSelection().has_value());
}

TEST(DeviceRegistryTest, ReplaceDeduplicatesKeepingFirstOccurrence) {
    DeviceRegistry reg;
    reg.replace(makeDevices({"10.0.0.5", "10.0.0.2", "10.0.0.5", "10.0.0.9", "10.0.0.2"}));

    EXPECT_EQ(addresses(reg.devices()),
              (std::vector<std::string>{"10.0.0.5", "10.0.0.2", "10.0.0.9"}));
    EXPECT_EQ(reg.generation(), 1u);
}

TEST(DeviceRegistryTest, SelectMarksExactlyOne) {
    DeviceRegistry reg;
    reg.replace(makeDevices({"10.0.0.1", "10.0.0.2", "10.0.0.3"}));

    ASSERT_TRUE(reg.select("10.0.0.2").is_ok());
    ASSERT_TRUE(reg.select("10.0.0.3").is_ok());

    int selected = 0;
    for (const auto& d : reg.devices()) {
        if (d.selected) ++selected;
    }
    EXPECT_EQ(selected, 1);
    ASSERT_TRUE(reg.currentSelection().has_value());
    EXPECT_EQ(reg.currentSelection()->address, "10.0.0.3");
}

TEST(DeviceRegistryTest, SelectUnknownAddressIsNotFoundAndKeepsSelection) {
    DeviceRegistry reg;
    reg.replace(makeDevices({"10.0.0.1"}));
    ASSERT_TRUE(reg.select("10.0.0.1").is_ok());

    auto r = reg.select("10.0.0.99");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    ASSERT_TRUE(reg.currentSelection().has_value());
    EXPECT_EQ(reg.currentSelection()->address, "10.0.0.1");
}

TEST(DeviceRegistryTest, ReplaceClearsSelection) {
    DeviceRegistry reg;
    reg.replace(makeDevices({"10.0.0.1", "10.0.0.2"}));
    ASSERT_TRUE(reg.select("10.0.0.1").is_ok());

    reg.replace(makeDevices({"10.0.0.1", "10.0.0.3"}));
    EXPECT_FALSE(reg.currentSelection().has_value());
    EXPECT_EQ(reg.generation(), 2u);
}

TEST(DeviceRegistryTest, ClearSelection) {
    DeviceRegistry reg;
    reg.replace(makeDevices({"10.0.0.1"}));
    ASSERT_TRUE(reg.select("10.0.0.1").is_ok());
    reg.clearSelection();
    EXPECT_FALSE(reg.currentSelection().has_value());
    EXPECT_EQ(reg.deviceCount(), 1u);
}

TEST(DeviceRegistryTest, SnapshotIsUnaffectedByLaterMutation) {
    DeviceRegistry reg;
    reg.replace(makeDevices({"10.0.0.1", "10.0.0.2"}));
    auto before = reg.snapshot();

    reg.replace(makeDevices({"10.0.0.7"}));
    ASSERT_TRUE(reg.select("10.0.0.7").is_ok());

    EXPECT_EQ(addresses(before->devices), (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
    EXPECT_EQ(before->generation, 1u);
    EXPECT_FALSE(before->selected().has_value());
    ASSERT_NE(reg.snapshot()->find("10.0.0.7"), nullptr);
    EXPECT_EQ(before->find("10.0.0.7"), nullptr);
}

TEST(DeviceRegistryTest, ChangeCallbackSeesEveryMutation) {
    DeviceRegistry reg;
    std::vector<uint64_t> generations;
    std::vector<size_t> sizes;
    reg.setChangeCallback([&](const DeviceRegistry::Snapshot& s) {
        generations.push_back(s.generation);
        sizes.push_back(s.devices.size());
    });

    reg.replace(makeDevices({"10.0.0.1", "10.0.0.2"}));
    ASSERT_TRUE(reg.select("10.0.0.2").is_ok());
    EXPECT_TRUE(reg.select("10.0.0.3").is_err());   // no change, no callback
    reg.clearSelection();

    EXPECT_EQ(generations, (std::vector<uint64_t>{1, 1, 1}));
    EXPECT_EQ(sizes, (std::vector<size_t>{2, 2, 2}));
}

TEST(DeviceRegistryTest, CallbackMayReadRegistry) {
    DeviceRegistry reg;
    size_t seen = 0;
    reg.setChangeCallback([&](const DeviceRegistry::Snapshot&) { seen = reg.deviceCount(); });
    reg.replace(makeDevices({"10.0.0.1", "10.0.0.2", "10.0.0.3"}));
    EXPECT_EQ(seen, 3u);
}

// ---------------------------------------------------------------------------
// Readers never observe a mix of two device sets
// ---------------------------------------------------------------------------
TEST(DeviceRegistryTest, ConcurrentReadersSeeWholeSets) {
    DeviceRegistry reg;
    const auto set_a = makeDevices({"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4"});
    const auto set_b = makeDevices({"10.0.1.1", "10.0.1.2"});
    reg.replace(set_a);

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop) {
                auto snap = reg.snapshot();
                auto addrs = addresses(snap->devices);
                bool is_a = addrs == addresses(set_a);
                bool is_b = addrs == addresses(set_b);
                if (!is_a && !is_b) ++torn;
            }
        });
    }

    for (int i = 0; i < 2000; ++i) {
        reg.replace(i % 2 ? set_a : set_b);
        if (i % 3 == 0) {
            auto r = reg.select(i % 2 ? "10.0.0.2" : "10.0.1.1");
            EXPECT_TRUE(r.is_ok());
        }
    }
    stop = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(reg.generation(), 2001u);
}

TEST(DeviceRegistryTest, ReachabilityNames) {
    EXPECT_STREQ(reachabilityStr(Device::Reachability::Reachable), "reachable");
    EXPECT_STREQ(reachabilityStr(Device::Reachability::Unreachable), "unreachable");
    EXPECT_STREQ(reachabilityStr(Device::Reachability::Unknown), "unknown");
}
