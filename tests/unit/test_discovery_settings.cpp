#include <gtest/gtest.h>
#include <string>

#include "configuration/discovery_settings.h"

using namespace audyn::discovery;

TEST(DiscoverySettingsTest, Defaults) {
    SapDiscoverySettings settings;
    EXPECT_TRUE(settings.bind_interface.empty());
    EXPECT_EQ(settings.multicast_addr, "239.255.255.255");
    EXPECT_EQ(settings.port, 9875);
    EXPECT_EQ(settings.stream_timeout_sec, 300);
    EXPECT_EQ(settings.sweep_interval_sec, 60);
    EXPECT_EQ(settings.poll_interval_ms, 1000);
    EXPECT_EQ(settings.receive_buffer_bytes, 65536u);
    EXPECT_TRUE(settings.join_admin_scope_with_global);
}

TEST(DiscoverySettingsTest, SanitizeRestoresDefaultsForInvalidValues) {
    SapDiscoverySettings settings;
    settings.multicast_addr = "";
    settings.port = 70000;
    settings.stream_timeout_sec = 0;
    settings.sweep_interval_sec = -5;
    settings.poll_interval_ms = 0;
    settings.receive_buffer_bytes = 16;

    const SapDiscoverySettings clean = sanitize_settings(settings);
    EXPECT_EQ(clean.multicast_addr, kSapAddrAdmin);
    EXPECT_EQ(clean.port, kSapPort);
    EXPECT_EQ(clean.stream_timeout_sec, kDefaultStreamTimeoutSec);
    EXPECT_EQ(clean.sweep_interval_sec, kDefaultSweepIntervalSec);
    EXPECT_EQ(clean.poll_interval_ms, kDefaultPollIntervalMs);
    EXPECT_EQ(clean.receive_buffer_bytes, kDefaultReceiveBufferBytes);
}

TEST(DiscoverySettingsTest, SanitizeKeepsValidValues) {
    SapDiscoverySettings settings;
    settings.multicast_addr = kSapAddrGlobal;
    settings.port = 19875;
    settings.stream_timeout_sec = 30;
    settings.poll_interval_ms = 50;

    const SapDiscoverySettings clean = sanitize_settings(settings);
    EXPECT_EQ(clean.multicast_addr, "224.2.127.254");
    EXPECT_EQ(clean.port, 19875);
    EXPECT_EQ(clean.stream_timeout_sec, 30);
    EXPECT_EQ(clean.poll_interval_ms, 50);
}

TEST(DiscoverySettingsTest, EmptyUpdateChangesNothing) {
    SapDiscoverySettings current;
    current.bind_interface = "eth0";
    current.stream_timeout_sec = 120;

    const SapDiscoverySettings merged = apply_settings_update(current, SapDiscoverySettingsUpdate());
    EXPECT_EQ(merged.bind_interface, "eth0");
    EXPECT_EQ(merged.stream_timeout_sec, 120);
    EXPECT_EQ(merged.multicast_addr, current.multicast_addr);
}

TEST(DiscoverySettingsTest, UpdateMergesOnlySetFields) {
    SapDiscoverySettings current;
    current.bind_interface = "eth0";

    SapDiscoverySettingsUpdate update;
    update.multicast_addr = std::string(kSapAddrGlobal);
    update.stream_timeout_sec = 600;
    update.join_admin_scope_with_global = false;

    const SapDiscoverySettings merged = apply_settings_update(current, update);
    EXPECT_EQ(merged.bind_interface, "eth0");
    EXPECT_EQ(merged.multicast_addr, kSapAddrGlobal);
    EXPECT_EQ(merged.stream_timeout_sec, 600);
    EXPECT_FALSE(merged.join_admin_scope_with_global);
    EXPECT_EQ(merged.port, kSapPort);
}

TEST(DiscoverySettingsTest, UpdateCanClearInterface) {
    SapDiscoverySettings current;
    current.bind_interface = "eth0";

    SapDiscoverySettingsUpdate update;
    update.bind_interface = std::string();
    EXPECT_TRUE(apply_settings_update(current, update).bind_interface.empty());
}

TEST(DiscoverySettingsTest, UpdatedValuesAreSanitized) {
    SapDiscoverySettingsUpdate update;
    update.port = -1;
    update.sweep_interval_sec = 0;

    const SapDiscoverySettings merged = apply_settings_update(SapDiscoverySettings(), update);
    EXPECT_EQ(merged.port, kSapPort);
    EXPECT_EQ(merged.sweep_interval_sec, kDefaultSweepIntervalSec);
}
