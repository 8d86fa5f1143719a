#include <gtest/gtest.h>
#include <dirent.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "configuration/discovery_settings.h"
#include "sap/sap_announcer.h"
#include "sap/sap_listener.h"
#include "sap/sap_packet.h"
#include "sap/sdp_builder.h"

using namespace audyn::discovery;
using namespace std::chrono_literals;

namespace {

std::string MakeSdp(const std::string& name, const std::string& addr, int port) {
    SdpBuildOptions options;
    options.session_name = name;
    options.multicast_addr = addr;
    options.port = port;
    options.session_id = 123456;
    return build_sdp(options);
}

class SapListenerPacketTest : public ::testing::Test {
protected:
    void SetUp() override {
        SapDiscoverySettings settings;
        settings.stream_timeout_sec = 5;
        listener_ = std::make_unique<SapListener>(settings);
        now_ = Clock::now();
    }

    void Deliver(const std::vector<uint8_t>& packet, const std::string& sender = "192.168.1.100") {
        listener_->handle_datagram(packet.data(), packet.size(), sender, now_);
    }

    std::unique_ptr<SapListener> listener_;
    TimePoint now_;
};

} // namespace

TEST_F(SapListenerPacketTest, AnnouncementIsDiscovered) {
    Deliver(encode_sap_packet(MakeSdp("Studio A", "239.69.1.10", 5004), "192.168.1.100", 0x0101));

    auto streams = listener_->get_streams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0].id, "192.168.1.100:0101");
    EXPECT_EQ(streams[0].origin_ip, "192.168.1.100");
    EXPECT_EQ(streams[0].sdp.session_name, "Studio A");

    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.packets_received, 1u);
    EXPECT_EQ(stats.packets_invalid, 0u);
    EXPECT_EQ(stats.announcements, 1u);
    EXPECT_EQ(stats.active_streams, 1);
}

TEST_F(SapListenerPacketTest, RepeatedAnnouncementsKeepOneStream) {
    const auto packet = encode_sap_packet(MakeSdp("Studio A", "239.69.1.10", 5004), "192.168.1.100", 0x0101);
    for (int i = 0; i < 10; ++i) {
        Deliver(packet);
    }

    EXPECT_EQ(listener_->get_streams(false).size(), 1u);
    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.packets_received, 10u);
    EXPECT_EQ(stats.announcements, 1u);
}

TEST_F(SapListenerPacketTest, EncryptedPacketIsCountedInvalid) {
    auto packet = encode_sap_packet(MakeSdp("Secret", "239.69.1.11", 5004), "192.168.1.100", 0x0202);
    packet[0] |= kSapFlagEncrypted;
    Deliver(packet);

    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.packets_received, 1u);
    EXPECT_EQ(stats.packets_invalid, 1u);
    EXPECT_EQ(stats.sdp_parse_errors, 0u);
    EXPECT_TRUE(listener_->get_streams(false).empty());
}

TEST_F(SapListenerPacketTest, MalformedPacketsAreCountedInvalid) {
    Deliver({0x20, 0x00, 0x01});
    Deliver({0x00, 0x00, 0x00, 0x01, 10, 0, 0, 1, 'v', '=', '0'});

    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.packets_received, 2u);
    EXPECT_EQ(stats.packets_invalid, 2u);
}

TEST_F(SapListenerPacketTest, SdpWithoutConnectionIsParseError) {
    const std::string sdp = "v=0\r\ns=Broken\r\nt=0 0\r\nm=audio 5004 RTP/AVP 96\r\n";
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0303));

    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.sdp_parse_errors, 1u);
    EXPECT_EQ(stats.announcements, 0u);
    EXPECT_TRUE(listener_->get_streams(false).empty());
}

TEST_F(SapListenerPacketTest, DeletionOfUnknownStreamIsNoOp) {
    Deliver(encode_sap_packet("", "192.168.1.100", 0x0404, true));

    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.deletions, 0u);
    EXPECT_EQ(stats.packets_invalid, 0u);
    EXPECT_TRUE(listener_->get_streams(false).empty());
}

TEST_F(SapListenerPacketTest, DeletionDeactivatesKnownStream) {
    const std::string sdp = MakeSdp("Studio A", "239.69.1.10", 5004);
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0505));
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0505, true));

    EXPECT_TRUE(listener_->get_streams(true).empty());
    auto all = listener_->get_streams(false);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_FALSE(all[0].active);

    const DiscoveryStatistics stats = listener_->get_stats();
    EXPECT_EQ(stats.deletions, 1u);
    EXPECT_EQ(stats.active_streams, 0);
}

TEST_F(SapListenerPacketTest, SameMessageIdFromDifferentOriginsAreDistinct) {
    const std::string sdp = MakeSdp("Shared", "239.69.1.12", 5004);
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0606));
    Deliver(encode_sap_packet(sdp, "192.168.1.101", 0x0606));

    EXPECT_EQ(listener_->get_streams().size(), 2u);
    EXPECT_EQ(listener_->get_stats().announcements, 2u);
}

TEST_F(SapListenerPacketTest, FindStreamAndFindByName) {
    Deliver(encode_sap_packet(MakeSdp("Studio A", "239.69.1.10", 5004), "192.168.1.100", 0x0001));
    Deliver(encode_sap_packet(MakeSdp("Studio B", "239.69.1.20", 5006), "192.168.1.100", 0x0002));

    auto by_addr = listener_->find_stream("239.69.1.20");
    ASSERT_TRUE(by_addr.has_value());
    EXPECT_EQ(by_addr->sdp.session_name, "Studio B");
    EXPECT_TRUE(listener_->find_stream("239.69.1.20", 5006).has_value());
    EXPECT_FALSE(listener_->find_stream("239.69.1.20", 5004).has_value());

    auto by_name = listener_->find_by_name("Studio A");
    ASSERT_TRUE(by_name.has_value());
    EXPECT_EQ(by_name->sdp.multicast_addr, "239.69.1.10");
    EXPECT_FALSE(listener_->find_by_name("Studio C").has_value());
}

TEST_F(SapListenerPacketTest, CleanupNowExpiresStaleStreams) {
    now_ = Clock::now() - 10s;
    Deliver(encode_sap_packet(MakeSdp("Stale", "239.69.1.30", 5004), "192.168.1.100", 0x0A0A));
    now_ = Clock::now();
    Deliver(encode_sap_packet(MakeSdp("Live", "239.69.1.31", 5004), "192.168.1.100", 0x0B0B));

    EXPECT_EQ(listener_->cleanup_now(), 1u);
    auto active = listener_->get_streams(true);
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].sdp.session_name, "Live");
    EXPECT_EQ(listener_->get_streams(false).size(), 2u);
}

TEST_F(SapListenerPacketTest, CallbacksReceiveEvents) {
    std::vector<DiscoveryEvent> events;
    const auto id = listener_->add_callback([&events](DiscoveryEvent event, const DiscoveredStream&) {
        events.push_back(event);
    });

    const std::string sdp = MakeSdp("Studio A", "239.69.1.10", 5004);
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0C0C));
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0C0C));
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0C0C, true));

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], DiscoveryEvent::NEW);
    EXPECT_EQ(events[1], DiscoveryEvent::UPDATE);
    EXPECT_EQ(events[2], DiscoveryEvent::DELETE);

    EXPECT_TRUE(listener_->remove_callback(id));
    Deliver(encode_sap_packet(sdp, "192.168.1.100", 0x0C0C));
    EXPECT_EQ(events.size(), 3u);
}

TEST_F(SapListenerPacketTest, ThrowingCallbackDoesNotAffectProcessing) {
    listener_->add_callback([](DiscoveryEvent, const DiscoveredStream&) {
        throw std::runtime_error("subscriber failure");
    });
    EXPECT_NO_THROW(Deliver(encode_sap_packet(MakeSdp("Studio A", "239.69.1.10", 5004), "192.168.1.100", 1)));
    EXPECT_EQ(listener_->get_stats().announcements, 1u);
}

TEST(SapListenerStartTest, SettingsAreSanitized) {
    SapDiscoverySettings settings;
    settings.port = 0;
    settings.stream_timeout_sec = -1;
    SapListener listener(settings);
    EXPECT_EQ(listener.settings().port, kSapPort);
    EXPECT_EQ(listener.settings().stream_timeout_sec, kDefaultStreamTimeoutSec);
    EXPECT_FALSE(listener.is_running());
    EXPECT_EQ(listener.state(), SapListener::State::Stopped);
}

TEST(SapListenerStartTest, InvalidMulticastAddressFailsStart) {
    SapDiscoverySettings settings;
    settings.multicast_addr = "10.0.0.1";
    SapListener listener(settings);

    EXPECT_THROW(listener.start(), std::runtime_error);
    EXPECT_FALSE(listener.is_running());
    EXPECT_EQ(listener.state(), SapListener::State::Stopped);
    EXPECT_NE(listener.last_error().find("10.0.0.1"), std::string::npos);
}

TEST(SapListenerStartTest, UnknownInterfaceFailsStart) {
    SapListener listener;
    EXPECT_THROW(listener.start("audyn-no-such-if0", kSapAddrAdmin), std::runtime_error);
    EXPECT_FALSE(listener.is_running());
    EXPECT_NE(listener.last_error().find("audyn-no-such-if0"), std::string::npos);
}

TEST(SapListenerStartTest, StopWhenStoppedIsSafe) {
    SapListener listener;
    EXPECT_NO_THROW(listener.stop());
    EXPECT_NO_THROW(listener.stop());
}

class SapListenerSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.port = 19875;
        settings_.poll_interval_ms = 100;
        listener_ = std::make_unique<SapListener>(settings_);
        try {
            listener_->start();
        } catch (const std::runtime_error& ex) {
            GTEST_SKIP() << "Multicast socket unavailable in this environment: " << ex.what();
        }
    }

    void TearDown() override {
        if (listener_) {
            listener_->stop();
        }
    }

    SapDiscoverySettings settings_;
    std::unique_ptr<SapListener> listener_;
};

TEST_F(SapListenerSocketTest, StartIsIdempotentAndStopIsPrompt) {
    ASSERT_TRUE(listener_->is_running());
    EXPECT_NO_THROW(listener_->start());
    EXPECT_TRUE(listener_->is_running());

    const auto begin = std::chrono::steady_clock::now();
    listener_->stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_FALSE(listener_->is_running());
    EXPECT_LT(elapsed, 2s);
}

TEST_F(SapListenerSocketTest, RestartAfterStop) {
    listener_->stop();
    ASSERT_NO_THROW(listener_->start());
    EXPECT_TRUE(listener_->is_running());
}

TEST_F(SapListenerSocketTest, ReceivesLoopbackAnnouncement) {
    struct Recorded {
        std::mutex mutex;
        std::vector<DiscoveryEvent> events;
    };
    auto recorded = std::make_shared<Recorded>();
    listener_->add_callback([recorded](DiscoveryEvent event, const DiscoveredStream&) {
        std::lock_guard<std::mutex> lock(recorded->mutex);
        recorded->events.push_back(event);
    });

    try {
        SapAnnouncer announcer(settings_.multicast_addr, settings_.port, 1);
        announcer.announce(MakeSdp("Loopback Stream", "239.69.9.9", 5004), "127.0.0.1", 0x7777);
    } catch (const std::runtime_error& ex) {
        GTEST_SKIP() << "Multicast send unavailable in this environment: " << ex.what();
    }

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline && !listener_->find_by_name("Loopback Stream")) {
        std::this_thread::sleep_for(20ms);
    }
    if (!listener_->find_by_name("Loopback Stream")) {
        GTEST_SKIP() << "Multicast loopback not delivered in this environment";
    }

    auto stream = listener_->find_by_name("Loopback Stream");
    EXPECT_EQ(stream->id, "127.0.0.1:7777");
    EXPECT_EQ(stream->sdp.multicast_addr, "239.69.9.9");
    EXPECT_GE(listener_->get_stats().packets_received, 1u);

    std::lock_guard<std::mutex> lock(recorded->mutex);
    ASSERT_FALSE(recorded->events.empty());
    EXPECT_EQ(recorded->events.front(), DiscoveryEvent::NEW);
}

namespace {

size_t OpenDescriptorCount() {
    size_t count = 0;
    DIR* dir = opendir("/proc/self/fd");
    if (dir == nullptr) {
        return 0;
    }
    while (readdir(dir) != nullptr) {
        ++count;
    }
    closedir(dir);
    return count;
}

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return predicate();
}

class SpawnFailingListener : public SapListener {
public:
    using SapListener::SapListener;

    std::atomic<int> fail_on_launch{0};

protected:
    std::thread launch_worker(std::function<void()> body) override {
        if (++launches_ == fail_on_launch.load()) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit reached");
        }
        return SapListener::launch_worker(std::move(body));
    }

private:
    int launches_ = 0;
};

} // namespace

TEST(SapListenerLifecycleTest, StopFromCallbackDoesNotWedge) {
    SapDiscoverySettings settings;
    settings.port = 19876;
    settings.poll_interval_ms = 50;
    settings.sweep_interval_sec = 1;
    settings.stream_timeout_sec = 1;
    SapListener listener(settings);

    const auto packet = encode_sap_packet(MakeSdp("Stale", "239.69.1.40", 5004), "192.168.1.100", 0x0D0D);
    listener.handle_datagram(packet.data(), packet.size(), "192.168.1.100", Clock::now() - 10s);

    std::atomic<int> expired{0};
    listener.add_callback([&listener, &expired](DiscoveryEvent event, const DiscoveredStream&) {
        if (event == DiscoveryEvent::EXPIRE) {
            expired++;
            listener.stop();
        }
    });

    try {
        listener.start();
    } catch (const std::runtime_error& ex) {
        GTEST_SKIP() << "Multicast socket unavailable in this environment: " << ex.what();
    }

    ASSERT_TRUE(WaitFor([&] { return expired.load() > 0; }, 5000ms));
    ASSERT_TRUE(WaitFor([&] { return listener.state() == SapListener::State::Stopping; }, 2000ms));
    EXPECT_FALSE(listener.is_running());

    listener.stop();
    EXPECT_EQ(listener.state(), SapListener::State::Stopped);

    ASSERT_NO_THROW(listener.start());
    EXPECT_TRUE(listener.is_running());
    listener.stop();
    EXPECT_EQ(listener.state(), SapListener::State::Stopped);
}

TEST(SapListenerLifecycleTest, StartAfterStopFromCallbackRestarts) {
    SapDiscoverySettings settings;
    settings.port = 19879;
    settings.poll_interval_ms = 50;
    settings.sweep_interval_sec = 1;
    settings.stream_timeout_sec = 1;
    SapListener listener(settings);

    const auto packet = encode_sap_packet(MakeSdp("Stale", "239.69.1.41", 5004), "192.168.1.100", 0x0E0E);
    listener.handle_datagram(packet.data(), packet.size(), "192.168.1.100", Clock::now() - 10s);
    listener.add_callback([&listener](DiscoveryEvent event, const DiscoveredStream&) {
        if (event == DiscoveryEvent::EXPIRE) {
            listener.stop();
        }
    });

    try {
        listener.start();
    } catch (const std::runtime_error& ex) {
        GTEST_SKIP() << "Multicast socket unavailable in this environment: " << ex.what();
    }

    ASSERT_TRUE(WaitFor([&] { return listener.state() == SapListener::State::Stopping; }, 5000ms));
    ASSERT_NO_THROW(listener.start());
    EXPECT_TRUE(listener.is_running());
    listener.stop();
}

TEST(SapListenerLifecycleTest, StartFromCallbackIsRejected) {
    SapDiscoverySettings settings;
    settings.port = 19880;
    settings.poll_interval_ms = 50;
    settings.sweep_interval_sec = 1;
    settings.stream_timeout_sec = 1;
    SapListener listener(settings);

    const auto packet = encode_sap_packet(MakeSdp("Stale", "239.69.1.42", 5004), "192.168.1.100", 0x0F0F);
    listener.handle_datagram(packet.data(), packet.size(), "192.168.1.100", Clock::now() - 10s);
    std::atomic<bool> rejected{false};
    listener.add_callback([&listener, &rejected](DiscoveryEvent event, const DiscoveredStream&) {
        if (event != DiscoveryEvent::EXPIRE) {
            return;
        }
        try {
            listener.start();
        } catch (const std::runtime_error&) {
            rejected = true;
        }
    });

    try {
        listener.start();
    } catch (const std::runtime_error& ex) {
        GTEST_SKIP() << "Multicast socket unavailable in this environment: " << ex.what();
    }

    EXPECT_TRUE(WaitFor([&] { return rejected.load(); }, 5000ms));
    EXPECT_TRUE(listener.is_running());
    listener.stop();
    EXPECT_EQ(listener.state(), SapListener::State::Stopped);
}

TEST(SapListenerLifecycleTest, FailedThreadSpawnReleasesSocket) {
    SapDiscoverySettings settings;
    settings.port = 19877;
    settings.poll_interval_ms = 50;
    SpawnFailingListener listener(settings);
    listener.fail_on_launch = 2;

    const size_t descriptors_before = OpenDescriptorCount();
    EXPECT_THROW(listener.start(), std::runtime_error);
    if (listener.last_error().find("worker thread") == std::string::npos) {
        GTEST_SKIP() << "Multicast socket unavailable in this environment: " << listener.last_error();
    }

    EXPECT_FALSE(listener.is_running());
    EXPECT_EQ(listener.state(), SapListener::State::Stopped);
    EXPECT_EQ(OpenDescriptorCount(), descriptors_before);

    listener.fail_on_launch = -1;
    ASSERT_NO_THROW(listener.start());
    EXPECT_TRUE(listener.is_running());
    listener.stop();
    EXPECT_EQ(OpenDescriptorCount(), descriptors_before);
}

TEST(SapListenerLifecycleTest, OversizedDatagramIsCountedInvalid) {
    SapDiscoverySettings settings;
    settings.port = 19878;
    settings.poll_interval_ms = 50;
    settings.receive_buffer_bytes = 2048;
    SapListener listener(settings);
    ASSERT_EQ(listener.settings().receive_buffer_bytes, 2048u);

    try {
        listener.start();
    } catch (const std::runtime_error& ex) {
        GTEST_SKIP() << "Multicast socket unavailable in this environment: " << ex.what();
    }

    std::string sdp = MakeSdp("Oversized", "239.69.1.50", 5004);
    sdp += "a=x-padding:" + std::string(4000, 'x') + "\r\n";
    try {
        SapAnnouncer announcer(settings.multicast_addr, settings.port, 1);
        announcer.announce(sdp, "127.0.0.1", 0x1234);
    } catch (const std::runtime_error& ex) {
        listener.stop();
        GTEST_SKIP() << "Multicast send unavailable in this environment: " << ex.what();
    }

    if (!WaitFor([&] { return listener.get_stats().packets_received > 0; }, 3000ms)) {
        listener.stop();
        GTEST_SKIP() << "Multicast loopback not delivered in this environment";
    }

    const DiscoveryStatistics stats = listener.get_stats();
    EXPECT_EQ(stats.packets_invalid, stats.packets_received);
    EXPECT_FALSE(listener.find_by_name("Oversized").has_value());
    listener.stop();
}
