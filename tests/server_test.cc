#include "kvwire/server.h"

#include <atomic>
#include <gtest/gtest.h>
#include <photon/common/alog.h>
#include <photon/common/utility.h>
#include <photon/photon.h>
#include <photon/thread/thread.h>
#include <photon/thread/thread11.h>

#include "kvwire/client.h"

using namespace kvwire;

TEST(ServerConfigTest, DefaultsAreValid)
{
    ServerConfig config;
    config.worker_thread_count_ = 2;
    EXPECT_EQ(config.validate(), std::nullopt);
    EXPECT_EQ(config.port_, 31337);
    EXPECT_EQ(config.host_, "127.0.0.1");
    EXPECT_EQ(config.max_concurrent_connections_, 64);
}

TEST(ServerConfigTest, RejectsBadHost)
{
    ServerConfig config;
    config.worker_thread_count_ = 1;
    config.host_ = "not-an-address";
    const auto problem = config.validate();
    ASSERT_TRUE(problem.has_value());
    EXPECT_NE(problem->find("not-an-address"), std::string::npos);
}

TEST(ServerConfigTest, RejectsZeroes)
{
    ServerConfig base;
    base.worker_thread_count_ = 1;

    auto config = base;
    config.port_ = 0;
    EXPECT_TRUE(config.validate().has_value());

    config = base;
    config.worker_thread_count_ = 0;
    EXPECT_TRUE(config.validate().has_value());

    config = base;
    config.max_concurrent_connections_ = 0;
    EXPECT_TRUE(config.validate().has_value());

    config = base;
    config.network_read_chunk_ = 0;
    EXPECT_TRUE(config.validate().has_value());

    config = base;
    config.max_bulk_length_ = -1;
    EXPECT_TRUE(config.validate().has_value());

    config = base;
    config.max_aggregate_length_ = -1;
    EXPECT_EQ(config.validate(), "max aggregate length cannot be negative");

    config = base;
    config.max_line_length_ = 0;
    EXPECT_EQ(config.validate(), "max line length must be positive");
}

TEST(ServerConfigTest, RejectsUnknownLogLevel)
{
    ServerConfig config;
    config.worker_thread_count_ = 1;
    config.log_level_ = "loud";
    EXPECT_EQ(config.validate(), "unknown log level 'loud'");
}

TEST(ServerConfigTest, ConnectionOptions)
{
    ServerConfig config;
    config.network_read_chunk_ = 4096;
    config.max_bulk_length_ = 10;
    config.max_nesting_depth_ = 4;
    config.max_aggregate_length_ = 16;
    config.max_line_length_ = 128;
    const auto options = config.connection_options();
    EXPECT_EQ(options.read_chunk_size, 4096);
    EXPECT_EQ(options.max_bulk_length, 10);
    EXPECT_EQ(options.max_nesting_depth, 4);
    EXPECT_EQ(options.max_aggregate_length, 16);
    EXPECT_EQ(options.max_line_length, 128);
}

TEST(LogLevelTest, Names)
{
    EXPECT_EQ(log_level_from_string("debug"), ALOG_DEBUG);
    EXPECT_EQ(log_level_from_string("info"), ALOG_INFO);
    EXPECT_EQ(log_level_from_string("warn"), ALOG_WARN);
    EXPECT_EQ(log_level_from_string("error"), ALOG_ERROR);
    EXPECT_EQ(log_level_from_string("INFO"), std::nullopt);
}

TEST(ServerTest, SharesTheGivenStore)
{
    auto store = std::make_shared<MemoryStore>();
    store->set("warm", Frame::bulk("cache"));
    ServerConfig config;
    config.worker_thread_count_ = 1;
    config.log_level_ = "warn";
    Server server(config, store);
    EXPECT_EQ(server.store().size(), 1);
    EXPECT_EQ(server.registry().size(), 7);
    EXPECT_EQ(log_output_level, ALOG_WARN);
}

// One connection slot: the second client is only served once the first one hangs up.
TEST(ServerTest, LoopbackQueuesBeyondConnectionLimit)
{
    ServerConfig config;
    config.port_ = 0;
    config.worker_thread_count_ = 1;
    config.max_concurrent_connections_ = 1;
    config.log_level_ = "warn";
    Server server(config);
    ASSERT_EQ(server.listen(), 0);
    ASSERT_NE(server.port(), 0);

    int served = -1;
    auto* accepting = photon::thread_create11([&server, &served]() { served = server.serve(); });
    auto* accepting_join = photon::thread_enable_join(accepting);

    auto first = Client::connect("127.0.0.1", server.port());
    EXPECT_EQ(first->set("k", "v"), 1);

    auto second = Client::connect("127.0.0.1", server.port());
    std::atomic<bool> answered{false};
    std::string pong;
    auto* waiting = photon::thread_create11([&second, &answered, &pong]() {
        pong = second->ping();
        answered = true;
    });
    auto* waiting_join = photon::thread_enable_join(waiting);

    photon::thread_usleep(100 * 1000);
    EXPECT_FALSE(answered);
    EXPECT_EQ(first->get("k"), "v");

    first->close();
    photon::thread_join(waiting_join);
    EXPECT_TRUE(answered);
    EXPECT_EQ(pong, "PONG");
    EXPECT_EQ(second->get("k"), "v");

    second->close();
    photon::thread_usleep(50 * 1000);
    server.stop();
    photon::thread_join(accepting_join);
    EXPECT_EQ(served, 0);
}

int main(int argc, char** argv)
{
    log_output_level = ALOG_WARN;
    photon::init(photon::INIT_EVENT_DEFAULT, photon::INIT_IO_NONE);
    DEFER(photon::fini(););
    ::testing::InitGoogleTest(&argc, argv);
    auto ret = RUN_ALL_TESTS();
    return ret;
}
