#include "kvwire/store.h"

#include <gtest/gtest.h>
#include <photon/common/utility.h>
#include <photon/photon.h>
#include <photon/thread/std-compat.h>
#include <photon/thread/thread.h>

using namespace kvwire;

class MemoryStoreTest : public ::testing::Test
{
protected:
    MemoryStore store;
};

TEST_F(MemoryStoreTest, GetMissing)
{
    EXPECT_EQ(store.get("nope"), std::nullopt);
    EXPECT_EQ(store.size(), 0);
}

TEST_F(MemoryStoreTest, SetThenGet)
{
    store.set("k", Frame::bulk("v"));
    auto value = store.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), Frame::bulk("v"));
}

TEST_F(MemoryStoreTest, LastWriteWins)
{
    store.set("k", Frame::bulk("one"));
    store.set("k", Frame::integer(2));
    EXPECT_EQ(store.get("k").value(), Frame::integer(2));
    EXPECT_EQ(store.size(), 1);
}

TEST_F(MemoryStoreTest, EmptyValueIsNotAbsent)
{
    store.set("k", Frame::bulk(""));
    auto value = store.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_FALSE(value->is_null());
}

TEST_F(MemoryStoreTest, Delete)
{
    store.set("k", Frame::bulk("v"));
    EXPECT_TRUE(store.del("k"));
    EXPECT_FALSE(store.del("k")) << "deleting twice reports the key as missing";
    EXPECT_EQ(store.get("k"), std::nullopt);
}

TEST_F(MemoryStoreTest, Clear)
{
    EXPECT_EQ(store.clear(), 0);
    store.set("a", Frame::integer(1));
    store.set("b", Frame::integer(2));
    EXPECT_EQ(store.clear(), 2);
    EXPECT_EQ(store.size(), 0);
    EXPECT_EQ(store.get("a"), std::nullopt);
}

TEST_F(MemoryStoreTest, MultiGetKeepsOrder)
{
    store.set("a", Frame::bulk("1"));
    store.set("c", Frame::bulk("3"));
    const auto values = store.multi_get({"c", "b", "a", "c"});
    ASSERT_EQ(values.size(), 4);
    EXPECT_EQ(values[0], Frame::bulk("3"));
    EXPECT_EQ(values[1], std::nullopt);
    EXPECT_EQ(values[2], Frame::bulk("1"));
    EXPECT_EQ(values[3], Frame::bulk("3"));
}

TEST_F(MemoryStoreTest, MultiSet)
{
    const auto written = store.multi_set({{"a", Frame::bulk("1")}, {"b", Frame::bulk("2")}, {"a", Frame::bulk("3")}});
    EXPECT_EQ(written, 3);
    EXPECT_EQ(store.size(), 2);
    EXPECT_EQ(store.get("a").value(), Frame::bulk("3")) << "a later pair wins within one call";
}

TEST_F(MemoryStoreTest, ConcurrentWriters)
{
    constexpr int kWriters = 8;
    constexpr int kKeysPerWriter = 100;
    std::vector<photon_std::thread> writers;
    writers.reserve(kWriters);
    for (int w = 0; w < kWriters; ++w)
    {
        writers.emplace_back([this, w]() {
            for (int i = 0; i < kKeysPerWriter; ++i)
            {
                store.set(std::to_string(w) + ":" + std::to_string(i), Frame::integer(i));
                if (i % 10 == 0) photon::thread_yield();
            }
        });
    }
    for (auto& writer: writers)
    {
        writer.join();
    }
    EXPECT_EQ(store.size(), kWriters * kKeysPerWriter);
    EXPECT_EQ(store.get("7:99").value(), Frame::integer(99));
}

int main(int argc, char** argv)
{
    photon::init(photon::INIT_EVENT_DEFAULT, photon::INIT_IO_NONE);
    DEFER(photon::fini(););
    ::testing::InitGoogleTest(&argc, argv);
    auto ret = RUN_ALL_TESTS();
    return ret;
}
