#include "kvwire/commands.h"

#include <gtest/gtest.h>
#include <photon/common/alog.h>
#include <photon/common/utility.h>
#include <photon/photon.h>
#include <stdexcept>

#include "kvwire/errors.h"

using namespace kvwire;

namespace
{
    Frame request(std::initializer_list<std::string_view> tokens)
    {
        std::vector<Frame> items;
        for (const auto token: tokens)
        {
            items.push_back(Frame::bulk(token));
        }
        return Frame::array(std::move(items));
    }
}  // namespace

class CommandsTest : public ::testing::Test
{
protected:
    CommandRegistry registry = CommandRegistry::with_default_commands();
    MemoryStore store;

    Frame run(std::initializer_list<std::string_view> tokens) { return registry.dispatch(request(tokens), store); }
};

TEST_F(CommandsTest, DefaultCommands)
{
    EXPECT_EQ(registry.size(), 7);
    for (const auto* name: {"GET", "SET", "DELETE", "FLUSH", "MGET", "MSET", "PING"})
    {
        EXPECT_TRUE(registry.contains(name)) << name;
    }
    EXPECT_TRUE(registry.contains("get")) << "lookups are case-insensitive";
    EXPECT_FALSE(registry.contains("INCR"));
}

TEST_F(CommandsTest, SetGetDeleteScenario)
{
    EXPECT_EQ(run({"SET", "x", "1"}), Frame::integer(1));
    EXPECT_EQ(run({"GET", "x"}), Frame::bulk("1"));
    EXPECT_EQ(run({"DELETE", "x"}), Frame::integer(1));
    EXPECT_EQ(run({"GET", "x"}), Frame::null());
    EXPECT_EQ(run({"DELETE", "x"}), Frame::integer(0));
}

TEST_F(CommandsTest, CommandNamesAreCaseInsensitive)
{
    EXPECT_EQ(run({"set", "k", "v"}), Frame::integer(1));
    EXPECT_EQ(run({"GeT", "k"}), Frame::bulk("v"));
}

TEST_F(CommandsTest, LastWriteWins)
{
    run({"SET", "k", "a"});
    run({"SET", "k", "b"});
    EXPECT_EQ(run({"GET", "k"}), Frame::bulk("b"));
}

TEST_F(CommandsTest, ValuesKeepTheirKind)
{
    const auto set = Frame::array({Frame::bulk("SET"), Frame::bulk("n"), Frame::integer(12)});
    EXPECT_EQ(registry.dispatch(set, store), Frame::integer(1));
    EXPECT_EQ(run({"GET", "n"}), Frame::integer(12));
}

TEST_F(CommandsTest, IntegerKeys)
{
    const auto set = Frame::array({Frame::bulk("SET"), Frame::integer(5), Frame::bulk("five")});
    EXPECT_EQ(registry.dispatch(set, store), Frame::integer(1));
    EXPECT_EQ(run({"GET", "5"}), Frame::bulk("five"));
}

TEST_F(CommandsTest, UnknownCommand)
{
    EXPECT_EQ(run({"FOO", "bar"}), Frame::error("Unrecognized command: FOO"));
}

TEST_F(CommandsTest, UnknownCommandWithLineBreaksStaysOneFrame)
{
    const auto reply = registry.dispatch(Frame::array({Frame::bulk("foo\r\n:1")}), store);
    EXPECT_EQ(reply.to_string(), "-Unrecognized command: FOO  :1\r\n");
}

TEST_F(CommandsTest, MissingCommand)
{
    EXPECT_EQ(registry.dispatch(Frame::array({}), store), Frame::error("Missing command"));
    EXPECT_EQ(registry.dispatch(Frame::simple("   "), store), Frame::error("Missing command"));
}

TEST_F(CommandsTest, RequestMustBeListOrString)
{
    const auto expected = Frame::error("Request must be list or simple string.");
    EXPECT_EQ(registry.dispatch(Frame::integer(3), store), expected);
    EXPECT_EQ(registry.dispatch(Frame::null(), store), expected);
    EXPECT_EQ(registry.dispatch(Frame::map({{Frame::bulk("GET"), Frame::bulk("x")}}), store), expected);
}

TEST_F(CommandsTest, CommandNameMustBeString)
{
    EXPECT_EQ(registry.dispatch(Frame::array({Frame::integer(1)}), store),
              Frame::error("command name must be a string"));
}

TEST_F(CommandsTest, InlineRequest)
{
    EXPECT_EQ(registry.dispatch(Frame::simple("SET k v"), store), Frame::integer(1));
    EXPECT_EQ(registry.dispatch(Frame::simple("GET k"), store), Frame::bulk("v"));
    EXPECT_EQ(registry.dispatch(Frame::bulk("  ping  "), store), Frame::simple("PONG"));
}

TEST_F(CommandsTest, TokensFromFrame)
{
    const auto tokens = CommandRegistry::tokens_from_frame(Frame::simple(" MGET a  b "));
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[0], Frame::bulk("MGET"));
    EXPECT_EQ(tokens[2], Frame::bulk("b"));
    EXPECT_THROW(CommandRegistry::tokens_from_frame(Frame::integer(1)), CommandError);
}

TEST_F(CommandsTest, WrongArity)
{
    EXPECT_EQ(run({"GET"}), Frame::error("wrong number of arguments for 'GET' command"));
    EXPECT_EQ(run({"SET", "k"}), Frame::error("wrong number of arguments for 'SET' command"));
    EXPECT_EQ(run({"DELETE", "a", "b"}), Frame::error("wrong number of arguments for 'DELETE' command"));
    EXPECT_EQ(run({"FLUSH", "now"}), Frame::error("wrong number of arguments for 'FLUSH' command"));
    EXPECT_EQ(store.size(), 0);
}

TEST_F(CommandsTest, AggregateValuesAreRejected)
{
    const auto set = Frame::array({Frame::bulk("SET"), Frame::bulk("k"), Frame::array({Frame::integer(1)})});
    EXPECT_EQ(registry.dispatch(set, store), Frame::error("value must be a scalar"));
    const auto bad_key = Frame::array({Frame::bulk("GET"), Frame::array({})});
    EXPECT_EQ(registry.dispatch(bad_key, store), Frame::error("key must be a string or an integer"));
    EXPECT_EQ(store.size(), 0);
}

TEST_F(CommandsTest, Flush)
{
    EXPECT_EQ(run({"FLUSH"}), Frame::integer(0));
    run({"SET", "a", "1"});
    run({"SET", "b", "2"});
    run({"SET", "c", "3"});
    EXPECT_EQ(run({"FLUSH"}), Frame::integer(3));
    EXPECT_EQ(run({"GET", "a"}), Frame::null());
}

TEST_F(CommandsTest, MultiGet)
{
    run({"SET", "a", "1"});
    run({"SET", "c", "3"});
    EXPECT_EQ(run({"MGET", "a", "b", "c"}), Frame::array({Frame::bulk("1"), Frame::null(), Frame::bulk("3")}));
    EXPECT_EQ(run({"MGET"}), Frame::array({}));
}

TEST_F(CommandsTest, MultiSet)
{
    EXPECT_EQ(run({"MSET", "a", "1", "b", "2"}), Frame::integer(2));
    EXPECT_EQ(run({"GET", "b"}), Frame::bulk("2"));
    EXPECT_EQ(run({"MSET"}), Frame::integer(0));
}

TEST_F(CommandsTest, MultiSetOddArgumentsWritesNothing)
{
    EXPECT_EQ(run({"MSET", "a", "1", "b"}), Frame::error("MSET requires an even number of arguments"));
    EXPECT_EQ(store.size(), 0);
}

TEST_F(CommandsTest, MultiSetInvalidPairWritesNothing)
{
    const auto mset = Frame::array(
            {Frame::bulk("MSET"), Frame::bulk("a"), Frame::bulk("1"), Frame::bulk("b"), Frame::set({})});
    EXPECT_EQ(registry.dispatch(mset, store), Frame::error("value must be a scalar"));
    EXPECT_EQ(store.size(), 0);
}

TEST_F(CommandsTest, Ping)
{
    EXPECT_EQ(run({"PING"}), Frame::simple("PONG"));
    EXPECT_EQ(run({"PING", "hello"}), Frame::bulk("hello"));
    EXPECT_EQ(run({"PING", "a", "b"}), Frame::error("wrong number of arguments for 'PING' command"));
}

TEST_F(CommandsTest, CustomHandler)
{
    registry.add("size", [](Store& s, CommandArgs) { return Frame::integer(static_cast<int64_t>(s.size())); });
    run({"SET", "a", "1"});
    EXPECT_EQ(run({"SIZE"}), Frame::integer(1));
}

TEST_F(CommandsTest, CustomHandlerReplacesBuiltin)
{
    registry.add("PING", [](Store&, CommandArgs) { return Frame::simple("custom"); });
    EXPECT_EQ(registry.size(), 7);
    EXPECT_EQ(run({"PING"}), Frame::simple("custom"));
}

TEST_F(CommandsTest, HandlerFaultIsContained)
{
    registry.add("BOOM", [](Store&, CommandArgs) -> Frame { throw std::runtime_error("kaboom"); });
    EXPECT_EQ(run({"BOOM"}), Frame::error("internal error: kaboom"));
    EXPECT_EQ(run({"PING"}), Frame::simple("PONG")) << "the registry keeps working after a fault";
}

TEST_F(CommandsTest, HandlerCommandError)
{
    registry.add("NOPE", [](Store&, CommandArgs) -> Frame { throw CommandError("not today"); });
    EXPECT_EQ(run({"NOPE"}), Frame::error("not today"));
}

TEST(KeyFromFrameTest, Conversions)
{
    EXPECT_EQ(key_from_frame(Frame::bulk("k")), "k");
    EXPECT_EQ(key_from_frame(Frame::simple("s")), "s");
    EXPECT_EQ(key_from_frame(Frame::integer(-12)), "-12");
    EXPECT_THROW(key_from_frame(Frame::null()), CommandError);
    EXPECT_THROW(key_from_frame(Frame::error("e")), CommandError);
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
