#include "lanlink/cli/command_reader.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <sstream>

#include <unistd.h>

using namespace lanlink;
using namespace lanlink::test;
using namespace std::chrono_literals;

namespace
{

class CommandReaderTest : public ::testing::Test
{
protected:
    CommandReaderTest()
        : prober(io_context)
        , discovery(io_context)
        , reconciler(io_context, store, prober, discovery)
        , items(io_context, reconciler)
        , commands(io_context, reconciler, items, out)
    {
    }

    bool output_contains(const std::string& text)
    {
        return run_until(io_context, [this, &text]() { return out.str().find(text) != std::string::npos; }, 1000ms);
    }

    boost::asio::io_context io_context;
    MemoryEndpointStore store;
    FakeProber prober;
    FakeDiscoveryChannel discovery;
    ConnectionReconciler reconciler;
    ItemsClient items;
    std::ostringstream out;
    CommandReader commands;
};

} // namespace

TEST_F(CommandReaderTest, InvalidDescriptorIsRefused)
{
    EXPECT_FALSE(commands.attach(-1));
    // Nothing to read from; start must not touch the closed descriptor.
    commands.start();
    run_for(io_context, 10ms);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandReaderTest, ReadsLinesFromPipe)
{
    int pipe_ends[2];
    ASSERT_EQ(::pipe(pipe_ends), 0);
    ASSERT_TRUE(commands.attach(pipe_ends[0]));
    ::close(pipe_ends[0]);
    commands.start();

    const std::string lines = "status\n";
    ASSERT_EQ(::write(pipe_ends[1], lines.data(), lines.size()), static_cast<ssize_t>(lines.size()));
    ::close(pipe_ends[1]);

    EXPECT_TRUE(output_contains("Not connected\n"));
}

TEST_F(CommandReaderTest, StatusPrintsStatusLine)
{
    EXPECT_TRUE(commands.execute("status"));
    EXPECT_EQ(out.str(), "Not connected\n");
}

TEST_F(CommandReaderTest, QuitEndsInput)
{
    EXPECT_FALSE(commands.execute("quit"));
}

TEST_F(CommandReaderTest, ItemCommandsNeedConnection)
{
    EXPECT_TRUE(commands.execute("items"));
    EXPECT_TRUE(output_contains("List items: not connected to a server"));

    EXPECT_TRUE(commands.execute("add milk"));
    EXPECT_TRUE(output_contains("Add item: not connected to a server"));
    EXPECT_TRUE(prober.probed.empty());
}

TEST_F(CommandReaderTest, MalformedIdShowsUsage)
{
    EXPECT_TRUE(commands.execute("rename x bread"));
    EXPECT_TRUE(commands.execute("delete"));
    EXPECT_NE(out.str().find("Usage: rename <id> <title>"), std::string::npos);
    EXPECT_NE(out.str().find("Usage: delete <id>"), std::string::npos);
}

TEST_F(CommandReaderTest, InvalidCodeIsReported)
{
    EXPECT_TRUE(commands.execute("code not-a-code"));
    EXPECT_NE(out.str().find("Invalid code: "), std::string::npos);
    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::idle);
}

TEST_F(CommandReaderTest, UnknownCommandPrintsHelp)
{
    EXPECT_TRUE(commands.execute("frobnicate"));
    EXPECT_NE(out.str().find("Commands: "), std::string::npos);
    EXPECT_TRUE(commands.execute(""));
}
