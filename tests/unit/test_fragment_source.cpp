#include <gtest/gtest.h>
#include "streamrpc/fragment_source.hpp"
#include "streamrpc/error.hpp"
#include <thread>

using namespace streamrpc;
using namespace std::chrono_literals;

TEST(VectorSource, YieldsInOrderThenEnds) {
    VectorSource source(std::vector<nlohmann::json>{"a", "b"});
    EXPECT_EQ(source.next(), nlohmann::json("a"));
    EXPECT_EQ(source.next(), nlohmann::json("b"));
    EXPECT_FALSE(source.next().has_value());
    EXPECT_FALSE(source.next().has_value());
}

TEST(VectorSource, CancelStopsEarly) {
    VectorSource source(std::vector<nlohmann::json>{1, 2, 3});
    EXPECT_TRUE(source.next().has_value());
    source.cancel();
    EXPECT_FALSE(source.next().has_value());
}

TEST(GeneratorSource, StopsAtFirstNullopt) {
    int calls = 0;
    GeneratorSource source([&]() -> std::optional<nlohmann::json> {
        ++calls;
        if (calls <= 2) return nlohmann::json(calls);
        return std::nullopt;
    });
    EXPECT_EQ(source.next(), nlohmann::json(1));
    EXPECT_EQ(source.next(), nlohmann::json(2));
    EXPECT_FALSE(source.next().has_value());
    EXPECT_FALSE(source.next().has_value());
    EXPECT_EQ(calls, 3);
}

TEST(GeneratorSource, ExceptionsPropagate) {
    GeneratorSource source([]() -> std::optional<nlohmann::json> {
        throw HandlerFailure("generator broke");
    });
    EXPECT_THROW(source.next(), HandlerFailure);
}

TEST(FragmentChannel, ProducerThreadToConsumer) {
    auto channel = std::make_shared<FragmentChannel>();
    std::thread producer([channel] {
        for (int i = 0; i < 5; ++i) {
            channel->push(i);
            std::this_thread::sleep_for(1ms);
        }
        channel->close();
    });

    ChannelSource source(channel);
    std::vector<int> got;
    while (auto f = source.next()) got.push_back(f->get<int>());
    producer.join();
    EXPECT_EQ(got, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(FragmentChannel, FailureAfterQueuedFragments) {
    FragmentChannel channel;
    channel.push("before");
    channel.fail(std::make_exception_ptr(HandlerFailure("upstream died")));
    EXPECT_EQ(channel.next(), nlohmann::json("before"));
    EXPECT_THROW(channel.next(), HandlerFailure);
}

TEST(FragmentChannel, CancelWakesBlockedConsumer) {
    FragmentChannel channel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        channel.cancel();
    });
    EXPECT_FALSE(channel.next().has_value());
    canceller.join();
    EXPECT_TRUE(channel.is_cancelled());
    EXPECT_FALSE(channel.push("ignored"));
}

TEST(FragmentChannel, PushAfterCloseIsRefused) {
    FragmentChannel channel;
    channel.close();
    EXPECT_FALSE(channel.push(1));
    EXPECT_FALSE(channel.next().has_value());
}
