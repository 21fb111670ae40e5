#include <gtest/gtest.h>
#include "toolhost/sequencer.hpp"
#include <algorithm>
#include <random>
#include <thread>
#include <vector>

using namespace toolhost;

namespace {

JsonRpcMessage response(int64_t id) {
    JsonRpcResponse r;
    r.id = RequestId{id};
    r.result = nlohmann::json::object();
    return r;
}

int64_t id_of(const JsonRpcMessage& m) {
    return std::get<int64_t>(*std::get<JsonRpcResponse>(m).id);
}

} // namespace

TEST(ResponseSequencer, InOrderPassesThrough) {
    std::vector<int64_t> out;
    ResponseSequencer seq([&out](const JsonRpcMessage& m) { out.push_back(id_of(m)); });
    auto a = seq.reserve();
    seq.complete(a, response(1));
    auto b = seq.reserve();
    seq.complete(b, response(2));
    EXPECT_EQ(out, (std::vector<int64_t>{1, 2}));
    EXPECT_EQ(seq.buffered(), 0u);
}

TEST(ResponseSequencer, HoldsLaterCompletions) {
    std::vector<int64_t> out;
    ResponseSequencer seq([&out](const JsonRpcMessage& m) { out.push_back(id_of(m)); });
    auto first = seq.reserve();
    auto second = seq.reserve();
    auto third = seq.reserve();

    seq.complete(third, response(3));
    seq.complete(second, response(2));
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(seq.buffered(), 2u);

    seq.complete(first, response(1));
    EXPECT_EQ(out, (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(seq.buffered(), 0u);
}

TEST(ResponseSequencer, EmptySlotProducesNoOutput) {
    std::vector<int64_t> out;
    ResponseSequencer seq([&out](const JsonRpcMessage& m) { out.push_back(id_of(m)); });
    auto a = seq.reserve();
    auto b = seq.reserve();
    seq.complete(b, response(2));
    seq.complete(a, std::nullopt);
    EXPECT_EQ(out, (std::vector<int64_t>{2}));
}

TEST(ResponseSequencer, ConcurrentCompletionsStayOrdered) {
    std::vector<int64_t> out;
    ResponseSequencer seq([&out](const JsonRpcMessage& m) { out.push_back(id_of(m)); });
    constexpr int kCount = 200;
    std::vector<uint64_t> tickets;
    for (int i = 0; i < kCount; ++i) tickets.push_back(seq.reserve());

    std::vector<int> order(kCount);
    for (int i = 0; i < kCount; ++i) order[i] = i;
    std::shuffle(order.begin(), order.end(), std::mt19937(42));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = t; i < kCount; i += 4) {
                int idx = order[i];
                seq.complete(tickets[idx], response(idx));
            }
        });
    }
    for (auto& th : threads) th.join();

    ASSERT_EQ(out.size(), static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i) EXPECT_EQ(out[i], i);
}
