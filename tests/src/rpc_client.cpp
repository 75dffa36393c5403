#include "unit-tests.hpp"

#include <algorithm>
#include <thread>
#include <unordered_map>

using namespace chainsink;
using namespace chainsink::tests;

namespace
{
    struct MockRpcNode
    {
        std::string best_number = "0x64";
        std::string finalized_hash = "0x" + std::string(62, '0') + "1f";
        std::string finalized_number = "0x1f";
        std::unordered_map<std::uint64_t, std::string> hashes;
        json block = json::object();
        json runtime_version = {{"specVersion", 9430u}, {"transactionVersion", 2}};
        std::string metadata = "0x6d657461";
        bool fail_transport = false;

        std::size_t get_block_calls = 0;
        std::thread::id last_caller;

        std::optional<json> call(const std::string &, const json & request)
        {
            if(fail_transport)
            {
                return std::nullopt;
            }

            last_caller = std::this_thread::get_id();

            const std::string method = request.value("method", "");
            const json & params = request["params"];

            const auto reply = [&request](json result)
            {
                return json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", std::move(result)}};
            };

            if(method == "chain_getFinalizedHead")
            {
                return reply(finalized_hash);
            }

            if(method == "chain_getHeader")
            {
                if(params.empty())
                {
                    return reply({{"number", best_number}});
                }
                if(params[0] == finalized_hash)
                {
                    return reply({{"number", finalized_number}});
                }
                return reply(nullptr);
            }

            if(method == "chain_getBlockHash")
            {
                const auto it = hashes.find(params[0].get<std::uint64_t>());
                if(it == hashes.end())
                {
                    return reply(nullptr);
                }
                return reply(it->second);
            }

            if(method == "chain_getBlock")
            {
                ++get_block_calls;
                return reply(block);
            }

            if(method == "state_getRuntimeVersion")
            {
                return reply(runtime_version);
            }

            if(method == "state_getMetadata")
            {
                return reply(metadata);
            }

            return json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"error", {{"code", -32601}, {"message", "Method not found"}}}};
        }
    };

    const std::string HASH_5 = "0x" + std::string(62, '0') + "05";
    const std::string HASH_4 = "0x" + std::string(62, '0') + "04";
    const std::string ROOT = "0x" + std::string(64, 'a');

    chain::RpcChainClient makeClient(MockRpcNode & node)
    {
        return chain::RpcChainClient(chain::RpcClientConfig{
            .rpc_url = "mock://node",
            .rpc_call = [&node](const std::string & rpc_url, const json & request)
            {
                return node.call(rpc_url, request);
            }
        });
    }
}

TEST_F(UnitTest, Rpc_CanonicalHeight_UsesFinalizedHead)
{
    asio::io_context io_context;
    MockRpcNode node;
    auto client = makeClient(node);

    // best head is 100, only 31 is final
    const auto height = runAwaitable(io_context, client.canonicalHeight());
    ASSERT_TRUE(height.has_value());
    EXPECT_EQ(*height, 31u);
    EXPECT_EQ(client.callCount(), 2u);

    node.finalized_number = "thirty one";
    const auto malformed = runAwaitable(io_context, client.canonicalHeight());
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error().kind, chain::ChainError::Kind::MALFORMED);

    node.finalized_hash = "0x" + std::string(64, 'f');
    node.finalized_number = "0x1f";
    auto unknown_head = runAwaitable(io_context, client.canonicalHeight());
    ASSERT_FALSE(unknown_head.has_value());
    EXPECT_EQ(unknown_head.error().kind, chain::ChainError::Kind::MALFORMED);
}

TEST_F(UnitTest, Rpc_Calls_RunOffCallerThread)
{
    asio::io_context io_context;
    MockRpcNode node;
    auto client = makeClient(node);

    ASSERT_TRUE(runAwaitable(io_context, client.canonicalHeight()).has_value());
    EXPECT_NE(node.last_caller, std::this_thread::get_id());
    EXPECT_NE(node.last_caller, std::thread::id{});
}

TEST_F(UnitTest, Rpc_Curl_BoundsEveryCall)
{
    const json request{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "chain_getFinalizedHead"}, {"params", json::array()}};

    const auto args = chain::curlArguments("http://node:9933", request,
        std::chrono::milliseconds(2500), std::chrono::milliseconds(5000));

    const auto value_after = [&args](const std::string & flag) -> std::string
    {
        const auto it = std::ranges::find(args, flag);
        if(it == args.end() || std::next(it) == args.end())
        {
            return "";
        }
        return *std::next(it);
    };

    EXPECT_EQ(value_after("--max-time"), "2.500");
    // never waits longer for the connection than for the whole call
    EXPECT_EQ(value_after("--connect-timeout"), "2.500");
    EXPECT_EQ(value_after("--data"), request.dump());
    EXPECT_NE(std::ranges::find(args, std::string("http://node:9933")), args.end());
}

TEST_F(UnitTest, Rpc_FetchBlock_ReadsHeaderAndExtrinsics)
{
    asio::io_context io_context;
    MockRpcNode node;
    node.hashes.emplace(5, HASH_5);
    node.block = {
        {"block", {
            {"header", {
                {"parentHash", HASH_4},
                {"number", "0x5"},
                {"stateRoot", ROOT},
                {"extrinsicsRoot", ROOT}
            }},
            {"extrinsics", json::array({"0x0401", "0x0402"})}
        }},
        {"justifications", nullptr}
    };
    auto client = makeClient(node);

    const auto block = runAwaitable(io_context, client.fetchBlock(5));
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->height, 5u);
    ASSERT_EQ(block->hash.size(), 32u);
    EXPECT_EQ(block->hash.back(), 0x05);
    EXPECT_EQ(block->parent_hash.back(), 0x04);
    EXPECT_EQ(block->state_root, Bytes(32, 0xAA));

    const auto body = codec::OpaqueCodec{}.decode(block->payload, 1);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->extrinsics.size(), 2u);

    EXPECT_EQ(client.callCount(), 2u);
}

TEST_F(UnitTest, Rpc_FetchBlock_ClassifiesFailures)
{
    asio::io_context io_context;
    MockRpcNode node;
    auto client = makeClient(node);

    const auto unknown = runAwaitable(io_context, client.fetchBlock(99));
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, chain::ChainError::Kind::NOT_FOUND);
    EXPECT_FALSE(chain::isTransient(unknown.error()));
    EXPECT_FALSE(client.executesBlocks());
    EXPECT_EQ(node.get_block_calls, 0u);

    node.hashes.emplace(5, HASH_5);
    node.block = {{"block", {{"extrinsics", json::array()}}}};
    const auto headless = runAwaitable(io_context, client.fetchBlock(5));
    ASSERT_FALSE(headless.has_value());
    EXPECT_EQ(headless.error().kind, chain::ChainError::Kind::MALFORMED);

    node.fail_transport = true;
    const auto down = runAwaitable(io_context, client.fetchBlock(5));
    ASSERT_FALSE(down.has_value());
    EXPECT_EQ(down.error().kind, chain::ChainError::Kind::TRANSPORT);
    EXPECT_TRUE(chain::isTransient(down.error()));
}

TEST_F(UnitTest, Rpc_RuntimeVersion_ReturnsSpecVersionAndMetadata)
{
    asio::io_context io_context;
    MockRpcNode node;
    node.hashes.emplace(5, HASH_5);
    auto client = makeClient(node);

    const auto version = runAwaitable(io_context, client.runtimeVersion(5));
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version->spec_version, 9430u);
    EXPECT_EQ(version->metadata, (Bytes{'m', 'e', 't', 'a'}));
}

TEST_F(UnitTest, Rpc_Execution_IsUnsupported)
{
    asio::io_context io_context;
    MockRpcNode node;
    auto client = makeClient(node);

    const auto delta = runAwaitable(io_context, client.executeBlock(5));
    ASSERT_FALSE(delta.has_value());
    EXPECT_EQ(delta.error().kind, chain::ChainError::Kind::UNSUPPORTED);

    const auto full = runAwaitable(io_context, client.fullStorage(5));
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().kind, chain::ChainError::Kind::UNSUPPORTED);
    EXPECT_EQ(client.callCount(), 0u);
}
