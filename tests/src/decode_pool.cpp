#include "unit-tests.hpp"

using namespace chainsink;
using namespace chainsink::tests;

namespace
{
    std::vector<std::uint64_t> heights(std::uint64_t from, std::uint64_t to)
    {
        std::vector<std::uint64_t> out;
        for(std::uint64_t h = from; h <= to; ++h)
        {
            out.push_back(h);
        }
        return out;
    }

    decode::DecodeConfig fastConfig(std::size_t workers = 4)
    {
        return decode::DecodeConfig{
            .workers = workers,
            .fetch_retries = 3,
            .fetch_backoff = std::chrono::milliseconds(1),
            .task_timeout = std::chrono::milliseconds(5000)
        };
    }
}

TEST_F(UnitTest, Decode_Pool_DecodesEveryHeightInOrder)
{
    asio::io_context io_context;
    FakeChain chain(20);
    codec::OpaqueCodec codec;
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{0, 1}, {6, 2}});

    decode::DecodeWorkerPool pool(chain, codec, resolver, fastConfig());
    const auto report = runAwaitable(io_context, pool.decode(heights(1, 10)));

    EXPECT_FALSE(report.fatal.has_value());
    EXPECT_TRUE(report.failures.empty());
    ASSERT_EQ(report.blocks.size(), 10u);

    for(std::size_t i = 0; i < report.blocks.size(); ++i)
    {
        const chain::DecodedBlock & decoded = report.blocks[i];
        EXPECT_EQ(decoded.block.height, i + 1);
        EXPECT_EQ(decoded.block.hash, fakeHash(i + 1));
        EXPECT_EQ(decoded.block.schema_version, decoded.block.height < 6 ? 1u : 2u);

        ASSERT_EQ(decoded.extrinsics.size(), 1u);
        EXPECT_EQ(decoded.extrinsics[0].block_hash, decoded.block.hash);
        EXPECT_EQ(decoded.extrinsics[0].height, decoded.block.height);
        EXPECT_EQ(decoded.extrinsics[0].module, "opaque");
    }
}

TEST_F(UnitTest, Decode_Pool_SkipsUndecodableBlocks)
{
    asio::io_context io_context;
    FakeChain chain(10);
    chain.corruptPayload(4);
    codec::OpaqueCodec codec;
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{0, 1}});

    decode::DecodeWorkerPool pool(chain, codec, resolver, fastConfig());
    const auto report = runAwaitable(io_context, pool.decode(heights(1, 10)));

    EXPECT_FALSE(report.fatal.has_value());
    EXPECT_EQ(report.blocks.size(), 9u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].height, 4u);
    EXPECT_EQ(report.failures[0].kind, decode::DecodeFailure::Kind::DECODE);
    EXPECT_TRUE(report.failures[0].permanent);
}

TEST_F(UnitTest, Decode_Pool_RetriesTransientFetchErrors)
{
    asio::io_context io_context;
    FakeChain chain(10);
    chain.failFetch(3, chain::ChainError{chain::ChainError::Kind::TRANSPORT, "connection reset"}, 2);
    chain.failFetch(5, chain::ChainError{chain::ChainError::Kind::TRANSPORT, "connection reset"});
    chain.failFetch(7, chain::ChainError{chain::ChainError::Kind::NOT_FOUND, "pruned"});
    codec::OpaqueCodec codec;
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{0, 1}});

    decode::DecodeWorkerPool pool(chain, codec, resolver, fastConfig(2));
    const auto report = runAwaitable(io_context, pool.decode({3, 5, 7}));

    ASSERT_EQ(report.blocks.size(), 1u);
    EXPECT_EQ(report.blocks[0].block.height, 3u);
    EXPECT_EQ(chain.fetchCalls(3), 3u);

    ASSERT_EQ(report.failures.size(), 2u);

    // retries exhausted: stays a gap
    EXPECT_EQ(report.failures[0].height, 5u);
    EXPECT_EQ(report.failures[0].kind, decode::DecodeFailure::Kind::FETCH);
    EXPECT_FALSE(report.failures[0].permanent);
    EXPECT_EQ(chain.fetchCalls(5), 4u);

    // answered, not worth retrying
    EXPECT_EQ(report.failures[1].height, 7u);
    EXPECT_TRUE(report.failures[1].permanent);
    EXPECT_EQ(chain.fetchCalls(7), 1u);
}

TEST_F(UnitTest, Decode_Pool_TimesOutSlowHeights)
{
    asio::io_context io_context;
    FakeChain chain(5);
    chain.delayFetch(2, std::chrono::milliseconds(2000));
    codec::OpaqueCodec codec;
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{0, 1}});

    auto cfg = fastConfig(2);
    cfg.task_timeout = std::chrono::milliseconds(30);
    decode::DecodeWorkerPool pool(chain, codec, resolver, cfg);
    const auto report = runAwaitable(io_context, pool.decode(heights(1, 3)));

    EXPECT_EQ(report.blocks.size(), 2u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].height, 2u);
    EXPECT_EQ(report.failures[0].kind, decode::DecodeFailure::Kind::TIMEOUT);
    EXPECT_FALSE(report.failures[0].permanent);
}

TEST_F(UnitTest, Decode_Pool_StopsOnUnknownSchema)
{
    asio::io_context io_context;
    FakeChain chain(10);
    codec::OpaqueCodec codec;
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{5, 1}});

    decode::DecodeWorkerPool pool(chain, codec, resolver, fastConfig(1));
    const auto report = runAwaitable(io_context, pool.decode({6, 7, 2, 8, 9}));

    ASSERT_TRUE(report.fatal.has_value());
    EXPECT_EQ(report.fatal->kind, version::ResolveError::Kind::NOT_FOUND);

    ASSERT_EQ(report.blocks.size(), 2u);
    EXPECT_EQ(report.blocks[0].block.height, 6u);
    EXPECT_EQ(report.blocks[1].block.height, 7u);
    EXPECT_EQ(chain.fetchCalls(8), 0u);
}
