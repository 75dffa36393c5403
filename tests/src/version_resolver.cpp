#include "unit-tests.hpp"

#include <atomic>
#include <functional>
#include <thread>
#include <utility>

using namespace chainsink;
using namespace chainsink::tests;

namespace
{
    // forwards to `inner`, running `before_version` ahead of the first runtimeVersion call
    class HookedChain : public chain::IChainClient
    {
    public:
        HookedChain(chain::IChainClient & inner, std::function<void()> before_version)
        :   _inner(inner), _before_version(std::move(before_version))
        {}

        asio::awaitable<std::expected<std::uint64_t, chain::ChainError>> canonicalHeight() override
        {
            co_return co_await _inner.canonicalHeight();
        }

        asio::awaitable<std::expected<chain::RawBlock, chain::ChainError>> fetchBlock(std::uint64_t height) override
        {
            co_return co_await _inner.fetchBlock(height);
        }

        asio::awaitable<std::expected<chain::StorageDelta, chain::ChainError>> executeBlock(std::uint64_t height) override
        {
            co_return co_await _inner.executeBlock(height);
        }

        asio::awaitable<std::expected<chain::StorageDelta, chain::ChainError>> fullStorage(std::uint64_t height) override
        {
            co_return co_await _inner.fullStorage(height);
        }

        asio::awaitable<std::expected<chain::RuntimeVersion, chain::ChainError>> runtimeVersion(std::uint64_t height) override
        {
            if(_before_version)
            {
                std::exchange(_before_version, nullptr)();
            }
            co_return co_await _inner.runtimeVersion(height);
        }

        bool executesBlocks() const override
        {
            return _inner.executesBlocks();
        }

    private:
        chain::IChainClient & _inner;
        std::function<void()> _before_version;
    };
}

TEST_F(UnitTest, Version_Resolve_PicksGreatestBreakpointAtOrBelowHeight)
{
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{0, 10}, {100, 11}, {250, 12}});

    EXPECT_EQ(resolver.resolve(0).value(), 10u);
    EXPECT_EQ(resolver.resolve(99).value(), 10u);
    EXPECT_EQ(resolver.resolve(100).value(), 11u);
    EXPECT_EQ(resolver.resolve(150).value(), 11u);
    EXPECT_EQ(resolver.resolve(249).value(), 11u);
    EXPECT_EQ(resolver.resolve(250).value(), 12u);
    EXPECT_EQ(resolver.resolve(300).value(), 12u);
}

TEST_F(UnitTest, Version_Resolve_BeforeFirstBreakpointIsNotFound)
{
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{10, 3}});

    const auto version = resolver.resolve(5);
    ASSERT_FALSE(version.has_value());
    EXPECT_EQ(version.error().kind, version::ResolveError::Kind::NOT_FOUND);

    version::VersionResolver empty;
    EXPECT_FALSE(empty.resolve(0).has_value());
}

TEST_F(UnitTest, Version_Insert_IsAppendOnly)
{
    version::VersionResolver resolver;

    EXPECT_TRUE(resolver.insert(0, 1));
    EXPECT_TRUE(resolver.insert(0, 1));
    EXPECT_FALSE(resolver.insert(0, 2));
    EXPECT_TRUE(resolver.insert(50, 2));
    EXPECT_FALSE(resolver.insert(20, 3));
    EXPECT_TRUE(resolver.insert(0, 1));

    const std::vector<version::Breakpoint> expected{{0, 1}, {50, 2}};
    EXPECT_EQ(resolver.breakpoints(), expected);
    EXPECT_EQ(resolver.latest(), (version::Breakpoint{50, 2}));
}

TEST_F(UnitTest, Version_Resolve_ConcurrentWithAppends)
{
    version::VersionResolver resolver(std::vector<version::Breakpoint>{{0, 1}});
    std::atomic<bool> done = false;
    std::atomic<std::size_t> bad = 0;

    std::vector<std::thread> readers;
    for(int i = 0; i < 4; ++i)
    {
        readers.emplace_back([&]
        {
            while(!done.load())
            {
                const auto version = resolver.resolve(5000);
                if(!version || *version < 1)
                {
                    ++bad;
                }
            }
        });
    }

    for(std::uint32_t v = 2; v <= 200; ++v)
    {
        EXPECT_TRUE(resolver.insert(v * 10, v));
    }
    done.store(true);

    for(std::thread & reader : readers)
    {
        reader.join();
    }

    EXPECT_EQ(bad.load(), 0u);
    EXPECT_EQ(resolver.resolve(5000).value(), 200u);
    EXPECT_EQ(resolver.breakpoints().size(), 200u);
}

TEST_F(UnitTest, Version_Discover_FindsUpgradeHeightsAndStoresMetadata)
{
    asio::io_context io_context;
    MemoryDatabase db;
    write::WriteCoordinator coordinator(db.factory(), write::WriteConfig{.pool_size = 2});

    FakeChain chain(500, 1);
    chain.setVersion(120, 2);
    chain.setVersion(401, 3);

    version::VersionResolver resolver;
    const auto added = runAwaitable(io_context, resolver.discover(chain, coordinator, 0, 500));
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(*added, 3u);

    const std::vector<version::Breakpoint> expected{{0, 1}, {120, 2}, {401, 3}};
    EXPECT_EQ(resolver.breakpoints(), expected);

    const auto tables = db.snapshot();
    ASSERT_EQ(tables.metadata.size(), 3u);
    EXPECT_EQ(tables.metadata.at(2), 120u);
    EXPECT_EQ(tables.metadata.at(3), 401u);

    // nothing new below the canonical height
    const auto again = runAwaitable(io_context, resolver.discover(chain, coordinator, 0, 500));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, 0u);

    version::VersionResolver reloaded;
    const auto loaded = runAwaitable(io_context, reloaded.refresh(coordinator));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 3u);
    EXPECT_EQ(reloaded.breakpoints(), expected);
}

TEST_F(UnitTest, Version_Discover_SeedsFromStartHeight)
{
    asio::io_context io_context;
    MemoryDatabase db;
    write::WriteCoordinator coordinator(db.factory(), write::WriteConfig{.pool_size = 1});

    FakeChain chain(100, 7);
    chain.setVersion(60, 8);

    version::VersionResolver resolver;
    const auto added = runAwaitable(io_context, resolver.discover(chain, coordinator, 40, 100));
    ASSERT_TRUE(added.has_value());

    const std::vector<version::Breakpoint> expected{{40, 7}, {60, 8}};
    EXPECT_EQ(resolver.breakpoints(), expected);
    EXPECT_FALSE(resolver.resolve(39).has_value());
}

TEST_F(UnitTest, Version_Discover_CountsOnlyAppendedBreakpoints)
{
    asio::io_context io_context;
    MemoryDatabase db;
    write::WriteCoordinator coordinator(db.factory(), write::WriteConfig{.pool_size = 1});

    FakeChain fake(30, 1);
    fake.setVersion(15, 2);

    version::VersionResolver resolver(std::vector<version::Breakpoint>{{1, 1}});

    // another writer records the upgrade while this discovery is bisecting
    HookedChain chain(fake, [&resolver]{ EXPECT_TRUE(resolver.insert(15, 2)); });

    const auto added = runAwaitable(io_context, resolver.discover(chain, coordinator, 1, 30));
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(*added, 0u);

    const std::vector<version::Breakpoint> expected{{1, 1}, {15, 2}};
    EXPECT_EQ(resolver.breakpoints(), expected);
    EXPECT_EQ(db.snapshot().metadata.at(2), 15u);
}
