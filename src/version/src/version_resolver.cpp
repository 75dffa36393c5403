#include "version_resolver.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

#include <spdlog/spdlog.h>

namespace chainsink::version
{
    namespace
    {
        ResolveError _chainError(std::uint64_t height, const chain::ChainError & error)
        {
            return ResolveError{ResolveError::Kind::CHAIN,
                std::format("runtime version at {}: {} ({})", height, error.kind, error.message)};
        }
    }

    VersionResolver::VersionResolver(std::vector<Breakpoint> breakpoints)
    {
        for(const Breakpoint & breakpoint : breakpoints)
        {
            insert(breakpoint.height, breakpoint.version);
        }
    }

    std::expected<std::uint32_t, ResolveError> VersionResolver::resolve(std::uint64_t height) const
    {
        std::shared_lock lock(_mutex);

        const auto it = std::ranges::upper_bound(_breakpoints, height, {}, &Breakpoint::height);
        if(it == _breakpoints.begin())
        {
            return std::unexpected(ResolveError{ResolveError::Kind::NOT_FOUND,
                std::format("no runtime version known at height {}", height)});
        }
        return std::prev(it)->version;
    }

    bool VersionResolver::insert(std::uint64_t height, std::uint32_t version)
    {
        return _insert(height, version) != InsertResult::REJECTED;
    }

    VersionResolver::InsertResult VersionResolver::_insert(std::uint64_t height, std::uint32_t version)
    {
        std::unique_lock lock(_mutex);

        if(!_breakpoints.empty())
        {
            const Breakpoint & last = _breakpoints.back();

            if(height < last.height)
            {
                const auto existing = std::ranges::find(_breakpoints, Breakpoint{height, version});
                if(existing != _breakpoints.end())
                {
                    return InsertResult::PRESENT;
                }

                spdlog::warn("Rejected runtime version {} at height {}: below newest breakpoint {}", version, height, last.height);
                return InsertResult::REJECTED;
            }

            if(height == last.height)
            {
                if(version == last.version)
                {
                    return InsertResult::PRESENT;
                }

                spdlog::warn("Rejected runtime version {} at height {}: version {} already starts there", version, height, last.version);
                return InsertResult::REJECTED;
            }

            if(version == last.version)
            {
                // still the same runtime
                return InsertResult::PRESENT;
            }
        }

        _breakpoints.push_back(Breakpoint{height, version});
        spdlog::debug("Runtime version {} in force from height {}", version, height);
        return InsertResult::APPENDED;
    }

    std::vector<Breakpoint> VersionResolver::breakpoints() const
    {
        std::shared_lock lock(_mutex);
        return _breakpoints;
    }

    std::optional<Breakpoint> VersionResolver::latest() const
    {
        std::shared_lock lock(_mutex);
        if(_breakpoints.empty())
        {
            return std::nullopt;
        }
        return _breakpoints.back();
    }

    asio::awaitable<std::expected<std::size_t, ResolveError>> VersionResolver::refresh(write::WriteCoordinator & coordinator)
    {
        const auto stored = co_await coordinator.query<std::vector<store::BreakpointRecord>>([](store::IConnection & connection)
        {
            return connection.breakpoints();
        });

        if(!stored)
        {
            co_return std::unexpected(ResolveError{ResolveError::Kind::STORE, stored.error().message});
        }

        std::vector<Breakpoint> loaded;
        loaded.reserve(stored->size());
        for(const store::BreakpointRecord & record : *stored)
        {
            loaded.push_back(Breakpoint{record.first_height, record.version});
        }
        std::ranges::sort(loaded, {}, &Breakpoint::height);

        {
            std::unique_lock lock(_mutex);
            _breakpoints = std::move(loaded);
        }

        spdlog::info("Loaded {} runtime version breakpoints", stored->size());
        co_return stored->size();
    }

    asio::awaitable<std::expected<std::size_t, ResolveError>> VersionResolver::discover(
        chain::IChainClient & chain,
        write::WriteCoordinator & coordinator,
        std::uint64_t start_height,
        std::uint64_t up_to_height)
    {
        std::size_t added = 0;

        const auto record = [&](std::uint64_t height, chain::RuntimeVersion runtime) -> asio::awaitable<std::expected<void, ResolveError>>
        {
            const auto stored = co_await coordinator.commitMetadata(runtime.spec_version, height, std::move(runtime.metadata));
            if(!stored)
            {
                co_return std::unexpected(ResolveError{ResolveError::Kind::STORE, stored.error().message});
            }

            if(_insert(height, runtime.spec_version) == InsertResult::APPENDED)
            {
                ++added;
            }
            co_return std::expected<void, ResolveError>{};
        };

        auto last = latest();
        if(!last)
        {
            auto seed = co_await chain.runtimeVersion(start_height);
            if(!seed)
            {
                co_return std::unexpected(_chainError(start_height, seed.error()));
            }

            const std::uint32_t seed_version = seed->spec_version;
            if(auto recorded = co_await record(start_height, std::move(*seed)); !recorded)
            {
                co_return std::unexpected(recorded.error());
            }
            last = Breakpoint{start_height, seed_version};
        }

        if(up_to_height <= last->height)
        {
            co_return added;
        }

        auto top = co_await chain.runtimeVersion(up_to_height);
        if(!top)
        {
            co_return std::unexpected(_chainError(up_to_height, top.error()));
        }

        while(top->spec_version != last->version)
        {
            // version(low) == last->version, version(high) differs
            std::uint64_t low = last->height;
            std::uint64_t high = up_to_height;
            chain::RuntimeVersion at_high = *top;

            while(high - low > 1)
            {
                const std::uint64_t mid = low + (high - low) / 2;
                auto sampled = co_await chain.runtimeVersion(mid);
                if(!sampled)
                {
                    co_return std::unexpected(_chainError(mid, sampled.error()));
                }

                if(sampled->spec_version == last->version)
                {
                    low = mid;
                }
                else
                {
                    high = mid;
                    at_high = std::move(*sampled);
                }
            }

            const std::uint32_t found_version = at_high.spec_version;
            spdlog::info("Runtime upgrade to version {} at height {}", found_version, high);

            if(auto recorded = co_await record(high, std::move(at_high)); !recorded)
            {
                co_return std::unexpected(recorded.error());
            }
            last = Breakpoint{high, found_version};
        }

        co_return added;
    }
}
