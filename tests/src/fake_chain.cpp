#include "fake_chain.hpp"

#include <iterator>

#include <nlohmann/json.hpp>

namespace chainsink::tests
{
    namespace
    {
        Bytes _bytesOf(std::uint64_t value, std::size_t size)
        {
            Bytes out(size, 0);
            for(std::size_t i = 0; i < 8 && i < size; ++i)
            {
                out[size - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
            }
            return out;
        }

        Bytes _storageKey(std::uint64_t height)
        {
            Bytes key{'k', 'e', 'y'};
            const Bytes suffix = _bytesOf(height, 8);
            key.insert(key.end(), suffix.begin(), suffix.end());
            return key;
        }
    }

    Bytes fakeHash(std::uint64_t height)
    {
        Bytes hash = _bytesOf(height, 32);
        // keep hashes of different heights distinct from zeroed values
        hash[0] = 0xAB;
        return hash;
    }

    chain::DecodedBlock fakeDecodedBlock(std::uint64_t height, std::uint32_t version, std::size_t extrinsics)
    {
        chain::DecodedBlock decoded;
        decoded.block = chain::BlockRecord{
            .hash = fakeHash(height),
            .parent_hash = height == 0 ? Bytes(32, 0) : fakeHash(height - 1),
            .height = height,
            .state_root = _bytesOf(height * 7, 32),
            .extrinsics_root = _bytesOf(height * 11, 32),
            .schema_version = version,
            .payload = std::nullopt
        };

        decoded.extrinsics.reserve(extrinsics);
        for(std::size_t i = 0; i < extrinsics; ++i)
        {
            decoded.extrinsics.push_back(chain::ExtrinsicRecord{
                .block_hash = decoded.block.hash,
                .height = height,
                .index = static_cast<std::uint32_t>(i),
                .module = "balances",
                .call_name = "transfer",
                .signature = std::nullopt,
                .args = nlohmann::json{{"amount", i}}
            });
        }

        decoded.events.push_back(chain::EventRecord{
            .block_hash = decoded.block.hash,
            .height = height,
            .index = 0,
            .module = "system",
            .event_name = "ExtrinsicSuccess",
            .parameters = nlohmann::json::object()
        });
        return decoded;
    }

    FakeChain::FakeChain(std::uint64_t height, std::uint32_t version)
    : _height(height)
    {
        _versions.emplace(0, version);
    }

    void FakeChain::setHeight(std::uint64_t height)
    {
        std::lock_guard lock(_mutex);
        _height = height;
    }

    void FakeChain::setVersion(std::uint64_t height, std::uint32_t version)
    {
        std::lock_guard lock(_mutex);
        _versions.insert_or_assign(height, version);
    }

    void FakeChain::failFetch(std::uint64_t height, chain::ChainError error, std::size_t times)
    {
        std::lock_guard lock(_mutex);
        _fetch_failures.insert_or_assign(height, Failure{std::move(error), times});
    }

    void FakeChain::failExecute(std::uint64_t height, chain::ChainError error, std::size_t times)
    {
        std::lock_guard lock(_mutex);
        _execute_failures.insert_or_assign(height, Failure{std::move(error), times});
    }

    void FakeChain::delayFetch(std::uint64_t height, std::chrono::milliseconds delay)
    {
        std::lock_guard lock(_mutex);
        _fetch_delays.insert_or_assign(height, delay);
    }

    void FakeChain::delayExecute(std::uint64_t height, std::chrono::milliseconds delay)
    {
        std::lock_guard lock(_mutex);
        _execute_delays.insert_or_assign(height, delay);
    }

    void FakeChain::corruptPayload(std::uint64_t height)
    {
        std::lock_guard lock(_mutex);
        _corrupt.insert_or_assign(height, true);
    }

    std::size_t FakeChain::fetchCalls(std::uint64_t height) const
    {
        std::lock_guard lock(_mutex);
        const auto it = _fetch_calls.find(height);
        return it == _fetch_calls.end() ? 0 : it->second;
    }

    std::size_t FakeChain::executeCalls(std::uint64_t height) const
    {
        std::lock_guard lock(_mutex);
        const auto it = _execute_calls.find(height);
        return it == _execute_calls.end() ? 0 : it->second;
    }

    std::size_t FakeChain::fullStorageCalls(std::uint64_t height) const
    {
        std::lock_guard lock(_mutex);
        const auto it = _full_calls.find(height);
        return it == _full_calls.end() ? 0 : it->second;
    }

    std::size_t FakeChain::versionCalls() const
    {
        std::lock_guard lock(_mutex);
        return _version_calls;
    }

    std::optional<chain::ChainError> FakeChain::takeFailure(std::map<std::uint64_t, Failure> & failures, std::uint64_t height)
    {
        const auto it = failures.find(height);
        if(it == failures.end() || it->second.remaining == 0)
        {
            return std::nullopt;
        }

        if(it->second.remaining != ALWAYS)
        {
            --it->second.remaining;
        }
        return it->second.error;
    }

    std::chrono::milliseconds FakeChain::delayFor(const std::map<std::uint64_t, std::chrono::milliseconds> & delays, std::uint64_t height) const
    {
        const auto it = delays.find(height);
        return it == delays.end() ? std::chrono::milliseconds(0) : it->second;
    }

    asio::awaitable<std::expected<std::uint64_t, chain::ChainError>> FakeChain::canonicalHeight()
    {
        std::lock_guard lock(_mutex);
        co_return _height;
    }

    asio::awaitable<std::expected<chain::RawBlock, chain::ChainError>> FakeChain::fetchBlock(std::uint64_t height)
    {
        std::chrono::milliseconds delay;
        std::optional<chain::ChainError> failure;
        bool corrupt = false;
        {
            std::lock_guard lock(_mutex);
            ++_fetch_calls[height];
            if(height > _height)
            {
                co_return std::unexpected(chain::ChainError{chain::ChainError::Kind::NOT_FOUND, "beyond chain head"});
            }
            delay = delayFor(_fetch_delays, height);
            failure = takeFailure(_fetch_failures, height);
            corrupt = _corrupt.contains(height);
        }

        if(delay.count() > 0)
        {
            co_await utils::sleepFor(delay);
        }

        if(failure)
        {
            co_return std::unexpected(*failure);
        }

        chain::RawBlock raw;
        raw.height = height;
        raw.hash = fakeHash(height);
        raw.parent_hash = height == 0 ? Bytes(32, 0) : fakeHash(height - 1);
        raw.state_root = _bytesOf(height * 7, 32);
        raw.extrinsics_root = _bytesOf(height * 11, 32);

        const std::string payload = corrupt
            ? std::string("not a block")
            : nlohmann::json::array({utils::toHex(_bytesOf(height, 4))}).dump();
        raw.payload.assign(payload.begin(), payload.end());

        co_return raw;
    }

    asio::awaitable<std::expected<chain::StorageDelta, chain::ChainError>> FakeChain::executeBlock(std::uint64_t height)
    {
        std::chrono::milliseconds delay;
        std::optional<chain::ChainError> failure;
        {
            std::lock_guard lock(_mutex);
            ++_execute_calls[height];
            delay = delayFor(_execute_delays, height);
            failure = takeFailure(_execute_failures, height);
        }

        if(delay.count() > 0)
        {
            co_await utils::sleepFor(delay);
        }

        if(failure)
        {
            co_return std::unexpected(*failure);
        }

        chain::StorageDelta delta;
        delta.height = height;
        delta.block_hash = fakeHash(height);
        delta.changes.push_back({_storageKey(height), _bytesOf(height, 8)});
        // every block also clears the key of its predecessor
        if(height > 0)
        {
            delta.changes.push_back({_storageKey(height - 1), std::nullopt});
        }
        co_return delta;
    }

    asio::awaitable<std::expected<chain::StorageDelta, chain::ChainError>> FakeChain::fullStorage(std::uint64_t height)
    {
        {
            std::lock_guard lock(_mutex);
            ++_full_calls[height];
        }

        chain::StorageDelta delta;
        delta.height = height;
        delta.block_hash = fakeHash(height);
        delta.is_full = true;
        delta.changes.push_back({Bytes{'s', 'y', 's'}, Bytes{0x01}});
        delta.changes.push_back({_storageKey(height), _bytesOf(height, 8)});
        co_return delta;
    }

    asio::awaitable<std::expected<chain::RuntimeVersion, chain::ChainError>> FakeChain::runtimeVersion(std::uint64_t height)
    {
        std::lock_guard lock(_mutex);
        ++_version_calls;

        auto it = _versions.upper_bound(height);
        --it;
        co_return chain::RuntimeVersion{
            .spec_version = it->second,
            .metadata = _bytesOf(it->second, 4)
        };
    }

    void FakeChain::disableExecution()
    {
        std::lock_guard lock(_mutex);
        _executes_blocks = false;
    }

    bool FakeChain::executesBlocks() const
    {
        std::lock_guard lock(_mutex);
        return _executes_blocks;
    }
}
