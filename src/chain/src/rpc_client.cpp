#include "rpc_client.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "native.h"
#include "utils.hpp"

namespace chainsink::chain
{
    using json = nlohmann::json;

    namespace
    {
        std::expected<Bytes, ChainError> _hexField(const json & object, const char * key)
        {
            if(!object.contains(key) || !object[key].is_string())
            {
                return std::unexpected(ChainError{ChainError::Kind::MALFORMED, std::format("missing `{}`", key)});
            }

            auto bytes = utils::fromHex(object[key].get<std::string>());
            if(!bytes)
            {
                return std::unexpected(ChainError{ChainError::Kind::MALFORMED, std::format("`{}` is not hex", key)});
            }
            return *bytes;
        }
    }

    bool isTransient(const ChainError & error)
    {
        return error.kind == ChainError::Kind::TRANSPORT || error.kind == ChainError::Kind::UNKNOWN;
    }

    std::vector<std::string> curlArguments(
        const std::string & rpc_url,
        const json & request,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds connect_timeout)
    {
        const auto seconds = [](std::chrono::milliseconds duration)
        {
            return std::format("{:.3f}", static_cast<double>(duration.count()) / 1000.0);
        };

        return {
            "-sS",
            "--max-time", seconds(timeout),
            "--connect-timeout", seconds(std::min(connect_timeout, timeout)),
            "-X", "POST",
            rpc_url,
            "-H", "Content-Type: application/json",
            "--data", request.dump()
        };
    }

    std::optional<json> rpcCallWithCurl(
        const std::string & rpc_url,
        const json & request,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds connect_timeout)
    {
        try
        {
            const auto [exit_code, output] = native::runProcess("curl", curlArguments(rpc_url, request, timeout, connect_timeout));
            if(exit_code != 0)
            {
                spdlog::error("Chain RPC call failed (exit={}): {}", exit_code, output);
                return std::nullopt;
            }

            return json::parse(output);
        }
        catch(const std::exception & e)
        {
            spdlog::error("Chain RPC call failed: {}", e.what());
            return std::nullopt;
        }
    }

    RpcChainClient::RpcChainClient(RpcClientConfig cfg)
    :   _cfg(std::move(cfg)),
        _threads(std::max<std::size_t>(1, _cfg.threads))
    {
        if(!_cfg.rpc_call)
        {
            _cfg.rpc_call = [timeout = _cfg.timeout, connect_timeout = _cfg.connect_timeout](const std::string & rpc_url, const json & request)
            {
                return rpcCallWithCurl(rpc_url, request, timeout, connect_timeout);
            };
        }
    }

    RpcChainClient::~RpcChainClient()
    {
        _threads.join();
    }

    bool RpcChainClient::executesBlocks() const
    {
        return false;
    }

    std::size_t RpcChainClient::callCount() const noexcept
    {
        return _calls.load();
    }

    asio::awaitable<std::expected<json, ChainError>> RpcChainClient::rpc(std::string method, json params)
    {
        co_return co_await asio::co_spawn(_threads,
            [this, method = std::move(method), params = std::move(params)]() mutable -> asio::awaitable<std::expected<json, ChainError>>
            {
                co_return call(method, std::move(params));
            },
            asio::use_awaitable);
    }

    std::expected<json, ChainError> RpcChainClient::call(const std::string & method, json params)
    {
        const std::size_t id = ++_calls;

        json request{
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", std::move(params)}
        };

        const auto response = _cfg.rpc_call(_cfg.rpc_url, request);
        if(!response)
        {
            return std::unexpected(ChainError{ChainError::Kind::TRANSPORT, std::format("no response to `{}`", method)});
        }

        if(response->contains("error"))
        {
            spdlog::error("Chain RPC error on '{}': {}", method, (*response)["error"].dump());
            return std::unexpected(ChainError{ChainError::Kind::TRANSPORT, (*response)["error"].dump()});
        }

        if(!response->contains("result"))
        {
            spdlog::error("Chain RPC malformed response on '{}': missing result", method);
            return std::unexpected(ChainError{ChainError::Kind::MALFORMED, std::format("`{}` response has no result", method)});
        }

        return (*response)["result"];
    }

    asio::awaitable<std::expected<std::string, ChainError>> RpcChainClient::blockHash(std::uint64_t height)
    {
        const auto result = co_await rpc("chain_getBlockHash", json::array({height}));
        if(!result)
        {
            co_return std::unexpected(result.error());
        }

        if(result->is_null())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::NOT_FOUND, std::format("no block at height {}", height)});
        }

        if(!result->is_string())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "block hash is not a string"});
        }

        co_return result->get<std::string>();
    }

    asio::awaitable<std::expected<std::uint64_t, ChainError>> RpcChainClient::canonicalHeight()
    {
        const auto finalized = co_await rpc("chain_getFinalizedHead", json::array());
        if(!finalized)
        {
            co_return std::unexpected(finalized.error());
        }

        if(!finalized->is_string())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "finalized head is not a hash"});
        }

        const auto header = co_await rpc("chain_getHeader", json::array({*finalized}));
        if(!header)
        {
            co_return std::unexpected(header.error());
        }

        if(!header->is_object() || !header->contains("number") || !(*header)["number"].is_string())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "header has no number"});
        }

        const auto number = utils::parseHexQuantity((*header)["number"].get<std::string>());
        if(!number)
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "header number is not a quantity"});
        }

        co_return *number;
    }

    asio::awaitable<std::expected<RawBlock, ChainError>> RpcChainClient::fetchBlock(std::uint64_t height)
    {
        const auto hash_hex = co_await blockHash(height);
        if(!hash_hex)
        {
            co_return std::unexpected(hash_hex.error());
        }

        const auto result = co_await rpc("chain_getBlock", json::array({*hash_hex}));
        if(!result)
        {
            co_return std::unexpected(result.error());
        }

        if(result->is_null())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::NOT_FOUND, std::format("block {} pruned", *hash_hex)});
        }

        if(!result->contains("block") || !(*result)["block"].contains("header"))
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "block without header"});
        }

        const json & block = (*result)["block"];
        const json & header = block["header"];

        RawBlock raw;
        raw.height = height;

        const auto hash = utils::fromHex(*hash_hex);
        if(!hash)
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "block hash is not hex"});
        }
        raw.hash = *hash;

        auto parent_hash = _hexField(header, "parentHash");
        auto state_root = _hexField(header, "stateRoot");
        auto extrinsics_root = _hexField(header, "extrinsicsRoot");
        if(!parent_hash) co_return std::unexpected(parent_hash.error());
        if(!state_root) co_return std::unexpected(state_root.error());
        if(!extrinsics_root) co_return std::unexpected(extrinsics_root.error());

        raw.parent_hash = std::move(*parent_hash);
        raw.state_root = std::move(*state_root);
        raw.extrinsics_root = std::move(*extrinsics_root);

        const std::string extrinsics = block.value("extrinsics", json::array()).dump();
        raw.payload.assign(extrinsics.begin(), extrinsics.end());

        co_return raw;
    }

    asio::awaitable<std::expected<StorageDelta, ChainError>> RpcChainClient::executeBlock(std::uint64_t height)
    {
        co_return std::unexpected(ChainError{ChainError::Kind::UNSUPPORTED,
            std::format("JSON-RPC node cannot re-execute block {}", height)});
    }

    asio::awaitable<std::expected<StorageDelta, ChainError>> RpcChainClient::fullStorage(std::uint64_t height)
    {
        co_return std::unexpected(ChainError{ChainError::Kind::UNSUPPORTED,
            std::format("JSON-RPC node cannot snapshot state at {}", height)});
    }

    asio::awaitable<std::expected<RuntimeVersion, ChainError>> RpcChainClient::runtimeVersion(std::uint64_t height)
    {
        const auto hash_hex = co_await blockHash(height);
        if(!hash_hex)
        {
            co_return std::unexpected(hash_hex.error());
        }

        const auto version = co_await rpc("state_getRuntimeVersion", json::array({*hash_hex}));
        if(!version)
        {
            co_return std::unexpected(version.error());
        }

        if(!version->is_object() || !version->contains("specVersion") || !(*version)["specVersion"].is_number_unsigned())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "runtime version without specVersion"});
        }

        const auto metadata = co_await rpc("state_getMetadata", json::array({*hash_hex}));
        if(!metadata)
        {
            co_return std::unexpected(metadata.error());
        }

        if(!metadata->is_string())
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "metadata is not a string"});
        }

        auto metadata_bytes = utils::fromHex(metadata->get<std::string>());
        if(!metadata_bytes)
        {
            co_return std::unexpected(ChainError{ChainError::Kind::MALFORMED, "metadata is not hex"});
        }

        co_return RuntimeVersion{
            .spec_version = (*version)["specVersion"].get<std::uint32_t>(),
            .metadata = std::move(*metadata_bytes)
        };
    }
}
