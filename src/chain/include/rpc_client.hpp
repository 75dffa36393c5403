#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json_fwd.hpp>

#include "chain_interface.hpp"

namespace chainsink::chain
{
    using RpcCall = std::function<std::optional<nlohmann::json>(const std::string & rpc_url, const nlohmann::json & request)>;

    struct RpcClientConfig
    {
        std::string rpc_url;

        // bound on one call, passed to curl as --max-time
        std::chrono::milliseconds timeout = std::chrono::milliseconds(20000);
        std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(5000);

        // calls block, so they run here instead of on the caller's executor
        std::size_t threads = 4;

        // empty selects the curl transport
        RpcCall rpc_call = {};
    };

    /**
     * @brief Chain client for Substrate style JSON-RPC nodes.
     *
     * Blocks are fetched with `chain_getBlockHash` + `chain_getBlock`; the payload handed to the codec
     * is the JSON array of hex encoded extrinsics. The canonical height is the finalized head, so
     * blocks that may still be reorged away are never handed out. Plain RPC nodes cannot re-execute
     * blocks, so `executeBlock` and `fullStorage` report `UNSUPPORTED`.
     */
    class RpcChainClient final : public IChainClient
    {
    public:
        explicit RpcChainClient(RpcClientConfig cfg);

        ~RpcChainClient() override;

        bool executesBlocks() const override;

        asio::awaitable<std::expected<std::uint64_t, ChainError>> canonicalHeight() override;

        asio::awaitable<std::expected<RawBlock, ChainError>> fetchBlock(std::uint64_t height) override;

        asio::awaitable<std::expected<StorageDelta, ChainError>> executeBlock(std::uint64_t height) override;

        asio::awaitable<std::expected<StorageDelta, ChainError>> fullStorage(std::uint64_t height) override;

        asio::awaitable<std::expected<RuntimeVersion, ChainError>> runtimeVersion(std::uint64_t height) override;

        std::size_t callCount() const noexcept;

    private:
        asio::awaitable<std::expected<nlohmann::json, ChainError>> rpc(std::string method, nlohmann::json params);

        std::expected<nlohmann::json, ChainError> call(const std::string & method, nlohmann::json params);

        asio::awaitable<std::expected<std::string, ChainError>> blockHash(std::uint64_t height);

        RpcClientConfig _cfg;
        std::atomic<std::size_t> _calls = 0;
        asio::thread_pool _threads;
    };

    /**
     * @brief Command line for one JSON-RPC POST, bounded by `timeout` and `connect_timeout`.
     */
    std::vector<std::string> curlArguments(
        const std::string & rpc_url,
        const nlohmann::json & request,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds connect_timeout);

    std::optional<nlohmann::json> rpcCallWithCurl(
        const std::string & rpc_url,
        const nlohmann::json & request,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds connect_timeout);
}
