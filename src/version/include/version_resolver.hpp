#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <asio.hpp>

#include "chain_interface.hpp"
#include "write_coordinator.hpp"

namespace chainsink::version
{
    struct ResolveError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            NOT_FOUND,
            STORE,
            CHAIN
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    struct Breakpoint
    {
        // first height at which `version` is in force
        std::uint64_t height = 0;
        std::uint32_t version = 0;

        bool operator==(const Breakpoint &) const = default;
    };

    /**
     * @brief Maps block heights to the runtime schema version in force at that height.
     *
     * Keeps an ascending list of breakpoints. Lookups take a shared lock, appends take the
     * exclusive lock for the duration of the push only.
     */
    class VersionResolver
    {
    public:
        VersionResolver() = default;

        explicit VersionResolver(std::vector<Breakpoint> breakpoints);

        VersionResolver(const VersionResolver &) = delete;
        VersionResolver & operator=(const VersionResolver &) = delete;

        /**
         * @brief Version of the greatest breakpoint at or below `height`.
         *
         * @return `NOT_FOUND` when `height` precedes the first breakpoint.
         */
        std::expected<std::uint32_t, ResolveError> resolve(std::uint64_t height) const;

        /**
         * @brief Appends a breakpoint.
         *
         * Inserting an existing breakpoint again is a no-op. A breakpoint below the newest one,
         * or a different version at an existing height, is rejected.
         *
         * @return false when rejected.
         */
        bool insert(std::uint64_t height, std::uint32_t version);

        std::vector<Breakpoint> breakpoints() const;

        std::optional<Breakpoint> latest() const;

        /**
         * @brief Replaces the breakpoints with the contents of the metadata table.
         */
        asio::awaitable<std::expected<std::size_t, ResolveError>> refresh(write::WriteCoordinator & coordinator);

        /**
         * @brief Finds runtime upgrades up to `up_to_height` and records them.
         *
         * Seeds the list with the version at `start_height` when empty. Each upgrade height is found
         * by bisecting between the newest breakpoint and `up_to_height`, its metadata is stored
         * through `coordinator` before the breakpoint is appended.
         *
         * @return number of breakpoints this call appended.
         */
        asio::awaitable<std::expected<std::size_t, ResolveError>> discover(
            chain::IChainClient & chain,
            write::WriteCoordinator & coordinator,
            std::uint64_t start_height,
            std::uint64_t up_to_height);

    private:
        enum class InsertResult : std::uint8_t
        {
            APPENDED,
            PRESENT,
            REJECTED
        };

        InsertResult _insert(std::uint64_t height, std::uint32_t version);

        mutable std::shared_mutex _mutex;
        std::vector<Breakpoint> _breakpoints;
    };
}

template <>
struct std::formatter<chainsink::version::ResolveError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::version::ResolveError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::version::ResolveError::Kind::NOT_FOUND : return formatter<string>::format("Not found", ctx);
            case chainsink::version::ResolveError::Kind::STORE : return formatter<string>::format("Store error", ctx);
            case chainsink::version::ResolveError::Kind::CHAIN : return formatter<string>::format("Chain error", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
