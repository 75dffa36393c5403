#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

namespace chainsink
{
    using Bytes = std::vector<std::uint8_t>;
}

namespace chainsink::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path);

    /**
     * @brief Local time formatted for file names, e.g. `2024-05-01-13_45_10`.
     */
    std::string currentTimestamp();

    asio::awaitable<void> sleepFor(std::chrono::milliseconds duration);

    std::string toHex(const Bytes & bytes);

    std::optional<Bytes> fromHex(std::string_view hex);

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value);

    /**
     * @brief Exponential backoff `base * 2^(attempt - 1)` clamped to `cap`.
     */
    std::chrono::milliseconds exponentialBackoff(std::uint32_t attempt, std::chrono::milliseconds base, std::chrono::milliseconds cap);
}
