#include "utils.hpp"

#include <algorithm>
#include <format>

namespace chainsink::utils
{
    namespace
    {
        int _hexDigit(char c)
        {
            if(c >= '0' && c <= '9') return c - '0';
            if(c >= 'a' && c <= 'f') return c - 'a' + 10;
            if(c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    std::string loadBuildTimestamp(const std::filesystem::path & path)
    {
        std::ifstream file(path);
        if (!file.is_open()) return "Unknown";
        std::string timestamp;
        std::getline(file, timestamp);
        return timestamp;
    }

    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    asio::awaitable<void> sleepFor(std::chrono::milliseconds duration)
    {
        asio::steady_timer timer(co_await asio::this_coro::executor);
        timer.expires_after(duration);
        co_await timer.async_wait(asio::use_awaitable);
    }

    std::string toHex(const Bytes & bytes)
    {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for(const std::uint8_t byte : bytes)
        {
            out.push_back(digits[byte >> 4]);
            out.push_back(digits[byte & 0x0F]);
        }
        return out;
    }

    std::optional<Bytes> fromHex(std::string_view hex)
    {
        if(hex.starts_with("0x") || hex.starts_with("0X"))
        {
            hex.remove_prefix(2);
        }

        if(hex.size() % 2 != 0)
        {
            return std::nullopt;
        }

        Bytes out;
        out.reserve(hex.size() / 2);
        for(std::size_t i = 0; i < hex.size(); i += 2)
        {
            const int hi = _hexDigit(hex[i]);
            const int lo = _hexDigit(hex[i + 1]);
            if(hi < 0 || lo < 0)
            {
                return std::nullopt;
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value)
    {
        try
        {
            if(value.empty())
            {
                return std::nullopt;
            }

            if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
            {
                return static_cast<std::uint64_t>(std::stoull(value.substr(2), nullptr, 16));
            }

            return static_cast<std::uint64_t>(std::stoull(value, nullptr, 10));
        }
        catch(const std::exception &)
        {
            return std::nullopt;
        }
    }

    std::chrono::milliseconds exponentialBackoff(std::uint32_t attempt, std::chrono::milliseconds base, std::chrono::milliseconds cap)
    {
        if(attempt == 0)
        {
            return std::chrono::milliseconds{0};
        }

        // stop doubling at the cap
        std::chrono::milliseconds delay = base;
        for(std::uint32_t i = 1; i < attempt && delay < cap; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, cap);
    }
}
