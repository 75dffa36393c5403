#pragma once

#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "chainsink.hpp"

#include "memory_store.hpp"
#include "fake_chain.hpp"

namespace chainsink::tests
{
    class UnitTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            spdlog::set_level(spdlog::level::warn);
        }
    };

    /**
     * @brief Runs `awaitable` on `io_context` to completion and returns its result.
     */
    template<class AwaitableT>
    auto runAwaitable(asio::io_context & io_context, AwaitableT awaitable)
    {
        auto future = asio::co_spawn(io_context, std::move(awaitable), asio::use_future);
        io_context.restart();
        io_context.run();
        return future.get();
    }
}
