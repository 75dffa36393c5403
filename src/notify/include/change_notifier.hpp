#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <asio.hpp>

#include "change_event.hpp"

namespace chainsink::notify
{
    /**
     * @brief Delivers one event. Returns false (or throws) when delivery failed.
     */
    using Sink = std::function<asio::awaitable<bool>(const ChangeEvent &)>;

    /**
     * @brief Post-commit fan-out of change events.
     *
     * `publish` only posts to the notifier strand and returns. Sinks run one event at a time on
     * the strand; their failures are logged and counted, they never reach the publisher.
     */
    class ChangeNotifier
    {
    public:
        explicit ChangeNotifier(asio::io_context & io_context);

        ChangeNotifier(const ChangeNotifier &) = delete;
        ChangeNotifier & operator=(const ChangeNotifier &) = delete;

        void addSink(Sink sink);

        void publish(std::vector<ChangeEvent> events);

        /**
         * @brief Events handed to every sink successfully.
         */
        std::size_t published() const;

        /**
         * @brief Failed (event, sink) deliveries.
         */
        std::size_t dropped() const;

    private:
        asio::awaitable<void> deliver(std::vector<ChangeEvent> events);

        asio::strand<asio::io_context::executor_type> _strand;

        mutable std::mutex _sinks_mutex;
        std::vector<Sink> _sinks;

        std::atomic<std::size_t> _published = 0;
        std::atomic<std::size_t> _dropped = 0;
    };
}
