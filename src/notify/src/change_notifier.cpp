#include "change_notifier.hpp"

#include <spdlog/spdlog.h>

namespace chainsink::notify
{
    ChangeNotifier::ChangeNotifier(asio::io_context & io_context)
    : _strand(asio::make_strand(io_context))
    {
    }

    void ChangeNotifier::addSink(Sink sink)
    {
        std::lock_guard lock(_sinks_mutex);
        _sinks.push_back(std::move(sink));
    }

    void ChangeNotifier::publish(std::vector<ChangeEvent> events)
    {
        if(events.empty())
        {
            return;
        }

        asio::co_spawn(_strand, deliver(std::move(events)), [](std::exception_ptr e)
        {
            if(!e) return;
            try
            {
                std::rethrow_exception(e);
            }
            catch(const std::exception & ex)
            {
                spdlog::error("Change notification round failed: {}", ex.what());
            }
        });
    }

    asio::awaitable<void> ChangeNotifier::deliver(std::vector<ChangeEvent> events)
    {
        std::vector<Sink> sinks;
        {
            std::lock_guard lock(_sinks_mutex);
            sinks = _sinks;
        }

        for(const ChangeEvent & event : events)
        {
            bool delivered = true;
            for(const Sink & sink : sinks)
            {
                bool ok = false;
                try
                {
                    ok = co_await sink(event);
                }
                catch(const std::exception & e)
                {
                    spdlog::warn("Change sink threw for {}#{}: {}", event.table, event.key, e.what());
                }

                if(!ok)
                {
                    delivered = false;
                    ++_dropped;
                    spdlog::warn("Change notification for {}#{} not delivered", event.table, event.key);
                }
            }

            if(delivered)
            {
                ++_published;
            }
        }
    }

    std::size_t ChangeNotifier::published() const
    {
        return _published.load();
    }

    std::size_t ChangeNotifier::dropped() const
    {
        return _dropped.load();
    }
}
