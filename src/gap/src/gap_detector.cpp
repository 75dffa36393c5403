#include "gap_detector.hpp"

#include <algorithm>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <spdlog/spdlog.h>

namespace chainsink::gap
{
    namespace
    {
        struct WindowRows
        {
            std::vector<std::uint64_t> blocks;
            std::vector<std::uint64_t> errored;
            std::vector<std::uint64_t> storage;
            std::vector<store::TaskRecord> tasks;
        };

        store::Result<WindowRows> _readWindow(store::IConnection & connection, std::uint64_t from, std::uint64_t to, bool with_storage)
        {
            WindowRows window;

            auto blocks = connection.blockHeights(from, to);
            if(!blocks) return std::unexpected(blocks.error());
            window.blocks = std::move(*blocks);

            auto errored = connection.erroredHeights(from, to);
            if(!errored) return std::unexpected(errored.error());
            window.errored = std::move(*errored);

            if(with_storage && !window.blocks.empty())
            {
                auto storage = connection.storageHeights(from, to);
                if(!storage) return std::unexpected(storage.error());
                window.storage = std::move(*storage);

                auto tasks = connection.tasks(from, to);
                if(!tasks) return std::unexpected(tasks.error());
                window.tasks = std::move(*tasks);
            }

            return window;
        }
    }

    bool Gaps::empty() const
    {
        return block_gaps.empty() && storage_gaps.empty() && failed_storage.empty();
    }

    GapDetector::GapDetector(write::WriteCoordinator & coordinator, GapConfig cfg)
    : _coordinator(coordinator), _cfg(std::move(cfg)), _floor(_cfg.start_height)
    {
        _cfg.window = std::max<std::uint64_t>(1, _cfg.window);
    }

    std::uint64_t GapDetector::floor() const
    {
        return _floor;
    }

    asio::awaitable<store::Result<Gaps>> GapDetector::detect(std::uint64_t canonical_height, std::size_t batch_limit)
    {
        const std::size_t limit = std::max<std::size_t>(1, batch_limit);

        std::uint64_t begin = std::max(_cfg.start_height, _floor);
        if(_cfg.backfill_depth > 0 && canonical_height > _cfg.backfill_depth)
        {
            begin = std::max(begin, canonical_height - _cfg.backfill_depth);
        }

        Gaps gaps;
        if(begin > canonical_height)
        {
            co_return gaps;
        }

        const auto full = [&]
        {
            const bool blocks_full = gaps.block_gaps.size() >= limit;
            if(!_cfg.storage)
            {
                return blocks_full;
            }
            return blocks_full && gaps.storage_gaps.size() >= limit && gaps.failed_storage.size() >= limit;
        };

        bool contiguous = (begin == _floor);
        std::uint64_t from = begin;

        while(from <= canonical_height && !full())
        {
            const std::uint64_t to = (canonical_height - from < _cfg.window - 1) ? canonical_height : from + _cfg.window - 1;

            const bool with_storage = _cfg.storage;
            auto window = co_await _coordinator.query<WindowRows>([from, to, with_storage](store::IConnection & connection)
            {
                return _readWindow(connection, from, to, with_storage);
            });

            if(!window)
            {
                spdlog::error("Gap scan of [{}, {}] failed: {}", from, to, window.error().message);
                co_return std::unexpected(window.error());
            }

            const absl::flat_hash_set<std::uint64_t> blocks(window->blocks.begin(), window->blocks.end());
            const absl::flat_hash_set<std::uint64_t> errored(window->errored.begin(), window->errored.end());
            const absl::flat_hash_set<std::uint64_t> storage(window->storage.begin(), window->storage.end());

            absl::flat_hash_map<std::uint64_t, const store::TaskRecord *> tasks;
            for(const store::TaskRecord & task : window->tasks)
            {
                tasks.emplace(task.target_height, &task);
            }

            bool complete = true;
            for(std::uint64_t height = from; height <= to; ++height)
            {
                if(!blocks.contains(height))
                {
                    complete = false;
                    if(!errored.contains(height) && gaps.block_gaps.size() < limit)
                    {
                        gaps.block_gaps.push_back(height);
                    }
                    continue;
                }

                if(!_cfg.storage || storage.contains(height))
                {
                    continue;
                }

                const auto task_it = tasks.find(height);
                if(task_it != tasks.end() && task_it->second->status == store::TaskStatus::DONE)
                {
                    continue;
                }

                complete = false;
                if(task_it == tasks.end())
                {
                    if(gaps.storage_gaps.size() < limit)
                    {
                        gaps.storage_gaps.push_back(height);
                    }
                }
                else if(store::isPermanentlyFailed(*task_it->second))
                {
                    if(gaps.failed_storage.size() < limit)
                    {
                        gaps.failed_storage.push_back(height);
                    }
                }
            }

            if(contiguous && complete)
            {
                _floor = to + 1;
                spdlog::debug("Indexed range complete below height {}", _floor);
            }
            else
            {
                contiguous = false;
            }

            if(to == canonical_height)
            {
                break;
            }
            from = to + 1;
        }

        if(!gaps.empty())
        {
            spdlog::info("Gaps up to height {}: {} blocks, {} storage, {} failed storage",
                canonical_height, gaps.block_gaps.size(), gaps.storage_gaps.size(), gaps.failed_storage.size());
        }
        co_return gaps;
    }
}
