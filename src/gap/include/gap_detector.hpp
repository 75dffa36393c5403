#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <asio.hpp>

#include "store.hpp"
#include "write_coordinator.hpp"

namespace chainsink::gap
{
    struct GapConfig
    {
        std::uint64_t start_height = 0;
        // 0 scans back to start_height
        std::uint64_t backfill_depth = 0;
        std::uint64_t window = 10000;
        // without storage indexing only block gaps are reported
        bool storage = true;
    };

    /**
     * @brief Outstanding work, each list ascending and at most `batch_limit` long.
     */
    struct Gaps
    {
        // no block row and no recorded decode failure
        std::vector<std::uint64_t> block_gaps;
        // block row present, storage neither captured nor being recovered
        std::vector<std::uint64_t> storage_gaps;
        // storage recovery gave up, waiting for an operator
        std::vector<std::uint64_t> failed_storage;

        bool empty() const;
    };

    /**
     * @brief Computes missing heights between the indexed set and the canonical height.
     *
     * The candidate range is scanned in windows of `window` heights. A floor below which every
     * height is known to be complete is kept in memory and only moves over windows with no gap
     * of any kind, so repeated calls without new writes return the same result.
     */
    class GapDetector
    {
    public:
        GapDetector(write::WriteCoordinator & coordinator, GapConfig cfg);

        asio::awaitable<store::Result<Gaps>> detect(std::uint64_t canonical_height, std::size_t batch_limit);

        /**
         * @brief Lowest height not known to be complete.
         */
        std::uint64_t floor() const;

    private:
        write::WriteCoordinator & _coordinator;
        GapConfig _cfg;
        std::uint64_t _floor;
    };
}
