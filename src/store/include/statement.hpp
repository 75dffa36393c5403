#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace chainsink::store
{
    /**
     * @brief A single bound parameter. `std::monostate` is SQL NULL.
     */
    using Value = std::variant<std::monostate, std::uint64_t, bool, std::string, Bytes, nlohmann::json>;

    using Row = std::vector<Value>;

    // columns of the widest insert (`blocks`, `extrinsics`); a statement bound below this cannot hold one row
    constexpr std::size_t MAX_ROW_WIDTH = 7;

    /**
     * @brief Multi-row `INSERT ... ON CONFLICT` statement.
     *
     * With no `update_columns` conflicting rows are skipped (`DO NOTHING`), otherwise the listed
     * columns are overwritten from the excluded row and `conflict_columns` names the target.
     */
    struct InsertStatement
    {
        std::string table;
        std::vector<std::string> columns;
        std::vector<Row> rows;

        std::vector<std::string> conflict_columns = {};
        std::vector<std::string> update_columns = {};

        std::size_t parameterCount() const;
    };

    /**
     * @brief Splits `statement` so no part binds more than `max_params` parameters.
     *
     * Each part carries `floor(max_params / columns)` rows (at least one), rows keep their order.
     */
    std::vector<InsertStatement> splitStatement(InsertStatement statement, std::size_t max_params);

    std::size_t rowsPerStatement(std::size_t columns, std::size_t max_params);
}
