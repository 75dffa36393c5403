#include "statement.hpp"

#include <algorithm>
#include <iterator>

namespace chainsink::store
{
    std::size_t InsertStatement::parameterCount() const
    {
        return rows.size() * columns.size();
    }

    std::size_t rowsPerStatement(std::size_t columns, std::size_t max_params)
    {
        if(columns == 0)
        {
            return 1;
        }
        return std::max<std::size_t>(1, max_params / columns);
    }

    std::vector<InsertStatement> splitStatement(InsertStatement statement, std::size_t max_params)
    {
        std::vector<InsertStatement> parts;
        if(statement.rows.empty())
        {
            return parts;
        }

        if(statement.parameterCount() <= max_params)
        {
            parts.push_back(std::move(statement));
            return parts;
        }

        const std::size_t chunk = rowsPerStatement(statement.columns.size(), max_params);
        parts.reserve((statement.rows.size() + chunk - 1) / chunk);

        for(std::size_t begin = 0; begin < statement.rows.size(); begin += chunk)
        {
            const std::size_t end = std::min(begin + chunk, statement.rows.size());

            InsertStatement part{
                .table = statement.table,
                .columns = statement.columns,
                .rows = {},
                .conflict_columns = statement.conflict_columns,
                .update_columns = statement.update_columns
            };
            part.rows.reserve(end - begin);
            std::move(
                std::next(statement.rows.begin(), static_cast<std::ptrdiff_t>(begin)),
                std::next(statement.rows.begin(), static_cast<std::ptrdiff_t>(end)),
                std::back_inserter(part.rows));

            parts.push_back(std::move(part));
        }

        return parts;
    }
}
