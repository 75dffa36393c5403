#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "connection.hpp"

namespace chainsink::store
{
    class ConnectionPool;

    /**
     * @brief Borrowed connection, returned to the pool on destruction.
     */
    class PooledConnection
    {
    public:
        PooledConnection(ConnectionPool & pool, std::unique_ptr<IConnection> connection);
        ~PooledConnection();

        PooledConnection(PooledConnection && other) noexcept;
        PooledConnection & operator=(PooledConnection &&) = delete;

        PooledConnection(const PooledConnection &) = delete;
        PooledConnection & operator=(const PooledConnection &) = delete;

        IConnection & operator*() const;
        IConnection * operator->() const;

        /**
         * @brief Drops the connection instead of returning it, e.g. after a connection error.
         */
        void invalidate();

    private:
        ConnectionPool * _pool;
        std::unique_ptr<IConnection> _connection;
        bool _valid = true;
    };

    /**
     * @brief Bounded set of store connections.
     *
     * At most `ceiling` connections exist at any time. `acquire` blocks until one is free, opening
     * a new one through the factory while below the ceiling.
     */
    class ConnectionPool
    {
    public:
        ConnectionPool(ConnectionFactory factory, std::size_t ceiling);

        ConnectionPool(const ConnectionPool &) = delete;
        ConnectionPool & operator=(const ConnectionPool &) = delete;

        Result<PooledConnection> acquire();

        void close();

        std::size_t ceiling() const;

        std::size_t outstanding() const;

        std::size_t peakOutstanding() const;

    private:
        friend class PooledConnection;

        void release(std::unique_ptr<IConnection> connection, bool valid);

        ConnectionFactory _factory;
        const std::size_t _ceiling;

        mutable std::mutex _mutex;
        std::condition_variable _available;

        std::vector<std::unique_ptr<IConnection>> _idle;
        // idle + borrowed + being opened
        std::size_t _open = 0;
        std::size_t _outstanding = 0;
        std::size_t _peak_outstanding = 0;
        bool _closed = false;
    };
}
