#include "connection_pool.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace chainsink::store
{
    PooledConnection::PooledConnection(ConnectionPool & pool, std::unique_ptr<IConnection> connection)
    : _pool(&pool), _connection(std::move(connection))
    {
    }

    PooledConnection::PooledConnection(PooledConnection && other) noexcept
    : _pool(other._pool), _connection(std::move(other._connection)), _valid(other._valid)
    {
        other._pool = nullptr;
    }

    PooledConnection::~PooledConnection()
    {
        if(_pool != nullptr && _connection)
        {
            _pool->release(std::move(_connection), _valid);
        }
    }

    IConnection & PooledConnection::operator*() const
    {
        return *_connection;
    }

    IConnection * PooledConnection::operator->() const
    {
        return _connection.get();
    }

    void PooledConnection::invalidate()
    {
        _valid = false;
    }

    ConnectionPool::ConnectionPool(ConnectionFactory factory, std::size_t ceiling)
    : _factory(std::move(factory)), _ceiling(std::max<std::size_t>(1, ceiling))
    {
    }

    Result<PooledConnection> ConnectionPool::acquire()
    {
        std::unique_lock lock(_mutex);
        _available.wait(lock, [this]{ return _closed || !_idle.empty() || _open < _ceiling; });

        if(_closed)
        {
            return std::unexpected(StoreError{StoreError::Kind::POOL_CLOSED, "connection pool is closed"});
        }

        ++_outstanding;
        _peak_outstanding = std::max(_peak_outstanding, _outstanding);

        if(!_idle.empty())
        {
            auto connection = std::move(_idle.back());
            _idle.pop_back();
            return PooledConnection(*this, std::move(connection));
        }

        // reserve the slot, open outside the lock
        ++_open;
        lock.unlock();

        auto connection_res = _factory();

        if(!connection_res)
        {
            spdlog::error("Failed to open store connection: {}", connection_res.error().message);
            lock.lock();
            --_open;
            --_outstanding;
            lock.unlock();
            _available.notify_one();
            return std::unexpected(connection_res.error());
        }

        spdlog::debug("Opened store connection");
        return PooledConnection(*this, std::move(*connection_res));
    }

    void ConnectionPool::release(std::unique_ptr<IConnection> connection, bool valid)
    {
        {
            std::lock_guard lock(_mutex);
            --_outstanding;
            if(valid && !_closed)
            {
                _idle.push_back(std::move(connection));
            }
            else
            {
                --_open;
                spdlog::debug("Dropped store connection");
            }
        }
        _available.notify_one();
    }

    void ConnectionPool::close()
    {
        std::vector<std::unique_ptr<IConnection>> idle;
        {
            std::lock_guard lock(_mutex);
            _closed = true;
            _open -= _idle.size();
            idle.swap(_idle);
        }
        _available.notify_all();
    }

    std::size_t ConnectionPool::ceiling() const
    {
        return _ceiling;
    }

    std::size_t ConnectionPool::outstanding() const
    {
        std::lock_guard lock(_mutex);
        return _outstanding;
    }

    std::size_t ConnectionPool::peakOutstanding() const
    {
        std::lock_guard lock(_mutex);
        return _peak_outstanding;
    }
}
