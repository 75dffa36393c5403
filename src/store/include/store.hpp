#pragma once

#include "store_error.hpp"
#include "schema.hpp"
#include "statement.hpp"
#include "connection.hpp"
#include "connection_pool.hpp"
#include "pg_connection.hpp"
