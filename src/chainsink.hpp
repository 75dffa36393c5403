#pragma once

#include <cstdint>

#include <asio.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "native.h"
#include "utils.hpp"
#include "config.hpp"
#include "parser.hpp"
#include "records.hpp"
#include "chain_interface.hpp"
#include "rpc_client.hpp"
#include "codec_interface.hpp"
#include "opaque_codec.hpp"
#include "store.hpp"
#include "pg_connection.hpp"
#include "change_event.hpp"
#include "change_notifier.hpp"
#include "write_coordinator.hpp"
#include "version_resolver.hpp"
#include "gap_detector.hpp"
#include "decode_pool.hpp"
#include "recovery_task.hpp"
#include "recovery_queue.hpp"
#include "pipeline.hpp"

namespace chainsink
{
    constexpr static std::uint32_t MAJOR_VERSION = 0;
    constexpr static std::uint32_t MINOR_VERSION = 1;
    constexpr static std::uint32_t PATCH_VERSION = 0;
}
