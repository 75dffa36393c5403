#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <string_view>

#include "chainsink.hpp"

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::string log_name = chainsink::utils::currentTimestamp() + "-chainsink.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    console_sink->set_level(spdlog::level::info);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] [%t] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

int main(int argc, char* argv[])
{
    chainsink::config::Config defaults;
    defaults.bin_path = std::filesystem::path(argv[0]).parent_path();
    defaults.logs_path = defaults.bin_path.parent_path() / "logs";

    if(argc < 2)
    {
        std::fprintf(stderr, "usage: %s <config.json>\n", argv[0]);
        return 1;
    }

    const std::string build_timestamp = chainsink::utils::loadBuildTimestamp(defaults.bin_path / "build_timestamp");
    if(std::string_view(argv[1]) == "--version")
    {
        std::printf("chainsink %u.%u.%u (%s)\n",
            chainsink::MAJOR_VERSION, chainsink::MINOR_VERSION, chainsink::PATCH_VERSION, build_timestamp.c_str());
        return 0;
    }

    auto cfg_res = chainsink::config::loadConfig(argv[1], defaults);
    if(!cfg_res)
    {
        std::fprintf(stderr, "Cannot load config %s: %s (%s)\n",
            argv[1], std::format("{}", cfg_res.error().kind).c_str(), cfg_res.error().message.c_str());
        return 1;
    }
    const chainsink::config::Config cfg = std::move(*cfg_res);

    const bool terminal_configured = chainsink::native::configureTerminal();
    _configureLogger(cfg.logs_path);

    if(!terminal_configured)
    {
        spdlog::warn("Terminal configuration was not fully applied");
    }

    spdlog::debug("Build timestamp: {}", build_timestamp);
    spdlog::debug("Version: {}.{}.{}", chainsink::MAJOR_VERSION, chainsink::MINOR_VERSION, chainsink::PATCH_VERSION);
    spdlog::info("Chain RPC: {}, {} store connections, notify channel `{}`",
        cfg.rpc_url, cfg.pool_size, cfg.notify_channel);

    asio::io_context io_context;

    chainsink::notify::ChangeNotifier notifier(io_context);

    chainsink::write::WriteCoordinator coordinator(
        [database_url = cfg.database_url]()
        {
            return chainsink::store::PgConnection::connect(database_url);
        },
        chainsink::write::WriteConfig{
            .pool_size = cfg.pool_size,
            .max_statement_params = cfg.max_statement_params
        },
        &notifier);

    notifier.addSink([&coordinator, channel = cfg.notify_channel](const chainsink::notify::ChangeEvent & event) -> asio::awaitable<bool>
    {
        const auto payload = chainsink::parse::parseToJson(event, chainsink::parse::use_json);
        if(!payload)
        {
            co_return false;
        }

        const auto sent = co_await coordinator.notify(channel, payload->dump());
        if(!sent)
        {
            spdlog::debug("pg_notify failed: {}", sent.error().message);
        }
        co_return sent.has_value();
    });

    chainsink::chain::RpcChainClient chain({
        .rpc_url = cfg.rpc_url,
        .timeout = std::chrono::milliseconds(cfg.task_timeout_ms),
        .threads = cfg.decode_workers + 1
    });
    chainsink::codec::OpaqueCodec codec;

    chainsink::archive::Pipeline pipeline(cfg, chain, codec, coordinator);

    int exit_code = 0;

    asio::co_spawn(io_context, pipeline.run(),
        [&io_context, &exit_code](std::exception_ptr e, std::expected<void, chainsink::archive::PipelineError> result)
        {
            if(e)
            {
                try
                {
                    std::rethrow_exception(e);
                }
                catch(const std::exception & ex)
                {
                    spdlog::error("Pipeline failed: {}", ex.what());
                }
                exit_code = 1;
            }
            else if(!result)
            {
                spdlog::error("Pipeline stopped: {}: {}", result.error().kind, result.error().message);
                exit_code = 2;
            }
            io_context.stop();
        });

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&io_context](const std::error_code & ec, int signal)
    {
        if(!ec)
        {
            spdlog::info("Received signal {}, shutting down", signal);
            io_context.stop();
        }
    });

    try
    {
        io_context.run();
    }
    catch(std::exception & e)
    {
        spdlog::error("Error: {}", e.what());
        exit_code = 1;
    }

    spdlog::debug("Program finished");
    return exit_code;
}
