#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ferry/client/config.hpp"
#include "ferry/client/local_session.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/sync_engine.hpp"
#include "ferry/client/transfer_manager.hpp"
#include "ferry/errors.hpp"
#include "ferry/version.hpp"

namespace
{

    using namespace ferry;
    using namespace ferry::client;

    // Runs an io_context on a background thread that only waits for SIGINT/SIGTERM.
    class SignalWatcher
    {
    public:
        explicit SignalWatcher(std::function<void(int)> handler)
            : signals_(io_context_, SIGINT, SIGTERM)
        {
            signals_.async_wait([handler = std::move(handler)](const std::error_code &ec, int signal)
                                {
                if (!ec) {
                    handler(signal);
                } });
            thread_ = std::thread([this]
                                  { io_context_.run(); });
        }

        ~SignalWatcher()
        {
            std::error_code ec;
            signals_.cancel(ec);
            io_context_.stop();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        SignalWatcher(const SignalWatcher &) = delete;
        SignalWatcher &operator=(const SignalWatcher &) = delete;

    private:
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread thread_;
    };

    std::shared_ptr<RemoteSession> open_session(const SessionFactory &factory, const AppConfig &app,
                                                const std::string &site_key)
    {
        const auto *site = app.find_site(site_key);
        if (!site)
        {
            throw ConfigurationError("Unknown site: " + site_key);
        }
        return factory.create(*site);
    }

    const SyncProfile &require_profile(const AppConfig &app, const std::string &key)
    {
        const auto *profile = app.find_profile(key);
        if (!profile)
        {
            throw ConfigurationError("Unknown sync profile: " + key);
        }
        return *profile;
    }

    int run_plan(const SessionFactory &factory, const AppConfig &app, const ClientConfig &options,
                 const Logger &logger)
    {
        const auto &profile = require_profile(app, options.arguments[0]);
        auto session = open_session(factory, app, profile.site_id);
        session->connect();

        SyncEngine engine(logger);
        SignalWatcher watcher([&engine](int)
                              { engine.cancel(); });
        const auto actions = engine.compare(profile, *session);
        session->disconnect();

        for (const auto &action : actions)
        {
            std::cout << action.describe() << "\n";
        }
        std::cout << actions.size() << " action(s) planned for " << profile.name << std::endl;
        return EXIT_SUCCESS;
    }

    int run_sync(const SessionFactory &factory, const AppConfig &app, const ClientConfig &options,
                 const Logger &logger)
    {
        auto profile = require_profile(app, options.arguments[0]);
        if (options.dry_run)
        {
            profile.dry_run = true;
        }
        auto session = open_session(factory, app, profile.site_id);
        session->connect();

        SyncEngine engine(logger);
        engine.subscribe([](const SyncEvent &event)
                         {
            if (event.kind == SyncEventKind::Progress) {
                std::cout << "[" << event.current << "/" << event.total << "]\r" << std::flush;
            } });
        SignalWatcher watcher([&engine](int)
                              { engine.cancel(); });

        const auto result = engine.execute(profile, *session);
        session->disconnect();

        std::cout << result.summary().dump(2) << std::endl;
        for (const auto &error : result.errors)
        {
            std::cerr << "FAILED: " << error.action.describe() << ": " << error.message << "\n";
        }
        return result.error_count() == 0 && !engine.cancelled() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int run_transfer(const SessionFactory &factory, const AppConfig &app, const ClientConfig &options,
                     const Logger &logger)
    {
        const bool upload = options.command == "upload";
        const auto *site = app.find_site(options.arguments[0]);
        if (!site)
        {
            throw ConfigurationError("Unknown site: " + options.arguments[0]);
        }

        auto item = upload ? make_transfer_item(site->id, TransferDirection::Upload, options.arguments[1],
                                                options.arguments[2])
                           : make_transfer_item(site->id, TransferDirection::Download, options.arguments[2],
                                                options.arguments[1]);
        item.max_retries = app.max_retries;
        const auto id = item.id;

        TransferManager manager(
            app.transfer_config(),
            [&factory, &app](const std::string &site_id)
            { return open_session(factory, app, site_id); },
            logger);

        std::mutex mutex;
        std::condition_variable finished_cv;
        bool finished = false;
        auto finish = [&]()
        {
            {
                std::lock_guard lock(mutex);
                finished = true;
            }
            finished_cv.notify_all();
        };

        manager.subscribe_transfers([&](const TransferEvent &event)
                                    {
            if (event.transfer_id != id) {
                return;
            }
            switch (event.kind) {
            case TransferEventKind::Progress:
                if (event.total > 0) {
                    std::cout << event.transferred * 100 / event.total << "%\r" << std::flush;
                }
                break;
            case TransferEventKind::Completed:
            case TransferEventKind::Failed:
            case TransferEventKind::Cancelled:
                finish();
                break;
            default:
                break;
            } });

        SignalWatcher watcher([&](int)
                              {
            manager.remove(id);
            finish(); });

        manager.add(std::move(item));
        manager.start();
        {
            std::unique_lock lock(mutex);
            finished_cv.wait(lock, [&]
                             { return finished; });
        }
        manager.stop();

        const auto result = manager.get(id);
        if (!result)
        {
            std::cerr << "Transfer cancelled" << std::endl;
            return EXIT_FAILURE;
        }
        if (result->status != TransferStatus::Completed)
        {
            std::cerr << "Transfer " << to_string(result->status) << ": " << result->error_message.value_or("")
                      << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Transferred " << result->transferred << " bytes" << std::endl;
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    ClientConfig options;
    try
    {
        options = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Ferry " << ferry::version() << "\n"
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        SessionFactory factory;
        register_builtin_protocols(factory);

        if (options.command == "protocols")
        {
            for (const auto &protocol : factory.supported_protocols())
            {
                std::cout << protocol << "\n";
            }
            return EXIT_SUCCESS;
        }

        const auto app = load_app_config(options.config_path, &factory);

        LoggerOptions logger_options;
        logger_options.path = options.log_path;
        logger_options.console = options.verbose;
        logger_options.level = options.verbose ? spdlog::level::debug : app.log_level;
        Logger logger(logger_options);
        spdlog::set_default_logger(logger.underlying());
        logger.info("main", "Ferry ", ferry::version(), " running ", options.command);

        if (options.command == "plan")
        {
            return run_plan(factory, app, options, logger);
        }
        if (options.command == "sync")
        {
            return run_sync(factory, app, options, logger);
        }
        return run_transfer(factory, app, options, logger);
    }
    catch (const ferry::Error &ex)
    {
        std::cerr << "ERROR (" << ferry::to_string(ex.code()) << "): " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
