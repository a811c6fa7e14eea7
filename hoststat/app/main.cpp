/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-14

Description: hoststat command-line entry point

**************************************************/

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "hoststat/app/cli.hpp"
#include "hoststat/config/options.hpp"
#include "hoststat/error/exception.hpp"
#include "hoststat/event/event_bus.hpp"
#include "hoststat/log/logging.hpp"
#include "hoststat/status/master.hpp"
#include "hoststat/status/status.hpp"
#include "hoststat/sysinfo/wmi.hpp"
#include "hoststat/system/command.hpp"
#include "hoststat/system/resolver.hpp"

using namespace hoststat;

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    app::Invocation invocation;
    config::Options options;
    try {
        invocation = app::parseInvocation(args);
        if (invocation.configPath) {
            options = config::Options::fromFile(*invocation.configPath);
        }
        for (const auto& [key, value] : invocation.overrides) {
            options.setFromString(key, value);
        }
        if (invocation.logLevel) {
            options.set("log_level", *invocation.logLevel);
        }
        log::setupLogging(options);
    } catch (const error::InvalidArgument& e) {
        std::cerr << e.getMessage() << "\n" << app::usage() << std::endl;
        return app::K_EXIT_USAGE;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot set up logging: " << e.what() << std::endl;
        return app::K_EXIT_FAILURE;
    }

    if constexpr (!status::isSupportedPlatform()) {
        spdlog::error("The status module is only available on Windows");
        return app::K_EXIT_USAGE;
    }

#ifdef _WIN32
    try {
        system::ShellCommandRunner runner;
        system::SystemHostResolver resolver;
        sysinfo::WmiProcessQuery processQuery;
        event::EventBus events;
        events.subscribe("", [](std::string_view tag,
                                const nlohmann::json& data) {
            std::cout << app::renderJson(
                             {{"tag", std::string(tag)}, {"data", data}})
                      << std::endl;
        });

        status::StatusModule module(options, runner, processQuery);
        status::MasterMonitor monitor(options, runner, resolver, events);

        const auto result = app::runFunction(invocation, module, monitor);
        std::cout << app::renderJson(result, 4) << std::endl;
        return app::K_EXIT_OK;
    } catch (const error::InvalidArgument& e) {
        spdlog::error("{}", e.getMessage());
        std::cerr << app::usage() << std::endl;
        return app::K_EXIT_USAGE;
    } catch (const error::Exception& e) {
        spdlog::error("{} failed: {}", invocation.function, e.what());
        return app::K_EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", invocation.function, e.what());
        return app::K_EXIT_FAILURE;
    }
#endif
}
