/*
 * cli.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-14

Description: Command-line front end for the status queries

**************************************************/

#include "cli.hpp"

#include <functional>
#include <set>
#include <unordered_map>
#include <utility>

#include "hoststat/error/exception.hpp"
#include "hoststat/utils/string.hpp"

namespace hoststat::app {

namespace {
using Arguments = std::map<std::string, std::string>;

auto splitKeyValue(const std::string& text)
    -> std::pair<std::string, std::string> {
    const auto pos = text.find('=');
    if (pos == std::string::npos || pos == 0) {
        THROW_INVALID_ARGUMENT("Expected key=value, got '", text, "'");
    }
    return {text.substr(0, pos), text.substr(pos + 1)};
}

void requireOnly(const Arguments& arguments,
                 const std::set<std::string>& allowed,
                 std::string_view function) {
    for (const auto& [key, value] : arguments) {
        if (!allowed.contains(key)) {
            THROW_INVALID_ARGUMENT(function, "() got an unexpected argument '",
                                   key, "'");
        }
    }
}

auto boolArgument(const Arguments& arguments, const std::string& key,
                  bool fallback) -> bool {
    auto it = arguments.find(key);
    return it == arguments.end() ? fallback : parseBool(it->second);
}

auto optionalArgument(const Arguments& arguments, const std::string& key)
    -> std::optional<std::string> {
    auto it = arguments.find(key);
    if (it == arguments.end()) {
        return std::nullopt;
    }
    return it->second;
}

using Runner = std::function<nlohmann::json(
    const Arguments&, status::StatusModule&, status::MasterMonitor&)>;

auto runners() -> const std::unordered_map<std::string, Runner>& {
    static const std::unordered_map<std::string, Runner> table = {
        {"cpuload",
         [](const Arguments& args, status::StatusModule& module,
            status::MasterMonitor&) -> nlohmann::json {
             requireOnly(args, {}, "cpuload");
             return module.cpuLoad();
         }},
        {"diskusage",
         [](const Arguments& args, status::StatusModule& module,
            status::MasterMonitor&) -> nlohmann::json {
             requireOnly(args, {"human_readable", "path"}, "diskusage");
             return module
                 .diskUsage(boolArgument(args, "human_readable", false),
                            optionalArgument(args, "path"))
                 .toJson();
         }},
        {"procs",
         [](const Arguments& args, status::StatusModule& module,
            status::MasterMonitor&) -> nlohmann::json {
             requireOnly(args, {"count"}, "procs");
             return status::toJson(
                 module.procs(boolArgument(args, "count", false)));
         }},
        {"saltmem",
         [](const Arguments& args, status::StatusModule& module,
            status::MasterMonitor&) -> nlohmann::json {
             requireOnly(args, {"human_readable"}, "saltmem");
             return status::toJson(
                 module.agentMemory(boolArgument(args, "human_readable", false)));
         }},
        {"uptime",
         [](const Arguments& args, status::StatusModule& module,
            status::MasterMonitor&) -> nlohmann::json {
             requireOnly(args, {"human_readable"}, "uptime");
             return status::toJson(
                 module.uptime(boolArgument(args, "human_readable", false)));
         }},
        {"master",
         [](const Arguments& args, status::StatusModule&,
            status::MasterMonitor& monitor) -> nlohmann::json {
             requireOnly(args, {"master", "connected"}, "master");
             auto fired = monitor.check(optionalArgument(args, "master"),
                                        boolArgument(args, "connected", true));
             if (!fired) {
                 return nullptr;
             }
             return *fired;
         }},
    };
    return table;
}
}  // namespace

auto parseBool(std::string_view text) -> bool {
    const auto lowered = utils::toLower(utils::trim(text));
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
        return false;
    }
    THROW_INVALID_ARGUMENT("Not a boolean: '", text, "'");
}

auto functionNames() -> const std::vector<std::string>& {
    static const std::vector<std::string> names = {
        "cpuload", "diskusage", "procs", "saltmem", "uptime", "master"};
    return names;
}

auto usage() -> std::string {
    std::string text =
        "usage: hoststat [--config FILE] [--log-level LEVEL] "
        "[--option KEY=VALUE ...] FUNCTION [key=value ...]\n"
        "functions:";
    for (const auto& name : functionNames()) {
        text += " " + name;
    }
    return text;
}

auto renderJson(const nlohmann::json& value, int indent) -> std::string {
    return value.dump(indent, ' ', false,
                      nlohmann::json::error_handler_t::replace);
}

auto parseInvocation(const std::vector<std::string>& args) -> Invocation {
    Invocation invocation;
    std::size_t i = 0;
    for (; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--config" || arg == "--log-level" || arg == "--option") {
            if (i + 1 >= args.size()) {
                THROW_INVALID_ARGUMENT(arg, " requires a value");
            }
            const auto& value = args[++i];
            if (arg == "--config") {
                invocation.configPath = value;
            } else if (arg == "--log-level") {
                invocation.logLevel = value;
            } else {
                auto [key, text] = splitKeyValue(value);
                invocation.overrides[key] = text;
            }
        } else if (arg.starts_with("--")) {
            THROW_INVALID_ARGUMENT("Unknown option ", arg);
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        THROW_INVALID_ARGUMENT("No function given");
    }
    invocation.function = args[i++];
    if (!runners().contains(invocation.function)) {
        THROW_INVALID_ARGUMENT("Unknown function '", invocation.function, "'");
    }

    for (; i < args.size(); ++i) {
        auto [key, value] = splitKeyValue(args[i]);
        invocation.arguments[key] = value;
    }
    return invocation;
}

auto runFunction(const Invocation& invocation, status::StatusModule& module,
                 status::MasterMonitor& monitor) -> nlohmann::json {
    auto it = runners().find(invocation.function);
    if (it == runners().end()) {
        THROW_INVALID_ARGUMENT("Unknown function '", invocation.function, "'");
    }
    return it->second(invocation.arguments, module, monitor);
}

}  // namespace hoststat::app
