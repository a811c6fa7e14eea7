#ifndef HOSTSTAT_TESTS_MOCK_COLLABORATORS_HPP
#define HOSTSTAT_TESTS_MOCK_COLLABORATORS_HPP

#include <gmock/gmock.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hoststat/event/event_bus.hpp"
#include "hoststat/system/command.hpp"
#include "hoststat/system/process_query.hpp"
#include "hoststat/system/resolver.hpp"

namespace hoststat::test {

class MockCommandRunner : public system::CommandRunner {
public:
    MOCK_METHOD(std::string, run, (const std::vector<std::string>& args),
                (override));
};

class MockHostResolver : public system::HostResolver {
public:
    MOCK_METHOD(std::optional<std::string>, resolve, (const std::string& name),
                (override));
};

class MockEventSink : public event::EventSink {
public:
    MOCK_METHOD(void, fireEvent,
                (const nlohmann::json& data, std::string_view tag),
                (override));
};

class MockProcessQuery : public system::ProcessQuery {
public:
    MOCK_METHOD(std::vector<std::unique_ptr<system::ProcessHandle>>, processes,
                (), (override));
    MOCK_METHOD(std::uint64_t, workingSet, (std::uint32_t pid), (override));
};

/**
 * @brief Process handle with a scripted owner lookup.
 */
class FakeProcessHandle : public system::ProcessHandle {
public:
    FakeProcessHandle(std::uint32_t pid, std::string name,
                      std::optional<std::string> commandLine,
                      system::OwnerLookup owner)
        : pid_(pid),
          name_(std::move(name)),
          commandLine_(std::move(commandLine)),
          owner_(std::move(owner)) {}

    [[nodiscard]] auto pid() const -> std::uint32_t override { return pid_; }
    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto commandLine() const
        -> std::optional<std::string> override {
        return commandLine_;
    }

    auto getOwner() -> system::OwnerLookup override {
        ++ownerCalls;
        if (throwOnOwner) {
            throw std::runtime_error("GetOwner unavailable");
        }
        return owner_;
    }

    bool throwOnOwner = false;
    int ownerCalls = 0;

private:
    std::uint32_t pid_;
    std::string name_;
    std::optional<std::string> commandLine_;
    system::OwnerLookup owner_;
};

inline auto makeProcess(std::uint32_t pid, std::string name,
                        std::optional<std::string> commandLine,
                        system::OwnerLookup owner)
    -> std::unique_ptr<system::ProcessHandle> {
    return std::make_unique<FakeProcessHandle>(
        pid, std::move(name), std::move(commandLine), std::move(owner));
}

}  // namespace hoststat::test

#endif  // HOSTSTAT_TESTS_MOCK_COLLABORATORS_HPP
