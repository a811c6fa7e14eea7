/*
 * event_bus.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-7-23

Description: Fire-and-forget event delivery

**************************************************/

#ifndef HOSTSTAT_EVENT_EVENT_BUS_HPP
#define HOSTSTAT_EVENT_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace hoststat::event {

inline constexpr std::string_view K_MASTER_CONNECTED = "__master_connected";
inline constexpr std::string_view K_MASTER_DISCONNECTED =
    "__master_disconnected";

/**
 * @brief Destination for events. Delivery is fire-and-forget: there is no
 * acknowledgement and the caller never sees handler failures.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void fireEvent(const nlohmann::json& data,
                           std::string_view tag) = 0;
};

/**
 * @class EventBus
 * @brief In-process publish/subscribe bus with synchronous delivery.
 */
class EventBus : public EventSink {
public:
    using Token = std::size_t;
    using Handler =
        std::function<void(std::string_view tag, const nlohmann::json& data)>;

    /**
     * @brief Registers a handler for one tag, or for every tag when tag is
     * empty.
     * @return Token for unsubscribe().
     */
    auto subscribe(std::string tag, Handler handler) -> Token;

    /**
     * @return true if a subscription was removed.
     */
    auto unsubscribe(Token token) -> bool;

    /**
     * @brief Delivers to the matching handlers in subscription order. A
     * handler that throws is logged and skipped.
     */
    void fireEvent(const nlohmann::json& data, std::string_view tag) override;

    [[nodiscard]] auto subscriberCount() const -> std::size_t;

private:
    struct Subscriber {
        Token token;
        std::string tag;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    Token nextToken_ = 1;
};

}  // namespace hoststat::event

#endif  // HOSTSTAT_EVENT_EVENT_BUS_HPP
