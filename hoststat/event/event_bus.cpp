/*
 * event_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-7-23

Description: Fire-and-forget event delivery

**************************************************/

#include "event_bus.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace hoststat::event {

auto EventBus::subscribe(std::string tag, Handler handler) -> Token {
    std::lock_guard lock(mutex_);
    const Token token = nextToken_++;
    subscribers_.push_back({token, std::move(tag), std::move(handler)});
    return token;
}

auto EventBus::unsubscribe(Token token) -> bool {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(subscribers_, [token](const auto& sub) {
        return sub.token == token;
    });
    return removed > 0;
}

void EventBus::fireEvent(const nlohmann::json& data, std::string_view tag) {
    std::vector<Handler> handlers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& sub : subscribers_) {
            if (sub.tag.empty() || sub.tag == tag) {
                handlers.push_back(sub.handler);
            }
        }
    }

    spdlog::info("Firing event {} to {} subscriber(s): {}", tag,
                 handlers.size(),
                 data.dump(-1, ' ', false,
                           nlohmann::json::error_handler_t::replace));
    // Handlers run outside the lock so they may subscribe or fire in turn.
    for (const auto& handler : handlers) {
        try {
            handler(tag, data);
        } catch (const std::exception& e) {
            spdlog::error("Event handler for {} failed: {}", tag, e.what());
        }
    }
}

auto EventBus::subscriberCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
}

}  // namespace hoststat::event
