// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <map>
#include <string>
#include <vector>
#include <functional>

#include <spdlog/spdlog.h>
#include <sdbus-c++/sdbus-c++.h>
#include <sunbrightd/sd-dbus.hpp>

namespace sunbrightd {
namespace dbus {

std::unique_ptr<sdbus::IProxy> register_signal_handler(
    std::string service,
    std::string obj_path,
    std::string interface,
    std::string signal_name,
    std::function<void(sdbus::Signal &signal)> handler) {
    auto proxy = sdbus::createProxy(service, obj_path);
    proxy->registerSignalHandler(interface, signal_name, handler);
    proxy->finishRegistration();
    return proxy;
}

std::unique_ptr<sdbus::IProxy> on_system_sleep(std::function<void(sdbus::Signal &signal)> fn) {
    return dbus::register_signal_handler(
            "org.freedesktop.login1",
            "/org/freedesktop/login1",
            "org.freedesktop.login1.Manager",
            "PrepareForSleep",
            fn);
}

// https://specifications.freedesktop.org/notification-spec/latest/protocol.html
notifier::notifier() {
    const std::string destination ("org.freedesktop.Notifications");
    const std::string object_path ("/org/freedesktop/Notifications");
    try {
        connection_ = sdbus::createSessionBusConnection();
        proxy_      = sdbus::createProxy(*connection_, destination, object_path);
    } catch (const sdbus::Error &e) {
        spdlog::error("[notify] {}", e.what());
    }
}

void notifier::notify(const std::string &message) {
    if (!proxy_) {
        spdlog::debug("[notify] no session bus, dropping: {}", message);
        return;
    }

    const std::string interface ("org.freedesktop.Notifications");
    const std::string method    ("Notify");

    const std::string app_name ("sunbright");
    const std::string summary  ("Display Brightness");
    const std::string icon     ("display-brightness");
    const uint32_t replaces_id = 0;
    const int32_t timeout_ms   = -1;
    const std::vector<std::string> actions;
    const std::map<std::string, sdbus::Variant> hints {
        {"urgency", sdbus::Variant(uint8_t(1))},
    };

    std::lock_guard lock(mutex_);
    try {
        uint32_t id = 0;
        proxy_->callMethod(method).onInterface(interface)
                .withArguments(app_name, replaces_id, icon, summary, message, actions, hints, timeout_ms)
                .storeResultsTo(id);
        spdlog::debug("[notify] sent '{}' (id: {})", message, id);
    } catch (const sdbus::Error &e) {
        spdlog::error("[notify] {}", e.what());
    }
}

} // namespace dbus
} // namespace sunbrightd
