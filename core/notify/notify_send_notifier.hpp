#pragma once

#include <string>

#include "notify/notifier.hpp"

namespace proxyvisor {
namespace notify {

// Delivers through the freedesktop `notify-send` tool without blocking the caller
class NotifySendNotifier : public INotifier {
public:
    explicit NotifySendNotifier(std::string app_name = "proxyvisor", std::string command = "notify-send");

    bool notify(const Notification &notification) override;

private:
    std::string app_name_;
    std::string command_;
};

}  // namespace notify
}  // namespace proxyvisor
