#pragma once

#include <string>

namespace proxyvisor {
namespace notify {

struct Notification {
    std::string id;  // Stable identifier, used for deduplication by callers
    std::string title;
    std::string body;
};

// Desktop notification sink. Mocked in tests.
class INotifier {
public:
    virtual ~INotifier() = default;

    // Returns true if the notification was handed to the OS
    virtual bool notify(const Notification &notification) = 0;
};

}  // namespace notify
}  // namespace proxyvisor
