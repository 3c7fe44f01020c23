
#pragma once
#include "status.hpp"
#include <string>

class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    virtual Status send(const std::string& address, const std::string& message) = 0;
};
