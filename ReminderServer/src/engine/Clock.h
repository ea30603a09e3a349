#pragma once

#include <ctime>

namespace engine {

class Clock {
public:
    virtual ~Clock() = default;
    virtual time_t now() const = 0;
};

class SystemClock : public Clock {
public:
    time_t now() const override { return std::time(nullptr); }
};

}
