/*******************************************************************************
    Project: Volcano Controller Manager

    File: clock.h

    Description:
        Wall-clock source for lease timestamps and expiry checks. Tests swap
        in a manual clock to drive lease expiry without sleeping.
*******************************************************************************/

#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>

namespace volcano {
namespace leaderelection {

class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace leaderelection
} // namespace volcano

#endif // CLOCK_H
