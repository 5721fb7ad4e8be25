#pragma once

#include <iosfwd>

class ILogger
{
public:
    virtual ~ILogger() {}
    virtual std::ostream& log() = 0;
};
