#include "compression/huffman/logger.hpp"

#include <ostream>
#include <stdexcept>

namespace huffpack::compression::huffman {
namespace {

class NullLogger : public Logger {
public:
    bool enabled(DebugLevel) const noexcept override { return false; }
    void write(DebugLevel, const std::string&) override {}
};

const char* levelTag(DebugLevel level)
{
    switch (level) {
    case DebugLevel::Off:
        return "off";
    case DebugLevel::Low:
        return "low";
    case DebugLevel::High:
        return "high";
    }
    return "?";
}

} // namespace

StreamLogger::StreamLogger(std::ostream& output, DebugLevel threshold)
    : output_(output)
    , threshold_(threshold)
{
}

bool StreamLogger::enabled(DebugLevel level) const noexcept
{
    return level != DebugLevel::Off && static_cast<int>(level) <= static_cast<int>(threshold_);
}

void StreamLogger::write(DebugLevel level, const std::string& message)
{
    output_ << "[huffpack:" << levelTag(level) << "] " << message << '\n';
}

Logger& nullLogger()
{
    static NullLogger logger;
    return logger;
}

DebugLevel parseDebugLevel(const std::string& value)
{
    if (value == "0") {
        return DebugLevel::Off;
    }
    if (value == "1") {
        return DebugLevel::Low;
    }
    if (value == "4") {
        return DebugLevel::High;
    }
    throw std::invalid_argument("Invalid debug level: " + value);
}

} // namespace huffpack::compression::huffman
