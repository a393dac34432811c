#pragma once

#include <iosfwd>
#include <string>

namespace huffpack::compression::huffman {

enum class DebugLevel {
    Off = 0,
    Low = 1,
    High = 4
};

class Logger {
public:
    virtual ~Logger() = default;

    virtual bool enabled(DebugLevel level) const noexcept = 0;
    virtual void write(DebugLevel level, const std::string& message) = 0;

    void log(DebugLevel level, const std::string& message)
    {
        if (enabled(level)) {
            write(level, message);
        }
    }
};

// Writes one line per message when its level is within the threshold.
class StreamLogger : public Logger {
public:
    StreamLogger(std::ostream& output, DebugLevel threshold);

    bool enabled(DebugLevel level) const noexcept override;
    void write(DebugLevel level, const std::string& message) override;

private:
    std::ostream& output_;
    DebugLevel threshold_ {DebugLevel::Off};
};

Logger& nullLogger();

DebugLevel parseDebugLevel(const std::string& value);

} // namespace huffpack::compression::huffman
