#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace host_sweep::common
{
    enum class LogLevel
    {
        Info,
        Warn,
        Error
    };

    // Collects one log line and emits it as a whole when destroyed, so lines
    // written from several workers never interleave.
    class LogLine
    {
    public:
        LogLine(LogLevel level, std::string_view tag);
        ~LogLine();

        LogLine(const LogLine &) = delete;
        LogLine &operator=(const LogLine &) = delete;

        template <typename T>
        LogLine &operator<<(const T &value)
        {
            m_stream << value;
            return *this;
        }

    private:
        LogLevel m_level;
        std::string m_tag;
        std::ostringstream m_stream;
    };

    namespace Log
    {
        inline LogLine Info(std::string_view tag) { return LogLine(LogLevel::Info, tag); }
        inline LogLine Warn(std::string_view tag) { return LogLine(LogLevel::Warn, tag); }
        inline LogLine Error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }
    }
}
