#include "Log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace host_sweep::common
{
    namespace
    {
        std::mutex &OutputMutex()
        {
            static std::mutex mutex;
            return mutex;
        }

        const char *LevelName(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warn:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            }
            return "INFO";
        }
    }

    LogLine::LogLine(LogLevel level, std::string_view tag)
        : m_level(level), m_tag(tag)
    {
    }

    LogLine::~LogLine()
    {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::ostringstream line;
        line << std::put_time(&local, "%Y/%m/%d %H:%M:%S") << " " << LevelName(m_level)
             << " [" << m_tag << "] " << m_stream.str() << "\n";

        std::lock_guard<std::mutex> lock(OutputMutex());
        std::ostream &out = (m_level == LogLevel::Info) ? std::cout : std::cerr;
        out << line.str();
        out.flush();
    }
}
