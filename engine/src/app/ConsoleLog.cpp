#include "ConsoleLog.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wsgate::app
{
    static std::mutex g_consoleMu;

    std::string ConsoleLog::Timestamp()
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        std::tm tm{};
        ::localtime_r(&now, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y/%m/%d %H:%M:%S");
        return oss.str();
    }

    void ConsoleLog::WriteTo(std::ostream& out, const std::string& line)
    {
        const std::string ts = Timestamp();

        std::lock_guard<std::mutex> lock(g_consoleMu);
        out << ts << " " << line << std::endl;
    }

    void ConsoleLog::Write(const std::string& line)
    {
        WriteTo(std::cout, line);
    }
}
