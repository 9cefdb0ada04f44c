#pragma once

#include <iosfwd>
#include <string>

namespace wsgate::app
{
    // Process log sink: "YYYY/MM/DD HH:MM:SS <line>", one line per call.
    class ConsoleLog
    {
    public:
        static void Write(const std::string& line);

        static void WriteTo(std::ostream& out, const std::string& line);

        static std::string Timestamp();
    };
}
