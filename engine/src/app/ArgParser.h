#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace wsgate::app
{
    struct ParsedArgs
    {
        std::map<std::string, std::string> values;
        std::set<std::string> flags;
        std::vector<std::string> positionals;

        bool Has(const std::string& key) const;
        std::string GetValue(const std::string& key) const;
    };

    // Go-style single dash flags. "--name" and "-name=value" are accepted too, and a bare
    // "--" ends flag parsing.
    class ArgParser
    {
    public:
        ArgParser(std::set<std::string> boolFlags, std::set<std::string> valueFlags);

        bool Parse(int argc, char** argv, ParsedArgs& out, std::string& outError) const;

    private:
        std::set<std::string> boolFlags_;
        std::set<std::string> valueFlags_;
    };
}
