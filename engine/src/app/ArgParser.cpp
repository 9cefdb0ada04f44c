#include "ArgParser.h"

#include <utility>

namespace wsgate::app
{
    bool ParsedArgs::Has(const std::string& key) const
    {
        return flags.count(key) != 0 || values.count(key) != 0;
    }

    std::string ParsedArgs::GetValue(const std::string& key) const
    {
        const auto it = values.find(key);
        return it == values.end() ? std::string() : it->second;
    }

    ArgParser::ArgParser(std::set<std::string> boolFlags, std::set<std::string> valueFlags)
        : boolFlags_(std::move(boolFlags)),
          valueFlags_(std::move(valueFlags))
    {
    }

    bool ArgParser::Parse(int argc, char** argv, ParsedArgs& out, std::string& outError) const
    {
        bool flagsDone = false;

        for (int i = 1; i < argc; i++)
        {
            const std::string arg = argv[i];

            if (flagsDone || arg.size() < 2 || arg[0] != '-')
            {
                out.positionals.push_back(arg);
                continue;
            }

            if (arg == "--")
            {
                flagsDone = true;
                continue;
            }

            std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
            std::string value;
            bool hasInlineValue = false;

            const auto eq = name.find('=');
            if (eq != std::string::npos)
            {
                value = name.substr(eq + 1);
                name.resize(eq);
                hasInlineValue = true;
            }

            if (boolFlags_.count(name))
            {
                if (hasInlineValue && value != "true" && value != "1")
                {
                    if (value != "false" && value != "0")
                    {
                        outError = "invalid boolean value \"" + value + "\" for flag -" + name;
                        return false;
                    }
                    out.flags.erase(name);
                    continue;
                }

                out.flags.insert(name);
                continue;
            }

            if (valueFlags_.count(name))
            {
                if (!hasInlineValue)
                {
                    if (i + 1 >= argc)
                    {
                        outError = "flag needs an argument: -" + name;
                        return false;
                    }
                    value = argv[++i];
                }

                out.values[name] = value;
                continue;
            }

            outError = "flag provided but not defined: -" + name;
            return false;
        }

        return true;
    }
}
