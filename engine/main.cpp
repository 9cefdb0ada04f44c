#include "AppMain.h"

#include "src/app/ConsoleLog.h"
#include "src/app/ServerConfig.h"

#include <iostream>

int main(int argc, char** argv)
{
    try
    {
        AppMain app;
        return app.Run(argc, argv);
    }
    catch (const wsgate::app::StartupConfigError& e)
    {
        wsgate::app::ConsoleLog::WriteTo(std::cerr, e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        wsgate::app::ConsoleLog::WriteTo(std::cerr, std::string("std::exception: ") + e.what());
        return 11;
    }
}
