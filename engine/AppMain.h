#pragma once

class AppMain
{
public:
    // Returns the process exit code.
    int Run(int argc, char** argv);
};
