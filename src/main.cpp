#include "app/Application.hpp"

#include <plog/Log.h>

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    try
    {
        return Application{ argc, argv }.run();
    }
    catch (const std::exception& e)
    {
        PLOG_FATAL << "Unhandled exception: " << e.what();
        std::cerr << "modkeep: unexpected error: " << e.what() << std::endl;
        return Application::ExitFailure;
    }
}
