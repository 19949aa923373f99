#include "PennyApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        PennyApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Penny Ledger Starting" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        // Template Method:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        app.run(argc, argv);

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Penny Ledger Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
