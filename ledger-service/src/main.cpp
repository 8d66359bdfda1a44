#include "LedgerApp.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

// Глобальный указатель для обработки сигналов
LedgerApp* g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
    std::_Exit(128 + signal);
}

int main(int argc, char* argv[])
{
    try
    {
        LedgerApp app;
        g_app = &app;

        // Обработчики сигналов: дослать события и выйти
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Template Method:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. execute()
        int code = app.run(argc, argv);

        g_app = nullptr;
        return code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
