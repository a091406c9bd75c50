#include <sluice/sluice.hpp>

using namespace sluice;

int main()
{
    // Console destination only
    auto factory = logger_configuration{}.minimum_level(log_level::debug).add_console().build();
    auto log     = factory->create_logger("integration");

    // Test basic logging
    log->info("Integration test successful!");
    log->debug("Debug message");
    log->warn("Warning message");

    // Test structured logging
    log->info("User login {UserId} from {Ip}", 12345, "192.168.1.1");

    // Ensure logs are flushed
    factory->close();

    return 0;
}
