#include <iostream>
#include <string>
#include "sluice/sluice.hpp"

using namespace sluice;

// Used when no configuration file is given
static constexpr const char *DEFAULT_CONFIG = R"({
    "minimum_level": "debug",
    "destinations": [
        { "kind": "console", "colors": true },
        { "kind": "sqlite", "path": "/tmp/sluice/config_demo.db", "pool_size": 2 }
    ]
})";

int main(int argc, char *argv[])
{
    if (argc > 2)
    {
        std::cerr << "Usage: " << argv[0] << " [config.json]\n";
        return 1;
    }

    std::unique_ptr<logger_factory> factory;
    try
    {
        auto config = argc == 2 ? configuration_from_file(argv[1]) : configuration_from_json(DEFAULT_CONFIG);
        factory     = config.build();
    }
    catch (const config_error &e)
    {
        std::cerr << "Invalid logging configuration: " << e.what() << "\n";
        return 1;
    }
    catch (const sink_init_error &e)
    {
        std::cerr << "Could not open log destination: " << e.what() << "\n";
        return 1;
    }

    auto log = factory->create_logger("config_demo");
    log->debug("Loaded {Count} destinations", factory->destinations().size());

    {
        auto scope = log->begin_scope("Import {BatchId}", "b-42");
        for (int i = 0; i < 3; ++i) { log->info("Imported row {Row}", i); }
        log->warn("Row {Row} has no {Field}", 3, "email");
    }

    factory->close();
    return 0;
}
