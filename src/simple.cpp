#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include "sluice/sluice.hpp"

using namespace sluice;

struct money
{
    long cents;
};

// Types formattable by fmt can be passed as template arguments
template <> struct fmt::formatter<money> : formatter<string_view>
{
    auto format(money m, format_context &ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{}.{:02}", m.cents / 100, m.cents % 100);
    }
};

struct checkout_state
{
    std::string cart_id;
    int items;

    log_properties to_log_properties() const
    {
        log_properties props;
        props.emplace("CartId", cart_id);
        props.emplace("Items", static_cast<int64_t>(items));
        return props;
    }
};

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -w <sink>         Destination: console, text, json, sqlite (default: console)\n"
              << "  -f <file>         Output file for text, json and sqlite (default: /tmp/sluice.log)\n"
              << "  -l <level>        Minimum level (default: trace)\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    std::string sink_type   = "console";
    std::string output_file = "/tmp/sluice.log";
    log_level minimum       = log_level::trace;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-w") == 0 && i + 1 < argc) { sink_type = argv[++i]; }
        else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { output_file = argv[++i]; }
        else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc)
        {
            auto level = log_level_from_string(argv[++i]);
            if (!level)
            {
                std::cerr << "Error: unknown level: " << argv[i] << "\n";
                return 1;
            }
            minimum = *level;
        }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    logger_configuration config;
    config.minimum_level(minimum);

    if (sink_type == "console") { config.add_console(); }
    else if (sink_type == "text") { config.add_text_file(output_file); }
    else if (sink_type == "json") { config.add_json_file(output_file); }
    else if (sink_type == "sqlite") { config.add_sqlite(output_file); }
    else
    {
        std::cerr << "Error: unknown sink type: " << sink_type << "\n";
        print_usage(argv[0]);
        return 1;
    }

    std::unique_ptr<logger_factory> factory;
    try
    {
        factory = config.build();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto log = factory->create_logger("main");

    log->info("sluice {Version} writing to {Sink}", VERSION, sink_type);
    log->trace("Trace message");
    log->debug("Debug message with {Value:.3f}", 3.14159);
    log->warn("Disk usage at {Percent}%", 91);

    {
        auto scope = log->begin_scope(checkout_state{"c-1001", 3});
        log->info("Charging {Amount} to {Customer:u}", money{12999}, "acme");

        auto payment = factory->create_logger("payments");
        payment->log(log_level::info, log_event_id{2001, "PaymentAccepted"}, "Payment {PaymentId} accepted", 77);
    }

    try
    {
        throw std::runtime_error("connection refused");
    }
    catch (const std::exception &e)
    {
        log->error(e, "Could not reach {Host}:{Port}", "db.internal", 5432);
    }

    factory->close();
    return 0;
}
