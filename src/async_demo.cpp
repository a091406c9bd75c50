#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "sluice/sluice.hpp"

using namespace sluice;
using namespace std::chrono_literals;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -t <threads>      Producer threads (default: 4)\n"
              << "  -n <count>        Entries per thread (default: 10000)\n"
              << "  -q <capacity>     Queue capacity (default: 1000)\n"
              << "  -d <dir>          Output directory (default: /tmp/sluice)\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    int thread_count      = 4;
    int per_thread        = 10000;
    size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;
    std::string out_dir   = "/tmp/sluice";

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) { thread_count = std::stoi(argv[++i]); }
        else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { per_thread = std::stoi(argv[++i]); }
        else if (strcmp(argv[i], "-q") == 0 && i + 1 < argc) { queue_capacity = std::stoul(argv[++i]); }
        else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) { out_dir = argv[++i]; }
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

    std::unique_ptr<async_logger_factory> factory;
    try
    {
        factory = async_logger_configuration{}
                      .minimum_level(log_level::debug)
                      .queue_capacity(queue_capacity)
                      .add_text_file(out_dir + "/blast.log", {.mode = write_mode::buffered, .buffer_threshold = 256})
                      .add_json_file(out_dir + "/blast.jsonl", {.mode = write_mode::buffered, .buffer_threshold = 256})
                      .build();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto log = factory->create_logger("blast");

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t)
    {
        threads.emplace_back(
            [&log, t, per_thread]
            {
                auto scope = log->begin_scope({{"Worker", t}});
                for (int i = 0; i < per_thread; ++i)
                {
                    if (i % 1000 == 999) { log->error("Worker {Worker} checkpoint {Iteration}", t, i); }
                    else { log->debug("Worker {Worker} iteration {Iteration}", t, i); }
                }
            });
    }
    for (auto &th : threads) { th.join(); }

    log->flush();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    auto stats   = log->get_stats();

    factory->close();

    std::cerr << "========== ASYNC LOGGER ==========\n";
    std::cerr << "  Elapsed: " << elapsed.count() << " ms\n";
    std::cerr << "  Enqueued: " << stats.enqueued << "\n";
    std::cerr << "  Dropped: " << stats.dropped << "\n";
    std::cerr << "  Direct writes: " << stats.direct_writes << "\n";
    std::cerr << "  State: " << async_logger_state_name(log->state()) << "\n";
    std::cerr << "==================================\n";

    return 0;
}
