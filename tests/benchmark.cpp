#include "testing.hpp"
#include "sres/blocks.hpp"
#include "sres/ml.hpp"
#include "util/string.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

using namespace sres;

struct bench_timings {
    double mean = 0.0;
    double stdev = 0.0;
};

template <typename F>
bench_timings run_benchmark(int iterations, F&& run) {
    std::vector<double> timings;
    timings.reserve(iterations);

    run(); // Warm-up

    for (int i = 0; i < iterations; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        run();
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;
        timings.push_back(elapsed.count());
    }

    double mean = std::accumulate(timings.begin(), timings.end(), 0.0) / timings.size();
    double sq_sum = std::inner_product(timings.begin(), timings.end(), timings.begin(), 0.0);
    double stdev = std::sqrt(std::max(0.0, sq_sum / timings.size() - mean * mean));
    return {mean, stdev};
}

struct bench_config {
    std::vector<std::string_view> blocks;
    int size = 64;
    int channels = 64;
    int iterations = 8;
    int threads = 0;
};

struct bench_result {
    std::string_view block;
    std::string_view path;
    float max_diff = 0;
    bench_timings time;
};

auto const bench_weights = [](conv_params const& p, int i) {
    return random_conv(p, 1000 + uint32_t(i), 0.05f);
};

template <typename Weights, typename Host, typename Graph>
void benchmark_block(
    std::string_view name,
    Weights const& w,
    Host&& host,
    Graph&& graph,
    bench_config const& config,
    backend_device const& backend,
    std::vector<bench_result>& results) {

    tensor_data x = random_tensor({1, config.channels, config.size, config.size}, 1);

    tensor_data host_out;
    bench_timings host_time = run_benchmark(config.iterations, [&] { host_out = host(w, x); });
    results.push_back({name, "host", 0.0f, host_time});

    tensor_data graph_out;
    bench_timings graph_time = run_benchmark(
        config.iterations, [&] { graph_out = graph(backend, w, x); });
    results.push_back({name, "graph", max_difference(host_out, graph_out), graph_time});
}

void benchmark(std::string_view block, bench_config const& config, backend_device const& b,
               std::vector<bench_result>& results) {
    if (block == "rdb") {
        auto p = rdb_params{config.channels, config.channels / 2};
        rdb_weights w = make_rdb(p, bench_weights);
        benchmark_block(block, w, rdb_forward, rdb_compute, config, b, results);

    } else if (block == "rrdb") {
        auto p = rdb_params{config.channels, config.channels / 2};
        rrdb_weights w = make_rrdb(p, bench_weights);
        benchmark_block(block, w, rrdb_forward, rrdb_compute, config, b, results);

    } else if (block == "rfdb") {
        rfdb_weights w = make_rfdb(rfdb_params{config.channels}, bench_weights);
        auto graph = [](backend_device const& dev, rfdb_weights const& rfdb, tensor_view const& x) {
            return rfdb_compute(dev, rfdb, x);
        };
        benchmark_block(block, w, rfdb_forward, graph, config, b, results);

    } else {
        fprintf(stderr, "Unknown block: %s\n", std::string(block).c_str());
    }
}

char const* next_arg(int argc, char** argv, int& i) {
    if (++i < argc) {
        return argv[i];
    } else {
        throw error("Missing argument after {}", argv[i - 1]);
    }
}

int next_int(int argc, char** argv, int& i) {
    char const* text = next_arg(argc, argv, i);
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != 0 || value <= 0) {
        throw error("Expected a positive number after {}, got {}", argv[i - 1], text);
    }
    return int(value);
}

void print(char const* str) {
    printf("%s", str);
}

int main(int argc, char** argv) {
    bench_config config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string_view arg(argv[i]);
            if (arg == "-b" || arg == "--block") {
                config.blocks.push_back(next_arg(argc, argv, i));
            } else if (arg == "-s" || arg == "--size") {
                config.size = next_int(argc, argv, i);
            } else if (arg == "-c" || arg == "--channels") {
                config.channels = next_int(argc, argv, i);
            } else if (arg == "-i" || arg == "--iterations") {
                config.iterations = next_int(argc, argv, i);
            } else if (arg == "-t" || arg == "--threads") {
                config.threads = next_int(argc, argv, i);
            } else {
                throw error("Unknown argument: {}", arg);
            }
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    if (config.blocks.empty()) {
        config.blocks = {"rdb", "rrdb", "rfdb"};
    }

    try {
        backend_device backend = backend_init();
        if (config.threads > 0) {
            backend_set_n_threads(backend, config.threads);
        }

        fixed_string<128> line;
        std::vector<bench_result> results;
        int i = 0;
        for (std::string_view block : config.blocks) {
            print(format(
                line, "[{}/{}] Running {} with {} channels on {}x{}...\n", ++i,
                config.blocks.size(), block, config.channels, config.size, config.size));
            benchmark(block, config, backend, results);
        }

        printf("\n");
        print(format(
            line, "| {: <6} | {: <6} | {: >11} | {: >6} | {: >9} |\n", "Block", "Path", "Avg",
            "Dev", "Max diff"));
        printf("|:-------|:-------|------------:|-------:|----------:|\n");
        for (const auto& result : results) {
            print(format(
                line, "| {: <6} | {: <6} | {:8.1f} ms | {:6.1f} | {:9.2e} |\n", result.block,
                result.path, result.time.mean, result.time.stdev, result.max_diff));
        }
        printf("\n");
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
