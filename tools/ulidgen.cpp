// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <fmt/format.h>
#include <fmt/chrono.h>

#include <modern-ulid/generator.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace mulid;

static void print_help()
{
    std::cout << "\nulidgen\n\n"
                 "Options:\n"
                 "  -h         This message\n"
                 "  -n COUNT   Number of ULIDs to generate (default 1)\n"
                 "  -m         Monotonic: ULIDs generated within the same millisecond are increasing\n"
                 "  -l         Print lowercase\n"
                 "  -i ULID    Inspect ULID instead of generating\n"
                 "  -s         Strict decoding of ULID passed to -i\n"
                 "  -v         Verbose logging\n"
                 "\nLog level can also be set via SPDLOG_LEVEL environment variable\n"
              << std::endl;
}

static int inspect(const std::string & text, decode_mode mode)
{
    ulid val;
    if (auto res = ulid::parse(text, val, mode); !res) {
        auto ec = make_error_code(res.ec);
        spdlog::error("cannot decode \"{}\": {} (position {})", text, ec.message(), res.position);
        return EXIT_FAILURE;
    }
    spdlog::debug("decoded {} using {} mode", text, mode == decode_mode::strict ? "strict" : "lenient");

    fmt::print("ulid:      {}\n", val);
    fmt::print("timestamp: {} ({} ms)\n", val.timestamp(), val.timestamp_millis());
    fmt::print("words:     {:#018x} {:#018x}\n", val.most_significant_bits(), val.least_significant_bits());
    fmt::print("integer:   {:d}\n", val);
    fmt::print("uuid:      {}\n", val.to_uuid().to_string());
    return EXIT_SUCCESS;
}

static int generate(unsigned long count, bool monotonic, ulid::format fmt)
{
    generator gen;
    ulid prev;
    for (unsigned long i = 0; i < count; ++i) {
        std::error_code ec;
        ulid val = monotonic ? gen.generate_monotonic(prev, ec) : gen.generate(ec);
        if (ec) {
            spdlog::error("generation failed: {}", ec.message());
            return EXIT_FAILURE;
        }
        if (monotonic && val < prev)
            spdlog::warn("clock moved backwards: {} generated after {}", val, prev);
        fmt::print("{}\n", val.to_string(fmt));
        prev = val;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    int ch = 0;
    unsigned long count = 1;
    bool monotonic = false;
    bool verbose = false;
    ulid::format fmt = ulid::uppercase;
    decode_mode mode = decode_mode::lenient;
    const char * to_inspect = nullptr;

    spdlog::cfg::load_env_levels();

    while ((ch = getopt(argc, argv, "hn:mli:sv")) != -1) {
        switch (ch) {
        case 'n': {
            char * end = nullptr;
            count = strtoul(optarg, &end, 10);
            if (*optarg == 0 || *end != 0) {
                spdlog::error("invalid count: {}", optarg);
                return EXIT_FAILURE;
            }
            break;
        }
        case 'm':
            monotonic = true;
            break;
        case 'l':
            fmt = ulid::lowercase;
            break;
        case 'i':
            to_inspect = optarg;
            break;
        case 's':
            mode = decode_mode::strict;
            break;
        case 'v':
            verbose = true;
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    if (verbose)
        spdlog::set_level(spdlog::level::debug);

    try {
        if (to_inspect)
            return inspect(to_inspect, mode);

        spdlog::debug("generating {} ULID(s), monotonic={}", count, monotonic);
        return generate(count, monotonic, fmt);
    } catch (std::exception &e) {
        spdlog::error("exception caught: {}", e.what());
        return EXIT_FAILURE;
    }
}
