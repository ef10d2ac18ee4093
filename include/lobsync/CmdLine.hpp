#pragma once

#include "lobsync/Config.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace lobsync {
    struct CmdOptions {
        ReplicatorConfig cfg;
        bool show_help{false};
    };

    /**
     * Fills `out` from argv. Returns false (after printing the error and usage) on a parse
     * error, a missing required option, or a config that fails validate().
     */
    inline bool parse_cmdline(int argc, char **argv, CmdOptions &out) {
        namespace po = boost::program_options;

        po::options_description desc("Options");
        desc.add_options()
                ("help,h", "Show this help message")
                ("symbols,s", po::value<std::vector<std::string> >()->multitoken()->required(),
                 "Symbols to replicate, e.g. BTCUSDT ETHUSDT BTCUSD_PERP")
                ("depth_limit", po::value<std::size_t>()->default_value(1000),
                 "REST snapshot depth")
                ("pace_ms", po::value<long>()->default_value(100),
                 "Delay after each processed frame, in milliseconds")
                ("publish_top", po::value<std::size_t>()->default_value(10),
                 "Levels per side in published snapshots (0 = all)")
                ("persist_path", po::value<std::string>(),
                 "Optional JSONL file receiving every published snapshot")
                ("connect_timeout_ms", po::value<long>()->default_value(5000),
                 "WebSocket connect deadline")
                ("ping_ms", po::value<long>()->default_value(0),
                 "WebSocket idle ping interval (0 = disabled)")
                ("rest_timeout_ms", po::value<long>()->default_value(5000),
                 "REST snapshot deadline")
                ("spot_ws_host", po::value<std::string>(), "Optional spot WebSocket host override")
                ("spot_ws_port", po::value<std::string>(), "Optional spot WebSocket port override")
                ("spot_rest_host", po::value<std::string>(), "Optional spot REST host override")
                ("spot_rest_port", po::value<std::string>(), "Optional spot REST port override")
                ("deriv_ws_host", po::value<std::string>(), "Optional derivative WebSocket host override")
                ("deriv_ws_port", po::value<std::string>(), "Optional derivative WebSocket port override")
                ("deriv_rest_host", po::value<std::string>(), "Optional derivative REST host override")
                ("deriv_rest_port", po::value<std::string>(), "Optional derivative REST port override")
                ("debug", po::bool_switch()->default_value(false), "Sampled parse/book logging")
                ("debug_raw", po::bool_switch()->default_value(false), "Also print truncated raw frames")
                ("debug_every", po::value<int>()->default_value(200), "Log 1/N parsed depth updates (0 = none)")
                ("debug_raw_max", po::value<int>()->default_value(512), "Truncate raw frames to N chars")
                ("debug_top", po::value<int>()->default_value(3), "Levels per side in snapshot dumps")
                ("debug_no_seq", po::bool_switch()->default_value(false), "Omit U/u update ids from debug lines");

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, desc), vm);

            if (vm.count("help")) {
                std::cout << "Usage: " << argv[0]
                        << " --symbols BTCUSDT [ETHUSDT ...] "
                        "[--depth_limit N] [--pace_ms MS] [--publish_top N] [--persist_path FILE]\n\n";
                std::cout << desc << "\n";
                out.show_help = true;
                return true;
            }

            po::notify(vm);
        } catch (const po::error &e) {
            std::cerr << "Error parsing command line: " << e.what() << "\n\n";
            std::cerr << desc << "\n";
            return false;
        }

        ReplicatorConfig &cfg = out.cfg;
        cfg.symbols = vm["symbols"].as<std::vector<std::string> >();
        cfg.depth_limit = vm["depth_limit"].as<std::size_t>();
        cfg.pace = std::chrono::milliseconds(vm["pace_ms"].as<long>());
        cfg.publish_top = vm["publish_top"].as<std::size_t>();
        cfg.connect_timeout = std::chrono::milliseconds(vm["connect_timeout_ms"].as<long>());
        cfg.ping_interval = std::chrono::milliseconds(vm["ping_ms"].as<long>());
        cfg.rest_timeout = std::chrono::milliseconds(vm["rest_timeout_ms"].as<long>());
        if (vm.count("persist_path")) cfg.persist_path = vm["persist_path"].as<std::string>();

        auto opt = [&vm](const char *name, std::string &dst) {
            if (vm.count(name)) dst = vm[name].as<std::string>();
        };
        opt("spot_ws_host", cfg.endpoints.spot_ws_host);
        opt("spot_ws_port", cfg.endpoints.spot_ws_port);
        opt("spot_rest_host", cfg.endpoints.spot_rest_host);
        opt("spot_rest_port", cfg.endpoints.spot_rest_port);
        opt("deriv_ws_host", cfg.endpoints.deriv_ws_host);
        opt("deriv_ws_port", cfg.endpoints.deriv_ws_port);
        opt("deriv_rest_host", cfg.endpoints.deriv_rest_host);
        opt("deriv_rest_port", cfg.endpoints.deriv_rest_port);

        cfg.debug = vm["debug"].as<bool>();
        cfg.debug_raw = vm["debug_raw"].as<bool>();
        cfg.debug_every = vm["debug_every"].as<int>();
        cfg.debug_raw_max = vm["debug_raw_max"].as<int>();
        cfg.debug_top = vm["debug_top"].as<int>();
        cfg.debug_seq = !vm["debug_no_seq"].as<bool>();

        if (const std::string problem = validate(cfg); !problem.empty()) {
            std::cerr << "Error: " << problem << "\n\n" << desc << "\n";
            return false;
        }
        return true;
    }
} // namespace lobsync
