// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 gatewarden contributors

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <rotor/asio.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>

#include "constants.h"
#include "config/utils.h"
#include "utils/location.h"
#include "utils/log.h"
#include "utils/log-setup.h"
#include "net/app_supervisor.h"

#include <pthread.h>
#include <signal.h>

namespace bfs = boost::filesystem;
namespace po = boost::program_options;
namespace pt = boost::posix_time;
namespace r = rotor;
namespace ra = r::asio;
namespace asio = boost::asio;

using namespace gatewarden;

[[noreturn]] static void report_error_and_die(r::actor_base_t *actor, const r::extended_error_ptr_t &ec) noexcept {
    auto name = actor ? actor->get_identity() : "unknown";
    spdlog::critical("actor '{}' error: {}", name, ec->message());
    std::terminate();
}

struct asio_sys_context_t : ra::system_context_asio_t {
    using parent_t = ra::system_context_asio_t;
    using parent_t::parent_t;
    void on_error(r::actor_base_t *actor, const r::extended_error_ptr_t &ec) noexcept override {
        report_error_and_die(actor, ec);
    }
};

static std::atomic_bool shutdown_flag = false;

static int app_main(int argc, char **argv, utils::dist_sink_t &dist_sink) {
    // clang-format off
    /* parse command-line & config options */
    po::options_description cmdline_descr("Allowed options");
    cmdline_descr.add_options()
        ("help", "show this help message")
        ("log_level", po::value<std::string>()->default_value("info"), "initial log level")
        ("config_dir", po::value<std::string>(), "configuration directory path");
    // clang-format on

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, cmdline_descr), vm);
    po::notify(vm);

    bool show_help = vm.count("help");
    if (show_help) {
        std::cout << cmdline_descr << "\n";
        return 1;
    }

    auto log_level_str = vm["log_level"].as<std::string>();
    auto log_level = utils::get_log_level(log_level_str);
    if (!log_level) {
        std::cerr << "unknown log level: " << log_level_str << "\n";
        return 1;
    }
    auto bootstrap_guard = utils::bootstrap(dist_sink, *log_level);

    bfs::path config_file_path;
    if (vm.count("config_dir")) {
        auto path = vm["config_dir"].as<std::string>();
        config_file_path = bfs::path{path.c_str()};
    } else {
        auto config_default = utils::get_default_config_dir();
        if (config_default) {
            config_file_path = config_default.value().string();
        } else {
            spdlog::error("cannot determine default config dir: {}", config_default.error().message());
            return 1;
        }
    }

    config_file_path.append("gatewarden.toml");
    auto config_file_path_str = config_file_path.string();
    bool populate = !bfs::exists(config_file_path);
    if (populate) {
        spdlog::info("config {} seems does not exist, creating default one...", config_file_path_str);
        auto cfg_opt = config::generate_config(config_file_path);
        if (!cfg_opt) {
            spdlog::error("cannot generate default config: {}", cfg_opt.error().message());
            return 1;
        }
        auto &cfg = cfg_opt.value();
        std::fstream f_cfg(config_file_path_str, f_cfg.binary | f_cfg.trunc | f_cfg.in | f_cfg.out);
        auto r = config::serialize(cfg, f_cfg);
        if (!r) {
            spdlog::error("cannot save default config at {}: {}", config_file_path_str, r.error().message());
            return 1;
        }
    }
    std::ifstream config_file(config_file_path_str);
    if (!config_file) {
        spdlog::error("cannot open config file {}", config_file_path_str);
        return 1;
    }

    config::config_result_t cfg_option = config::get_config(config_file, config_file_path);
    if (!cfg_option) {
        spdlog::error("config file {} is incorrect :: {}", config_file_path_str, cfg_option.error());
        return 1;
    }
    auto &cfg = cfg_option.value();
    spdlog::trace("configuration seems OK");

    if (vm["log_level"].defaulted() == false) {
        for (auto &log_cfg : cfg.log_configs) {
            if (log_cfg.name == "default") {
                log_cfg.level = *log_level;
            }
        }
    }

    auto init_result = utils::init_loggers(cfg.log_configs);
    if (!init_result) {
        spdlog::error("loggers initialization failed :: {}", init_result.error().message());
        return 1;
    }
    bootstrap_guard.reset();

    auto gateways = config::load_gateways(cfg.gateways_file);

    spdlog::info("starting {} {}, {} gateway(s) declared", constants::client_name, constants::client_version,
                 gateways.size());

    /* pre-init actors */
    asio::io_context io_context;
    ra::system_context_ptr_t sys_context{new asio_sys_context_t{io_context}};
    auto strand = std::make_shared<asio::io_context::strand>(io_context);
    auto timeout = pt::milliseconds{cfg.timeout};

    auto sup = sys_context->create_supervisor<net::app_supervisor_t>()
                   .app_config(cfg)
                   .gateways(std::move(gateways))
                   .strand(strand)
                   .timeout(timeout)
                   .create_registry()
                   .guard_context(true)
                   .shutdown_flag(shutdown_flag, r::pt::millisec{50})
                   .finish();
    sup->start();

    pthread_setname_np(pthread_self(), "gw/main");
    io_context.run();
    spdlog::trace("main loop has been terminated");
    return 0;
}

int main(int argc, char **argv) {
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = [](int) { shutdown_flag = true; };
    if (sigaction(SIGINT, &act, nullptr) != 0 || sigaction(SIGTERM, &act, nullptr) != 0) {
        spdlog::critical("cannot set signal handler");
        return 1;
    }

    auto dist_sink = utils::create_root_logger();
    int r = 0;
    try {
        r = app_main(argc, argv, dist_sink);
    } catch (const po::error &ex) {
        spdlog::critical("program options exception: {}", ex.what());
        r = 1;
    } catch (const std::exception &ex) {
        spdlog::critical("app failure : {}", ex.what());
        r = 1;
    }

    if (r == 0) {
        spdlog::info("normal exit");
    }
    utils::finalize_loggers();
    return r;
}
