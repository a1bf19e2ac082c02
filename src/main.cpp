#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>

#include "cap_solver.hpp"
#include "exit_status.hpp"
#include "metrics.hpp"
#include "challenge_response.hpp"
#include "solver_config.hpp"
#include "solver_logger.hpp"
#include "pow_errors.hpp"

namespace net = boost::asio;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --token TOKEN [options]\n"
              << "       " << prog << " --challenge-json [options] < challenge.json\n"
              << "Options:\n"
              << "  --count N            Number of challenges (default 50)\n"
              << "  --salt-length L      Salt length in hex characters (default 32)\n"
              << "  --difficulty D       Required hex prefix length (default 4)\n"
              << "  --workers W          Worker threads, 0 = hardware concurrency\n"
              << "  --timeout-ms MS      Batch deadline, 0 disables it\n"
              << "  --derivation NAME    stream | capjs\n"
              << "  --format NAME        nonces | redeem | detailed\n"
              << "  --verbose, -v        Log progress and hash rate to stderr\n"
              << "  --metrics            Dump solver metrics (Prometheus text) to stderr\n"
              << "  --help, -h           Show this help\n";
}

int parse_int_arg(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        throw capsolve::InputError(flag + " expects an integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw capsolve::InputError(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

}

int main(int argc, char* argv[]) {
    using capsolve::SolverLogger;
    try {
        capsolve::SolverConfig config;
        capsolve::apply_env_overrides(config);

        std::string token;
        capsolve::ChallengeParams params = config.default_params;
        bool read_challenge_json = false;
        bool derivation_set = false;
        bool format_set = false;
        bool show_metrics = false;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next_value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw capsolve::InputError(arg + " expects a value");
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--metrics") {
                show_metrics = true;
            } else if (arg == "--token") {
                token = next_value();
            } else if (arg == "--challenge-json") {
                read_challenge_json = true;
            } else if (arg == "--count") {
                params.count = parse_int_arg(arg, next_value());
            } else if (arg == "--salt-length") {
                params.salt_length = parse_int_arg(arg, next_value());
            } else if (arg == "--difficulty") {
                params.difficulty = parse_int_arg(arg, next_value());
            } else if (arg == "--workers") {
                config.worker_count = parse_int_arg(arg, next_value());
            } else if (arg == "--timeout-ms") {
                config.timeout_ms = parse_int_arg(arg, next_value());
            } else if (arg == "--derivation") {
                config.derivation = capsolve::parse_derivation(next_value());
                derivation_set = true;
            } else if (arg == "--format") {
                config.solution_format = capsolve::parse_solution_format(next_value());
                format_set = true;
            } else {
                print_usage(argv[0]);
                return 2;
            }
        }

        SolverLogger::set_min_level(config.verbose ? SolverLogger::Level::DEBUG : SolverLogger::Level::WARNING);

        if (read_challenge_json) {
            std::string body((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
            auto response = capsolve::ChallengeResponse::parse(body);
            token = response.token;
            params = response.params;
            // A raw Cap.js challenge implies the Cap.js derivation and redeem body
            if (!derivation_set && std::getenv("CAPSOLVE_DERIVATION") == nullptr) {
                config.derivation = capsolve::ChallengeDerivation::PER_CHALLENGE;
            }
            if (!format_set && std::getenv("CAPSOLVE_FORMAT") == nullptr) {
                config.solution_format = capsolve::SolutionFormat::REDEEM_JSON;
            }
            SolverLogger::log(SolverLogger::Level::INFO, SolverLogger::EventType::CHALLENGE_RECEIVED, token,
                              "c=" + std::to_string(params.count) + " s=" + std::to_string(params.salt_length) +
                              " d=" + std::to_string(params.difficulty) +
                              " expires=" + std::to_string(response.expires));
        }

        if (token.empty()) {
            print_usage(argv[0]);
            return 2;
        }

        if (config.timeout_ms < 0 || config.worker_count < 0) {
            throw capsolve::InputError("--workers and --timeout-ms must not be negative");
        }

        SolverLogger::log(SolverLogger::Level::INFO, SolverLogger::EventType::CONFIG, token,
                          capsolve::describe(config));

        capsolve::CapSolver solver(config);
        if (config.verbose) {
            solver.set_progress_callback([&token](size_t done, size_t total) {
                SolverLogger::log(SolverLogger::Level::DEBUG, SolverLogger::EventType::BATCH_PROGRESS, token,
                                  "progress " + std::to_string(done) + "/" + std::to_string(total));
            });
        }

        // SIGINT and SIGTERM abort the batch instead of killing the process mid-write
        capsolve::CancellationToken cancel;
        net::io_context ioc;
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&cancel, &token](const boost::system::error_code& ec, int) {
            if (ec) return;
            SolverLogger::log(SolverLogger::Level::WARNING, SolverLogger::EventType::BATCH_CANCELLED, token,
                              "Signal received, stopping workers");
            cancel.cancel();
        });
        std::thread signal_thread([&ioc] { ioc.run(); });

        auto outcome = capsolve::run_guarded([&] { return solver.solve(token, params, &cancel); });

        ioc.stop();
        signal_thread.join();

        if (show_metrics) {
            capsolve::MetricsRegistry::instance().write_prometheus(std::cerr);
        }

        if (outcome.exit_code == capsolve::EXIT_OK) {
            std::cout << outcome.solution << std::endl;
        } else {
            std::cerr << "[!] " << outcome.error << "\n";
        }
        return outcome.exit_code;

    } catch (const capsolve::InputError& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return capsolve::EXIT_INPUT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return capsolve::EXIT_FATAL;
    }
}
