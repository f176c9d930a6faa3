#include "readygate/cli/cli.hpp"

#include "readygate/endpoint/endpoint.hpp"
#include "readygate/probe/prober.hpp"
#include "readygate/source/endpoint_source.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <set>
#include <string_view>
#include <system_error>
#include <utility>

namespace readygate::cli {

namespace {

constexpr std::string_view kTimeoutEnv = "READYGATE_TIMEOUT";
constexpr std::string_view kDebugEnv = "READYGATE_DEBUG";
constexpr std::string_view kQuietEnv = "READYGATE_QUIET";

// One year; larger values are rejected so millisecond conversions stay exact.
constexpr long long kMaxSeconds = 365LL * 24 * 60 * 60;

std::optional<std::string_view>
lookup(const std::vector<std::string>& environment, std::string_view key) {
    for (const std::string& entry : environment) {
        const std::string_view view{entry};
        if (view.size() > key.size() && view.starts_with(key) &&
            view[key.size()] == '=') {
            return view.substr(key.size() + 1);
        }
    }
    return std::nullopt;
}

bool is_truthy(std::string_view value) noexcept {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::chrono::seconds> parse_seconds(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    const auto [end, status] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (status != std::errc{} || end != text.data() + text.size() || value < 0 ||
        value > kMaxSeconds) {
        return std::nullopt;
    }
    return std::chrono::seconds{value};
}

std::unexpected<usage_error> fail(std::string message) {
    return std::unexpected<usage_error>{usage_error{std::move(message)}};
}

// Splits `--name=value`; returns the name and the inline value, if any.
std::pair<std::string_view, std::optional<std::string_view>>
split_inline(std::string_view arg) {
    const std::size_t equals = arg.find('=');
    if (!arg.starts_with("--") || equals == std::string_view::npos) {
        return {arg, std::nullopt};
    }
    return {arg.substr(0, equals), arg.substr(equals + 1)};
}

} // namespace

std::expected<options, usage_error>
parse_command_line(const std::vector<std::string>& args,
                   const std::vector<std::string>& environment) {
    options opts{};

    if (const auto value = lookup(environment, kTimeoutEnv)) {
        const auto seconds = parse_seconds(*value);
        if (!seconds) {
            return fail(std::string{kTimeoutEnv} + " must be a number of "
                        "seconds between 0 and " + std::to_string(kMaxSeconds) +
                        ", got '" + std::string{*value} + "'");
        }
        opts.timeout = *seconds;
    }
    if (const auto value = lookup(environment, kDebugEnv)) {
        opts.debug = is_truthy(*value);
    }
    if (const auto value = lookup(environment, kQuietEnv)) {
        opts.quiet = is_truthy(*value);
    }

    bool options_done = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg{args[i]};

        if (options_done || !arg.starts_with('-') || arg == "-") {
            opts.endpoints.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        const auto [name, inline_value] = split_inline(arg);
        auto take_value = [&]() -> std::optional<std::string_view> {
            if (inline_value) {
                return inline_value;
            }
            if (i + 1 < args.size()) {
                return std::string_view{args[++i]};
            }
            return std::nullopt;
        };

        if (name == "-h" || name == "--help") {
            opts.help = true;
        } else if (name == "-d" || name == "--debug") {
            opts.debug = true;
        } else if (name == "-q" || name == "--quiet") {
            opts.quiet = true;
        } else if (name == "-t" || name == "--timeout" ||
                   name == "--probe-timeout") {
            const auto value = take_value();
            if (!value) {
                return fail(std::string{name} + " requires a value");
            }
            const auto seconds = parse_seconds(*value);
            if (!seconds) {
                return fail(std::string{name} + " must be a number of seconds "
                            "between 0 and " + std::to_string(kMaxSeconds) +
                            ", got '" + std::string{*value} + "'");
            }
            if (name == "--probe-timeout") {
                if (seconds->count() == 0) {
                    return fail("--probe-timeout must be at least 1 second");
                }
                opts.probe_timeout = *seconds;
            } else {
                opts.timeout = *seconds;
            }
        } else if (name == "--endpoint-timeout") {
            const auto value = take_value();
            if (!value) {
                return fail("--endpoint-timeout requires ENDPOINT=SECONDS");
            }
            const std::size_t equals = value->rfind('=');
            if (equals == std::string_view::npos || equals == 0) {
                return fail("--endpoint-timeout expects ENDPOINT=SECONDS, got '" +
                            std::string{*value} + "'");
            }
            const auto seconds = parse_seconds(value->substr(equals + 1));
            if (!seconds) {
                return fail("--endpoint-timeout has an invalid number of "
                            "seconds in '" + std::string{*value} + "'");
            }
            opts.endpoint_timeouts[std::string{value->substr(0, equals)}] =
                *seconds;
        } else {
            return fail("unknown option '" + std::string{arg} + "'");
        }
    }

    return opts;
}

std::string usage() {
    return "usage: readygate [options] [ENDPOINT...]\n"
           "\n"
           "Wait until every ENDPOINT accepts connections or its timeout "
           "expires.\n"
           "ENDPOINT is tcp://HOST:PORT, udp://HOST:PORT or unix://PATH.\n"
           "Without ENDPOINTs, values of <SERVICE>_<INDEX>_PORT environment\n"
           "variables are used.\n"
           "\n"
           "options:\n"
           "  -t, --timeout SECONDS        per-endpoint budget (default 30, "
           "READYGATE_TIMEOUT)\n"
           "      --probe-timeout SECONDS  limit for a single connection "
           "attempt (default 5, min 1)\n"
           "      --endpoint-timeout ENDPOINT=SECONDS\n"
           "                               budget for one endpoint\n"
           "  -d, --debug                  log every attempt "
           "(READYGATE_DEBUG)\n"
           "  -q, --quiet                  log errors only (READYGATE_QUIET)\n"
           "  -h, --help                   show this text\n"
           "\n"
           "exit status: 0 all endpoints up, 1 some did not come up,\n"
           "2 usage error, 3 socket family unavailable.\n";
}

log::verbosity verbosity_of(const options& opts) noexcept {
    if (opts.debug) {
        return log::verbosity::debug;
    }
    if (opts.quiet) {
        return log::verbosity::quiet;
    }
    return log::verbosity::normal;
}

gate::wait_options to_wait_options(const options& opts,
                                   std::shared_ptr<spdlog::logger> logger) {
    gate::wait_options wait{};
    wait.timeout = opts.timeout;
    wait.timeout_overrides = opts.endpoint_timeouts;
    wait.probe.timeout = opts.probe_timeout;
    wait.logger = std::move(logger);
    return wait;
}

int run(const std::vector<std::string>& args,
        const std::vector<std::string>& environment) {
    const auto parsed = parse_command_line(args, environment);
    if (!parsed.has_value()) {
        auto logger = log::make_logger(log::verbosity::quiet);
        logger->error("{}", parsed.error().message);
        logger->error("run 'readygate --help' for usage");
        return kExitUsage;
    }
    const options& opts = parsed.value();
    if (opts.help) {
        std::cout << usage();
        return kExitAllUp;
    }

    auto logger = log::make_logger(verbosity_of(opts));

    const source::endpoint_source endpoints_from =
        opts.endpoints.empty() ? source::from_environment(environment)
                               : source::from_arguments(opts.endpoints);
    const std::vector<std::string> endpoints = endpoints_from();

    std::set<protocol> protocols;
    for (const std::string& raw : endpoints) {
        protocols.insert(parse_endpoint(raw).proto);
    }
    for (const protocol proto : protocols) {
        const auto supported = probe::check_probe_support(proto);
        if (!supported.has_value()) {
            logger->critical("cannot create {} sockets on this host: {}",
                             to_string(proto), supported.error().message());
            return kExitUnsupported;
        }
    }

    if (endpoints.empty()) {
        logger->debug("no endpoints to wait for");
    }

    try {
        const auto overall =
            gate::wait_for_all(endpoints, to_wait_options(opts, logger));
        if (!overall.all_up()) {
            const auto failed = overall.failed();
            logger->error("{} of {} endpoints did not come up", failed.size(),
                          endpoints.size());
            return kExitFailed;
        }
    } catch (const std::system_error& ex) {
        logger->critical("cannot start pollers: {}", ex.what());
        return kExitFailed;
    }
    return kExitAllUp;
}

} // namespace readygate::cli
