#include "readygate/gate/coordinator.hpp"

#include "readygate/endpoint/endpoint.hpp"

#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace readygate::gate {

namespace {

long long whole_seconds(std::chrono::milliseconds value) {
    return std::chrono::duration_cast<std::chrono::seconds>(value).count();
}

void report(const poll::poll_result& outcome, std::chrono::seconds budget,
            const std::shared_ptr<spdlog::logger>& logger) {
    if (!logger) {
        return;
    }
    if (outcome.succeeded()) {
        logger->info("{} is available after {} seconds", outcome.endpoint,
                     whole_seconds(outcome.elapsed));
        return;
    }
    if (outcome.problem) {
        logger->warn("{} cannot be waited for: {}", outcome.endpoint,
                     outcome.problem->message());
        return;
    }
    logger->error("timeout occurred after waiting {} seconds for {}",
                  budget.count(), outcome.endpoint);
}

poll::poll_result wait_for_one(const std::string& raw,
                               const wait_options& options) {
    const endpoint target = parse_endpoint(raw);

    poll::poll_options poll_opts{};
    poll_opts.timeout = timeout_for(raw, options);
    poll_opts.interval = options.interval;
    poll_opts.probe = options.probe;
    poll_opts.prober = options.prober;
    poll_opts.logger = options.logger;

    if (options.logger) {
        options.logger->debug("waiting {} seconds for {}",
                              poll_opts.timeout.count(), raw);
    }

    poll::poll_result outcome = poll::poll_until_open(target, poll_opts);
    report(outcome, poll_opts.timeout, options.logger);
    return outcome;
}

// Result for a poller that ended with an exception.
poll::poll_result abandoned(const std::string& raw, const char* reason,
                            const std::shared_ptr<spdlog::logger>& logger) {
    if (logger) {
        logger->error("poller for {} failed: {}", raw, reason);
    }
    poll::poll_result failed{};
    failed.endpoint = raw;
    failed.status = poll::poll_status::timed_out;
    return failed;
}

} // namespace

bool overall_result::all_up() const noexcept {
    for (const auto& entry : results) {
        if (!entry.succeeded()) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> overall_result::failed() const {
    std::vector<std::string> names;
    for (const auto& entry : results) {
        if (!entry.succeeded()) {
            names.push_back(entry.endpoint);
        }
    }
    return names;
}

std::chrono::seconds timeout_for(const std::string& raw,
                                 const wait_options& options) {
    const auto found = options.timeout_overrides.find(raw);
    if (found != options.timeout_overrides.end()) {
        return found->second;
    }
    return options.timeout;
}

overall_result wait_for_all(const std::vector<std::string>& raw_endpoints,
                            const wait_options& options) {
    overall_result overall{};
    if (raw_endpoints.empty()) {
        return overall;
    }

    if (raw_endpoints.size() == 1) {
        overall.results.push_back(wait_for_one(raw_endpoints.front(), options));
        return overall;
    }

    std::vector<std::future<poll::poll_result>> pending;
    std::vector<std::thread> pollers;
    pending.reserve(raw_endpoints.size());
    pollers.reserve(raw_endpoints.size());

    try {
        for (const std::string& raw : raw_endpoints) {
            std::promise<poll::poll_result> promise;
            pending.push_back(promise.get_future());
            pollers.emplace_back(
                [&raw, &options, promise = std::move(promise)]() mutable {
                    try {
                        promise.set_value(wait_for_one(raw, options));
                    } catch (...) {
                        promise.set_exception(std::current_exception());
                    }
                });
        }
    } catch (...) {
        for (auto& poller : pollers) {
            poller.join();
        }
        throw;
    }

    for (auto& poller : pollers) {
        poller.join();
    }

    overall.results.reserve(raw_endpoints.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        try {
            overall.results.push_back(pending[i].get());
        } catch (const std::exception& ex) {
            overall.results.push_back(
                abandoned(raw_endpoints[i], ex.what(), options.logger));
        } catch (...) {
            overall.results.push_back(abandoned(
                raw_endpoints[i], "unknown exception", options.logger));
        }
    }
    return overall;
}

} // namespace readygate::gate
