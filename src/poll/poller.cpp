#include "readygate/poll/poller.hpp"

#include <thread>

namespace readygate::poll {

poll_result poll_until_open(const endpoint& target,
                            const poll_options& options) {
    const probe::probe_function prober =
        options.prober ? options.prober : probe::socket_prober(options.probe);
    const auto& logger = options.logger;
    const auto started = std::chrono::steady_clock::now();
    const auto budget = options.timeout.count();

    poll_result outcome{};
    outcome.endpoint = target.raw;

    auto finish = [&](poll_status status) {
        outcome.status = status;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return outcome;
    };

    if (!target.valid()) {
        outcome.problem =
            target.problem.value_or(error{errc::unsupported_protocol});
        return finish(poll_status::timed_out);
    }

    for (long long elapsed_intervals = 0;; ++elapsed_intervals) {
        const probe::probe_outcome attempt = prober(target);
        ++outcome.attempts;

        if (logger) {
            logger->debug("{}: attempt {} {}{}{}", target.raw, outcome.attempts,
                          probe::to_string(attempt.status),
                          attempt.reason ? ": " : "",
                          attempt.reason ? attempt.reason->message() : "");
        }

        switch (attempt.status) {
        case probe::probe_status::open:
            return finish(poll_status::succeeded);
        case probe::probe_status::invalid:
            outcome.problem = attempt.reason;
            return finish(poll_status::timed_out);
        case probe::probe_status::closed:
            break;
        }

        if (elapsed_intervals >= budget) {
            return finish(poll_status::timed_out);
        }
        std::this_thread::sleep_for(options.interval);
    }
}

} // namespace readygate::poll
