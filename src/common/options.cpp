/*******************************************************************************
    Project: Volcano Controller Manager

    File: options.cpp

    Description:
        ServerOption defaults, validation and duration parsing.
*******************************************************************************/

#include "common/options.h"
#include "common/errors.h"

#include <cctype>
#include <stdexcept>

namespace volcano {

namespace {

bool take_value(const std::vector<std::string>& args, size_t& i, const std::string& flag,
                std::string& value) {
    const std::string& arg = args[i];
    if (arg == flag) {
        if (i + 1 >= args.size()) {
            throw ConfigError("flag needs an argument: " + flag);
        }
        value = args[++i];
        return true;
    }
    if (arg.compare(0, flag.size() + 1, flag + "=") == 0) {
        value = arg.substr(flag.size() + 1);
        return true;
    }
    return false;
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "true" || text == "1") { out = true; return true; }
    if (text == "false" || text == "0") { out = false; return true; }
    return false;
}

int to_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw ConfigError("invalid value \"" + value + "\" for " + flag);
    }
    return result;
}

float to_float(const std::string& flag, const std::string& value) {
    size_t used = 0;
    float result = 0.0f;
    try {
        result = std::stof(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw ConfigError("invalid value \"" + value + "\" for " + flag);
    }
    return result;
}

std::chrono::milliseconds to_duration(const std::string& flag, const std::string& value) {
    std::chrono::milliseconds result(0);
    if (!parse_duration(value, result)) {
        throw ConfigError("invalid duration \"" + value + "\" for " + flag);
    }
    return result;
}

} // anonymous namespace

void ServerOption::validate() const {
    if (kube_api_qps <= 0.0f) {
        throw ConfigError("kube-api-qps must be positive, got " + std::to_string(kube_api_qps));
    }
    if (kube_api_burst <= 0) {
        throw ConfigError("kube-api-burst must be positive, got " + std::to_string(kube_api_burst));
    }
    if (worker_threads <= 0) {
        throw ConfigError("worker-threads must be positive, got " + std::to_string(worker_threads));
    }

    if (!enable_leader_election) return;

    if (lock_object_namespace.empty()) {
        throw ConfigError("lock-object-namespace must not be empty when leader election is enabled");
    }
    if (lease_duration <= renew_deadline) {
        throw ConfigError("lease duration must be greater than renew deadline");
    }
    // Same jitter factor the elector applies to the retry period.
    if (renew_deadline.count() <= static_cast<long long>(1.2 * retry_period.count())) {
        throw ConfigError("renew deadline must be greater than 1.2 x retry period");
    }
    if (retry_period.count() <= 0) {
        throw ConfigError("retry period must be positive");
    }
}

bool parse_duration(const std::string& text, std::chrono::milliseconds& out) {
    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        digits++;
    }
    if (digits == 0 || digits > 12) {
        return false;
    }

    long long value = std::stoll(text.substr(0, digits));
    std::string unit = text.substr(digits);

    if (unit == "ms") {
        out = std::chrono::milliseconds(value);
    } else if (unit == "s" || unit.empty()) {
        out = std::chrono::seconds(value);
    } else if (unit == "m") {
        out = std::chrono::minutes(value);
    } else if (unit == "h") {
        out = std::chrono::hours(value);
    } else {
        return false;
    }
    return true;
}

void parse_command_line(const std::vector<std::string>& args, ServerOption& options) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (arg == "--leader-elect") {
            options.enable_leader_election = true;
            if (i + 1 < args.size() && parse_bool(args[i + 1], options.enable_leader_election)) {
                ++i;
            }
        } else if (arg.compare(0, 15, "--leader-elect=") == 0) {
            if (!parse_bool(arg.substr(15), options.enable_leader_election)) {
                throw ConfigError("invalid boolean \"" + arg.substr(15) + "\" for --leader-elect");
            }
        } else if (take_value(args, i, "--master", value)) {
            options.master = value;
        } else if (take_value(args, i, "--kubeconfig", value)) {
            options.kubeconfig = value;
        } else if (take_value(args, i, "--kube-api-qps", value)) {
            options.kube_api_qps = to_float("--kube-api-qps", value);
        } else if (take_value(args, i, "--kube-api-burst", value)) {
            options.kube_api_burst = to_int("--kube-api-burst", value);
        } else if (take_value(args, i, "--healthz-bind-address", value)) {
            options.healthz_bind_address = value;
        } else if (take_value(args, i, "--lock-object-namespace", value)) {
            options.lock_object_namespace = value;
        } else if (take_value(args, i, "--lock-type", value)) {
            options.lock_type = value;
        } else if (take_value(args, i, "--lock-dir", value)) {
            options.lock_dir = value;
        } else if (take_value(args, i, "--lease-duration", value)) {
            options.lease_duration = to_duration("--lease-duration", value);
        } else if (take_value(args, i, "--renew-deadline", value)) {
            options.renew_deadline = to_duration("--renew-deadline", value);
        } else if (take_value(args, i, "--retry-period", value)) {
            options.retry_period = to_duration("--retry-period", value);
        } else if (take_value(args, i, "--worker-threads", value)) {
            options.worker_threads = to_int("--worker-threads", value);
        } else if (take_value(args, i, "--scheduler-name", value)) {
            options.scheduler_name = value;
        } else if (take_value(args, i, "--log-level", value)) {
            if (!parse_log_level(value, options.log_level)) {
                throw ConfigError("invalid log level \"" + value + "\"");
            }
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }
}

} // namespace volcano
