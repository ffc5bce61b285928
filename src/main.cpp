#include "audit/logger_audit.hpp"
#include "audit/splunk_audit.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "core/version.hpp"

#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace gabi;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitWriteFailed = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string config_file;
    QueryData data;
    bool timestamp_given = false;
};

void print_usage() {
    std::cerr << "Usage: gabi-audit [--config FILE] [--user USER] [--timestamp EPOCH] QUERY...\n"
                 "  Without --config, settings are read from SPLUNK_ENDPOINT, SPLUNK_TOKEN,\n"
                 "  SPLUNK_INDEX, HOST, NAMESPACE and POD_NAME.\n";
}

// Returns false on malformed arguments
bool parse_args(int argc, char* argv[], CliOptions& opts) {
    std::vector<std::string> query_words;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            opts.config_file = argv[++i];
        } else if (arg == "--user" && has_value) {
            opts.data.user = argv[++i];
        } else if (arg == "--timestamp" && has_value) {
            const auto ts = utils::try_parse_int<int64_t>(argv[++i]);
            if (!ts) {
                std::cerr << std::format("Invalid --timestamp value: {}\n", argv[i]);
                return false;
            }
            opts.data.timestamp = *ts;
            opts.timestamp_given = true;
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("Unknown or incomplete option: {}\n", arg);
            return false;
        } else {
            query_words.emplace_back(arg);
        }
    }

    for (size_t i = 0; i < query_words.size(); ++i) {
        if (i > 0) opts.data.query += ' ';
        opts.data.query += query_words[i];
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return kExitUsage;
    }
    if (!opts.timestamp_given) {
        opts.data.timestamp = utils::epoch_seconds();
    }

    utils::log::info(std::format("{} starting...", user_agent()));

    auto config_result = opts.config_file.empty()
        ? ConfigLoader::load_from_env()
        : ConfigLoader::load_from_file(opts.config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitUsage;
    }
    const auto& cfg = config_result.config;

    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    std::vector<std::unique_ptr<IQueryAudit>> sinks;
    if (cfg.audit.log_queries) {
        sinks.push_back(std::make_unique<LoggerAudit>());
    }
    sinks.push_back(std::make_unique<SplunkAudit>(
        cfg.splunk,
        std::vector<SplunkAudit::Option>{
            with_http_client(std::make_shared<HttpClient>(cfg.http)),
        }));

    utils::log::info(std::format("Auditing query for user '{}' to {} sink(s)",
                                 opts.data.user, sinks.size()));

    int exit_code = kExitOk;
    for (const auto& sink : sinks) {
        const auto status = sink->write(opts.data);
        if (status.is_error()) {
            utils::log::error(std::format("Audit sink {} failed ({}): {}", sink->name(),
                                          error_category_to_string(status.category()),
                                          status.message()));
            exit_code = kExitWriteFailed;
        }
    }
    return exit_code;
}
