#include "cli_options.hpp"

#include "waypoint/core/config.hpp"
#include "waypoint/core/logging.hpp"
#include "waypoint/core/uuid.hpp"
#include "waypoint/state/chat_history.hpp"
#include "waypoint/state/session_store.hpp"
#include "waypoint/state/state_manager.hpp"
#include "waypoint/state/state_template.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>

using namespace waypoint;
using namespace waypoint::core;

namespace {

int report(const Error& error) {
    std::cerr << "error: " << error.to_string() << "\n";
    return 1;
}

Result<Json, Error> read_json_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<Json, Error>::err(ErrorCode::FileReadFailed, "Failed to open file", path.string());
    }
    Json j = Json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return Result<Json, Error>::err(ErrorCode::DiffValidationFailed, "File is not valid JSON", path.string());
    }
    return Result<Json, Error>::ok(std::move(j));
}

int run(const app::CliOptions& options) {
    Config config;
    if (options.config_path) {
        auto loaded = Config::load(*options.config_path);
        if (loaded.is_err()) {
            return report(loaded.error());
        }
        config = std::move(loaded).value();
    } else {
        config = Config::load_or_default(Config::default_path());
    }
    if (options.verbose) {
        config.observability.log_level = "debug";
    }

    auto logging = init_logging(config.observability);
    if (logging.is_err()) {
        return report(logging.error());
    }

    auto state_template = state::StateTemplate::resolve(config.state.template_path);
    if (state_template.is_err()) {
        return report(state_template.error());
    }

    state::FileSessionStore store(config.state.store_path);
    state::StateManager manager(store, std::move(state_template).value(), config.state);
    state::ChatHistory history(store, static_cast<size_t>(config.state.history_limit));

    switch (options.command) {
        case app::Command::New: {
            SessionId id = generate_session_id();
            auto created = manager.commit(id, state::Diff{});
            if (created.is_err()) {
                return report(created.error());
            }
            std::cout << id << "\n";
            return 0;
        }

        case app::Command::Show: {
            auto current = manager.get_state(options.session_id);
            if (current.is_err()) {
                return report(current.error());
            }
            std::cout << current.value().to_json().dump(2) << "\n";
            return 0;
        }

        case app::Command::Commit: {
            auto candidate = read_json_file(options.diff_file);
            if (candidate.is_err()) {
                return report(candidate.error());
            }
            auto diff = manager.propose_diff(candidate.value());
            if (diff.is_err()) {
                return report(diff.error());
            }
            auto committed = manager.commit(options.session_id, diff.value());
            if (committed.is_err()) {
                return report(committed.error());
            }
            std::cout << committed.value().to_json().dump(2) << "\n";
            return 0;
        }

        case app::Command::Clear: {
            auto cleared = manager.clear(options.session_id);
            if (cleared.is_err()) {
                return report(cleared.error());
            }
            auto forgotten = history.clear(options.session_id);
            if (forgotten.is_err()) {
                return report(forgotten.error());
            }
            return 0;
        }

        case app::Command::Help:
            std::cout << app::usage();
            return 0;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto options = app::parse_cli(args);
    if (options.is_err()) {
        std::cerr << "error: " << options.error().full_message() << "\n\n" << app::usage();
        return 2;
    }

    return run(options.value());
}
