#include "delguard/cli/commands.hpp"
#include "delguard/core/logger.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>

#include <nlohmann/json.hpp>

#include "delguard/guard/detector.hpp"
#include "delguard/guard/engine.hpp"
#include "delguard/infra/paths.hpp"

namespace delguard::cli {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

auto string_field(const json& j, std::string_view key) -> std::string {
    auto it = j.find(std::string(key));
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

auto process_cwd() -> fs::path {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path("/") : cwd;
}

void print_analysis_text(std::ostream& out, const guard::Command& command,
                         const guard::Analysis& analysis) {
    out << "command:      " << command.text << "\n";
    out << "cwd:          " << command.cwd.string() << "\n";
    out << "deletion:     " << (analysis.deletion ? "yes" : "no") << "\n";
    if (!analysis.deletion) {
        return;
    }
    out << "unresolvable: " << (analysis.unresolvable ? "yes" : "no") << "\n";
    if (analysis.unresolvable) {
        out << "  would prompt: targets cannot be determined statically\n";
        return;
    }

    out << "targets:\n";
    if (analysis.targets.empty()) {
        if (guard::is_find_delete(command.text) || guard::is_git_clean_force(command.text)) {
            out << "  (none explicit, dry-run discovery would run)\n";
        } else {
            out << "  (none, would prompt)\n";
        }
        return;
    }
    for (const auto& target : analysis.targets) {
        out << "  " << target.path.string() << "  " << guard::zone_to_string(target.zone);
        if (!target.backup_root.empty()) {
            out << "  (backup root: " << target.backup_root.string() << ")";
        }
        if (!target.exists) {
            out << "  [missing]";
        }
        out << "\n";
    }
}

auto analysis_to_json(const guard::Command& command, const guard::Analysis& analysis) -> json {
    json j = {
        {"command", command.text},
        {"cwd", command.cwd.string()},
        {"deletion", analysis.deletion},
        {"unresolvable", analysis.unresolvable},
        {"targets", json::array()},
    };
    for (const auto& target : analysis.targets) {
        json t = {
            {"path", target.path.string()},
            {"zone", std::string(guard::zone_to_string(target.zone))},
            {"exists", target.exists},
        };
        if (!target.backup_root.empty()) {
            t["backup_root"] = target.backup_root.string();
        }
        j["targets"].push_back(std::move(t));
    }
    return j;
}

} // anonymous namespace

auto parse_hook_input(std::string_view raw) -> Result<HookInput> {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Invalid hook input JSON", e.what()));
    }
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Hook input is not a JSON object"));
    }

    HookInput input;
    input.tool_name = string_field(j, "tool_name");
    input.cwd = string_field(j, "cwd");
    if (auto it = j.find("tool_input"); it != j.end() && it->is_object()) {
        input.command = string_field(*it, "command");
    }
    return input;
}

auto load_effective_config(const GlobalOptions& options) -> Config {
    auto path = options.config_path.empty()
        ? default_config_path()
        : fs::path(infra::expand_user(options.config_path));
    auto config = load_config(path);
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    Logger::set_level(config.log_level);
    LOG_DEBUG("Configuration loaded from {}", path.string());
    return config;
}

auto run_check(std::string_view raw_input,
               const Config& config,
               infra::Prompter& prompter,
               backup::BackupStore& store,
               guard::DryRunDiscoverer& discoverer,
               std::ostream& err) -> int {
    auto input = parse_hook_input(raw_input);
    if (!input) {
        LOG_DEBUG("Ignoring hook input: {}", input.error().what());
        return guard::kExitAllow;
    }
    if (input->tool_name != "Bash" || input->command.empty()) {
        return guard::kExitAllow;
    }

    fs::path cwd = input->cwd.empty() ? process_cwd() : fs::path(input->cwd);
    auto workspace = resolve_workspace_root(input->cwd);

    guard::DecisionEngine engine(config, workspace, prompter, store, discoverer);
    auto verdict = engine.evaluate(guard::Command{input->command, cwd});
    if (!verdict) {
        LOG_ERROR("Guard failed [{}]: {}", error_code_to_string(verdict.error().code()),
                  verdict.error().what());
        err << "[delguard] unhandled error (failing open): " << verdict.error().what() << "\n";
        return guard::kExitAllow;
    }

    LOG_INFO("Decision: {} ({} backup(s))", guard::decision_to_string(verdict->decision),
             verdict->backups);
    if (verdict->decision == guard::Decision::Block) {
        err << verdict->message << "\n";
    }
    return verdict->exit_code;
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("check",
                                   "Run as a pre-execution hook (reads hook JSON from stdin)");

    sub->callback([&options]() {
        auto config = load_effective_config(options);

        std::string raw(std::istreambuf_iterator<char>(std::cin), {});

        infra::TtyPrompter prompter(infra::make_line_reader(config.prompt_strategy),
                                    std::chrono::seconds(config.prompt_timeout_seconds));
        auto store = backup::make_backup_store(config);
        guard::DryRunDiscoverer discoverer(
            std::chrono::seconds(config.dry_run_timeout_seconds));

        options.exit_code = run_check(raw, config, prompter, *store, discoverer, std::cerr);
    });
}

// ---------------------------------------------------------------------------
// explain command
// ---------------------------------------------------------------------------

void register_explain_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("explain",
                                   "Show how a command would be classified, without running it");

    struct ExplainArgs {
        std::string command;
        std::string cwd;
        bool as_json = false;
    };
    auto args = std::make_shared<ExplainArgs>();

    sub->add_option("command", args->command, "Shell command to analyze")->required();
    sub->add_option("--cwd", args->cwd, "Working directory the command would run in");
    sub->add_flag("--json", args->as_json, "Print the analysis as JSON");

    sub->callback([&options, args]() {
        auto config = load_effective_config(options);

        fs::path cwd = args->cwd.empty() ? process_cwd() : fs::path(args->cwd);
        auto roots = guard::make_zone_roots(config, resolve_workspace_root(cwd.string()));

        guard::Command command{args->command, infra::resolve_path(cwd)};
        auto analysis = guard::analyze_command(command, roots);

        if (args->as_json) {
            std::cout << analysis_to_json(command, analysis).dump(2) << "\n";
        } else {
            std::cout << "workspace:    " << roots.workspace.string() << "\n";
            print_analysis_text(std::cout, command, analysis);
        }
        options.exit_code = 0;
    });
}

} // namespace delguard::cli
