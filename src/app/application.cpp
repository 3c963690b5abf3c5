/*
 * HalBox C++17 - Application Implementation
 */
#include <halbox/app/application.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <iostream>
#include <iterator>
#include <cstring>

namespace halbox {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

const int USAGE_EXIT_CODE = 2;

void print_usage(const char* prog, std::ostream& os) {
    os << AppInfo::NAME << " - sandboxed code execution\n\n"
       << "Usage:\n"
       << "  " << prog << " --run-file PATH [options]\n"
       << "  " << prog << " --run-stdin [--prompt TEXT] [options]\n"
       << "  " << prog << " --env [options]\n\n"
       << "Options:\n"
       << "  --profile NAME     Execution profile (see the policy_overrides config key)\n"
       << "  --prompt TEXT      Request text used to pick a profile (--run-stdin)\n"
       << "  --config PATH      Policy file (default ~/.config/halbox/sandbox.json)\n"
       << "  --data-dir DIR     Logs and scratch files (default ~/.local/share/halbox)\n"
       << "  --json             Print the full result as JSON\n"
       << "  --summary          Print a short summary of the result to stderr\n"
       << "  --log-level LEVEL  debug, info, warn or error\n"
       << "  -h, --help         Show this help message\n"
       << "  -v, --version      Show version\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void write_terminated(std::ostream& os, const std::string& text) {
    if (text.empty()) return;
    os << text;
    if (text.back() != '\n') os << '\n';
    os.flush();
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : mode_(RunMode::NONE)
    , json_output_(false)
    , print_summary_(false)
    , exit_code_(0)
{}

bool Application::parse_args(int argc, char* argv[]) {
    auto need_value = [&](int i) -> bool {
        if (i + 1 >= argc) {
            std::cerr << argv[0] << ": " << argv[i] << " requires a value\n";
            exit_code_ = USAGE_EXIT_CODE;
            return false;
        }
        return true;
    };
    auto set_mode = [&](RunMode mode, const char* flag) -> bool {
        if (mode_ != RunMode::NONE) {
            std::cerr << argv[0] << ": " << flag << " conflicts with an earlier mode\n";
            exit_code_ = USAGE_EXIT_CODE;
            return false;
        }
        mode_ = mode;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0], std::cout);
            exit_code_ = 0;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code_ = 0;
            return false;
        }
        if (strcmp(argv[i], "--run-file") == 0) {
            if (!set_mode(RunMode::RUN_FILE, argv[i]) || !need_value(i)) return false;
            file_path_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--run-stdin") == 0) {
            if (!set_mode(RunMode::RUN_STDIN, argv[i])) return false;
            continue;
        }
        if (strcmp(argv[i], "--env") == 0) {
            if (!set_mode(RunMode::ENV, argv[i])) return false;
            continue;
        }
        if (strcmp(argv[i], "--profile") == 0) {
            if (!need_value(i)) return false;
            profile_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--prompt") == 0) {
            if (!need_value(i)) return false;
            prompt_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (!need_value(i)) return false;
            config_file_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--data-dir") == 0) {
            if (!need_value(i)) return false;
            data_dir_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--log-level") == 0) {
            if (!need_value(i)) return false;
            log_level_ = argv[++i];
            LogLevel level;
            if (!parse_log_level(log_level_, level)) {
                std::cerr << argv[0] << ": unknown log level '" << log_level_ << "'\n";
                exit_code_ = USAGE_EXIT_CODE;
                return false;
            }
            continue;
        }
        if (strcmp(argv[i], "--json") == 0) {
            json_output_ = true;
            continue;
        }
        if (strcmp(argv[i], "--summary") == 0) {
            print_summary_ = true;
            continue;
        }
        std::cerr << argv[0] << ": unknown argument '" << argv[i] << "'\n";
        exit_code_ = USAGE_EXIT_CODE;
        return false;
    }

    if (mode_ == RunMode::NONE) {
        print_usage(argv[0], std::cerr);
        exit_code_ = USAGE_EXIT_CODE;
        return false;
    }
    if (!prompt_.empty() && mode_ != RunMode::RUN_STDIN) {
        std::cerr << argv[0] << ": --prompt is only valid with --run-stdin\n";
        exit_code_ = USAGE_EXIT_CODE;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    // Command line wins over the config file
    std::string name = log_level_.empty()
        ? sandbox_.registry().config().get_string("log_level", "warn")
        : log_level_;

    LogLevel level;
    if (parse_log_level(name, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Unknown log_level '%s' in config, keeping current level", name.c_str());
    }
}

bool Application::validate_profile() {
    if (profile_.empty() || sandbox_.registry().has_profile(profile_)) {
        return true;
    }
    std::cerr << AppInfo::NAME << ": unknown profile '" << profile_ << "' (choose from: "
              << join(sandbox_.registry().profile_names(), ", ") << ")\n";
    exit_code_ = USAGE_EXIT_CODE;
    return false;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    // Early level so config loading problems are visible
    LogLevel early;
    if (!log_level_.empty() && parse_log_level(log_level_, early)) {
        Logger::instance().set_level(early);
    }

    if (!sandbox_.init(config_file_, data_dir_)) {
        exit_code_ = 1;
        return false;
    }
    setup_logging();

    if (!validate_profile()) {
        return false;
    }

    LOG_DEBUG("%s v%s ready", AppInfo::NAME, AppInfo::VERSION);
    return true;
}

int Application::run() {
    switch (mode_) {
        case RunMode::ENV:
            return run_env();
        case RunMode::RUN_FILE:
        case RunMode::RUN_STDIN:
            return run_code();
        default:
            return USAGE_EXIT_CODE;
    }
}

int Application::run_env() {
    EnvironmentDescriptor env = sandbox_.detect_environment();
    ExecutionProfile profile = sandbox_.registry().resolve_profile(profile_, env);

    Json out;
    out["env"] = env.to_json();
    out["profile"] = profile.name;
    out["preamble"] = EnvironmentDetector::preamble(env, profile.name);
    std::cout << out.dump(2, ' ', false, Json::error_handler_t::replace) << std::endl;
    return 0;
}

int Application::run_code() {
    ExecutionResult result;
    try {
        if (mode_ == RunMode::RUN_FILE) {
            result = sandbox_.run_file(file_path_, profile_);
        } else {
            std::string code((std::istreambuf_iterator<char>(std::cin)),
                             std::istreambuf_iterator<char>());
            result = sandbox_.run_snippet(code, profile_, prompt_);
        }
    } catch (const StorageError& e) {
        std::cerr << AppInfo::NAME << ": " << e.what() << "\n";
        return 1;
    }

    print_result(result);
    if (result.ok) return 0;
    return result.return_code != 0 ? result.return_code : 1;
}

void Application::print_result(const ExecutionResult& result) const {
    if (json_output_) {
        std::cout << result.to_json().dump(2, ' ', false, Json::error_handler_t::replace) << std::endl;
    } else {
        write_terminated(std::cout, result.stdout_text);
        write_terminated(std::cerr, result.stderr_text);
    }
    if (print_summary_) {
        write_terminated(std::cerr, ResultClassifier::summarize(result));
    }
}

void Application::shutdown() {
    LOG_DEBUG("Shutdown complete");
}

} // namespace halbox
