/*
 * HalBox C++17 - Application
 *
 * Command-line front end for the code sandbox.
 */
#ifndef halbox_APP_APPLICATION_HPP
#define halbox_APP_APPLICATION_HPP

#include <halbox/sandbox/code_sandbox.hpp>

#include <string>

namespace halbox {

struct AppInfo {
    static constexpr const char* NAME = "halbox";
    static constexpr const char* VERSION = "0.3.0";
};

enum class RunMode {
    NONE,
    RUN_FILE,
    RUN_STDIN,
    ENV
};

class Application {
public:
    static Application& instance();

    // Parse arguments, set up logging and load the policy file.
    // Returns false when there is nothing to run; exit_code() says why.
    bool init(int argc, char* argv[]);

    // Execute the selected mode; the return value is the process exit status
    int run();

    void shutdown();

    int exit_code() const { return exit_code_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool validate_profile();

    int run_env();
    int run_code();
    void print_result(const ExecutionResult& result) const;

    CodeSandbox sandbox_;
    RunMode mode_;
    std::string file_path_;
    std::string profile_;
    std::string prompt_;
    std::string config_file_;
    std::string data_dir_;
    std::string log_level_;
    bool json_output_;
    bool print_summary_;
    int exit_code_;
};

} // namespace halbox

#endif // halbox_APP_APPLICATION_HPP
