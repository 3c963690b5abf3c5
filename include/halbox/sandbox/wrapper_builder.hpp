/*
 * HalBox C++17 - Execution Wrapper Builder
 *
 * Produces the Python bootstrap that runs a target file under a profile.
 * The bootstrap:
 *   - intercepts every import path (meta_path finder, builtins.__import__,
 *     importlib.import_module) and rejects blocked module roots;
 *   - replaces blocked callables with stand-ins that raise;
 *   - runs the target as __main__ and maps failures to exit codes
 *     (2 = blocked import, 1 = any other uncaught exception).
 */
#ifndef halbox_SANDBOX_WRAPPER_BUILDER_HPP
#define halbox_SANDBOX_WRAPPER_BUILDER_HPP

#include <halbox/sandbox/policy_registry.hpp>

#include <string>
#include <vector>

namespace halbox {

class WrapperBuilder {
public:
    std::string build(const std::string& target_path, const ExecutionProfile& profile) const;

    // Interpreter arguments that run a wrapper file (argv[1..])
    static std::vector<std::string> interpreter_args(const std::string& wrapper_path);
};

} // namespace halbox

#endif // halbox_SANDBOX_WRAPPER_BUILDER_HPP
