/*
 * HalBox C++17 - Environment Detector
 *
 * Snapshot of the host the agent is running on. Never cached: callers
 * take a fresh one for every request.
 */
#ifndef halbox_SANDBOX_ENVIRONMENT_HPP
#define halbox_SANDBOX_ENVIRONMENT_HPP

#include <halbox/core/json.hpp>

#include <string>

namespace halbox {

struct EnvironmentDescriptor {
    std::string os_kind;        // uname sysname ("Linux", "Darwin", ...)
    std::string os_release;
    bool is_remote_session;     // SSH_CONNECTION / SSH_CLIENT / SSH_TTY
    bool has_display;           // DISPLAY or WAYLAND_DISPLAY set
    std::string display;
    bool is_interactive;        // stdout is a terminal
    std::string user;
    std::string host;

    EnvironmentDescriptor()
        : is_remote_session(false)
        , has_display(false)
        , is_interactive(false) {}

    Json to_json() const;
};

class EnvironmentDetector {
public:
    EnvironmentDescriptor detect() const;

    // The one-line capability summary handed to the code generator
    static std::string preamble(const EnvironmentDescriptor& env, const std::string& profile);
};

} // namespace halbox

#endif // halbox_SANDBOX_ENVIRONMENT_HPP
