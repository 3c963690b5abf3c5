/*
 * HalBox C++17 - Environment Detector Implementation
 */
#include <halbox/sandbox/environment.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <cstdlib>
#include <climits>
#include <unistd.h>
#include <sys/utsname.h>

namespace halbox {

namespace {

std::string env_value(const char* name) {
    const char* v = getenv(name);
    return v ? std::string(v) : std::string();
}

bool env_set(const char* name) {
    const char* v = getenv(name);
    return v && v[0] != '\0';
}

} // anonymous namespace

Json EnvironmentDescriptor::to_json() const {
    Json j;
    j["os"] = os_kind;
    j["os_release"] = os_release;
    j["is_ssh"] = is_remote_session;
    j["display"] = display;
    j["has_gui"] = has_display;
    j["is_tty"] = is_interactive;
    j["user"] = user;
    j["hostname"] = host;
    return j;
}

EnvironmentDescriptor EnvironmentDetector::detect() const {
    EnvironmentDescriptor env;

    struct utsname uts;
    if (uname(&uts) == 0) {
        env.os_kind = uts.sysname;
        env.os_release = uts.release;
    } else {
        env.os_kind = "unknown";
    }

    env.is_remote_session = env_set("SSH_CONNECTION") || env_set("SSH_CLIENT") || env_set("SSH_TTY");

    env.display = env_value("DISPLAY");
    if (env.display.empty()) {
        env.display = env_value("WAYLAND_DISPLAY");
    }
    env.has_display = !env.display.empty();

    env.is_interactive = isatty(STDOUT_FILENO) == 1;

    env.user = current_user_name();
    if (env.user.empty()) {
        env.user = "unknown";
    }

    char hostname[HOST_NAME_MAX + 1];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[HOST_NAME_MAX] = '\0';
        env.host = hostname;
    }
    if (env.host.empty()) {
        env.host = "unknown";
    }

    LOG_DEBUG("[Environment] os=%s ssh=%d gui=%d tty=%d user=%s host=%s",
              env.os_kind.c_str(), env.is_remote_session ? 1 : 0, env.has_display ? 1 : 0,
              env.is_interactive ? 1 : 0, env.user.c_str(), env.host.c_str());
    return env;
}

std::string EnvironmentDetector::preamble(const EnvironmentDescriptor& env, const std::string& profile) {
    std::string s = "EnvironmentProfile=" + profile;
    s += "; GUI=";
    s += env.has_display ? "True" : "False";
    s += "; Runtime=";
    s += env.has_display ? "gui" : "terminal";
    s += "; Network=Restricted; IO=FilesystemLimited";
    return s;
}

} // namespace halbox
