// Shared fixtures for the halbox test suite.
#ifndef halbox_TESTS_TEST_HELPERS_HPP
#define halbox_TESTS_TEST_HELPERS_HPP

#include <halbox/sandbox/process_runner.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <dirent.h>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace halbox {
namespace testing_support {

// Sets (or unsets) one variable for the lifetime of the guard
struct EnvGuard {
    std::string key;
    bool had_value;
    std::string old_value;

    EnvGuard(const std::string& key_, const char* value) : key(key_), had_value(false) {
        if (const char* existing = std::getenv(key.c_str())) {
            had_value = true;
            old_value = existing;
        }
        if (value) {
            setenv(key.c_str(), value, 1);
        } else {
            unsetenv(key.c_str());
        }
    }

    ~EnvGuard() {
        if (had_value) {
            setenv(key.c_str(), old_value.c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }
};

inline void remove_tree(const std::string& path) {
    DIR* dir = opendir(path.c_str());
    if (dir) {
        while (struct dirent* entry = readdir(dir)) {
            std::string name = entry->d_name;
            if (name == "." || name == "..") continue;
            std::string child = path + "/" + name;
            struct stat st;
            if (lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                remove_tree(child);
            } else {
                unlink(child.c_str());
            }
        }
        closedir(dir);
    }
    rmdir(path.c_str());
}

// mkdtemp directory removed with its contents on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/halbox_test_XXXXXX";
        char* made = mkdtemp(tmpl);
        if (made) path_ = made;
    }
    ~TempDir() {
        if (!path_.empty()) remove_tree(path_);
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    std::string path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
    out << content;
}

inline std::vector<std::string> list_dir(const std::string& path) {
    std::vector<std::string> names;
    DIR* dir = opendir(path.c_str());
    if (!dir) return names;
    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") names.push_back(name);
    }
    closedir(dir);
    return names;
}

inline size_t count_lines(const std::string& path) {
    std::ifstream in(path.c_str());
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

// True when python3 can be started with the runner's reduced environment
inline bool python_available() {
    static int cached = -1;
    if (cached < 0) {
        RunSpec spec;
        spec.program = "python3";
        spec.args = {"-c", "print('ok')"};
        spec.timeout_ms = 20000;
        RawRunResult r = ProcessRunner().execute(spec);
        cached = (r.return_code == 0 && r.stdout_text == "ok\n") ? 1 : 0;
    }
    return cached == 1;
}

} // namespace testing_support
} // namespace halbox

#define HALBOX_REQUIRE_PYTHON()                                        \
    do {                                                               \
        if (!halbox::testing_support::python_available()) {            \
            GTEST_SKIP() << "python3 is not runnable on this host";    \
        }                                                              \
    } while (0)

#endif // halbox_TESTS_TEST_HELPERS_HPP
