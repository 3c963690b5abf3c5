/*
 * HalBox C++17 - Execution Wrapper Builder Implementation
 */
#include <halbox/sandbox/wrapper_builder.hpp>
#include <halbox/core/json.hpp>
#include <halbox/core/logger.hpp>

#include <map>

namespace halbox {

namespace {

// JSON strings and arrays of strings are valid Python literals
std::string py_literal(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

const char* WRAPPER_TEMPLATE = R"PY(# halbox execution wrapper
import sys, os, types, sysconfig, traceback, builtins, importlib, importlib.abc

_TARGET = @TARGET@
_BLOCKED_IMPORTS = frozenset(@BLOCKED_IMPORTS@)
_BLOCKED_CALLS = @BLOCKED_CALLS@

# Private references, taken before anything is revoked
_halbox_real_compile = builtins.compile
_halbox_real_exec = builtins.exec
_halbox_real_eval = builtins.eval
_halbox_real_getframe = sys._getframe
_halbox_real_import = builtins.__import__
_halbox_real_import_module = importlib.import_module

with open(_TARGET, "rb") as _f:
    _halbox_source = _f.read()

_halbox_main = types.ModuleType("__main__")
_halbox_main.__file__ = _TARGET
_halbox_main.__builtins__ = builtins


class SandboxImportBlocked(ImportError):
    pass


class SandboxCallBlocked(RuntimeError):
    pass


def _halbox_check(name):
    root = (name or "").split(".")[0]
    if root in _BLOCKED_IMPORTS:
        raise SandboxImportBlocked("SandboxViolation: blocked import '%s'" % root)


_halbox_stdlib = tuple(sorted(set(
    os.path.realpath(p) + os.sep
    for p in (sysconfig.get_paths().get("stdlib"), sysconfig.get_paths().get("platstdlib"))
    if p)))
_halbox_trust = {}


# Standard library callers keep a revoked builtin: the import system and
# modules such as collections call exec/eval/compile internally.
def _halbox_trusted(frame):
    g = frame.f_globals
    name = g.get("__name__")
    mod = sys.modules.get(name) if isinstance(name, str) else None
    if mod is None or mod is _halbox_main or getattr(mod, "__dict__", None) is not g:
        return False
    if name not in _halbox_trust:
        spec = getattr(mod, "__spec__", None)
        origin = getattr(spec, "origin", None) or getattr(mod, "__file__", None) or ""
        if origin in ("frozen", "built-in"):
            ok = True
        else:
            path = os.path.realpath(origin) if origin else ""
            ok = (path.startswith(_halbox_stdlib) and
                  "site-packages" not in path and "dist-packages" not in path)
        _halbox_trust[name] = ok
    return _halbox_trust[name]


def _halbox_guard(name, real, stdlib_allowed):
    def _blocked(*args, **kwargs):
        frame = _halbox_real_getframe(1)
        if not (stdlib_allowed and _halbox_trusted(frame)):
            raise SandboxCallBlocked("SandboxViolation: blocked call '%s'" % name)
        if real in (_halbox_real_exec, _halbox_real_eval) and len(args) == 1 and not kwargs:
            return real(args[0], frame.f_globals, frame.f_locals)
        return real(*args, **kwargs)
    _blocked.__name__ = name.rsplit(".", 1)[-1]
    return _blocked


_halbox_self = globals()


def _halbox_revoke(name, real):
    stand_in = _halbox_guard(name, real, "." not in name)
    for _mod in list(sys.modules.values()):
        try:
            ns = vars(_mod)
        except TypeError:
            continue
        if ns is _halbox_self:
            continue
        for _key, _value in list(ns.items()):
            if _value is real:
                try:
                    ns[_key] = stand_in
                except TypeError:
                    pass


# Capability table: bare names live on builtins, dotted names on their
# module. Every alias loaded so far is replaced as well.
for _name in _BLOCKED_CALLS:
    if "." not in _name:
        _real = getattr(builtins, _name, None)
    else:
        _mod_name, _attr = _name.rsplit(".", 1)
        if _mod_name.split(".")[0] in _BLOCKED_IMPORTS:
            continue
        try:
            _real = getattr(_halbox_real_import_module(_mod_name), _attr, None)
        except Exception:
            continue
    if callable(_real):
        _halbox_revoke(_name, _real)

for _cached in list(sys.modules):
    if _cached.split(".")[0] in _BLOCKED_IMPORTS:
        del sys.modules[_cached]


class _HalboxFinder(importlib.abc.MetaPathFinder):
    def find_spec(self, fullname, path=None, target=None):
        _halbox_check(fullname)
        return None


def _halbox_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level == 0:
        _halbox_check(name)
    return _halbox_real_import(name, globals, locals, fromlist, level)


def _halbox_import_module(name, package=None):
    if not name.startswith("."):
        _halbox_check(name)
    return _halbox_real_import_module(name, package)


sys.meta_path.insert(0, _HalboxFinder())
builtins.__import__ = _halbox_import
importlib.import_module = _halbox_import_module

sys.argv = [_TARGET]
sys.path[0] = os.path.dirname(os.path.abspath(_TARGET))

sys.modules["__main__"] = _halbox_main

try:
    _halbox_code = _halbox_real_compile(_halbox_source, _TARGET, "exec", dont_inherit=True)
    _halbox_real_exec(_halbox_code, _halbox_main.__dict__)
except SandboxImportBlocked as e:
    sys.stderr.write(str(e) + "\n")
    sys.stderr.flush()
    sys.exit(2)
except Exception:
    traceback.print_exc()
    sys.stderr.flush()
    sys.exit(1)
)PY";

// Replaces @NAME@ tokens in one pass; inserted text is never rescanned
std::string substitute(const std::string& text, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('@', pos);
        if (open == std::string::npos) break;
        size_t close = text.find('@', open + 1);
        if (close == std::string::npos) break;
        auto it = values.find(text.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            out.append(text, pos, close - pos);
            pos = close;
            continue;
        }
        out.append(text, pos, open - pos);
        out += it->second;
        pos = close + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

} // anonymous namespace

std::string WrapperBuilder::build(const std::string& target_path, const ExecutionProfile& profile) const {
    Json imports = Json::array();
    for (const auto& m : profile.blocked_imports) imports.push_back(m);
    Json calls = Json::array();
    for (const auto& c : profile.blocked_calls) calls.push_back(c);

    std::map<std::string, std::string> values;
    values["TARGET"] = py_literal(Json(target_path));
    values["BLOCKED_IMPORTS"] = py_literal(imports);
    values["BLOCKED_CALLS"] = py_literal(calls);
    std::string source = substitute(WRAPPER_TEMPLATE, values);

    LOG_DEBUG("[WrapperBuilder] Built wrapper for %s (%zu imports, %zu calls blocked)",
              target_path.c_str(), profile.blocked_imports.size(), profile.blocked_calls.size());
    return source;
}

std::vector<std::string> WrapperBuilder::interpreter_args(const std::string& wrapper_path) {
    return {"-u", "-B", wrapper_path};
}

} // namespace halbox
