#include "sandbox/runner.h"
#include <nlohmann/json.hpp>
#include <regex>
#include <algorithm>
#include <signal.h>

namespace warden {
namespace sandbox {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxErrorChars = 400;
constexpr uint64_t kEnvelopeOverheadFactor = 4;
constexpr uint64_t kArtifactAllowance = 8ULL * 1024 * 1024;

const char* const kRunnerSource = R"PY(
import sys, io, os, json, base64, csv, signal
import builtins as _bi

_out = sys.stdout
_MARK = "@@WARDEN_RESULT@@"

def _emit(status, text, err, artifacts):
    try:
        line = json.dumps({"status": status, "stdout": text, "error": err, "artifacts": artifacts})
    except Exception:
        line = json.dumps({"status": "error", "stdout": "", "error": "ResultError: result could not be encoded", "artifacts": []})
    _out.write("\n" + _MARK + line + "\n")
    _out.flush()

try:
    signal.signal(signal.SIGXFSZ, signal.SIG_IGN)
except Exception:
    pass

_payload = json.loads(sys.stdin.read())
_policy = _payload.get("policy", {})
_allowed = set(_policy.get("allowed_imports", []))
_real_import = _bi.__import__

_ModuleType = type(sys)
_views = {}
_VISIBLE = ("__name__", "__all__", "__doc__")

def _expose(value):
    if isinstance(value, _ModuleType):
        if value.__name__.split(".")[0] not in _allowed:
            raise AttributeError("module '" + value.__name__ + "' is not permitted")
        return _view(value)
    return value

def _view(mod):
    if id(mod) in _views:
        return _views[id(mod)]

    class ModuleView(object):
        __slots__ = ()

        def __getattribute__(self, name):
            if name.startswith("_") and name not in _VISIBLE:
                raise AttributeError("access to '" + name + "' is not permitted")
            return _expose(getattr(mod, name))

        def __setattr__(self, name, value):
            raise AttributeError("module '" + mod.__name__ + "' is read-only")

        def __delattr__(self, name):
            raise AttributeError("module '" + mod.__name__ + "' is read-only")

        def __dir__(self):
            return [n for n in dir(mod) if not n.startswith("_")]

        def __repr__(self):
            return "<module '" + mod.__name__ + "'>"

    v = ModuleView()
    _views[id(mod)] = v
    return v

def _guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or name.split(".")[0] not in _allowed:
        raise ImportError("import of '" + name + "' is not permitted")
    return _view(_real_import(name, globals, locals, fromlist, level))

_safe = {}
for _n in _policy.get("vetted_builtins", []):
    if hasattr(_bi, _n):
        _safe[_n] = getattr(_bi, _n)
_safe["__import__"] = _guarded_import
_ns = {"__builtins__": _safe, "__name__": "__analysis__"}

for _alias, _mod in _policy.get("preloaded", {}).items():
    try:
        if _mod.split(".")[0] == "matplotlib":
            import matplotlib
            matplotlib.use("Agg")
        _ns[_alias] = _view(_real_import(_mod, fromlist=["_"]) if "." in _mod else _real_import(_mod))
    except Exception:
        pass

_data = _payload.get("data") or {}
_csv = _data.get("csv", "")
_ns["data_name"] = _data.get("name", "")
_ns["metadata"] = dict(_data.get("metadata", {}))
_ns["rows"] = list(csv.DictReader(io.StringIO(_csv))) if _csv else []
if _csv and "pd" in _ns:
    try:
        _ns["df"] = _ns["pd"].read_csv(io.StringIO(_csv))
    except Exception as e:
        _emit("error", "", "DataError: dataset could not be parsed", [])
        sys.exit(0)

_limits = _payload.get("limits", {})
_fs_mode = _limits.get("filesystem", "none")
_network = bool(_limits.get("network", False))
_scratch = os.path.realpath(os.getcwd())
_cache = os.path.realpath(os.environ.get("MPLCONFIGDIR", _scratch))
_runtime_roots = set()
for _p in list(sys.path) + [sys.prefix, sys.base_prefix, sys.exec_prefix, "/usr/share/zoneinfo", "/usr/share/fonts"]:
    if _p:
        _runtime_roots.add(os.path.realpath(_p))
_runtime_roots.add(_cache)

_PROCESS_EVENTS = ("os.system", "os.exec", "os.posix_spawn", "os.spawn", "os.fork", "os.forkpty",
                   "os.kill", "os.killpg", "os.putenv", "os.unsetenv", "subprocess.Popen",
                   "pty.spawn", "ctypes.dlopen")
_NETWORK_EVENTS = ("socket.connect", "socket.bind", "socket.sendto", "socket.sendmsg", "socket.getaddrinfo")
_WRITE_EVENTS = ("os.remove", "os.rename", "os.rmdir", "os.mkdir", "os.chmod", "os.chown", "os.link",
                 "os.symlink", "os.truncate", "os.utime", "os.chdir", "shutil.copyfile", "shutil.copymode",
                 "shutil.copystat", "shutil.copytree", "shutil.move", "shutil.rmtree", "shutil.make_archive",
                 "shutil.unpack_archive")
_LIST_EVENTS = ("os.listdir", "os.scandir", "glob.glob", "os.listxattr", "os.getxattr")
_WRITE_FLAGS = os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_TRUNC | os.O_APPEND
_in_hook = [False]

def _under(path, roots):
    for root in roots:
        if path == root or path.startswith(root.rstrip(os.sep) + os.sep):
            return True
    return False

def _resolve(path):
    if isinstance(path, int):
        return None
    try:
        return os.path.realpath(os.fsdecode(path))
    except (TypeError, ValueError):
        return ""

def _check_read(path):
    p = _resolve(path)
    if p is None or _fs_mode == "read-only":
        return
    if not _under(p, _runtime_roots):
        raise PermissionError("filesystem access is not permitted")

def _check_write(path):
    p = _resolve(path)
    if p is None:
        return
    if _fs_mode != "read-only" or not _under(p, (_scratch,)):
        raise PermissionError("filesystem writes are not permitted")

def _audit(event, args):
    if _in_hook[0]:
        return
    if event.startswith(_PROCESS_EVENTS):
        raise PermissionError("process control is not permitted")
    if event in _NETWORK_EVENTS and not _network:
        raise PermissionError("network access is not permitted")
    if event != "open" and event not in _WRITE_EVENTS and event not in _LIST_EVENTS:
        return
    _in_hook[0] = True
    try:
        if event == "open":
            path, mode, flags = (tuple(args) + (None, None, None))[:3]
            if isinstance(flags, int):
                writing = bool(flags & _WRITE_FLAGS)
            else:
                writing = isinstance(mode, str) and any(c in mode for c in "wax+")
            if writing:
                _check_write(path)
            else:
                _check_read(path)
        elif event in _WRITE_EVENTS:
            for a in tuple(args)[:2]:
                if isinstance(a, (str, bytes, os.PathLike)):
                    _check_write(a)
        else:
            target = args[0] if args else "."
            _check_read("." if target is None else target)
    finally:
        _in_hook[0] = False

if not hasattr(sys, "addaudithook"):
    _emit("error", "", "SandboxError: interpreter does not support audit hooks", [])
    sys.exit(0)
sys.addaudithook(_audit)

_buf = io.StringIO()
_status, _err = "ok", ""
sys.stdout = _buf
sys.stderr = io.StringIO()
try:
    exec(compile(_payload.get("code", ""), "<analysis>", "exec"), _ns)
except MemoryError:
    _status, _err = "memory", "MemoryError: memory limit exceeded"
except SystemExit:
    pass
except BaseException as e:
    _status, _err = "error", type(e).__name__ + ": " + str(e)
finally:
    sys.stdout = _out
    sys.stderr = sys.__stderr__

_artifacts = []
if _status == "ok":
    _plt = _ns.get("plt")
    if _plt is not None:
        try:
            for _num in _plt.get_fignums():
                _png = io.BytesIO()
                _plt.figure(_num).savefig(_png, format="png", bbox_inches="tight")
                _artifacts.append({"kind": "plot_image", "payload": base64.b64encode(_png.getvalue()).decode("ascii")})
            _plt.close("all")
        except Exception:
            pass
    _legacy = _ns.get("plot_base64")
    if isinstance(_legacy, str) and _legacy:
        _artifacts.append({"kind": "plot_image", "payload": _legacy})
    _fig = _ns.get("fig")
    if _fig is not None and hasattr(_fig, "to_html") and hasattr(_fig, "to_plotly_json"):
        try:
            _artifacts.append({"kind": "plot_html", "payload": _fig.to_html(include_plotlyjs="cdn", full_html=False)})
        except Exception:
            pass
    _res = _ns.get("result")
    if _res is not None and hasattr(_res, "to_json") and hasattr(_res, "columns"):
        try:
            _artifacts.append({"kind": "table", "payload": _res.to_json(orient="split")})
        except Exception:
            pass

_emit(_status, _buf.getvalue(), _err, _artifacts)
)PY";

bool parseArtifactKind(const std::string& name, core::ArtifactKind& out) {
    if (name == "plot_image") { out = core::ArtifactKind::PLOT_IMAGE; return true; }
    if (name == "plot_html") { out = core::ArtifactKind::PLOT_HTML; return true; }
    if (name == "table") { out = core::ArtifactKind::TABLE; return true; }
    return false;
}

bool looksLikeMemoryFailure(const std::string& text) {
    return text.find("MemoryError") != std::string::npos ||
           text.find("Cannot allocate memory") != std::string::npos ||
           text.find("out of memory") != std::string::npos;
}

}

const std::string& runnerScript() {
    static const std::string script(kRunnerSource);
    return script;
}

std::string buildRunnerPayload(const std::string& code, const core::DataContext& data,
                               const policy::PolicyStore& policy, const core::ResourceLimits& limits) {
    json payload;
    payload["code"] = code;
    payload["data"] = {
        {"name", data.name},
        {"csv", data.csv},
        {"metadata", data.metadata}
    };
    payload["policy"] = {
        {"allowed_imports", policy.allowedImports()},
        {"vetted_builtins", policy.vettedBuiltins()},
        {"preloaded", policy.preloadedModules()}
    };
    payload["limits"] = {
        {"filesystem", core::filesystemModeName(limits.filesystemMode)},
        {"network", limits.networkEnabled}
    };
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<RunnerEnvelope> parseEnvelope(const std::string& output) {
    // Analysis output is JSON-escaped inside the envelope, so a marker at the
    // start of a line can only come from the runner.
    const std::string marker = std::string("\n") + kEnvelopeMarker;
    size_t pos = output.rfind(marker);
    if (pos == std::string::npos) {
        return Error(ErrorCode::PARSE_ERROR, "no result envelope in runner output");
    }
    pos += marker.size();
    size_t end = output.find('\n', pos);
    std::string line = output.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "malformed result envelope");
    }

    RunnerEnvelope env;
    env.status = j.value("status", "");
    env.stdoutText = j.value("stdout", "");
    env.error = j.value("error", "");
    if (env.status != "ok" && env.status != "error" && env.status != "memory") {
        return Error(ErrorCode::PARSE_ERROR, "unknown envelope status '" + env.status + "'");
    }
    if (j.contains("artifacts") && j["artifacts"].is_array()) {
        for (const auto& a : j["artifacts"]) {
            if (!a.is_object()) continue;
            core::Artifact artifact;
            if (!parseArtifactKind(a.value("kind", ""), artifact.kind)) continue;
            artifact.payload = a.value("payload", "");
            env.artifacts.push_back(std::move(artifact));
        }
    }
    return env;
}

std::string scrubHostDetails(const std::string& text) {
    static const std::regex frameRe(R"(File "[^"]*", line \d+(, in [^\n]*)?)");
    static const std::regex pathRe(R"((?:[A-Za-z]:)?(?:/[\w.\-@+]+){2,}/?)");

    std::string out = std::regex_replace(text, frameRe, "<frame>");
    out = std::regex_replace(out, pathRe, "<path>");
    size_t nl = out.find('\n');
    if (nl != std::string::npos) out = out.substr(0, nl);
    if (out.size() > kMaxErrorChars) {
        out = out.substr(0, kMaxErrorChars) + "...";
    }
    return out;
}

uint64_t channelCapacity(uint64_t maxOutputBytes) {
    return maxOutputBytes * kEnvelopeOverheadFactor + kArtifactAllowance;
}

core::ExecutionResult interpretOutcome(const ProcessOutcome& outcome, uint64_t maxOutputBytes,
                                       const std::vector<int>& infraExitCodes) {
    core::ExecutionResult result;
    result.wallTimeMs = outcome.wallTimeMs;

    switch (outcome.termination) {
        case Termination::SPAWN_FAILED:
            result.status = core::ExecutionStatus::SANDBOX_UNAVAILABLE;
            return result;
        case Termination::TIMED_OUT:
            result.status = core::ExecutionStatus::TIMEOUT;
            return result;
        case Termination::CANCELLED:
            result.status = core::ExecutionStatus::CANCELLED;
            return result;
        default:
            break;
    }

    if (outcome.outputTruncated) {
        result.status = core::ExecutionStatus::RESOURCE_EXCEEDED;
        result.errorMessage = "output limit exceeded";
        return result;
    }

    if (outcome.termination == Termination::SIGNALED) {
        int sig = outcome.signal;
        if (sig == SIGKILL || sig == SIGXCPU || sig == SIGXFSZ || sig == SIGSEGV || sig == SIGABRT) {
            result.status = core::ExecutionStatus::RESOURCE_EXCEEDED;
            result.errorMessage = "terminated by resource limit";
        } else {
            result.status = core::ExecutionStatus::RUNTIME_ERROR;
            result.errorMessage = "terminated by signal " + std::to_string(sig);
        }
        return result;
    }

    auto envelope = parseEnvelope(outcome.stdoutData);
    if (envelope.ok()) {
        const RunnerEnvelope& env = envelope.value();
        if (env.stdoutText.size() > maxOutputBytes) {
            result.status = core::ExecutionStatus::RESOURCE_EXCEEDED;
            result.errorMessage = "output limit exceeded";
            return result;
        }
        result.stdoutText = env.stdoutText;
        if (env.status == "ok") {
            result.status = core::ExecutionStatus::OK;
            result.artifacts = env.artifacts;
        } else if (env.status == "memory") {
            result.status = core::ExecutionStatus::RESOURCE_EXCEEDED;
            result.errorMessage = "memory limit exceeded";
        } else {
            result.status = core::ExecutionStatus::RUNTIME_ERROR;
            result.errorMessage = scrubHostDetails(env.error);
        }
        return result;
    }

    if (std::find(infraExitCodes.begin(), infraExitCodes.end(), outcome.exitCode) != infraExitCodes.end()) {
        result.status = core::ExecutionStatus::SANDBOX_UNAVAILABLE;
        return result;
    }
    if (outcome.exitCode == 128 + SIGKILL || looksLikeMemoryFailure(outcome.stderrData)) {
        result.status = core::ExecutionStatus::RESOURCE_EXCEEDED;
        result.errorMessage = "memory limit exceeded";
        return result;
    }
    result.status = core::ExecutionStatus::RUNTIME_ERROR;
    result.errorMessage = "execution failed (exit code " + std::to_string(outcome.exitCode) + ")";
    return result;
}

}
}
