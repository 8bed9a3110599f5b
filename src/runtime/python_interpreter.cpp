#include "runtime/python_interpreter.hpp"

#include <atomic>
#include <cstdlib>
#include <utility>

#include "utils/logging.hpp"

namespace pysandbox::runtime {
namespace bp = boost::python;
namespace {

// Helpers live in their own namespace so guest code never sees them.
constexpr const char* kBootstrap = R"PY(
import ast
import inspect
import io
import sys
import tokenize
import traceback

_capture = {}
_loop = None
_SKIPPED_TOKENS = (
    tokenize.COMMENT,
    tokenize.NL,
    tokenize.NEWLINE,
    tokenize.INDENT,
    tokenize.DEDENT,
    tokenize.ENDMARKER,
)


def _safe(text):
    # Lone surrogates cannot cross into UTF-8.
    return text.encode("utf-8", "backslashreplace").decode("utf-8")


def install_capture():
    _capture["stdout"] = sys.stdout
    _capture["stderr"] = sys.stderr
    _capture["out"] = io.StringIO()
    _capture["err"] = io.StringIO()
    sys.stdout = _capture["out"]
    sys.stderr = _capture["err"]


def _drain(key):
    buffer = _capture.pop(key, None)
    if buffer is None:
        return ""
    try:
        return _safe(buffer.getvalue())
    except Exception:
        return ""
    finally:
        try:
            buffer.close()
        except Exception:
            pass


def restore_capture():
    out = _drain("out")
    err = _drain("err")
    if "stdout" in _capture:
        sys.stdout = _capture.pop("stdout")
    if "stderr" in _capture:
        sys.stderr = _capture.pop("stderr")
    return out, err


def _failure(exc):
    if isinstance(exc, SyntaxError):
        text = "".join(traceback.format_exception_only(type(exc), exc))
        return (False, type(exc).__name__, _safe(text))
    tb = exc.__traceback__
    guest = tb
    while guest is not None and guest.tb_frame.f_code.co_filename != "<exec>":
        guest = guest.tb_next
    text = "".join(traceback.format_exception(type(exc), exc, guest if guest is not None else tb))
    return (False, type(exc).__name__, _safe(text))


def _quiet(source):
    last = None
    try:
        for token in tokenize.generate_tokens(io.StringIO(source).readline):
            if token.type not in _SKIPPED_TOKENS:
                last = token
    except (tokenize.TokenError, SyntaxError):
        return False
    return last is not None and last.type == tokenize.OP and last.string == ";"


def _evaluate(code, namespace):
    result = eval(code, namespace)
    if not code.co_flags & inspect.CO_COROUTINE:
        return result
    global _loop
    if _loop is None:
        import asyncio
        _loop = asyncio.new_event_loop()
        asyncio.set_event_loop(_loop)
    return _loop.run_until_complete(result)


def run(source, namespace):
    flags = ast.PyCF_ALLOW_TOP_LEVEL_AWAIT
    try:
        tree = ast.parse(source, "<exec>", "exec")
        tail = None
        if tree.body and isinstance(tree.body[-1], ast.Expr) and not _quiet(source):
            tail = ast.Expression(tree.body.pop().value)
        _evaluate(compile(tree, "<exec>", "exec", flags), namespace)
        if tail is None:
            return (True, None, None)
        value = _evaluate(compile(tail, "<exec>", "eval", flags), namespace)
        if value is None:
            return (True, None, None)
        return (True, _safe(str(value)), None)
    except BaseException as exc:
        return _failure(exc)
)PY";

// Generation of the active run; 0 when nothing is armed.
std::atomic<std::uint64_t> g_armed_generation{0};
// Generation the queued interrupt was aimed at.
std::atomic<std::uint64_t> g_targeted_generation{0};

int RaiseInterrupt(void*) {
    const auto generation = g_targeted_generation.exchange(0);
    if (generation == 0 || generation != g_armed_generation.load()) {
        return 0;
    }
    PyErr_SetString(PyExc_KeyboardInterrupt, "execution interrupted");
    return -1;
}

struct PythonError {
    std::string type;
    std::string text;
};

// Consumes the pending Python exception.
PythonError FetchPythonError() {
    PythonError error{"Exception", "unknown Python error"};
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) {
        return error;
    }
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> type_handle(type);
    bp::handle<> value_handle(bp::allow_null(value));
    bp::handle<> traceback_handle(bp::allow_null(traceback));
    try {
        bp::object type_object(type_handle);
        bp::object name = type_object.attr("__name__");
        error.type = bp::extract<std::string>(name)();
        bp::object formatter = bp::import("traceback").attr("format_exception");
        bp::object lines = formatter(
            type_object,
            value_handle ? bp::object(value_handle) : bp::object(),
            traceback_handle ? bp::object(traceback_handle) : bp::object());
        bp::object joined = bp::str("").attr("join")(lines);
        error.text = bp::extract<std::string>(joined)();
    } catch (const bp::error_already_set&) {
        PyErr_Clear();
    }
    return error;
}

class ArmedRun {
public:
    explicit ArmedRun(std::uint64_t generation) {
        g_armed_generation.store(generation);
    }
    ~ArmedRun() {
        g_armed_generation.store(0);
    }

    ArmedRun(const ArmedRun&) = delete;
    ArmedRun& operator=(const ArmedRun&) = delete;
};

}  // namespace

PythonInterpreter::PythonInterpreter(config::RuntimeConfig config)
    : config_(std::move(config)) {}

void PythonInterpreter::Initialize() {
    if (initialized_) {
        return;
    }
    // Plotting libraries must not look for a display.
    ::setenv("MPLBACKEND", "Agg", 0);
    if (!Py_IsInitialized()) {
        // 0: leave signal handling to the host process.
        Py_InitializeEx(0);
    }
    try {
        bp::object sys = bp::import("sys");
        // Anything printed outside a capture goes to diagnostics, never to
        // the protocol stream.
        sys.attr("stdout") = sys.attr("stderr");
        bp::object search_path = sys.attr("path");
        for (auto it = config_.python_path.rbegin(); it != config_.python_path.rend(); ++it) {
            search_path.attr("insert")(0, *it);
        }

        bp::dict helpers;
        helpers["__builtins__"] = bp::import("builtins");
        bp::exec(kBootstrap, helpers, helpers);
        helpers_ = helpers;
        main_namespace_ = bp::import("__main__").attr("__dict__");

        for (const auto& package : config_.preload_packages) {
            utils::LogInfo("runtime", "loading package " + package);
            bp::import(package.c_str());
        }
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        throw RuntimeInitError("python initialization failed: " + error.text);
    }
    initialized_ = true;
}

void PythonInterpreter::InstallCapture() {
    try {
        helpers_["install_capture"]();
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        throw std::runtime_error("failed to install output capture: " + error.text);
    }
}

CapturedOutput PythonInterpreter::RestoreCapture() noexcept {
    CapturedOutput captured{};
    try {
        bp::object streams = helpers_["restore_capture"]();
        bp::object out = streams[0];
        bp::object err = streams[1];
        captured.out = bp::extract<std::string>(out)();
        captured.err = bp::extract<std::string>(err)();
    } catch (const bp::error_already_set&) {
        const auto error = FetchPythonError();
        utils::LogError("capture", "restore failed: " + error.text);
        // Last resort: point both streams back at diagnostics.
        PyObject* sys_stderr = PySys_GetObject("__stderr__");
        if (sys_stderr) {
            PySys_SetObject("stdout", sys_stderr);
            PySys_SetObject("stderr", sys_stderr);
        }
    } catch (const std::exception& ex) {
        utils::LogError("capture", std::string("restore failed: ") + ex.what());
    }
    return captured;
}

RunOutcome PythonInterpreter::Run(const std::string& code, const CancellationToken& token) {
    RunOutcome outcome{};
    if (token.IsCancelled()) {
        outcome.status = RunStatus::kTimedOut;
        return outcome;
    }

    ArmedRun armed(++next_generation_);
    // A deadline that passed before arming found nothing to interrupt.
    if (token.IsCancelled()) {
        outcome.status = RunStatus::kTimedOut;
        return outcome;
    }
    try {
        bp::object result = helpers_["run"](code, main_namespace_);
        bp::object ok = result[0];
        bp::object detail = result[1];
        bp::object text = result[2];
        if (bp::extract<bool>(ok)()) {
            outcome.status = RunStatus::kCompleted;
            if (!detail.is_none()) {
                outcome.value = bp::extract<std::string>(detail)();
            }
        } else {
            outcome.status = RunStatus::kFailed;
            outcome.error_type = bp::extract<std::string>(detail)();
            outcome.error = bp::extract<std::string>(text)();
        }
    } catch (const bp::error_already_set&) {
        // The interrupt can land inside the helper itself.
        const auto error = FetchPythonError();
        outcome.status = RunStatus::kFailed;
        outcome.error_type = error.type;
        outcome.error = error.text;
    }

    if (token.IsCancelled()) {
        outcome.status = RunStatus::kTimedOut;
        outcome.value.reset();
    }
    return outcome;
}

void PythonInterpreter::Interrupt() {
    const auto generation = g_armed_generation.load();
    if (generation == 0) {
        return;
    }
    g_targeted_generation.store(generation);
    if (Py_AddPendingCall(RaiseInterrupt, nullptr) != 0) {
        utils::LogWarn("runtime", "interrupt queue is full; interrupt dropped");
    }
}

void PythonInterpreter::DisarmInterrupt() noexcept {
    g_armed_generation.store(0);
    g_targeted_generation.store(0);
}

}  // namespace pysandbox::runtime
