#include "script_engine.hpp"
#include <pybind11/embed.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

namespace py = pybind11;

namespace sandlot {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* SNAPSHOT_FORMAT = "sandlot-snapshot/1";
constexpr int MAX_CONVERT_DEPTH = 100;
constexpr uint32_t MAX_RECURSION_LIMIT = 10000;
constexpr uint32_t RECURSION_HEADROOM = 20;
constexpr size_t STDOUT_LIMIT = 1 << 20;
constexpr auto INTERRUPT_RETRY = std::chrono::milliseconds(50);

// Support code installed once into a private namespace of the interpreter.
const char* RUNTIME_SOURCE = R"PY(
import ast
import builtins
import reprlib

FILENAME = '<code>'

BLOCKED_BUILTINS = frozenset({
    '__build_class__', '__import__', '__loader__', '__spec__', 'aiter', 'anext',
    'breakpoint', 'classmethod', 'compile', 'copyright', 'credits', 'delattr',
    'dir', 'eval', 'exec', 'exit', 'frozenset', 'getattr', 'globals', 'hasattr',
    'help', 'input', 'license', 'locals', 'memoryview', 'object', 'open',
    'property', 'quit', 'set', 'setattr', 'staticmethod', 'super', 'vars',
})

REJECTED_NODES = {
    ast.Import: 'import', ast.ImportFrom: 'import', ast.ClassDef: 'class',
    ast.Try: 'try', ast.With: 'with', ast.AsyncWith: 'async with',
    ast.Yield: 'yield', ast.YieldFrom: 'yield', ast.AsyncFunctionDef: 'async def',
    ast.AsyncFor: 'async for', ast.Await: 'await', ast.Global: 'global',
    ast.Nonlocal: 'nonlocal', ast.Delete: 'del', ast.Raise: 'raise',
    ast.Set: 'set literals', ast.SetComp: 'set comprehensions',
}
if hasattr(ast, 'TryStar'):
    REJECTED_NODES[ast.TryStar] = 'try'


def reject(node, message):
    line = getattr(node, 'lineno', 1)
    col = getattr(node, 'col_offset', 0) + 1
    raise SyntaxError(message, (FILENAME, line, col, None))


def check_tree(tree):
    for node in ast.walk(tree):
        construct = REJECTED_NODES.get(type(node))
        if construct is not None:
            reject(node, f"'{construct}' is not supported")
        if isinstance(node, ast.Attribute) and node.attr.startswith('_'):
            reject(node, f"access to private attribute '{node.attr}' is not allowed")
        if isinstance(node, ast.Name) and node.id.startswith('__'):
            reject(node, f"name '{node.id}' is not allowed")


def compile_unit(source):
    compile(source, FILENAME, 'exec', dont_inherit=True)
    tree = ast.parse(source, FILENAME, 'exec')
    check_tree(tree)
    tail, tail_line = None, 0
    if tree.body and isinstance(tree.body[-1], ast.Expr):
        last = tree.body.pop()
        tail = compile(ast.Expression(last.value), FILENAME, 'eval', dont_inherit=True)
        tail_line = last.lineno
    body = compile(tree, FILENAME, 'exec', dont_inherit=True)
    return body, tail, tail_line


def describe_syntax_error(exc):
    if isinstance(exc, SyntaxError):
        return f'line {exc.lineno or 1}: {exc.msg}'
    if isinstance(exc, (MemoryError, RecursionError)):
        return 'line 1: expression nested too deeply'
    return f'line 1: {exc}'


def describe_error(exc, tb, default_text):
    line = 0
    while tb is not None:
        if tb.tb_frame.f_code.co_filename == FILENAME:
            line = tb.tb_lineno or line
        tb = tb.tb_next
    text = str(exc) or default_text
    head = f'line {line or 1}: {type(exc).__name__}'
    return f'{head}: {text}' if text else head


class CappedWriter:
    def __init__(self, limit):
        self.parts = []
        self.size = 0
        self.limit = limit

    def write(self, text):
        room = self.limit - self.size
        if room > 0:
            chunk = text[:room]
            self.parts.append(chunk)
            self.size += len(chunk)
        return len(text)

    def flush(self):
        pass

    def getvalue(self):
        return ''.join(self.parts)


def make_builtins(out):
    table = {k: v for k, v in vars(builtins).items() if k not in BLOCKED_BUILTINS}

    def guarded_import(name, *args, **kwargs):
        raise ImportError(f"import of '{name}' is not allowed")

    def print(*args, sep=' ', end='\n', file=None, flush=False):
        builtins.print(*args, sep=sep, end=end, file=out)

    table['__import__'] = guarded_import
    table['print'] = print
    return table


_short = reprlib.Repr()
_short.maxlevel = 3
_short.maxstring = 80
_short.maxother = 80
_short.maxlist = _short.maxtuple = _short.maxset = _short.maxfrozenset = _short.maxdict = 20


def short_repr(obj):
    try:
        return _short.repr(obj)
    except Exception:
        return f'<{type(obj).__name__} object>'


_error_classes = {}


def error_class(name):
    cls = getattr(builtins, name, None)
    if isinstance(cls, type) and issubclass(cls, BaseException):
        return cls
    cls = _error_classes.get(name)
    if cls is None:
        cls = _error_classes[name] = type(name, (Exception,), {})
    return cls
)PY";

// The process-wide interpreter. Initialised on first use and never
// finalised; the GIL is released whenever no code unit is running.
class Interpreter {
public:
    static Interpreter& instance() {
        static Interpreter* interpreter = new Interpreter();
        return *interpreter;
    }

    // Requires the GIL.
    py::object fn(const char* name) const { return (*runtime_)[name]; }

private:
    Interpreter() {
        py::initialize_interpreter(false);
        runtime_ = new py::dict();
        py::exec(RUNTIME_SOURCE, *runtime_);
        std::cerr << "[engine] Embedded Python " << PY_VERSION << " ready\n";
        PyEval_SaveThread();
    }

    py::dict* runtime_ = nullptr;
};

std::string utf8_text(py::handle text) {
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text.ptr(), &size);
    if (data) return std::string(data, static_cast<size_t>(size));
    // Lone surrogates have no UTF-8 form.
    PyErr_Clear();
    auto bytes = py::reinterpret_steal<py::object>(PyUnicode_AsEncodedString(text.ptr(), "utf-8", "replace"));
    if (!bytes) throw py::error_already_set();
    return std::string(PyBytes_AS_STRING(bytes.ptr()), static_cast<size_t>(PyBytes_GET_SIZE(bytes.ptr())));
}

py::str make_str(const std::string& s) {
    auto obj = py::reinterpret_steal<py::str>(
        PyUnicode_DecodeUTF8(s.data(), static_cast<Py_ssize_t>(s.size()), "replace"));
    if (!obj) throw py::error_already_set();
    return obj;
}

void apply_recursion_limit(const ResourceLimits& limits) {
    uint32_t depth = std::min(limits.max_call_depth, MAX_RECURSION_LIMIT) + RECURSION_HEADROOM;
    py::module_::import("sys").attr("setrecursionlimit")(depth);
}

std::string type_name_of(py::error_already_set& e) {
    return reinterpret_cast<PyTypeObject*>(e.type().ptr())->tp_name;
}

// A conversion stopped by the sequence budget or the deadline. `type` is the
// Python exception name it surfaces as.
class ConversionLimit : public std::runtime_error {
public:
    ConversionLimit(std::string type, const std::string& message)
        : std::runtime_error(message), type_(std::move(type)) {}
    const std::string& type() const { return type_; }

private:
    std::string type_;
};

// ── Python → Value ──────────────────────────────────────────────

// Copies a Python object graph into a Value tree. Every list, tuple or dict
// slot is charged against the budget, so aliased containers cost once per
// appearance. A container already on the current path becomes an object
// rendered "[...]"; anything other than None, bool, int, float, str, list,
// tuple or dict becomes an object carrying a short repr.
class ValueConverter {
public:
    ValueConverter(size_t budget, Clock::time_point deadline, std::string timeout_text)
        : budget_(budget), remaining_(budget), deadline_(deadline),
          timeout_text_(std::move(timeout_text)) {}

    Value convert(py::handle obj) {
        charge(1);
        return convert(obj, 0);
    }

    size_t remaining() const { return remaining_; }

    // Rewind after a failed conversion.
    void restore(size_t remaining) {
        remaining_ = remaining;
        active_.clear();
    }

private:
    void charge(size_t n) {
        if (n > remaining_) {
            throw ConversionLimit("MemoryError", "value exceeds the sequence length limit of " +
                                                     std::to_string(budget_));
        }
        remaining_ -= n;
    }

    void tick() {
        if ((++steps_ & 0xFFF) == 0 && Clock::now() > deadline_) {
            throw ConversionLimit("TimeoutError", timeout_text_);
        }
    }

    Value opaque(py::handle obj) {
        py::object text = Interpreter::instance().fn("short_repr")(obj);
        return Value::object(Py_TYPE(obj.ptr())->tp_name, utf8_text(text));
    }

    Value convert(py::handle obj, int depth) {
        tick();
        PyObject* p = obj.ptr();
        if (p == Py_None) return Value::none();
        if (PyBool_Check(p)) return Value::boolean(p == Py_True);
        if (PyLong_Check(p)) {
            int overflow = 0;
            long long i = PyLong_AsLongLongAndOverflow(p, &overflow);
            if (overflow != 0) return opaque(obj);
            if (i == -1 && PyErr_Occurred()) throw py::error_already_set();
            return Value::integer(static_cast<int64_t>(i));
        }
        if (PyFloat_Check(p)) return Value::number(PyFloat_AsDouble(p));
        if (PyUnicode_Check(p)) return Value::string(utf8_text(obj));

        bool is_list = PyList_Check(p);
        bool is_tuple = PyTuple_Check(p);
        bool is_dict = PyDict_Check(p);
        if ((!is_list && !is_tuple && !is_dict) || depth >= MAX_CONVERT_DEPTH) return opaque(obj);
        if (!active_.insert(p).second) {
            return Value::object(Py_TYPE(p)->tp_name, is_list ? "[...]" : is_dict ? "{...}" : "(...)");
        }

        Value out;
        if (is_dict) {
            charge(2 * static_cast<size_t>(PyDict_Size(p)));
            out = Value::dict();
            Py_ssize_t pos = 0;
            PyObject* key = nullptr;
            PyObject* value = nullptr;
            while (PyDict_Next(p, &pos, &key, &value)) {
                Value k = convert(key, depth + 1);
                out.as_dict().set(k, convert(value, depth + 1));
            }
        } else {
            Py_ssize_t n = is_list ? PyList_GET_SIZE(p) : PyTuple_GET_SIZE(p);
            charge(static_cast<size_t>(n));
            std::vector<Value> items;
            items.reserve(static_cast<size_t>(n));
            for (Py_ssize_t i = 0; i < n; ++i) {
                PyObject* item = is_list ? PyList_GET_ITEM(p, i) : PyTuple_GET_ITEM(p, i);
                items.push_back(convert(item, depth + 1));
            }
            out = is_list ? Value::list(std::move(items)) : Value::tuple(std::move(items));
        }
        active_.erase(p);
        return out;
    }

    size_t budget_;
    size_t remaining_;
    Clock::time_point deadline_;
    std::string timeout_text_;
    uint64_t steps_ = 0;
    std::unordered_set<PyObject*> active_;
};

// ── Value → Python ──────────────────────────────────────────────

py::object to_python(const Value& v) {
    switch (v.kind()) {
        case ValueKind::None: return py::none();
        case ValueKind::Bool: return py::bool_(v.as_bool());
        case ValueKind::Int: return py::int_(v.as_int());
        case ValueKind::Float: return py::float_(v.as_float());
        case ValueKind::Str: return make_str(v.as_str());
        case ValueKind::Object: return make_str(v.as_object().text);
        case ValueKind::List: {
            py::list out;
            for (const auto& item : v.items()) out.append(to_python(item));
            return std::move(out);
        }
        case ValueKind::Tuple: {
            const auto& items = v.items();
            py::tuple out(items.size());
            for (size_t i = 0; i < items.size(); ++i) {
                PyTuple_SET_ITEM(out.ptr(), static_cast<Py_ssize_t>(i), to_python(items[i]).release().ptr());
            }
            return std::move(out);
        }
        case ValueKind::Dict: {
            py::dict out;
            for (const auto& [key, value] : v.as_dict().entries()) {
                out[to_python(key)] = to_python(value);
            }
            return std::move(out);
        }
    }
    return py::none();
}

// ── Execution ───────────────────────────────────────────────────

// One code unit running on its own worker thread. The host and the worker
// take turns: the host waits while the worker runs Python, the worker waits
// inside an external shim while the host serves the call.
class PythonExecution : public Execution {
public:
    PythonExecution(std::string source, py::object body, py::object tail, int tail_line,
                    std::vector<std::string> externals, const ResourceLimits& limits)
        : source_(std::move(source)), body_(std::move(body)), tail_(std::move(tail)),
          tail_line_(tail_line), externals_(std::move(externals)), limits_(limits) {}

    ~PythonExecution() override {
        if (worker_.joinable()) {
            // Still parked in a shim: unwind it.
            {
                std::lock_guard<std::mutex> lock(mutex_);
                reply_ = Reply{};
                reply_.abandon = true;
                turn_ = Turn::Worker;
            }
            cv_.notify_all();
            worker_.join();
        }
        py::gil_scoped_acquire gil;
        body_ = py::object();
        tail_ = py::object();
    }

    Progress start() override {
        if (state_ != RunState::Ready) throw std::logic_error("execution already started");
        deadline_ = Clock::now() + limits_.max_duration;
        turn_ = Turn::Worker;
        worker_ = std::thread([this] { run_worker(); });
        return wait_for_worker();
    }

    Progress resume(Value return_value) override {
        Reply reply;
        reply.value = std::move(return_value);
        return hand_back(std::move(reply));
    }

    Progress resume_error(const std::string& error_type, const std::string& message) override {
        Reply reply;
        reply.error_type = error_type;
        reply.error_message = message;
        return hand_back(std::move(reply));
    }

    std::string dump() const override { return snapshot_; }

private:
    enum class RunState { Ready, Paused, Finished };
    enum class Turn { Host, Worker };

    struct Reply {
        Value value;
        std::optional<std::string> error_type;
        std::string error_message;
        bool abandon = false;
    };

    struct Report {
        Progress progress;
        std::optional<std::string> error;
    };

    std::string timeout_text() const {
        return "execution exceeded the time limit of " + std::to_string(limits_.max_duration.count()) + " ms";
    }

    bool is_external(const std::string& name) const {
        return std::find(externals_.begin(), externals_.end(), name) != externals_.end();
    }

    // ── Host side ──

    Progress hand_back(Reply reply) {
        if (state_ != RunState::Paused) throw std::logic_error("execution is not paused at an external call");
        if (Clock::now() > deadline_) {
            reply = Reply{};
            reply.error_type = "TimeoutError";
            reply.error_message = timeout_text();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reply_ = std::move(reply);
            turn_ = Turn::Worker;
        }
        cv_.notify_all();
        return wait_for_worker();
    }

    Progress wait_for_worker() {
        Report report;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto host_turn = [this] { return turn_ == Turn::Host; };
            if (!cv_.wait_until(lock, deadline_, host_turn)) {
                timed_out_ = true;
                do {
                    lock.unlock();
                    interrupt_worker();
                    lock.lock();
                } while (!cv_.wait_for(lock, INTERRUPT_RETRY, host_turn));
            }
            report = std::move(report_);
            report_ = Report{};
        }

        if (!report.error && report.progress.kind == ProgressKind::ExternalCall) {
            state_ = RunState::Paused;
            return std::move(report.progress);
        }
        state_ = RunState::Finished;
        worker_.join();
        if (report.error) throw ScriptRuntimeError(*report.error);
        return std::move(report.progress);
    }

    // Raise TimeoutError in the worker at its next bytecode boundary.
    void interrupt_worker() {
        py::gil_scoped_acquire gil;
        std::lock_guard<std::mutex> lock(mutex_);
        if (turn_ == Turn::Worker && !user_code_done_ && worker_ident_ != 0) {
            PyThreadState_SetAsyncExc(worker_ident_, PyExc_TimeoutError);
        }
    }

    // ── Worker side ──

    void run_worker() {
        Report report;
        {
            py::gil_scoped_acquire gil;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                worker_ident_ = PyThread_get_thread_ident();
            }
            try {
                report = execute();
            } catch (const std::exception& e) {
                finish_user_code();
                report = Report{};
                report.error = std::string("line 1: RuntimeError: ") + e.what();
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            report_ = std::move(report);
            turn_ = Turn::Host;
        }
        cv_.notify_all();
    }

    // Stop further interrupts and drop one that has not been delivered yet.
    void finish_user_code() {
        std::lock_guard<std::mutex> lock(mutex_);
        user_code_done_ = true;
        PyThreadState_SetAsyncExc(worker_ident_, nullptr);
    }

    Report execute() {
        auto& interpreter = Interpreter::instance();
        Report report;
        py::object out = interpreter.fn("CappedWriter")(STDOUT_LIMIT);
        py::dict globals;
        py::object result;
        try {
            apply_recursion_limit(limits_);
            globals["__builtins__"] = interpreter.fn("make_builtins")(out);
            globals["__name__"] = "__main__";
            for (const auto& name : externals_) {
                globals[py::str(name)] = py::cpp_function(
                    [this, name](py::args args, py::kwargs kwargs) { return call_external(name, args, kwargs); },
                    py::name(name.c_str()));
            }
            eval_code(body_, globals);
            if (tail_ && !tail_.is_none()) result = eval_code(tail_, globals);
        } catch (py::error_already_set& e) {
            finish_user_code();
            report.error = describe_error(e);
            globals.clear();
            return report;
        }
        finish_user_code();

        try {
            ValueConverter converter(limits_.max_sequence_length, deadline_, timeout_text());
            if (result) report.progress.output = converter.convert(result);
            snapshot_ = take_snapshot(globals, out);
        } catch (const ConversionLimit& e) {
            report.error = "line " + std::to_string(tail_line_) + ": " + e.type() + ": " + e.what();
        } catch (py::error_already_set& e) {
            report.error = describe_error(e);
        }
        globals.clear();
        return report;
    }

    py::object eval_code(const py::object& code, const py::dict& globals) {
        PyObject* result = PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr());
        if (!result) throw py::error_already_set();
        return py::reinterpret_steal<py::object>(result);
    }

    std::string describe_error(py::error_already_set& e) {
        bool timed_out = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timed_out = timed_out_;
        }
        std::string default_text = timed_out && e.matches(PyExc_TimeoutError) ? timeout_text() : "";
        try {
            py::object trace = e.trace() ? py::object(e.trace()) : py::object(py::none());
            py::object text = Interpreter::instance().fn("describe_error")(e.value(), trace, default_text);
            return utf8_text(text);
        } catch (const std::exception&) {
            std::string head = "line 1: " + type_name_of(e);
            return default_text.empty() ? head : head + ": " + default_text;
        }
    }

    [[noreturn]] void raise_python(const std::string& type, const std::string& message) {
        py::object cls = Interpreter::instance().fn("error_class")(make_str(type));
        PyErr_SetObject(cls.ptr(), make_str(message).ptr());
        throw py::error_already_set();
    }

    // Body of every external shim. Runs on the worker with the GIL held.
    py::object call_external(const std::string& name, const py::args& args, const py::kwargs& kwargs) {
        ExternalCall call;
        call.function_name = name;
        try {
            ValueConverter converter(limits_.max_sequence_length, deadline_, timeout_text());
            for (auto arg : args) call.args.push_back(converter.convert(arg));
            for (auto item : kwargs) {
                call.kwargs.emplace_back(utf8_text(item.first), converter.convert(item.second));
            }
        } catch (const ConversionLimit& e) {
            raise_python(e.type(), e.what());
        }

        Reply reply = pause(std::move(call));
        if (reply.abandon) raise_python("SystemExit", "execution abandoned");
        if (reply.error_type) raise_python(*reply.error_type, reply.error_message);
        return to_python(reply.value);
    }

    Reply pause(ExternalCall call) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            report_ = Report{};
            report_.progress.kind = ProgressKind::ExternalCall;
            report_.progress.call = std::move(call);
            turn_ = Turn::Host;
        }
        cv_.notify_all();

        py::gil_scoped_release release;
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return turn_ == Turn::Worker; });
        Reply reply = std::move(reply_);
        reply_ = Reply{};
        return reply;
    }

    // MessagePack of the source, captured stdout and every global with a
    // JSON form. The snapshot shares the run's sequence budget per global and
    // stops at the deadline.
    std::string take_snapshot(const py::dict& globals, const py::object& out) {
        nlohmann::ordered_json snapshot;
        snapshot["format"] = SNAPSHOT_FORMAT;
        snapshot["source"] = source_;
        snapshot["stdout"] = utf8_text(out.attr("getvalue")());

        std::vector<std::pair<std::string, py::handle>> entries;
        for (auto item : globals) {
            if (!PyUnicode_Check(item.first.ptr())) continue;
            std::string name = utf8_text(item.first);
            if (name.rfind("__", 0) == 0 || is_external(name)) continue;
            entries.emplace_back(std::move(name), item.second);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        ValueConverter converter(limits_.max_sequence_length, deadline_, timeout_text());
        auto vars = nlohmann::ordered_json::object();
        bool truncated = false;
        for (const auto& [name, value] : entries) {
            size_t remaining = converter.remaining();
            try {
                vars[name] = to_json(converter.convert(value));
            } catch (const std::invalid_argument&) {
                // functions, sets and self-referencing containers have no JSON form
            } catch (const ConversionLimit& e) {
                converter.restore(remaining);
                if (e.type() == "TimeoutError") {
                    truncated = true;
                    break;
                }
                std::cerr << "[engine] Snapshot omits " << name << ": " << e.what() << "\n";
            }
        }
        snapshot["globals"] = std::move(vars);
        if (truncated) {
            snapshot["truncated"] = true;
            std::cerr << "[engine] Snapshot truncated at the deadline\n";
        }

        auto bytes = nlohmann::ordered_json::to_msgpack(snapshot);
        return std::string(bytes.begin(), bytes.end());
    }

    std::string source_;
    py::object body_;
    py::object tail_;
    int tail_line_;
    std::vector<std::string> externals_;
    ResourceLimits limits_;

    RunState state_ = RunState::Ready;
    Clock::time_point deadline_;
    std::thread worker_;
    std::string snapshot_;

    std::mutex mutex_;
    std::condition_variable cv_;
    Turn turn_ = Turn::Host;
    Reply reply_;
    Report report_;
    unsigned long worker_ident_ = 0;
    bool timed_out_ = false;
    bool user_code_done_ = false;
};

std::string describe_syntax_error(py::error_already_set& e) {
    try {
        py::object text = Interpreter::instance().fn("describe_syntax_error")(e.value());
        return utf8_text(text);
    } catch (const std::exception&) {
        return "line 1: " + type_name_of(e);
    }
}

} // namespace

std::unique_ptr<Execution> ScriptEngine::compile(const std::string& code,
                                                 const std::vector<std::string>& external_functions,
                                                 const ResourceLimits& limits) const {
    auto& interpreter = Interpreter::instance();
    py::gil_scoped_acquire gil;
    try {
        apply_recursion_limit(limits);
        auto unit = interpreter.fn("compile_unit")(make_str(code)).cast<py::tuple>();
        py::object body = unit[0];
        py::object tail = unit[1];
        int tail_line = unit[2].cast<int>();
        return std::make_unique<PythonExecution>(code, std::move(body), std::move(tail), tail_line,
                                                 external_functions, limits);
    } catch (py::error_already_set& e) {
        throw ScriptSyntaxError(describe_syntax_error(e));
    }
}

} // namespace sandlot
