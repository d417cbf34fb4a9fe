#include "sandbox/harness.h"

namespace analysis_sandbox {

namespace {

// Analysis aliases bound into the namespace when installed and referenced
const char* const kAliases[][2] = {
    {"pd", "pandas"},
    {"np", "numpy"},
    {"plt", "matplotlib.pyplot"},
    {"sns", "seaborn"},
    {"px", "plotly.express"},
    {"go", "plotly.graph_objects"},
    {"stats", "scipy.stats"},
};

const char kHarness[] = R"PY(
import base64
import builtins
import importlib
import io
import json
import math
import os
import re
import sys
import traceback
import types


def _diag(message):
    try:
        sys.stderr.write("harness: %s\n" % message)
        sys.stderr.flush()
    except Exception:
        pass


def _write_envelope(fd, envelope):
    data = json.dumps(envelope, allow_nan=False).encode("utf-8")
    view = memoryview(data)
    while view:
        written = os.write(fd, view)
        view = view[written:]
    os.close(fd)


def _fail(fd, kind, message):
    _write_envelope(fd, {"status": "error",
                         "error": {"kind": kind, "type": "", "message": message,
                                   "traceback": ""},
                         "images": [], "figures": [], "variables": {}})


def _load_aliases(aliases, code):
    loaded = {}
    for alias, module_name in aliases:
        if not re.search(r"\b%s\b" % re.escape(alias), code):
            continue
        try:
            if module_name.startswith("matplotlib"):
                import matplotlib
                matplotlib.use("Agg")
            loaded[alias] = importlib.import_module(module_name)
        except Exception as exc:
            _diag("alias %s unavailable: %s" % (alias, exc))
    return loaded


def _build_frame(frame):
    try:
        import pandas
    except Exception:
        pandas = None
    if pandas is not None:
        if isinstance(frame, dict):
            return pandas.DataFrame(frame)
        return pandas.DataFrame.from_records(frame)
    if isinstance(frame, dict):
        return {name: list(column) for name, column in frame.items()}
    columns = {}
    for record in frame:
        for name in record:
            columns.setdefault(name, [])
    for record in frame:
        for name, column in columns.items():
            column.append(record.get(name))
    return columns


class ReadOnlyDatabase(object):
    _ALLOWED = (20, 21, 31, 33)  # READ, SELECT, FUNCTION, RECURSIVE

    def __init__(self, path):
        import sqlite3
        from urllib.parse import quote
        allowed = self._ALLOWED

        def authorize(action, arg1, arg2, db_name, source):
            return sqlite3.SQLITE_OK if action in allowed else sqlite3.SQLITE_DENY

        self._conn = sqlite3.connect("file:%s?mode=ro" % quote(path), uri=True)
        self._conn.set_authorizer(authorize)

    def _check(self, sql):
        text = re.sub(r"^(\s+|--[^\n]*\n?|/\*.*?\*/)+", "", sql, flags=re.S)
        head = text.split(None, 1)[0].lower() if text.strip() else ""
        if head not in ("select", "with"):
            raise PermissionError("Only SELECT queries are allowed")

    def query(self, sql, params=()):
        self._check(sql)
        cursor = self._conn.execute(sql, params)
        names = [d[0] for d in cursor.description or ()]
        return [dict(zip(names, row)) for row in cursor.fetchall()]

    def query_df(self, sql, params=()):
        rows = self.query(sql, params)
        try:
            import pandas
        except Exception:
            return rows
        return pandas.DataFrame.from_records(rows)

    def tables(self):
        rows = self.query("SELECT name FROM sqlite_master WHERE type = 'table' ORDER BY name")
        return [row["name"] for row in rows]

    def close(self):
        self._conn.close()


def _module_guard(forbidden):
    # Real modules live only in this closure; user code sees proxies whose
    # attribute lookups never hand out a forbidden module.
    targets = {}
    proxies = {}

    class GuardedModule(types.ModuleType):
        def __getattribute__(self, name):
            return guard(getattr(targets[id(self)], name))

        def __setattr__(self, name, value):
            setattr(targets[id(self)], name, value)

        def __delattr__(self, name):
            delattr(targets[id(self)], name)

        def __dir__(self):
            return dir(targets[id(self)])

        def __repr__(self):
            return repr(targets[id(self)])

    def guard(value):
        if not isinstance(value, types.ModuleType) or isinstance(value, GuardedModule):
            return value
        top = value.__name__.split(".")[0]
        if top in forbidden:
            raise AttributeError("Access to module '%s' is not allowed" % top)
        proxy = proxies.get(id(value))
        if proxy is None:
            proxy = GuardedModule(value.__name__)
            targets[id(proxy)] = value
            proxies[id(value)] = proxy
        return proxy

    return guard


def _guarded_import(real_import, forbidden, guard):
    def guarded(name, globals=None, locals=None, fromlist=(), level=0):
        if level == 0 and name.split(".")[0] in forbidden:
            raise ImportError("Import of module '%s' is not allowed" % name.split(".")[0])
        return guard(real_import(name, globals, locals, fromlist, level))
    return guarded


def _is_plain(value, depth=0):
    if depth > 32:
        return False
    kind = type(value)
    if value is None or kind in (bool, int, str):
        return True
    if kind is float:
        return math.isfinite(value)
    if kind in (list, tuple):
        return all(_is_plain(item, depth + 1) for item in value)
    if kind is dict:
        return all(type(k) is str and _is_plain(v, depth + 1) for k, v in value.items())
    return False


def _capture_variables(namespace, excluded, max_chars):
    variables = {}
    for name, value in list(namespace.items()):
        if name.startswith("_") or name in excluded:
            continue
        if isinstance(value, types.ModuleType) or isinstance(value, type) or callable(value):
            continue
        if not _is_plain(value):
            continue
        try:
            text = json.dumps(value, allow_nan=False)
        except (TypeError, ValueError):
            continue
        if len(text) <= max_chars:
            variables[name] = json.loads(text)
    return variables


def _capture_images():
    images = []
    plt = sys.modules.get("matplotlib.pyplot")
    if plt is None:
        return images
    for number in plt.get_fignums():
        buffer = io.BytesIO()
        try:
            plt.figure(number).savefig(buffer, format="png", bbox_inches="tight", dpi=100)
        except Exception as exc:
            _diag("figure %s not rendered: %s" % (number, exc))
            continue
        images.append(base64.b64encode(buffer.getvalue()).decode("ascii"))
    plt.close("all")
    return images


def _capture_figures(namespace):
    figures = []
    graph_objects = sys.modules.get("plotly.graph_objects")
    if graph_objects is None:
        return figures
    for name, value in list(namespace.items()):
        if name.startswith("_") or not isinstance(value, graph_objects.Figure):
            continue
        try:
            figures.append({"type": "plotly", "name": name, "data": json.loads(value.to_json())})
        except Exception as exc:
            _diag("plotly figure %s not serialized: %s" % (name, exc))
    return figures


def _main():
    request = json.loads(sys.stdin.buffer.read().decode("utf-8"))
    result_fd = int(request.get("result_fd", 3))
    try:
        code = request["code"]
        aliases = _load_aliases(request.get("aliases", []), code)
        bindings = {"df": _build_frame(request["df"])}
        if request.get("database"):
            bindings["db"] = ReadOnlyDatabase(request["database"])
        bindings.update(request.get("values", {}))

        forbidden_callables = set(request.get("forbidden_callables", []))
        forbidden_modules = set(request.get("forbidden_modules", []))
        guard = _module_guard(forbidden_modules)
        safe_builtins = {name: value for name, value in vars(builtins).items()
                         if name not in forbidden_callables}
        safe_builtins["__import__"] = _guarded_import(
            builtins.__import__, forbidden_modules, guard)

        namespace = {"__builtins__": safe_builtins, "__name__": "__main__"}
        namespace.update({alias: guard(module) for alias, module in aliases.items()})
        namespace.update(bindings)
        excluded = set(aliases) | set(bindings)
        compiled = compile(code, "<analysis>", "exec")
    except Exception as exc:
        _fail(result_fd, "InternalError", "Harness bootstrap failed: %s: %s"
              % (type(exc).__name__, exc))
        return

    envelope = {"status": "ok", "error": None}
    keep_artifacts = True
    try:
        exec(compiled, namespace)
    except MemoryError:
        keep_artifacts = False
        envelope = {"status": "error",
                    "error": {"kind": "ResourceExceeded", "type": "MemoryError",
                              "message": "Memory limit exceeded", "traceback": ""}}
    except BaseException as exc:
        tb = exc.__traceback__.tb_next if exc.__traceback__ is not None else None
        envelope = {"status": "error",
                    "error": {"kind": "RuntimeException", "type": type(exc).__name__,
                              "message": "%s: %s" % (type(exc).__name__, exc),
                              "traceback": "".join(
                                  traceback.format_exception(type(exc), exc, tb))}}
    try:
        sys.stdout.flush()
    except Exception:
        pass

    envelope["images"] = []
    envelope["figures"] = []
    envelope["variables"] = {}
    if keep_artifacts:
        try:
            envelope["images"] = _capture_images()
            envelope["figures"] = _capture_figures(namespace)
            envelope["variables"] = _capture_variables(
                namespace, excluded, int(request.get("max_variable_chars", 10000)))
        except MemoryError:
            envelope = {"status": "error",
                        "error": {"kind": "ResourceExceeded", "type": "MemoryError",
                                  "message": "Memory limit exceeded", "traceback": ""},
                        "images": [], "figures": [], "variables": {}}
    _write_envelope(result_fd, envelope)


_main()
)PY";

}  // namespace

const std::string& HarnessSource() {
  static const std::string source(kHarness);
  return source;
}

nlohmann::json BuildHarnessRequest(const std::string& code,
                                   const ExecutionContext& context,
                                   const Policy& policy) {
  nlohmann::json request;
  request["code"] = code;
  request["df"] = context.data_frame;
  request["values"] = nlohmann::json::object();
  for (const auto& [name, value] : context.values) {
    request["values"][name] = value;
  }
  if (!context.database_path.empty()) {
    request["database"] = context.database_path;
  }

  request["forbidden_callables"] = policy.forbidden_callables;
  request["forbidden_modules"] = policy.forbidden_modules;

  nlohmann::json aliases = nlohmann::json::array();
  for (const auto& alias : kAliases) {
    aliases.push_back({alias[0], alias[1]});
  }
  request["aliases"] = std::move(aliases);

  request["max_variable_chars"] = kMaxVariableChars;
  request["result_fd"] = kResultFd;
  return request;
}

}  // namespace analysis_sandbox
