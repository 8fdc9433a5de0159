#include "sanityml/rules/rule_table.hpp"

namespace sanityml {
namespace rules {

namespace {

// Deny and gadget rules are matched in table order, so exact symbols are
// listed before the module wildcards that would also cover them.
const char* const DEFAULT_RULES = R"RULES(
# ---------------------------------------------------------------------------
# Module aliases applied before any symbol comparison
# ---------------------------------------------------------------------------
alias | __builtin__ | builtins
alias | posix | os
alias | nt | os
alias | cPickle | pickle
alias | _pickle | pickle
alias | copy_reg | copyreg
alias | commands | subprocess

# ---------------------------------------------------------------------------
# Code execution primitives (pickle and source)
# ---------------------------------------------------------------------------
deny | DENY_BUILTINS_EVAL | critical | builtins:eval | Evaluates arbitrary Python expressions
deny | DENY_BUILTINS_EXEC | critical | builtins:exec | Executes arbitrary Python code
deny | DENY_BUILTINS_EXECFILE | critical | builtins:execfile | Executes an arbitrary Python file
deny | DENY_BUILTINS_COMPILE | critical | builtins:compile | Compiles arbitrary code objects
deny | DENY_BUILTINS_IMPORT | critical | builtins:__import__ | Imports arbitrary modules at load time
deny | DENY_OS_SYSTEM | critical | os:system | Runs a shell command
deny | DENY_OS_POPEN | critical | os:popen | Runs a shell command and opens a pipe to it
deny | DENY_OS_EXEC | critical | os:exec* | Replaces the process with an arbitrary program
deny | DENY_OS_SPAWN | critical | os:spawn* | Starts an arbitrary program
deny | DENY_SUBPROCESS_GETOUTPUT | critical | subprocess:getoutput | Runs a shell command
deny | DENY_SUBPROCESS_GETSTATUSOUTPUT | critical | subprocess:getstatusoutput | Runs a shell command
deny | DENY_PTY_SPAWN | critical | pty:spawn | Spawns a process attached to a pseudo terminal
deny | DENY_RUNPY_RUN_PATH | critical | runpy:run_path | Executes an arbitrary Python file
deny | DENY_RUNPY_RUN_MODULE | critical | runpy:run_module | Executes an arbitrary Python module
deny | DENY_RUNPY_RUN_CODE | critical | runpy:_run_code | Executes an arbitrary code object
deny | DENY_NUMPY_RUNSTRING | critical | numpy.testing._private.utils:runstring | Executes a string of Python code

# ---------------------------------------------------------------------------
# Reconstruction gadgets (pickle only)
# ---------------------------------------------------------------------------
gadget | GADGET_BUILTINS_GETATTR | critical | builtins:getattr | Resolves arbitrary attributes, a building block for call chains
gadget | GADGET_BUILTINS_SETATTR | critical | builtins:setattr | Mutates arbitrary objects during load
gadget | GADGET_BUILTINS_DELATTR | critical | builtins:delattr | Mutates arbitrary objects during load
gadget | GADGET_BUILTINS_OPEN | critical | builtins:open | Opens files during load
gadget | GADGET_BUILTINS_APPLY | critical | builtins:apply | Calls an arbitrary callable
gadget | GADGET_BUILTINS_BREAKPOINT | critical | builtins:breakpoint | Enters an interactive debugger
gadget | GADGET_BUILTINS_INPUT | critical | builtins:input | Reads from the terminal during load
gadget | GADGET_BUILTINS_GLOBALS | critical | builtins:globals | Exposes the interpreter namespace
gadget | GADGET_OPERATOR_ATTRGETTER | critical | operator:attrgetter | Resolves arbitrary attributes
gadget | GADGET_OPERATOR_METHODCALLER | critical | operator:methodcaller | Calls arbitrary methods
gadget | GADGET_OS | critical | os:* | Operating system access during load
gadget | GADGET_SUBPROCESS | critical | subprocess:* | Process creation during load
gadget | GADGET_SYS | critical | sys:* | Interpreter state access during load
gadget | GADGET_SOCKET | critical | socket:* | Network access during load
gadget | GADGET_SHUTIL | critical | shutil:* | File system manipulation during load
gadget | GADGET_PTY | critical | pty:* | Pseudo terminal access during load
gadget | GADGET_WEBBROWSER | critical | webbrowser:* | Opens URLs during load
gadget | GADGET_CTYPES | critical | ctypes:* | Native code access during load
gadget | GADGET_IMPORTLIB | critical | importlib:* | Imports arbitrary modules during load
gadget | GADGET_PICKLE | critical | pickle:* | Nested deserialization of untrusted data
gadget | GADGET_MARSHAL | critical | marshal:* | Loads raw code objects
gadget | GADGET_TYPES | critical | types:* | Constructs code and function objects
gadget | GADGET_ASYNCIO | critical | asyncio:* | Process and network access during load
gadget | GADGET_MULTIPROCESSING | critical | multiprocessing:* | Process creation during load
gadget | GADGET_REQUESTS | critical | requests:* | Network access during load
gadget | GADGET_URLLIB_REQUEST | critical | urllib.request:* | Network access during load
gadget | GADGET_HTTPLIB | critical | httplib:* | Network access during load
gadget | GADGET_HTTP_CLIENT | critical | http.client:* | Network access during load
gadget | GADGET_AIOHTTP_CLIENT | critical | aiohttp.client:* | Network access during load
gadget | GADGET_TORCH_HUB | critical | torch.hub:* | Downloads and runs remote code

# ---------------------------------------------------------------------------
# Modules expected in model pickles; any other import is reported
# ---------------------------------------------------------------------------
allow | NON_ALLOWLISTED_GLOBAL | warn | builtins collections copyreg _codecs numpy torch torchvision sklearn scipy pandas joblib transformers tokenizers xgboost lightgbm datetime decimal fractions pathlib enum uuid argparse typing | Import of a module that model files do not normally reference

# ---------------------------------------------------------------------------
# Reconstruction chain shapes
# ---------------------------------------------------------------------------
shape | SHAPE_DENIED_CALL_CHAIN | critical | denied_call_chain | Calls the result of a dangerous call
shape | SHAPE_CALL_OF_CALL | warn | call_of_call | Calls the result of another call, a common obfuscation
shape | SHAPE_DYNAMIC_GLOBAL | warn | dynamic_global | Import target is computed on the stack and cannot be resolved statically
shape | SHAPE_UNRESOLVED_CALLEE | warn | unresolved_callee | Callable comes from an unresolved memo entry or external buffer
shape | DOTTED_ATTRIBUTE_TRAVERSAL | warn | dotted_attribute | Import name walks attributes of the module and can reach objects it merely imports

# ---------------------------------------------------------------------------
# Source imports
# ---------------------------------------------------------------------------
import | IMPORT_SUBPROCESS | warn | subprocess | Module can run shell commands
import | IMPORT_SOCKET | warn | socket | Module opens raw network connections
import | IMPORT_PTY | warn | pty | Module spawns processes on a pseudo terminal
import | IMPORT_PICKLE | info | pickle | Module deserializes arbitrary objects
import | IMPORT_CTYPES | info | ctypes | Module calls native code
import | IMPORT_MARSHAL | info | marshal | Module loads raw code objects

# ---------------------------------------------------------------------------
# Source patterns
# ---------------------------------------------------------------------------
pattern | SHELL_TRUE | critical | \bshell\s*=\s*True\b | Subprocess call runs through the shell
pattern | FORMATTED_SHELL_COMMAND | critical | \b(os\.system|os\.popen|subprocess\.(run|call|check_call|check_output|Popen))\s*\(\s*(f["']|["'][^"']*["']\s*(%|\.format\b|\+)) | Shell command built from formatted text
pattern | TORCH_LOAD_UNSAFE | warn | \btorch\.load\s*\((?![^)]*weights_only\s*=\s*True) | torch.load without weights_only=True unpickles arbitrary objects
pattern | PICKLE_LOAD | warn | \b(pickle|cPickle|dill|joblib|cloudpickle)\.loads?\s*\( | Deserializes arbitrary objects
pattern | YAML_UNSAFE_LOAD | warn | \byaml\.unsafe_load\s*\(|\byaml\.load(_all)?\s*\((?![^)]*Loader\s*=\s*(yaml\.)?(SafeLoader|CSafeLoader|BaseLoader)) | YAML load without a safe loader constructs arbitrary objects
pattern | NOTEBOOK_SHELL_ESCAPE | warn | ^\s*(!|%system\b|%%bash\b|%%sh\b|%%script\b) | Notebook cell runs a shell command
pattern | TRUST_REMOTE_CODE | warn | \btrust_remote_code\s*=\s*True\b | Downloads and runs model code from a remote repository

# ---------------------------------------------------------------------------
# Keras layers that embed code
# ---------------------------------------------------------------------------
layer | KERAS_LAMBDA_LAYER | warn | Lambda | Lambda layer carries serialized Python code
)RULES";

} // anonymous namespace

const std::string& default_rules_text() {
    static const std::string text(DEFAULT_RULES);
    return text;
}

} // namespace rules
} // namespace sanityml
