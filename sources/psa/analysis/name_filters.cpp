#include "psa/analysis/name_filters.h"
#include "psa/utils/string_utils.h"

namespace psa::analysis {

    BuiltinSet::BuiltinSet()
        : names_(python_builtins().begin(), python_builtins().end()) {}

    BuiltinSet::BuiltinSet(const std::vector<std::string>& extra_names)
        : BuiltinSet() {
        names_.insert(extra_names.begin(), extra_names.end());
    }

    bool BuiltinSet::contains(const std::string& name) const {
        return names_.contains(name);
    }

    const std::vector<std::string>& BuiltinSet::python_builtins() {
        static const std::vector<std::string> names = {
            // functions and types
            "abs", "aiter", "all", "anext", "any", "ascii", "bin", "bool", "breakpoint",
            "bytearray", "bytes", "callable", "chr", "classmethod", "compile", "complex",
            "copyright", "credits", "delattr", "dict", "dir", "divmod", "enumerate", "eval",
            "exec", "exit", "filter", "float", "format", "frozenset", "getattr", "globals",
            "hasattr", "hash", "help", "hex", "id", "input", "int", "isinstance",
            "issubclass", "iter", "len", "license", "list", "locals", "map", "max",
            "memoryview", "min", "next", "object", "oct", "open", "ord", "pow", "print",
            "property", "quit", "range", "repr", "reversed", "round", "set", "setattr",
            "slice", "sorted", "staticmethod", "str", "sum", "super", "tuple", "type",
            "vars", "zip", "__import__", "__build_class__",

            // constants
            "True", "False", "None", "NotImplemented", "Ellipsis", "__debug__",

            // exceptions and warnings
            "BaseException", "BaseExceptionGroup", "Exception", "ExceptionGroup",
            "ArithmeticError", "AssertionError", "AttributeError", "BlockingIOError",
            "BrokenPipeError", "BufferError", "BytesWarning", "ChildProcessError",
            "ConnectionAbortedError", "ConnectionError", "ConnectionRefusedError",
            "ConnectionResetError", "DeprecationWarning", "EOFError", "EncodingWarning",
            "EnvironmentError", "FileExistsError", "FileNotFoundError", "FloatingPointError",
            "FutureWarning", "GeneratorExit", "IOError", "ImportError", "ImportWarning",
            "IndentationError", "IndexError", "InterruptedError", "IsADirectoryError",
            "KeyError", "KeyboardInterrupt", "LookupError", "MemoryError",
            "ModuleNotFoundError", "NameError", "NotADirectoryError", "NotImplementedError",
            "OSError", "OverflowError", "PendingDeprecationWarning", "PermissionError",
            "ProcessLookupError", "RecursionError", "ReferenceError", "ResourceWarning",
            "RuntimeError", "RuntimeWarning", "StopAsyncIteration", "StopIteration",
            "SyntaxError", "SyntaxWarning", "SystemError", "SystemExit", "TabError",
            "TimeoutError", "TypeError", "UnboundLocalError", "UnicodeDecodeError",
            "UnicodeEncodeError", "UnicodeError", "UnicodeTranslateError", "UnicodeWarning",
            "UserWarning", "ValueError", "Warning", "ZeroDivisionError",

            // module and class dunders
            "__name__", "__file__", "__doc__", "__package__", "__spec__", "__loader__",
            "__builtins__", "__path__", "__annotations__", "__dict__", "__cached__",
            "__qualname__", "__module__", "__class__"
        };
        return names;
    }

    bool is_private_name(const std::string_view name, const core::PrivateConvention convention) {
        switch (convention) {
            case core::PrivateConvention::DUNDER:
                return name.size() > 4 && utils::starts_with(name, "__") && utils::ends_with(name, "__");
            case core::PrivateConvention::UNDERSCORE:
                return utils::starts_with(name, "_");
            case core::PrivateConvention::NONE:
            default:
                return false;
        }
    }

}
