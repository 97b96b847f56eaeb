#include "engine/validator.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <algorithm>
#include "common/io_utils.hpp"

namespace runner {
using namespace std;

static const string PROCESS_SPAWNING = "process spawning";
static const string FILESYSTEM_ACCESS = "filesystem access";
static const string NETWORK_ACCESS = "network access";
static const string SYSTEM_CALL = "system call invocation";
static const string MODULE_IMPORT = "restricted module import";
static const string INTERPRETER_ESCAPE = "interpreter escape";
static const string DYNAMIC_EVALUATION = "dynamic code evaluation";
static const string EMBEDDED_CONTENT = "embedded content";
static const string STORAGE_ACCESS = "storage access";

validation_result validation_result::accept() {
    return {true, nullopt, status::SUCCESS};
}

validation_result validation_result::reject(runner::status status, const string &reason) {
    return {false, reason, status};
}

const vector<denylist_pattern> &builtin_denylist(language lang) {
    static const vector<denylist_pattern> python = {
        {"__import__", MODULE_IMPORT},
        {"eval(", DYNAMIC_EVALUATION},
        {"exec(", DYNAMIC_EVALUATION},
        {"compile(", DYNAMIC_EVALUATION},
        {"globals(", INTERPRETER_ESCAPE},
        {"locals(", INTERPRETER_ESCAPE},
        {"vars(", INTERPRETER_ESCAPE},
        {"open(", FILESYSTEM_ACCESS, true},
        {"file(", FILESYSTEM_ACCESS},
        {"system(", PROCESS_SPAWNING, true},
        {"popen(", PROCESS_SPAWNING, true},
        {"spawn(", PROCESS_SPAWNING, true},
        {"fork(", PROCESS_SPAWNING, true},
        {"kill(", SYSTEM_CALL, true},
        {"__builtins__", INTERPRETER_ESCAPE},
        {"__subclasses__", INTERPRETER_ESCAPE},
        {"__globals__", INTERPRETER_ESCAPE},
        {"__class__", INTERPRETER_ESCAPE},
        {"__bases__", INTERPRETER_ESCAPE},
        {"__mro__", INTERPRETER_ESCAPE},
        {"getattr(", INTERPRETER_ESCAPE},
        {"breakpoint(", INTERPRETER_ESCAPE}};

    static const vector<denylist_pattern> c = {
        {"unistd.h", SYSTEM_CALL},
        {"sys/", SYSTEM_CALL},
        {"signal.h", SYSTEM_CALL},
        {"dlfcn.h", MODULE_IMPORT},
        {"netinet/", NETWORK_ACCESS},
        {"arpa/", NETWORK_ACCESS},
        {"netdb.h", NETWORK_ACCESS},
        {"spawn.h", PROCESS_SPAWNING},
        {"fcntl.h", FILESYSTEM_ACCESS},
        {"dirent.h", FILESYSTEM_ACCESS},
        {"pwd.h", FILESYSTEM_ACCESS},
        {"grp.h", FILESYSTEM_ACCESS},
        {"termios.h", SYSTEM_CALL},
        {"system(", PROCESS_SPAWNING},
        {"popen(", PROCESS_SPAWNING},
        {"fork(", PROCESS_SPAWNING},
        {"execl(", PROCESS_SPAWNING},
        {"execv(", PROCESS_SPAWNING},
        {"execle(", PROCESS_SPAWNING},
        {"execvp(", PROCESS_SPAWNING},
        {"execve(", PROCESS_SPAWNING},
        {"kill(", SYSTEM_CALL},
        {"socket(", NETWORK_ACCESS},
        {"connect(", NETWORK_ACCESS},
        {"fopen(", FILESYSTEM_ACCESS},
        {"open(", FILESYSTEM_ACCESS},
        {"unlink(", FILESYSTEM_ACCESS},
        {"remove(", FILESYSTEM_ACCESS},
        {"rename(", FILESYSTEM_ACCESS},
        {"chmod(", FILESYSTEM_ACCESS},
        {"chdir(", FILESYSTEM_ACCESS},
        {"mkdir(", FILESYSTEM_ACCESS},
        {"rmdir(", FILESYSTEM_ACCESS},
        {"ptrace(", SYSTEM_CALL},
        {"syscall(", SYSTEM_CALL},
        {"dlopen(", MODULE_IMPORT},
        {"mmap(", SYSTEM_CALL},
        {"setuid(", SYSTEM_CALL},
        {"setsid(", SYSTEM_CALL},
        {"asm(", SYSTEM_CALL},
        {"asm volatile", SYSTEM_CALL},
        {"__asm__", SYSTEM_CALL}};

    static const vector<denylist_pattern> javascript = {
        {"require(", MODULE_IMPORT},
        {"import(", MODULE_IMPORT},
        {"import ", MODULE_IMPORT},
        {"export ", MODULE_IMPORT},
        {"process.", PROCESS_SPAWNING},
        {"child_process", PROCESS_SPAWNING},
        {"globalthis", INTERPRETER_ESCAPE},
        {"eval(", DYNAMIC_EVALUATION},
        {"new function", DYNAMIC_EVALUATION},
        {"__proto__", INTERPRETER_ESCAPE},
        {"fetch(", NETWORK_ACCESS},
        {"xmlhttprequest", NETWORK_ACCESS},
        {"websocket", NETWORK_ACCESS}};

    static const vector<denylist_pattern> html = {
        {"<iframe", EMBEDDED_CONTENT},
        {"<object", EMBEDDED_CONTENT},
        {"<embed", EMBEDDED_CONTENT},
        {"<base", EMBEDDED_CONTENT},
        {"http-equiv", EMBEDDED_CONTENT},
        {"javascript:", INTERPRETER_ESCAPE},
        {"document.cookie", STORAGE_ACCESS},
        {"localstorage", STORAGE_ACCESS},
        {"sessionstorage", STORAGE_ACCESS},
        {"xmlhttprequest", NETWORK_ACCESS},
        {"fetch(", NETWORK_ACCESS, true},
        {"websocket", NETWORK_ACCESS}};

    switch (lang) {
        case language::python: return python;
        case language::c: return c;
        case language::javascript: return javascript;
        case language::html: return html;
    }
    throw invalid_argument("Unrecognized language");
}

const vector<string> &restricted_python_modules() {
    static const vector<string> modules = {
        "os", "sys", "subprocess", "socket", "shutil", "ctypes", "importlib",
        "multiprocessing", "pty", "signal", "pathlib", "tempfile", "glob",
        "urllib", "http", "ftplib", "telnetlib", "smtplib", "pickle", "marshal",
        "builtins", "code", "codeop", "inspect", "gc", "resource", "fcntl",
        "posix", "mmap", "asyncio", "threading", "_thread", "webbrowser", "platform"};
    return modules;
}

static bool is_space(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

string normalize_code(const string &code) {
    string result;
    result.reserve(code.size());
    bool last_space = false;
    for (char ch : code) {
        if (is_space(ch)) {
            if (!last_space) result.push_back(' ');
            last_space = true;
        } else {
            result.push_back(ch >= 'A' && ch <= 'Z' ? ch - 'A' + 'a' : ch);
            last_space = false;
        }
    }
    return result;
}

// 多字节的 UTF-8 字符也视为标识符的一部分
static bool is_identifier(char ch) {
    unsigned char c = ch;
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c >= 0x80;
}

string compact_code(const string &normalized) {
    string result;
    result.reserve(normalized.size());
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (normalized[i] == ' ' &&
            !(i > 0 && i + 1 < normalized.size() && is_identifier(normalized[i - 1]) && is_identifier(normalized[i + 1])))
            continue;
        result.push_back(normalized[i]);
    }
    return result;
}

static bool matches(const string &text, const denylist_pattern &entry) {
    const string &pattern = entry.pattern;
    bool bounded = is_identifier(pattern.front());
    bool call = pattern.back() == '(';
    for (size_t pos = text.find(pattern); pos != string::npos; pos = text.find(pattern, pos + 1)) {
        if (!bounded || pos == 0) return true;
        char prev = text[pos - 1];
        if (is_identifier(prev)) continue;
        if (prev == '.' && call && !entry.member) continue;
        return true;
    }
    return false;
}

static bool is_restricted_module(const string &name) {
    // 只比较顶层包名，os.path 视为 os
    string top = name.substr(0, name.find('.'));
    auto &modules = restricted_python_modules();
    return find(modules.begin(), modules.end(), top) != modules.end();
}

optional<string> find_restricted_import(const string &code) {
    vector<string> statements;
    boost::split(statements, code, boost::is_any_of("\n;"));
    for (auto &raw : statements) {
        string statement = boost::algorithm::trim_copy(normalize_code(raw));
        if (statement.rfind("import ", 0) == 0) {
            vector<string> names;
            string rest = statement.substr(7);
            boost::split(names, rest, boost::is_any_of(","));
            for (auto &name : names) {
                string module = boost::algorithm::trim_copy(name);
                module = module.substr(0, module.find(' '));
                if (is_restricted_module(module)) return module;
            }
        } else if (statement.rfind("from ", 0) == 0) {
            string rest = statement.substr(5);
            string module = rest.substr(0, rest.find(' '));
            if (is_restricted_module(module)) return module;
        }
    }
    return nullopt;
}

validator::validator(const engine_config &config)
    : max_code_length(config.max_code_length) {
    for (auto &info : get_languages()) {
        auto &list = patterns[info.lang];
        for (auto &entry : builtin_denylist(info.lang))
            list.push_back({normalize_code(entry.pattern), entry.category, entry.member});
        if (config.denylist.count(info.lang))
            for (auto &pattern : config.denylist.at(info.lang))
                if (!pattern.empty())
                    list.push_back({normalize_code(pattern), "custom"});
    }
}

validation_result validator::validate(const string &code, const string &language_id) const {
    if (all_of(code.begin(), code.end(), is_space))
        return validation_result::reject(status::INVALID_INPUT, "Code cannot be empty");

    if (!utf8_check_is_valid(code))
        return validation_result::reject(status::INVALID_INPUT, "Code must be valid UTF-8");

    if (utf8_length(code) > max_code_length)
        return validation_result::reject(status::INVALID_INPUT,
                                         fmt::format("Code too long. Maximum {} characters allowed.", max_code_length));

    auto lang = parse_language(language_id);
    if (!lang)
        return validation_result::reject(status::INVALID_INPUT, "Unsupported language: " + language_id);

    string normalized = normalize_code(code);
    string compacted = compact_code(normalized);
    for (auto &entry : patterns.at(*lang)) {
        // 不含空白的模式在压缩后的代码中查找，以识别 "eval (" 这样的写法
        bool found = entry.pattern.find(' ') == string::npos ? matches(compacted, entry) : matches(normalized, entry);
        if (found) {
            DLOG(INFO) << "Code rejected by pattern " << entry.pattern;
            return validation_result::reject(status::VALIDATION_REJECTED,
                                             "Potentially dangerous code detected: " + entry.category);
        }
    }

    if (*lang == language::python) {
        if (auto module = find_restricted_import(code)) {
            DLOG(INFO) << "Code rejected for importing " << *module;
            return validation_result::reject(status::VALIDATION_REJECTED,
                                             "Potentially dangerous code detected: " + MODULE_IMPORT);
        }
    }

    return validation_result::accept();
}

}  // namespace runner
