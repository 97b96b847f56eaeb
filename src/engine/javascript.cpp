#include "engine/javascript.hpp"
#include <glog/logging.h>
#include <quickjs.h>
#include <chrono>
#include <memory>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;

namespace {

/**
 * @brief 一次执行的宿主状态，通过 opaque 指针传给 QuickJS 回调
 */
struct js_session {
    string stdout_data, stderr_data;
    bool stdout_truncated = false, stderr_truncated = false;
    int64_t stream_size;
    chrono::steady_clock::time_point deadline;
    bool timed_out = false;

    void append(bool to_stderr, const string &text) {
        string &data = to_stderr ? stderr_data : stdout_data;
        bool &truncated = to_stderr ? stderr_truncated : stdout_truncated;
        if (stream_size < 0) {
            data += text;
            return;
        }
        size_t room = data.size() < (size_t)stream_size ? (size_t)stream_size - data.size() : 0;
        if (text.size() > room) truncated = true;
        data.append(text, 0, min(room, text.size()));
    }
};

struct runtime_deleter {
    void operator()(JSRuntime *rt) const { JS_FreeRuntime(rt); }
};

struct context_deleter {
    void operator()(JSContext *ctx) const { JS_FreeContext(ctx); }
};

enum console_stream {
    CONSOLE_STDOUT = 0,
    CONSOLE_STDERR = 1
};

int interrupt_handler(JSRuntime *, void *opaque) {
    auto *session = static_cast<js_session *>(opaque);
    if (chrono::steady_clock::now() >= session->deadline) {
        session->timed_out = true;
        return 1;
    }
    return 0;
}

string to_std_string(JSContext *ctx, JSValueConst value) {
    size_t len;
    const char *str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        // toString 本身抛出了异常，丢弃它
        JS_FreeValue(ctx, JS_GetException(ctx));
        return "[unprintable]";
    }
    string result(str, len);
    JS_FreeCString(ctx, str);
    return result;
}

string format_value(JSContext *ctx, JSValueConst value) {
    if (JS_IsObject(value) && !JS_IsFunction(ctx, value) && !JS_IsError(ctx, value)) {
        JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
        if (JS_IsException(json)) {
            JS_FreeValue(ctx, JS_GetException(ctx));
        } else if (JS_IsString(json)) {
            string result = to_std_string(ctx, json);
            JS_FreeValue(ctx, json);
            return result;
        } else {
            JS_FreeValue(ctx, json);
        }
    }
    return to_std_string(ctx, value);
}

JSValue console_write(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv, int magic) {
    auto *session = static_cast<js_session *>(JS_GetContextOpaque(ctx));
    string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) line += ' ';
        line += format_value(ctx, argv[i]);
    }
    line += '\n';
    session->append(magic == CONSOLE_STDERR, line);
    return JS_UNDEFINED;
}

void install_console(JSContext *ctx) {
    static const pair<const char *, int> methods[] = {
        {"log", CONSOLE_STDOUT},
        {"info", CONSOLE_STDOUT},
        {"debug", CONSOLE_STDOUT},
        {"warn", CONSOLE_STDERR},
        {"error", CONSOLE_STDERR}};

    JSValue global = JS_GetGlobalObject(ctx);
    JSValue console = JS_NewObject(ctx);
    for (auto &[name, stream] : methods)
        JS_SetPropertyStr(ctx, console, name,
                          JS_NewCFunctionMagic(ctx, console_write, name, 1, JS_CFUNC_generic_magic, stream));
    JS_SetPropertyStr(ctx, global, "console", console);
    JS_FreeValue(ctx, global);
}

/**
 * @brief 只加载 ECMAScript 内置对象，不提供任何宿主能力
 */
unique_ptr<JSContext, context_deleter> new_sandbox_context(JSRuntime *rt) {
    unique_ptr<JSContext, context_deleter> ctx(JS_NewContextRaw(rt));
    if (!ctx) throw internal_error("unable to create JavaScript context");
    JS_AddIntrinsicBaseObjects(ctx.get());
    JS_AddIntrinsicDate(ctx.get());
    JS_AddIntrinsicEval(ctx.get());
    JS_AddIntrinsicStringNormalize(ctx.get());
    JS_AddIntrinsicRegExp(ctx.get());
    JS_AddIntrinsicJSON(ctx.get());
    JS_AddIntrinsicMapSet(ctx.get());
    JS_AddIntrinsicTypedArrays(ctx.get());
    JS_AddIntrinsicPromise(ctx.get());
    install_console(ctx.get());
    return ctx;
}

void report_exception(JSContext *ctx, js_session &session) {
    JSValue exception = JS_GetException(ctx);
    string message = "Uncaught " + to_std_string(ctx, exception) + "\n";
    if (JS_IsError(ctx, exception)) {
        JSValue stack = JS_GetPropertyStr(ctx, exception, "stack");
        if (JS_IsString(stack)) message += to_std_string(ctx, stack);
        JS_FreeValue(ctx, stack);
    }
    JS_FreeValue(ctx, exception);
    session.append(true, message);
}

}  // namespace

execution_result run_javascript(const string &code, const javascript_options &options) {
    elapsed_time timer;
    js_session session;
    session.stream_size = options.stream_size;
    session.deadline = chrono::steady_clock::now() +
                       chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(options.timeout));

    bool failed = false;
    {
        unique_ptr<JSRuntime, runtime_deleter> rt(JS_NewRuntime());
        if (!rt) throw internal_error("unable to create JavaScript runtime");
        if (options.memory_limit > 0)
            JS_SetMemoryLimit(rt.get(), (size_t)options.memory_limit);
        JS_SetMaxStackSize(rt.get(), 1 << 20);
        JS_SetInterruptHandler(rt.get(), interrupt_handler, &session);

        auto ctx = new_sandbox_context(rt.get());
        JS_SetContextOpaque(ctx.get(), &session);

        JSValue value = JS_Eval(ctx.get(), code.c_str(), code.size(), "main.js", JS_EVAL_TYPE_GLOBAL);
        if (JS_IsException(value)) {
            report_exception(ctx.get(), session);
            failed = true;
        }
        JS_FreeValue(ctx.get(), value);

        while (!failed && !session.timed_out) {
            JSContext *job_ctx;
            int ret = JS_ExecutePendingJob(rt.get(), &job_ctx);
            if (ret == 0) break;
            if (ret < 0) {
                report_exception(job_ctx, session);
                failed = true;
            }
        }
    }

    execution_result result;
    result.stdout_data = move(session.stdout_data);
    result.stderr_data = move(session.stderr_data);
    result.stdout_truncated = session.stdout_truncated;
    result.stderr_truncated = session.stderr_truncated;
    result.wall_time = timer.duration<chrono::duration<double>>().count();

    if (session.timed_out) {
        result.timed_out = true;
        result.status = status::EXECUTION_TIMEOUT;
    } else if (failed) {
        result.exitcode = 1;
        result.status = status::EXECUTION_FAILED;
    } else {
        result.exitcode = 0;
        result.status = status::SUCCESS;
    }
    result.success = result.status == status::SUCCESS;
    return result;
}

}  // namespace runner
