#include "bato_core/password_evaluator.h"
#include "bato_core/child_process.h"
#include "bato_core/resolve_error.h"
#include <duktape.h>
#include <system_error>

namespace bato_core {

namespace {

// Exit codes of the evaluation child.
constexpr int kHeapFailed = 1;
constexpr int kEvalError = 2;
constexpr int kNotAString = 3;
constexpr int kWriteFailed = 4;

int evaluateInHeap(const std::string& expression, int outFd) {
    duk_context* ctx = duk_create_heap_default();
    if (!ctx) {
        return kHeapFailed;
    }

    int rc = 0;
    if (duk_peval_lstring(ctx, expression.data(), expression.size()) != 0) {
        duk_size_t len = 0;
        const char* message = duk_safe_to_lstring(ctx, -1, &len);
        writeAll(outFd, message, len);
        rc = kEvalError;
    } else if (duk_is_string(ctx, -1) || duk_is_number(ctx, -1)) {
        duk_size_t len = 0;
        const char* value = duk_safe_to_lstring(ctx, -1, &len);
        rc = writeAll(outFd, value, len) ? 0 : kWriteFailed;
    } else {
        rc = kNotAString;
    }
    duk_pop(ctx);
    duk_destroy_heap(ctx);
    return rc;
}

} // namespace

DuktapeEvaluator::DuktapeEvaluator(const EvaluatorOptions& options) : options_(options) {}

std::string DuktapeEvaluator::evaluate(const std::string& expression) const {
    ChildResult result;
    try {
        result = runInChild([&expression](int outFd) { return evaluateInHeap(expression, outFd); },
                            options_.timeout);
    } catch (const std::system_error& e) {
        throw ResolveError(ErrorKind::EvaluatorFailed, std::string("could not start evaluator: ") + e.what());
    }

    if (result.timedOut) {
        throw ResolveError(ErrorKind::EvaluatorFailed,
                           "timed out after " + std::to_string(options_.timeout.count()) + " ms");
    }
    if (result.truncated) {
        throw ResolveError(ErrorKind::EvaluatorFailed,
                           "result exceeds " + std::to_string(kMaxChildOutput) + " bytes");
    }
    if (!result.exitedNormally) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "evaluator process terminated abnormally");
    }
    switch (result.exitCode) {
        case 0:
            break;
        case kHeapFailed:
            throw ResolveError(ErrorKind::EvaluatorFailed, "failed to create Duktape heap");
        case kEvalError:
            throw ResolveError(ErrorKind::EvaluatorFailed, "expression raised: " + result.output);
        case kNotAString:
            throw ResolveError(ErrorKind::EvaluatorFailed, "expression did not produce a string");
        default:
            throw ResolveError(ErrorKind::EvaluatorFailed,
                               "evaluator exited with code " + std::to_string(result.exitCode));
    }

    if (result.output.empty()) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "expression evaluated to an empty string");
    }
    return result.output;
}

} // namespace bato_core
