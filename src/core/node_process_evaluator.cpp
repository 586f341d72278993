#include "bato_core/password_evaluator.h"
#include "bato_core/child_process.h"
#include "bato_core/resolve_error.h"
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace bato_core {

namespace {

constexpr int kExecFailed = 127;

int execNode(const std::string& nodePath, const std::string& script, int outFd) {
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
        ::dup2(devNull, STDERR_FILENO);
    }
    if (::dup2(outFd, STDOUT_FILENO) < 0) {
        return kExecFailed;
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(nodePath.c_str()));
    argv.push_back(const_cast<char*>("-e"));
    argv.push_back(const_cast<char*>(script.c_str()));
    argv.push_back(nullptr);
    ::execvp(argv[0], argv.data());
    return kExecFailed;
}

} // namespace

NodeProcessEvaluator::NodeProcessEvaluator(const EvaluatorOptions& options) : options_(options) {}

std::string NodeProcessEvaluator::evaluate(const std::string& expression) const {
    const std::string script = "console.log(JSON.stringify(" + expression + "))";
    const std::string& nodePath = options_.nodePath;

    ChildResult result;
    try {
        result = runInChild([&](int outFd) { return execNode(nodePath, script, outFd); }, options_.timeout);
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
        throw ResolveError(ErrorKind::EvaluatorFailed, "node terminated abnormally");
    }
    if (result.exitCode == kExecFailed) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "could not run '" + nodePath + "'");
    }
    if (result.exitCode != 0) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "node exited with code " + std::to_string(result.exitCode));
    }

    std::string password;
    try {
        nlohmann::json value = nlohmann::json::parse(result.output);
        if (value.is_string()) {
            password = value.get<std::string>();
        } else if (value.is_number()) {
            password = value.dump();
        } else {
            throw ResolveError(ErrorKind::EvaluatorFailed, "expression did not produce a string");
        }
    } catch (const nlohmann::json::exception& e) {
        throw ResolveError(ErrorKind::EvaluatorFailed, std::string("unreadable node output: ") + e.what());
    }

    if (password.empty()) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "expression evaluated to an empty string");
    }
    return password;
}

} // namespace bato_core
