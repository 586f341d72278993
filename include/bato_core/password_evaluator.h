#ifndef BATO_CORE_PASSWORD_EVALUATOR_H
#define BATO_CORE_PASSWORD_EVALUATOR_H

#include <chrono>
#include <memory>
#include <string>

namespace bato_core {

struct EvaluatorOptions {
    std::chrono::milliseconds timeout{5000};
    std::string nodePath = "node"; // looked up on PATH when not absolute
};

// Turns the site's batoPass expression into the decryption password.
// Implementations throw ResolveError(EvaluatorFailed) on any failure, including
// timeouts and results that are not a non-empty string.
class PasswordEvaluator {
public:
    virtual ~PasswordEvaluator() = default;
    virtual std::string evaluate(const std::string& expression) const = 0;
    virtual std::string name() const = 0;
};

// Known expression shapes only: a quoted string literal, a '+' chain of quoted
// literals, or a bare integer. Runs in-process, no engine involved.
class LiteralEvaluator : public PasswordEvaluator {
public:
    std::string evaluate(const std::string& expression) const override;
    std::string name() const override { return "literal"; }
};

// Evaluates the expression with Duktape inside a forked child, so a runaway
// expression is stopped by killing the child once the timeout elapses.
class DuktapeEvaluator : public PasswordEvaluator {
public:
    explicit DuktapeEvaluator(const EvaluatorOptions& options = EvaluatorOptions{});
    std::string evaluate(const std::string& expression) const override;
    std::string name() const override { return "duktape"; }

private:
    EvaluatorOptions options_;
};

// Runs `node -e "console.log(JSON.stringify(<expr>))"` and reads stdout.
class NodeProcessEvaluator : public PasswordEvaluator {
public:
    explicit NodeProcessEvaluator(const EvaluatorOptions& options = EvaluatorOptions{});
    std::string evaluate(const std::string& expression) const override;
    std::string name() const override { return "node"; }

private:
    EvaluatorOptions options_;
};

// "duktape", "node" or "literal"; nullptr for anything else.
std::unique_ptr<PasswordEvaluator> makeEvaluator(const std::string& backend, const EvaluatorOptions& options);

} // namespace bato_core

#endif // BATO_CORE_PASSWORD_EVALUATOR_H
