#include "bato_core/password_evaluator.h"
#include "bato_core/resolve_error.h"
#include <cctype>

namespace bato_core {

namespace {

void skipSpace(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
}

// Integers JS would print differently (leading zeros, negative zero, beyond
// 2^53) are out of shape.
constexpr size_t kMaxIntegerDigits = 15;

// Reads a single- or double-quoted literal starting at s[i]; i ends past the
// closing quote. Escapes other than quote, backslash, n, t and r are rejected.
bool readQuoted(const std::string& s, size_t& i, std::string& out) {
    const char quote = s[i++];
    while (i < s.size()) {
        char c = s[i++];
        if (c == quote) return true;
        if (c == '\\') {
            if (i >= s.size()) return false;
            char e = s[i++];
            switch (e) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case '\'':
                case '"':
                case '\\': out += e; break;
                default:
                    throw ResolveError(ErrorKind::EvaluatorFailed,
                                       std::string("unsupported escape sequence '\\") + e + "'");
            }
        } else {
            out += c;
        }
    }
    return false;
}

} // namespace

std::string LiteralEvaluator::evaluate(const std::string& expression) const {
    size_t i = 0;
    skipSpace(expression, i);
    if (i == expression.size()) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "empty expression");
    }

    std::string result;
    const char first = expression[i];
    if (std::isdigit(static_cast<unsigned char>(first)) || first == '-') {
        size_t start = i++;
        while (i < expression.size() && std::isdigit(static_cast<unsigned char>(expression[i]))) ++i;
        result = expression.substr(start, i - start);
        skipSpace(expression, i);
        if (i != expression.size() || result == "-") {
            throw ResolveError(ErrorKind::EvaluatorFailed, "unsupported expression shape");
        }
        const std::string digits = result[0] == '-' ? result.substr(1) : result;
        if ((digits.size() > 1 && digits[0] == '0') || result == "-0" || digits.size() > kMaxIntegerDigits) {
            throw ResolveError(ErrorKind::EvaluatorFailed, "unsupported integer literal '" + result + "'");
        }
        return result;
    }

    while (true) {
        if (i >= expression.size() || (expression[i] != '\'' && expression[i] != '"')) {
            throw ResolveError(ErrorKind::EvaluatorFailed, "unsupported expression shape");
        }
        if (!readQuoted(expression, i, result)) {
            throw ResolveError(ErrorKind::EvaluatorFailed, "unterminated string literal");
        }
        skipSpace(expression, i);
        if (i == expression.size()) break;
        if (expression[i] != '+') {
            throw ResolveError(ErrorKind::EvaluatorFailed, "unsupported expression shape");
        }
        ++i;
        skipSpace(expression, i);
    }

    if (result.empty()) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "expression evaluated to an empty string");
    }
    return result;
}

std::unique_ptr<PasswordEvaluator> makeEvaluator(const std::string& backend, const EvaluatorOptions& options) {
    if (backend == "duktape") {
        return std::make_unique<DuktapeEvaluator>(options);
    }
    if (backend == "node") {
        return std::make_unique<NodeProcessEvaluator>(options);
    }
    if (backend == "literal") {
        return std::make_unique<LiteralEvaluator>();
    }
    return nullptr;
}

} // namespace bato_core
