// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license
// Example instrumented harness: an integer expression calculator

/**
 * Reads an expression from stdin, prints its value on stdout.
 *
 *   expr   := term (('+' | '-') term)*
 *   term   := factor (('*' | '/' | '%') factor)*
 *   factor := '-' factor | '(' expr ')' | number | 'max' '(' expr ',' expr ')'
 *
 * Every COV() site appends a line record, and consecutive sites an arc
 * record, to the file named by STVFUZZ_COVERAGE_FILE. Every evaluation
 * error is reported on stderr as "ERR:" followed by a traceback of the
 * evaluator frames, so each error site is a distinct crash for the fuzzer.
 */

#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::set<int> g_lines;
std::set<std::pair<int, int>> g_arcs;
int g_lastLine = -1;

struct Frame {
    const char* function;
    int line;
};
std::vector<Frame> g_frames;

/** Frames of the innermost throw, captured before unwinding */
std::vector<Frame> g_crashFrames;

void Hit(int line) {
    g_lines.insert(line);
    g_arcs.emplace(g_lastLine, line);
    g_lastLine = line;
    if (!g_frames.empty()) {
        g_frames.back().line = line;
    }
}

#define COV() Hit(__LINE__)

struct FrameGuard {
    explicit FrameGuard(const char* function) { g_frames.push_back({function, __LINE__}); }
    ~FrameGuard() { g_frames.pop_back(); }
};

class CalcError : public std::runtime_error {
public:
    CalcError(std::string type, const std::string& what)
        : std::runtime_error(what), m_type(std::move(type)) {
        if (g_crashFrames.empty()) {
            g_crashFrames = g_frames;
        }
    }
    const std::string& Type() const { return m_type; }

private:
    std::string m_type;
};

class Calculator {
public:
    explicit Calculator(std::string text) : m_text(std::move(text)) {}

    int64_t Evaluate() {
        FrameGuard frame("Evaluate");
        COV();
        int64_t value = ParseExpr();
        SkipSpaces();
        if (m_pos != m_text.size()) {
            COV();
            throw CalcError("SyntaxError", "unexpected character at offset " + std::to_string(m_pos));
        }
        COV();
        return value;
    }

private:
    std::string m_text;
    size_t m_pos{0};
    int m_depth{0};

    void SkipSpaces() {
        while (m_pos < m_text.size() && (m_text[m_pos] == ' ' || m_text[m_pos] == '\t' || m_text[m_pos] == '\n')) {
            ++m_pos;
        }
    }

    char Peek() {
        SkipSpaces();
        return m_pos < m_text.size() ? m_text[m_pos] : '\0';
    }

    int64_t ParseExpr() {
        FrameGuard frame("ParseExpr");
        COV();
        int64_t value = ParseTerm();
        while (true) {
            char op = Peek();
            if (op == '+') {
                COV();
                ++m_pos;
                if (__builtin_add_overflow(value, ParseTerm(), &value)) {
                    COV();
                    throw CalcError("OverflowError", "integer addition overflow");
                }
            } else if (op == '-') {
                COV();
                ++m_pos;
                if (__builtin_sub_overflow(value, ParseTerm(), &value)) {
                    COV();
                    throw CalcError("OverflowError", "integer subtraction overflow");
                }
            } else {
                COV();
                return value;
            }
        }
    }

    int64_t ParseTerm() {
        FrameGuard frame("ParseTerm");
        COV();
        int64_t value = ParseFactor();
        while (true) {
            char op = Peek();
            if (op == '*') {
                COV();
                ++m_pos;
                if (__builtin_mul_overflow(value, ParseFactor(), &value)) {
                    COV();
                    throw CalcError("OverflowError", "integer multiplication overflow");
                }
            } else if (op == '/') {
                COV();
                ++m_pos;
                int64_t divisor = ParseFactor();
                if (divisor == 0) {
                    COV();
                    throw CalcError("ZeroDivisionError", "integer division by zero");
                }
                if (divisor == -1) {
                    COV();
                    value = Negate(value);
                } else {
                    value /= divisor;
                }
            } else if (op == '%') {
                COV();
                ++m_pos;
                value = Modulo(value, ParseFactor());
            } else {
                COV();
                return value;
            }
        }
    }

    int64_t Modulo(int64_t value, int64_t divisor) {
        FrameGuard frame("Modulo");
        COV();
        if (divisor == 0) {
            COV();
            throw CalcError("ArithmeticError", "modulo by zero");
        }
        if (divisor == -1) {
            COV();
            return 0;
        }
        COV();
        return value % divisor;
    }

    int64_t Negate(int64_t value) {
        FrameGuard frame("Negate");
        COV();
        if (value == INT64_MIN) {
            COV();
            throw CalcError("OverflowError", "integer negation overflow");
        }
        return -value;
    }

    char At(size_t pos) {
        FrameGuard frame("At");
        COV();
        if (pos >= m_text.size()) {
            COV();
            throw CalcError("IndexError", "string index out of range");
        }
        return m_text[pos];
    }

    int64_t ParseFactor() {
        FrameGuard frame("ParseFactor");
        COV();
        char c = Peek();
        if (c == '-') {
            COV();
            ++m_pos;
            return Negate(ParseFactor());
        }
        if (c == '(') {
            COV();
            ++m_pos;
            if (++m_depth > 6) {
                COV();
                throw CalcError("RecursionError", "maximum nesting depth exceeded");
            }
            int64_t value = ParseExpr();
            if (Peek() != ')') {
                COV();
                throw CalcError("SyntaxError", "expected ')'");
            }
            COV();
            ++m_pos;
            --m_depth;
            return value;
        }
        if (c == 'm') {
            COV();
            return ParseMax();
        }
        if (c >= '0' && c <= '9') {
            COV();
            return ParseNumber();
        }
        COV();
        throw CalcError("SyntaxError", std::string("unexpected '") + (c == '\0' ? std::string("end of input") : std::string(1, c)) + "'");
    }

    int64_t ParseMax() {
        FrameGuard frame("ParseMax");
        COV();
        if (m_text.compare(m_pos, 4, "max(") != 0) {
            COV();
            throw CalcError("NameError", "unknown function");
        }
        m_pos += 4;
        int64_t a = ParseExpr();
        if (Peek() != ',') {
            COV();
            throw CalcError("SyntaxError", "expected ','");
        }
        ++m_pos;
        int64_t b = ParseExpr();
        // Reads past the end on "max(1,2" instead of reporting a syntax error
        if (At(m_pos) != ')') {
            COV();
            throw CalcError("SyntaxError", "expected ')'");
        }
        COV();
        ++m_pos;
        return a > b ? a : b;
    }

    int64_t ParseNumber() {
        FrameGuard frame("ParseNumber");
        COV();
        int64_t value = 0;
        size_t digits = 0;
        while (m_pos < m_text.size() && m_text[m_pos] >= '0' && m_text[m_pos] <= '9') {
            if (++digits > 18) {
                COV();
                throw CalcError("OverflowError", "integer literal too large");
            }
            value = value * 10 + (m_text[m_pos] - '0');
            ++m_pos;
        }
        COV();
        return value;
    }
};

void WriteCoverage() {
    const char* path = std::getenv("STVFUZZ_COVERAGE_FILE");
    if (path == nullptr || *path == '\0') {
        return;
    }
    FILE* file = std::fopen(path, "w");
    if (file == nullptr) {
        return;
    }
    std::fprintf(file, "# stvfuzz coverage records\n");
    for (int line : g_lines) {
        std::fprintf(file, "L\t%s\t%d\n", __FILE__, line);
    }
    for (const auto& arc : g_arcs) {
        std::fprintf(file, "B\t%s\t%d\t%d\n", __FILE__, arc.first, arc.second);
    }
    std::fclose(file);
}

void WriteTraceback(const std::string& type, const std::string& message) {
    std::cerr << "ERR:Traceback (most recent call last):" << std::endl;
    for (const Frame& frame : g_crashFrames) {
        std::cerr << "  File \"" << __FILE__ << "\", line " << frame.line << ", in " << frame.function << std::endl;
    }
    std::cerr << type << ": " << message << std::endl;
}

} // namespace

int main() {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    int rc = 0;
    try {
        Calculator calc(input);
        std::cout << calc.Evaluate() << std::endl;
    } catch (const CalcError& e) {
        WriteTraceback(e.Type(), e.what());
        rc = 1;
    }

    // Exit arc
    g_arcs.emplace(g_lastLine, -1);
    WriteCoverage();
    return rc;
}
