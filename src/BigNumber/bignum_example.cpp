#include "Big.hpp"

#include <iostream>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bignum;

/**
 * Small calculator showing how to use Big from the outside.
 *
 * Usage: bignum_example [--fixed N | --exp N] [expression]
 *
 * An expression is a single value, "<fn> <value>" with fn one of neg, abs,
 * log10, ln, or "<value> <op> <value>" with op one of + - * / % ^ cmp.
 * Without an expression argument, expressions are read from stdin, one per line.
 */

namespace {

enum class OutputForm { Default, Fixed, Exponential };

struct Options {
    OutputForm form{OutputForm::Default};
    std::size_t places{2};
    std::vector<std::string> expression;
};

std::string render(const Big& value, const Options& options) {
    switch (options.form) {
        case OutputForm::Fixed: return value.toFixed(options.places);
        case OutputForm::Exponential: return value.toExponential(options.places);
        default: return value.toString();
    }
}

double toDouble(const std::string& text) {
    // The power is a plain double, not a Big
    std::size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument("not a plain number: '" + text + "'");
    }
    return value;
}

std::string evaluate(const std::vector<std::string>& tokens, const Options& options) {
    std::ostringstream out;

    if (tokens.size() == 1) {
        out << render(Big::fromString(tokens[0]), options);
    } else if (tokens.size() == 2) {
        const std::string& fn = tokens[0];
        Big value = Big::fromString(tokens[1]);
        if (fn == "neg") out << render(-value, options);
        else if (fn == "abs") out << render(value.abs(), options);
        else if (fn == "log10") out << value.log10();
        else if (fn == "ln") out << value.ln();
        else throw std::invalid_argument("unknown function '" + fn + "'");
    } else if (tokens.size() == 3) {
        const std::string& op = tokens[1];
        Big lhs = Big::fromString(tokens[0]);
        if (op == "^") {
            out << render(lhs.pow(toDouble(tokens[2])), options);
            return out.str();
        }
        Big rhs = Big::fromString(tokens[2]);
        if (op == "+") out << render(lhs + rhs, options);
        else if (op == "-") out << render(lhs - rhs, options);
        else if (op == "*") out << render(lhs * rhs, options);
        else if (op == "/") out << render(lhs / rhs, options);
        else if (op == "%") out << render(lhs % rhs, options);
        else if (op == "cmp") out << compare(lhs, rhs);
        else throw std::invalid_argument("unknown operator '" + op + "'");
    } else {
        throw std::invalid_argument("expected 1 to 3 tokens, got " + std::to_string(tokens.size()));
    }
    return out.str();
}

std::vector<std::string> splitTokens(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool runExpression(const std::vector<std::string>& tokens, const Options& options) {
    try {
        std::cout << evaluate(tokens, options) << std::endl;
        return true;
    } catch (const BigParseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: number out of range (" << e.what() << ")" << std::endl;
    } catch (const std::length_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: result too large to print, try --exp" << std::endl;
    }
    return false;
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--fixed" || arg == "--exp") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a digit count" << std::endl;
                return false;
            }
            try {
                options.places = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: invalid digit count '" << argv[i] << "'" << std::endl;
                return false;
            }
            options.form = arg == "--fixed" ? OutputForm::Fixed : OutputForm::Exponential;
        } else {
            options.expression.push_back(arg);
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        std::cerr << "Usage: " << argv[0] << " [--fixed N | --exp N] [expression]" << std::endl;
        return 2;
    }

    if (!options.expression.empty()) {
        return runExpression(options.expression, options) ? 0 : 1;
    }

    bool ok = true;
    std::string line;
    while (std::getline(std::cin, line)) {
        auto tokens = splitTokens(line);
        if (tokens.empty()) continue;
        ok = runExpression(tokens, options) && ok;
    }
    return ok ? 0 : 1;
}
