#include "addsub/driver.hpp"
#include <istream>
#include <ostream>
#include "addsub/addsub.hpp"

namespace addsub {

static bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

// "-x" or "--word". Anything else, "- 1" and "-1 + 2" included, is an expression.
static bool looks_like_option(std::string_view a) {
    if (a.find(' ') != std::string_view::npos) return false;
    if (a == "--") return true;
    if (a.size() == 2 && a[0] == '-') return is_alpha(a[1]);
    return a.size() > 2 && a[0] == '-' && a[1] == '-' && is_alpha(a[2]);
}

Result<DriverOptions, std::string> parse_args(int argc, const char* const* argv) {
    DriverOptions opts;
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if (!options_done && looks_like_option(a)) {
            if (a == "--") { options_done = true; continue; }
            if (a == "--trace") { opts.trace = true; continue; }
            if (a == "-q" || a == "--quiet") { opts.quiet = true; continue; }
            if (a == "-h" || a == "--help") { opts.help = true; continue; }
            return "unknown option: " + std::string(a);
        }
        opts.expressions.emplace_back(a);
    }
    return opts;
}

void print_usage(std::ostream& os, std::string_view prog) {
    os << "usage: " << prog << " [--trace] [-q|--quiet] [--] [EXPRESSION...]\n"
       << "Evaluate '+'/'-' integer expressions left to right.\n"
       << "Without EXPRESSION, each line of standard input is evaluated.\n";
}

static bool evaluate_one(const DriverOptions& opts, std::string_view input, std::ostream& out,
                         std::ostream& err) {
    if (opts.trace) err << "Evaluating: " << input << "\n";
    Outcome o = run(input);

    if (auto* e = std::get_if<LexError>(&o.result)) {
        err << "error: " << describe(*e) << "\n";
        return false;
    }
    if (opts.trace) err << "Lexer output: " << to_string(o.tokens) << "\n";

    if (auto* e = std::get_if<ParseError>(&o.result)) {
        err << "error: " << describe(*e) << "\n";
        return false;
    }

    const std::int64_t v = std::get<std::int64_t>(o.result);
    if (opts.trace) err << "Parser output: " << v << "\n";
    if (opts.quiet) out << v << "\n";
    else            out << input << " = " << v << "\n";
    return true;
}

int run_driver(const DriverOptions& opts, std::istream& in, std::ostream& out, std::ostream& err) {
    bool all_ok = true;
    if (!opts.expressions.empty()) {
        for (const auto& e : opts.expressions) all_ok = evaluate_one(opts, e, out, err) && all_ok;
        return all_ok ? 0 : 1;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        all_ok = evaluate_one(opts, line, out, err) && all_ok;
    }
    return all_ok ? 0 : 1;
}

int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
    const std::string_view prog = argc > 0 ? argv[0] : "addsub-calc";

    auto opts = parse_args(argc, argv);
    if (!opts) {
        err << prog << ": " << opts.error() << "\n";
        print_usage(err, prog);
        return 2;
    }
    if (opts.value().help) {
        print_usage(out, prog);
        return 0;
    }
    return run_driver(opts.value(), in, out, err);
}

} // namespace addsub
