#include "tools/smt_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace transpiler::tools {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

}  // namespace

VerificationQuery build_verification_query(const std::string& smt_text) {
    static const std::regex kPreName(R"(\(define-fun\s+([A-Za-z_][A-Za-z0-9_-]*-pre)\b)");
    static const std::regex kIntParam(R"(\((\w+)\s+Int\))");

    std::vector<std::string> lines;
    {
        std::istringstream in(smt_text);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
    }

    std::vector<std::string> preconditions;
    std::unordered_map<std::string, std::vector<std::string>> parameters;
    for (const auto& line : lines) {
        std::smatch match;
        if (!std::regex_search(line, match, kPreName)) {
            continue;
        }
        const std::string name = match[1].str();
        preconditions.push_back(name);

        // Parameters sit between the name and the " Bool" result sort.
        std::string signature = match.suffix().str();
        const auto bool_pos = signature.find(" Bool");
        if (bool_pos != std::string::npos) {
            signature = signature.substr(0, bool_pos);
        }
        auto& names = parameters[name];
        for (std::sregex_iterator it(signature.begin(), signature.end(), kIntParam), end;
             it != end; ++it) {
            names.push_back((*it)[1].str());
        }
    }

    VerificationQuery query;
    if (preconditions.empty()) {
        query.text = smt_text;
        return query;
    }

    const std::string& pre = preconditions.front();
    std::string pre_call = pre;
    const auto& args = parameters[pre];
    if (!args.empty()) {
        pre_call = "(" + pre;
        for (const auto& arg : args) {
            pre_call += " " + arg;
        }
        pre_call += ")";
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string stripped = trim(lines[i]);
        const bool negated_equality = stripped.rfind("(assert", 0) == 0 &&
                                      stripped.find("not (= ") != std::string::npos;
        // "(assert " is 8 characters; the body runs up to the closing paren.
        if (negated_equality && stripped.size() > 9 && stripped.back() == ')') {
            const std::string body = stripped.substr(8, stripped.size() - 9);
            out << "(assert (and " << pre_call << " " << body << "))";
            query.used_precondition = true;
        } else {
            out << lines[i];
        }
        if (i + 1 < lines.size()) {
            out << "\n";
        }
    }

    query.text = query.used_precondition ? out.str() : smt_text;
    return query;
}

SolverVerdict parse_solver_verdict(const std::string& solver_output) {
    std::istringstream in(solver_output);
    std::string line;
    while (std::getline(in, line)) {
        const std::string token = lowercase(trim(line));
        if (token.empty()) {
            continue;
        }
        if (token == "unsat") {
            return SolverVerdict::Verified;
        }
        if (token == "sat") {
            return SolverVerdict::Counterexample;
        }
        return SolverVerdict::Unknown;
    }
    return SolverVerdict::Unknown;
}

std::string to_string(const SolverVerdict verdict) {
    switch (verdict) {
        case SolverVerdict::Verified:
            return "verified";
        case SolverVerdict::Counterexample:
            return "counterexample";
        case SolverVerdict::Unknown:
            return "unknown";
        default:
            return "unknown";
    }
}

}  // namespace transpiler::tools
