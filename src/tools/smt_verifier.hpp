#pragma once

#include <string>

namespace transpiler::tools {

enum class SolverVerdict {
    Verified,        // unsat: no input breaks the postcondition
    Counterexample,  // sat
    Unknown
};

struct VerificationQuery {
    std::string text;
    bool used_precondition = false;
};

// Guards every `(assert (not (= ...)))` with the first `NAME-pre` function the
// transpiler emitted, so the solver only searches inputs the precondition allows.
// Without a precondition the SMT text is returned unchanged.
VerificationQuery build_verification_query(const std::string& smt_text);

SolverVerdict parse_solver_verdict(const std::string& solver_output);

std::string to_string(SolverVerdict verdict);

}  // namespace transpiler::tools
