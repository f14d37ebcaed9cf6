#pragma once

#include <cstddef>
#include <string>
#include "protocol/invocation_outcome.hpp"

namespace transpiler::tools {

constexpr std::size_t kDefaultExcerptLimit = 2000;

// Decision order: timeout, cancellation, exit 0 with output, exit 0 without
// output (contract violation), non-zero exit.
protocol::InvocationOutcome classify(const protocol::RawOutcome& raw,
                                     std::size_t excerpt_limit = kDefaultExcerptLimit);

// Head of `text`, at most `limit` bytes plus a truncation marker.
std::string bound_excerpt(const std::string& text, std::size_t limit);

}  // namespace transpiler::tools
