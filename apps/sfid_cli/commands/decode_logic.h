#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace sfid::cli {

struct DecodeOptions {
  // Treat identifiers with bit 63 or bit 21 set as errors.
  bool require_generated_layout{false};  // NOLINT(readability-identifier-naming)
};

// execute_decode prints one describe_json object per input, in input order.
// Unparsable inputs (and, with require_generated_layout, values the generator
// could not have produced) are reported to err and skipped.
// Returns 0 if every input decoded cleanly, 1 otherwise.
int execute_decode(const std::vector<std::string>& inputs, const DecodeOptions& options,
                   std::ostream& out, std::ostream& err);

}  // namespace sfid::cli
