#pragma once
#include <iosfwd>
#include <optional>
#include <string>

#include "../probes/device_probe.hpp"

namespace wcl {
// Asks for an address until one is well-formed and answers a probe, or the
// user quits (q, quit, exit, empty line, end of input).
std::optional<std::string> prompt_for_address(std::istream& in, std::ostream& out,
                                              const ProbeFn& probe, int timeout_ms);
}  // namespace wcl
