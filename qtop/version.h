#pragma once

namespace qtop {

constexpr const char* kVerifierName = "qtop-verifier";
constexpr const char* kVerifierVersion = "0.1.0";
constexpr const char* kVerifierAbout = "Quantum topological winding number verifier";

}  // namespace qtop
