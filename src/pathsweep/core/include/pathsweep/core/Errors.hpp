#pragma once

#include <stdexcept>
#include <string>

namespace pathsweep {

/* Two frames that must share a shape do not (or are not 8-bit gray). */
class ShapeMismatch : public std::runtime_error {
public:
    explicit ShapeMismatch(const std::string& what) : std::runtime_error(what) {}
};

/* Correlation surface with max == min under DegeneratePolicy::Throw. */
class DegenerateSurface : public std::runtime_error {
public:
    explicit DegenerateSurface(const std::string& what) : std::runtime_error(what) {}
};

/* Reading or writing a stored sequence failed. */
class SequenceIoError : public std::runtime_error {
public:
    explicit SequenceIoError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace pathsweep
