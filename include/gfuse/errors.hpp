#pragma once

#include <stdexcept>
#include <string>

namespace gfuse {

/// Standard deviation that is not strictly positive and finite.
class InvalidParameter : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Fusion requested with fewer than two resolvable parents.
class InsufficientParents : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Sample count too small for the requested sampling routine.
class InvalidSampleCount : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Lookup of a node id that is not in the graph.
class UnknownId : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/// Malformed or inconsistent snapshot text.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace gfuse
