#pragma once

#include <stdexcept>
#include <string>

namespace mapping
{

// Base class for every failure raised while building or combining position maps.
class PositionMapError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Span bounds outside [0, target_len], non-monotonic starts/stops, or an inconsistent source length.
class InvalidMapError : public PositionMapError
{
public:
    using PositionMapError::PositionMapError;
};

// compose/concat called on maps whose spaces do not line up.
class DimensionMismatchError : public PositionMapError
{
public:
    using PositionMapError::PositionMapError;
};

// project() called with data whose length differs from the source space.
class LengthMismatchError : public DimensionMismatchError
{
public:
    using DimensionMismatchError::DimensionMismatchError;
};

class UnsupportedStepError : public PositionMapError
{
public:
    using PositionMapError::PositionMapError;
};

// Named composition: a name does not follow the "<source>2<target>" convention.
class InvalidMapNameError : public PositionMapError
{
public:
    using PositionMapError::PositionMapError;
};

class NoPathFoundError : public PositionMapError
{
public:
    using PositionMapError::PositionMapError;
};

class CycleDetectedError : public PositionMapError
{
public:
    using PositionMapError::PositionMapError;
};

} // namespace mapping
