#pragma once

#include <stdexcept>
#include <string>

namespace processing
{

// A normalization stage reported a map whose dimensions disagree with its input/output text lengths.
class ConsistencyError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class InvalidLanguageTagError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace processing
