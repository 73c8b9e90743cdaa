#pragma once
#include <stdexcept>
#include <string>

namespace bitwise {

struct Error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Malformed schema text. Compilation never returns a partial schema.
class SyntaxError : public Error
{
    int line_;
public:
    SyntaxError(int line, const std::string& message)
        : Error("line " + std::to_string(line) + ": " + message), line_(line) {}
    int line() const { return line_; }
};

// Structurally inconsistent layout found while resolving offsets.
class LayoutError : public Error
{
    std::string node_;
public:
    LayoutError(std::string node, const std::string& message)
        : Error(node.empty() ? message : node + ": " + message), node_(std::move(node)) {}
    const std::string& node() const { return node_; }
};

struct OutOfBoundsError : Error
{
    using Error::Error;
};

struct TypeMismatchError : Error
{
    using Error::Error;
};

// Value not representable by the target field. Raised before any byte is written.
struct EncodingError : Error
{
    using Error::Error;
};

} // namespace bitwise
