#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace LayerGrid {

    // Bad dimensions, unknown layer on read, unknown value, bad save token.
    class InvalidArgument : public std::invalid_argument {
    public:
        explicit InvalidArgument(const std::string& message) : std::invalid_argument(message) {}
    };

    // Cell coordinate, row or column outside the grid.
    class IndexOutOfBounds : public std::out_of_range {
    public:
        explicit IndexOutOfBounds(const std::string& message) : std::out_of_range(message) {}
    };

    // A required position or color was not given.
    class NullInput : public std::logic_error {
    public:
        explicit NullInput(const std::string& message) : std::logic_error(message) {}
    };

} // namespace LayerGrid

#endif // ERRORS_HPP
