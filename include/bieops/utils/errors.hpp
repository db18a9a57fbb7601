// --------------------------------
// See LICENCE file at project root
// File : utils/errors.hpp
// --------------------------------
#ifndef BIEOPS_UTILS_ERRORS_HPP
#define BIEOPS_UTILS_ERRORS_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bieops
{
    /**
     * @brief Raised when the geometry or the kernel descriptor handed to an operator is not usable
     *
     * e.g. a component source without components, a kernel entry without evaluation routine,
     * a kernel matrix that is not n x n for n components.
     */
    struct input_type_error : std::invalid_argument
    {
        explicit input_type_error(std::string const& what)
          : std::invalid_argument(what)
        {
        }
    };

    /**
     * @brief Raised when a vector length or an operator block shape does not match the block layout
     */
    struct shape_mismatch_error : std::length_error
    {
        explicit shape_mismatch_error(std::string const& what)
          : std::length_error(what)
        {
        }

        shape_mismatch_error(std::string const& what, std::size_t actual, std::size_t expected)
          : std::length_error(format(what, actual, expected))
        {
        }

      private:
        static auto format(std::string const& what, std::size_t actual, std::size_t expected) -> std::string
        {
            std::stringstream ss;
            ss << what << " (got " << actual << ", expected " << expected << ")";
            return ss.str();
        }
    };

}   // namespace bieops

#endif   // BIEOPS_UTILS_ERRORS_HPP
