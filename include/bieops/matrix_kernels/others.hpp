// --------------------------------
// See LICENCE file at project root
// File : matrix_kernels/others.hpp
// --------------------------------
#ifndef BIEOPS_MATRIX_KERNELS_OTHERS_HPP
#define BIEOPS_MATRIX_KERNELS_OTHERS_HPP

#include <array>
#include <cstddef>
#include <string>

#include "bieops/geometry/point_info.hpp"
#include "bieops/matrix_kernels/mk_common.hpp"

namespace bieops::matrix_kernels::others
{
    ///////
    /// \brief constant kernel, every entry of the kn x km block is the value c
    ///
    template<std::size_t Kn = 1, std::size_t Km = 1>
    struct constant
    {
        static constexpr auto singularity_tag{singularity::smooth};
        static constexpr std::size_t km{Km};
        static constexpr std::size_t kn{Kn};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        constant() = default;
        explicit constant(double c)
          : m_c(c)
        {
        }

        const std::string name() const { return std::string("constant"); }

        [[nodiscard]] inline auto value() const noexcept -> double { return m_c; }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& /*x*/,
                                           geometry::node<ValueType> const& /*y*/) const noexcept
          -> matrix_type<ValueType>
        {
            matrix_type<ValueType> res{};
            res.fill(ValueType(m_c));
            return res;
        }

      private:
        double m_c{1.};
    };

    ///////
    /// \brief zero kernel, used to decouple components in a kernel matrix
    ///
    template<std::size_t Kn = 1, std::size_t Km = 1>
    struct zero
    {
        static constexpr auto singularity_tag{singularity::smooth};
        static constexpr std::size_t km{Km};
        static constexpr std::size_t kn{Kn};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        const std::string name() const { return std::string("zero"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& /*x*/,
                                           geometry::node<ValueType> const& /*y*/) const noexcept
          -> matrix_type<ValueType>
        {
            return matrix_type<ValueType>{};
        }
    };

}   // namespace bieops::matrix_kernels::others
#endif   // BIEOPS_MATRIX_KERNELS_OTHERS_HPP
