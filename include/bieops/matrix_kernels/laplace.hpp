// --------------------------------
// See LICENCE file at project root
// File : matrix_kernels/laplace.hpp
// --------------------------------
#ifndef BIEOPS_MATRIX_KERNELS_LAPLACE_HPP
#define BIEOPS_MATRIX_KERNELS_LAPLACE_HPP

#include <array>
#include <cstddef>
#include <string>
#include <type_traits>

#include <xsimd/xsimd.hpp>

#include "bieops/geometry/point_info.hpp"
#include "bieops/matrix_kernels/mk_common.hpp"

/// Laplace layer potentials on curves in R^2.
///
/// The Green function is \f$ G(x,y) = -\frac{1}{2\pi} \ln |x-y| \f$. All the kernels are written
/// \f$ k(x,y) \f$ with x the target node and y the source node; the matrix is stored by rows (kn x km).
namespace bieops::matrix_kernels::laplace
{
    namespace details
    {
        template<typename ValueType>
        inline constexpr ValueType pi = ValueType(3.14159265358979323846264338327950);
    }

    ///////
    /// \brief The single_layer struct corresponds to the \f$ G(x,y) \f$ kernel
    ///
    ///   The kernel \f$k(x,y): R^{km} -> R^{kn}\f$  with \f$ kn = km = 1\f$
    ///           \f$k(x,y) = -\frac{1}{2\pi}\ln| x - y |\f$
    ///
    struct single_layer
    {
        static constexpr auto singularity_tag{singularity::log};
        static constexpr std::size_t km{1};
        static constexpr std::size_t kn{1};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        const std::string name() const { return std::string("laplace_single_layer"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& x,
                                           geometry::node<ValueType> const& y) const noexcept -> matrix_type<ValueType>
        {
            auto const diff = x.r - y.r;
            return matrix_type<ValueType>{-xsimd::log(diff.norm2()) /
                                          (ValueType(4.) * details::pi<ValueType>)};
        }
    };

    ///////
    /// \brief The double_layer struct corresponds to the \f$ \partial_{n_y} G(x,y) \f$ kernel
    ///
    ///   \f$k(x,y) = \frac{(x-y)\cdot n_y}{2\pi| x - y |^2}\f$
    ///
    /// The kernel is smooth on smooth curves, at coincident nodes it takes its limit
    /// \f$ -\kappa(y)/(4\pi)\f$ with \f$\kappa\f$ the signed curvature.
    ///
    struct double_layer
    {
        static constexpr auto singularity_tag{singularity::smooth};
        static constexpr std::size_t km{1};
        static constexpr std::size_t kn{1};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        const std::string name() const { return std::string("laplace_double_layer"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& x,
                                           geometry::node<ValueType> const& y) const noexcept -> matrix_type<ValueType>
        {
            auto const diff = x.r - y.r;
            auto const r2 = diff.norm2();
            if(r2 == ValueType(0.))
            {
                return matrix_type<ValueType>{-y.curvature() / (ValueType(4.) * details::pi<ValueType>)};
            }
            return matrix_type<ValueType>{diff.dot(y.n) / (ValueType(2.) * details::pi<ValueType> * r2)};
        }
    };

    ///////
    /// \brief The normal_derivative struct corresponds to the \f$ \partial_{n_x} G(x,y) \f$ kernel (S')
    ///
    ///   \f$k(x,y) = -\frac{(x-y)\cdot n_x}{2\pi| x - y |^2}\f$
    ///
    /// Smooth on smooth curves, limit \f$ -\kappa(x)/(4\pi)\f$ at coincident nodes.
    ///
    struct normal_derivative
    {
        static constexpr auto singularity_tag{singularity::smooth};
        static constexpr std::size_t km{1};
        static constexpr std::size_t kn{1};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        const std::string name() const { return std::string("laplace_normal_derivative"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& x,
                                           geometry::node<ValueType> const& y) const noexcept -> matrix_type<ValueType>
        {
            auto const diff = x.r - y.r;
            auto const r2 = diff.norm2();
            if(r2 == ValueType(0.))
            {
                return matrix_type<ValueType>{-x.curvature() / (ValueType(4.) * details::pi<ValueType>)};
            }
            return matrix_type<ValueType>{-diff.dot(x.n) / (ValueType(2.) * details::pi<ValueType> * r2)};
        }
    };

    ///////
    /// \brief The combined_field struct is \f$ \alpha D + \beta S \f$
    ///
    /// Used for exterior Dirichlet problems. Log singular as soon as \f$\beta \neq 0\f$.
    ///
    struct combined_field
    {
        static constexpr auto singularity_tag{singularity::log};
        static constexpr std::size_t km{1};
        static constexpr std::size_t kn{1};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        combined_field() = default;
        combined_field(double alpha, double beta)
          : m_alpha(alpha)
          , m_beta(beta)
        {
        }

        const std::string name() const { return std::string("laplace_combined_field"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& x,
                                           geometry::node<ValueType> const& y) const noexcept -> matrix_type<ValueType>
        {
            auto const d = double_layer{}.evaluate(x, y);
            auto const s = single_layer{}.evaluate(x, y);
            return matrix_type<ValueType>{ValueType(m_alpha) * d[0] + ValueType(m_beta) * s[0]};
        }

      private:
        double m_alpha{1.};
        double m_beta{1.};
    };

    ////////////////////////////////////////////////////////////////////////////////////////////////
    /// \brief grad_single_layer matrix kernel, the gradient of the single layer with respect to the target
    ///
    /// grad_single_layer \f$ k(x,y) : R -> R^{2}\f$
    ///
    ///           \f$k(x,y) = \nabla_x G(x,y) = -\frac{x-y}{2\pi| x - y |^2}\f$
    ///
    struct grad_single_layer
    {
        static constexpr auto singularity_tag{singularity::pv};
        static constexpr std::size_t km{1};
        static constexpr std::size_t kn{2};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        const std::string name() const { return std::string("laplace_grad_single_layer"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& x,
                                           geometry::node<ValueType> const& y) const noexcept -> matrix_type<ValueType>
        {
            auto const diff = x.r - y.r;
            auto const tmp = -ValueType(1.) / (ValueType(2.) * details::pi<ValueType> * diff.norm2());
            return matrix_type<ValueType>{tmp * diff[0], tmp * diff[1]};
        }
    };

    ///////
    /// \brief The double_layer_mrhs applies the double layer to two independent densities
    ///
    ///   The kernel \f$k(x,y): R^2 -> R^2\f$
    ///                    \f$ (q1,q2) --> (p1,p2)\f$
    ///           \f$k(x,y) = D(x,y) Id_{2x2}\f$
    ///
    struct double_layer_mrhs
    {
        static constexpr auto singularity_tag{singularity::smooth};
        static constexpr std::size_t km{2};
        static constexpr std::size_t kn{2};
        template<typename ValueType>
        using matrix_type = std::array<ValueType, kn * km>;

        const std::string name() const { return std::string("laplace_double_layer_mrhs"); }

        template<typename ValueType>
        [[nodiscard]] inline auto evaluate(geometry::node<ValueType> const& x,
                                           geometry::node<ValueType> const& y) const noexcept -> matrix_type<ValueType>
        {
            auto const val = double_layer{}.evaluate(x, y)[0];
            return matrix_type<ValueType>{val, ValueType(0.), ValueType(0.), val};
        }
    };

}   // namespace bieops::matrix_kernels::laplace
#endif   // BIEOPS_MATRIX_KERNELS_LAPLACE_HPP
