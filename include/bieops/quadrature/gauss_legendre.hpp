// --------------------------------
// See LICENCE file at project root
// File : quadrature/gauss_legendre.hpp
// --------------------------------
#ifndef BIEOPS_QUADRATURE_GAUSS_LEGENDRE_HPP
#define BIEOPS_QUADRATURE_GAUSS_LEGENDRE_HPP

#include <cmath>
#include <cstddef>
#include <limits>
#include <tuple>

#include <xtensor/xtensor.hpp>

#include "bieops/utils/errors.hpp"

namespace bieops::quadrature
{
    /**
     * @brief Gauss-Legendre rule of order k on [-1,1]
     *
     * The roots of P_k are refined by Newton iterations on the three terms recurrence
     * starting from \f$ \cos(\pi (i+3/4)/(k+1/2)) \f$. The weights are
     * \f$ w_i = 2/((1-x_i^2) P_k'(x_i)^2) \f$.
     *
     * @param k the number of nodes
     * @return a tuple (nodes, weights), the nodes in increasing order
     */
    template<typename ValueType>
    inline auto gauss_legendre(std::size_t k) -> std::tuple<xt::xtensor<ValueType, 1>, xt::xtensor<ValueType, 1>>
    {
        using value_type = ValueType;
        if(k == 0)
        {
            throw input_type_error("gauss_legendre: the order must be positive.");
        }
        constexpr value_type pi = value_type(3.14159265358979323846264338327950);
        constexpr int max_iterations{100};
        const value_type tol = value_type(4) * std::numeric_limits<value_type>::epsilon();

        using vector_type = xt::xtensor<value_type, 1>;
        const typename vector_type::shape_type shape{k};
        vector_type x(shape);
        vector_type w(shape);

        for(std::size_t i = 0; i < (k + 1) / 2; ++i)
        {
            value_type z = std::cos(pi * (value_type(i) + value_type(0.75)) / (value_type(k) + value_type(0.5)));
            value_type dp{1};
            for(int it = 0; it < max_iterations; ++it)
            {
                value_type p0{1};
                value_type p1{z};
                for(std::size_t j = 2; j <= k; ++j)
                {
                    value_type p2 = ((value_type(2 * j - 1)) * z * p1 - value_type(j - 1) * p0) / value_type(j);
                    p0 = p1;
                    p1 = p2;
                }
                // p1 = P_k(z), p0 = P_{k-1}(z)
                dp = value_type(k) * (z * p1 - p0) / (z * z - value_type(1));
                const value_type dz = p1 / dp;
                z -= dz;
                if(std::abs(dz) <= tol)
                {
                    break;
                }
            }
            const value_type wi = value_type(2) / ((value_type(1) - z * z) * dp * dp);
            // symmetric pair, nodes stored in increasing order
            x(k - 1 - i) = z;
            x(i) = -z;
            w(k - 1 - i) = wi;
            w(i) = wi;
        }
        return std::make_tuple(x, w);
    }

}   // namespace bieops::quadrature

#endif   // BIEOPS_QUADRATURE_GAUSS_LEGENDRE_HPP
