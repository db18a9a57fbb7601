// --------------------------------
// See LICENCE file at project root
// File : utils/generate.hpp
// --------------------------------
#ifndef BIEOPS_UTILS_GENERATE_HPP
#define BIEOPS_UTILS_GENERATE_HPP

#include <cmath>
#include <cstddef>
#include <tuple>
#include <utility>

#include <xtensor/xtensor.hpp>

#include "bieops/container/point.hpp"
#include "bieops/geometry/chunker.hpp"
#include "bieops/geometry/point_info.hpp"
#include "bieops/quadrature/gauss_legendre.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::utils
{
    ///
    /// \brief make_chunker discretizes a parameterized curve with nch chunks of order k
    ///
    /// The parameter interval [ta, tb] is split in nch equal chunks, each mapped on [-1, 1]. The derivatives
    /// are scaled by the chunk half length h (d = r'(t) h, d2 = r''(t) h^2) and the normal is
    /// n = (d_y, -d_x)/|d|, outward for a counterclockwise curve.
    ///
    /// \param[in] curve callable t -> (r(t), r'(t), r''(t)) as three container::point<ValueType, 2>
    /// \param[in] nch the number of chunks
    /// \param[in] k the order of the chunks
    /// \param[in] ta start of the parameter interval
    /// \param[in] tb end of the parameter interval
    /// \param[in] closed true if r(ta) = r(tb)
    ///
    template<typename ValueType, typename Curve>
    inline auto make_chunker(Curve&& curve, std::size_t nch, std::size_t k, ValueType ta, ValueType tb,
                             bool closed) -> geometry::chunker<ValueType>
    {
        using chunker_type = geometry::chunker<ValueType>;
        using info_type = typename chunker_type::info_type;

        if(nch == 0)
        {
            throw input_type_error("make_chunker: at least one chunk is required.");
        }
        auto const xleg = std::get<0>(quadrature::gauss_legendre<ValueType>(k));
        info_type info(nch * k);
        const ValueType h = (tb - ta) / ValueType(2 * nch);

        for(std::size_t ich = 0; ich < nch; ++ich)
        {
            const ValueType mid = ta + ValueType(2 * ich + 1) * h;
            for(std::size_t j = 0; j < k; ++j)
            {
                const std::size_t i = ich * k + j;
                auto const [r, d, d2] = curve(mid + h * xleg(j));
                const ValueType speed = d.norm();
                for(std::size_t dim = 0; dim < 2; ++dim)
                {
                    info.r()(dim, i) = r[dim];
                    info.d()(dim, i) = d[dim] * h;
                    info.d2()(dim, i) = d2[dim] * h * h;
                }
                info.n()(0, i) = d[1] / speed;
                info.n()(1, i) = -d[0] / speed;
            }
        }
        return chunker_type(std::move(info), k, chunker_type::chained_adjacency(nch, closed));
    }

    ///
    /// \brief circle of the given radius and center, counterclockwise, outward normals
    ///
    template<typename ValueType>
    inline auto circle(ValueType radius, container::point<ValueType, 2> center, std::size_t nch, std::size_t k)
      -> geometry::chunker<ValueType>
    {
        using point_type = container::point<ValueType, 2>;
        constexpr ValueType two_pi = ValueType(2. * 3.14159265358979323846264338327950);
        auto curve = [radius, center](ValueType t)
        {
            const ValueType c = std::cos(t);
            const ValueType s = std::sin(t);
            return std::make_tuple(center + point_type{radius * c, radius * s}, point_type{-radius * s, radius * c},
                                   point_type{-radius * c, -radius * s});
        };
        return make_chunker<ValueType>(curve, nch, k, ValueType(0.), two_pi, true);
    }

    ///
    /// \brief straight segment from a to b
    ///
    template<typename ValueType>
    inline auto segment(container::point<ValueType, 2> a, container::point<ValueType, 2> b, std::size_t nch,
                        std::size_t k) -> geometry::chunker<ValueType>
    {
        using point_type = container::point<ValueType, 2>;
        auto curve = [a, b](ValueType t)
        { return std::make_tuple(a + t * (b - a), b - a, point_type(ValueType(0.))); };
        return make_chunker<ValueType>(curve, nch, k, ValueType(0.), ValueType(1.), false);
    }

}   // namespace bieops::utils

#endif   // BIEOPS_UTILS_GENERATE_HPP
