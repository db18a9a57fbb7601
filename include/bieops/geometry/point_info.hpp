// --------------------------------
// See LICENCE file at project root
// File : geometry/point_info.hpp
// --------------------------------
#ifndef BIEOPS_GEOMETRY_POINT_INFO_HPP
#define BIEOPS_GEOMETRY_POINT_INFO_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xtensor.hpp>
#include <xtensor/xview.hpp>

#include "bieops/container/point.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::geometry
{
    /// \brief node is the geometric data of one discretization node of a curve.
    ///
    /// The matrix kernels are evaluated on nodes: the position, the first and second derivative
    /// with respect to the underlying parameterization and the unit normal.
    template<typename ValueType>
    struct node
    {
        using value_type = ValueType;
        using point_type = container::point<value_type, 2>;

        point_type r{};    ///< position
        point_type d{};    ///< first derivative
        point_type d2{};   ///< second derivative
        point_type n{};    ///< unit normal

        /// signed curvature of the curve at the node
        [[nodiscard]] inline auto curvature() const -> value_type
        {
            auto const speed = d.norm();
            return container::cross(d, d2) / (speed * speed * speed);
        }
    };

    ///
    /// \brief point_info stores n points on curves with their derivatives and normals.
    ///
    /// Each array has the shape {2, n}. It is the argument type of the kernel
    /// evaluation routines (source info and target info).
    ///
    template<typename ValueType>
    class point_info
    {
      public:
        using value_type = ValueType;
        using array_type = xt::xtensor<value_type, 2>;
        using shape_type = typename array_type::shape_type;
        using node_type = geometry::node<value_type>;

        point_info() = default;

        explicit point_info(std::size_t n)
          : m_r(xt::zeros<value_type>(shape_type{2, n}))
          , m_d(xt::zeros<value_type>(shape_type{2, n}))
          , m_d2(xt::zeros<value_type>(shape_type{2, n}))
          , m_n(xt::zeros<value_type>(shape_type{2, n}))
        {
        }

        point_info(array_type r, array_type d, array_type d2, array_type n)
          : m_r(std::move(r))
          , m_d(std::move(d))
          , m_d2(std::move(d2))
          , m_n(std::move(n))
        {
            check_shape(m_r, "positions");
            check_shape(m_d, "first derivatives");
            check_shape(m_d2, "second derivatives");
            check_shape(m_n, "normals");
        }

        [[nodiscard]] inline auto size() const noexcept -> std::size_t { return m_r.shape()[1]; }

        [[nodiscard]] inline auto r() const noexcept -> array_type const& { return m_r; }
        [[nodiscard]] inline auto d() const noexcept -> array_type const& { return m_d; }
        [[nodiscard]] inline auto d2() const noexcept -> array_type const& { return m_d2; }
        [[nodiscard]] inline auto n() const noexcept -> array_type const& { return m_n; }
        inline auto r() noexcept -> array_type& { return m_r; }
        inline auto d() noexcept -> array_type& { return m_d; }
        inline auto d2() noexcept -> array_type& { return m_d2; }
        inline auto n() noexcept -> array_type& { return m_n; }

        /// \brief node at index i
        [[nodiscard]] inline auto node(std::size_t i) const -> node_type
        {
            node_type nd{};
            for(std::size_t k = 0; k < 2; ++k)
            {
                nd.r[k] = m_r(k, i);
                nd.d[k] = m_d(k, i);
                nd.d2[k] = m_d2(k, i);
                nd.n[k] = m_n(k, i);
            }
            return nd;
        }

        /// \brief points [begin, end) as a new point_info
        [[nodiscard]] inline auto subset(std::size_t begin, std::size_t end) const -> point_info
        {
            auto const range = xt::range(begin, end);
            return point_info(array_type(xt::view(m_r, xt::all(), range)), array_type(xt::view(m_d, xt::all(), range)),
                              array_type(xt::view(m_d2, xt::all(), range)),
                              array_type(xt::view(m_n, xt::all(), range)));
        }

        /// \brief order preserving concatenation
        static auto concatenate(std::vector<point_info> const& infos) -> point_info
        {
            std::size_t total{0};
            for(auto const& info: infos)
            {
                total += info.size();
            }
            point_info res(total);
            std::size_t start{0};
            for(auto const& info: infos)
            {
                auto const range = xt::range(start, start + info.size());
                xt::view(res.m_r, xt::all(), range) = info.m_r;
                xt::view(res.m_d, xt::all(), range) = info.m_d;
                xt::view(res.m_d2, xt::all(), range) = info.m_d2;
                xt::view(res.m_n, xt::all(), range) = info.m_n;
                start += info.size();
            }
            return res;
        }

      private:
        inline auto check_shape(array_type const& a, std::string const& what) const -> void
        {
            if(a.shape()[0] != 2 || a.shape()[1] != m_r.shape()[1])
            {
                throw input_type_error("point_info: " + what + " must be a 2 x n array with n the number of points.");
            }
        }

        array_type m_r{};
        array_type m_d{};
        array_type m_d2{};
        array_type m_n{};
    };

}   // namespace bieops::geometry

#endif   // BIEOPS_GEOMETRY_POINT_INFO_HPP
