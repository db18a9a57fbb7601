// --------------------------------
// See LICENCE file at project root
// File : container/point.hpp
// --------------------------------
#ifndef BIEOPS_CONTAINER_POINT_HPP
#define BIEOPS_CONTAINER_POINT_HPP

#include <array>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <algorithm>
#include <ostream>
#include <type_traits>

namespace bieops::container
{
    /// \brief point in R^Dim
    ///
    /// Thin wrapper on std::array with the arithmetic needed by the matrix kernels.
    template<typename Arithmetic, std::size_t Dim = 2>
    struct point : public std::array<Arithmetic, Dim>
    {
        static_assert(std::is_arithmetic_v<Arithmetic>, "Point's inner type should be arithmetic!");

        using base_type = std::array<Arithmetic, Dim>;
        /// Floating number type
        using value_type = Arithmetic;
        /// Space dimension count
        static constexpr std::size_t dimension = Dim;

        point() = default;
        point(point const&) = default;
        point(point&&) noexcept = default;
        auto operator=(point const&) -> point& = default;
        auto operator=(point&&) noexcept -> point& = default;
        ~point() = default;

        point(std::initializer_list<value_type> l) { std::copy(l.begin(), l.end(), this->begin()); }

        point(std::array<value_type, dimension> a)
          : base_type(a)
        {
        }

        explicit point(value_type to_splat) { this->fill(to_splat); }

        inline auto operator+=(point const& other) -> point&
        {
            for(std::size_t i = 0; i < dimension; ++i)
            {
                (*this)[i] += other[i];
            }
            return *this;
        }

        inline auto operator-=(point const& other) -> point&
        {
            for(std::size_t i = 0; i < dimension; ++i)
            {
                (*this)[i] -= other[i];
            }
            return *this;
        }

        inline auto operator*=(value_type other) -> point&
        {
            for(std::size_t i = 0; i < dimension; ++i)
            {
                (*this)[i] *= other;
            }
            return *this;
        }

        inline auto operator/=(value_type other) -> point&
        {
            for(std::size_t i = 0; i < dimension; ++i)
            {
                (*this)[i] /= other;
            }
            return *this;
        }

        ///
        /// \brief norm2 compute the L2 norm squared of the point.
        /// \return the L2 norm squared of the point.
        ///
        inline auto norm2() const -> value_type
        {
            value_type square_sum{0};
            for(auto a: *this)
            {
                square_sum += a * a;
            }
            return square_sum;
        }

        ///
        /// \brief norm compute the L2 norm of the point.
        ///
        inline auto norm() const -> value_type { return std::sqrt(norm2()); }

        inline auto dot(point const& other) const -> value_type
        {
            value_type res{0};
            for(std::size_t i = 0; i < dimension; ++i)
            {
                res += (*this)[i] * other[i];
            }
            return res;
        }

        inline auto distance(point const& p) const -> value_type
        {
            value_type square_sum{0};
            for(std::size_t i{0}; i < dimension; ++i)
            {
                auto tmp = (*this)[i] - p[i];
                square_sum += tmp * tmp;
            }
            return std::sqrt(square_sum);
        }
    };

    template<typename A, std::size_t D>
    inline auto operator+(point<A, D> other, point<A, D> const& another) -> point<A, D>
    {
        other += another;
        return other;
    }

    template<typename A, std::size_t D>
    inline auto operator-(point<A, D> other, point<A, D> const& another) -> point<A, D>
    {
        other -= another;
        return other;
    }

    template<typename A, std::size_t D>
    inline auto operator*(point<A, D> other, A another) -> point<A, D>
    {
        other *= another;
        return other;
    }

    template<typename A, std::size_t D>
    inline auto operator*(A another, point<A, D> other) -> point<A, D>
    {
        other *= another;
        return other;
    }

    /// 2d cross product (z component of the 3d one)
    template<typename A>
    inline auto cross(point<A, 2> const& a, point<A, 2> const& b) -> A
    {
        return a[0] * b[1] - a[1] * b[0];
    }

    template<typename Arithmetic, std::size_t Dim>
    inline auto operator<<(std::ostream& os, const point<Arithmetic, Dim>& pos) -> std::ostream&
    {
        os << "[";
        for(std::size_t i{0}; i < Dim - 1; ++i)
        {
            os << pos.at(i) << ", ";
        }
        os << pos.at(Dim - 1) << "]";
        return os;
    }
}   // namespace bieops::container

#endif   // BIEOPS_CONTAINER_POINT_HPP
