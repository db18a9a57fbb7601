// --------------------------------
// See LICENCE file at project root
// File : geometry/chunker.hpp
// --------------------------------
#ifndef BIEOPS_GEOMETRY_CHUNKER_HPP
#define BIEOPS_GEOMETRY_CHUNKER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xtensor.hpp>
#include <xtensor/xview.hpp>

#include "bieops/geometry/point_info.hpp"
#include "bieops/quadrature/gauss_legendre.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::geometry
{
    template<typename ValueType>
    class chunker;

    /// ordered sequence of geometric components
    template<typename ValueType>
    using component_refs = std::vector<std::reference_wrapper<chunker<ValueType> const>>;

    ///
    /// \brief chunker is a panel (chunk) discretization of a curve.
    ///
    /// The curve is split in nch chunks, each carrying k Gauss-Legendre nodes. The node data
    /// (positions, derivatives, second derivatives, normals) are stored point-major: the node j of the
    /// chunk ich has the index ich*k + j. The derivatives are taken with respect to the parameter
    /// mapped onto [-1,1] on each chunk, so the smooth quadrature weight of a node is
    /// \f$ w = w^{GL}_j |d| \f$.
    ///
    /// The adjacency array (2 x nch) holds the left and right neighbours of each chunk, -1 at a free end.
    ///
    template<typename ValueType>
    class chunker
    {
      public:
        using value_type = ValueType;
        using info_type = point_info<value_type>;
        using array_type = typename info_type::array_type;
        using vector_type = xt::xtensor<value_type, 1>;
        using adjacency_type = xt::xtensor<long, 2>;

        chunker() = delete;
        chunker(chunker const&) = default;
        chunker(chunker&&) = default;
        auto operator=(chunker const&) -> chunker& = default;
        auto operator=(chunker&&) -> chunker& = default;
        ~chunker() = default;

        ///
        /// \brief chunker constructor
        ///
        /// \param[in] info the node data (2 x k*nch arrays)
        /// \param[in] k the number of nodes per chunk
        /// \param[in] adj the chunk adjacency (2 x nch), if empty chunks are chained as an open curve
        ///
        chunker(info_type info, std::size_t k, adjacency_type adj = adjacency_type{})
          : m_k(k)
          , m_info(std::move(info))
          , m_adj(std::move(adj))
        {
            if(m_k < 2)
            {
                throw input_type_error("chunker: at least two nodes per chunk are required.");
            }
            if(m_info.size() == 0 || m_info.size() % m_k != 0)
            {
                throw input_type_error("chunker: the number of points must be a positive multiple of the order.");
            }
            m_nch = m_info.size() / m_k;
            if(m_adj.size() == 0)
            {
                m_adj = chained_adjacency(m_nch, false);
            }
            if(m_adj.shape()[0] != 2 || m_adj.shape()[1] != m_nch)
            {
                throw input_type_error("chunker: the adjacency must be a 2 x nch array.");
            }
            std::tie(std::ignore, m_wstor) = quadrature::gauss_legendre<value_type>(m_k);
        }

        /// \brief order of the chunks (number of nodes per chunk)
        [[nodiscard]] inline auto k() const noexcept -> std::size_t { return m_k; }
        /// \brief number of chunks
        [[nodiscard]] inline auto nch() const noexcept -> std::size_t { return m_nch; }
        /// \brief total number of nodes
        [[nodiscard]] inline auto npt() const noexcept -> std::size_t { return m_k * m_nch; }

        [[nodiscard]] inline auto r() const noexcept -> array_type const& { return m_info.r(); }
        [[nodiscard]] inline auto d() const noexcept -> array_type const& { return m_info.d(); }
        [[nodiscard]] inline auto d2() const noexcept -> array_type const& { return m_info.d2(); }
        [[nodiscard]] inline auto n() const noexcept -> array_type const& { return m_info.n(); }
        [[nodiscard]] inline auto adjacency() const noexcept -> adjacency_type const& { return m_adj; }
        /// \brief Gauss-Legendre weights of the reference chunk
        [[nodiscard]] inline auto wstor() const noexcept -> vector_type const& { return m_wstor; }

        /// \brief all the nodes as a point_info
        [[nodiscard]] inline auto info() const noexcept -> info_type const& { return m_info; }

        /// \brief the node i as a one point point_info
        [[nodiscard]] inline auto info(std::size_t i) const -> info_type
        {
            if(i >= npt())
            {
                throw input_type_error("chunker: node index out of range.");
            }
            return m_info.subset(i, i + 1);
        }

        /// \brief node data of chunk ich
        [[nodiscard]] inline auto chunk_info(std::size_t ich) const -> info_type
        {
            return m_info.subset(ich * m_k, (ich + 1) * m_k);
        }

        /// \brief smooth quadrature weights of all nodes
        [[nodiscard]] inline auto weights() const -> vector_type
        {
            vector_type w = xt::sqrt(xt::view(d(), 0, xt::all()) * xt::view(d(), 0, xt::all()) +
                                     xt::view(d(), 1, xt::all()) * xt::view(d(), 1, xt::all()));
            for(std::size_t i = 0; i < npt(); ++i)
            {
                w(i) *= m_wstor(i % m_k);
            }
            return w;
        }

        /// \brief a chunker is a component source with a single component
        [[nodiscard]] inline auto components() const -> component_refs<value_type> { return {std::cref(*this)}; }

        /// \brief adjacency of nch chunks chained one after the other
        static auto chained_adjacency(std::size_t nch, bool closed) -> adjacency_type
        {
            adjacency_type adj = xt::zeros<long>(typename adjacency_type::shape_type{2, nch});
            for(std::size_t ich = 0; ich < nch; ++ich)
            {
                adj(0, ich) = long(ich) - 1;
                adj(1, ich) = long(ich) + 1;
            }
            adj(0, 0) = closed ? long(nch) - 1 : -1;
            adj(1, nch - 1) = closed ? 0 : -1;
            return adj;
        }

      private:
        std::size_t m_k{};
        std::size_t m_nch{};
        info_type m_info;
        adjacency_type m_adj{};
        vector_type m_wstor{};
    };

    ///
    /// \brief merge concatenates chunkers in order.
    ///
    /// The chunks of components[0] come first, then those of components[1], ... The adjacency
    /// indices are shifted accordingly. All the chunkers must have the same order.
    ///
    /// \param[in] components the chunkers to merge
    /// \return the merged chunker
    template<typename ValueType>
    inline auto merge(component_refs<ValueType> const& components) -> chunker<ValueType>
    {
        using chunker_type = chunker<ValueType>;
        using info_type = typename chunker_type::info_type;
        using adjacency_type = typename chunker_type::adjacency_type;

        if(components.empty())
        {
            throw input_type_error("merge: nothing to merge.");
        }
        const std::size_t k = components.front().get().k();
        std::size_t nch{0};
        std::vector<info_type> infos;
        infos.reserve(components.size());
        for(auto const& c: components)
        {
            if(c.get().k() != k)
            {
                throw input_type_error("merge: all chunkers must have the same order (" + std::to_string(k) +
                                       " != " + std::to_string(c.get().k()) + ").");
            }
            infos.push_back(c.get().info());
            nch += c.get().nch();
        }

        adjacency_type adj = xt::zeros<long>(typename adjacency_type::shape_type{2, nch});
        std::size_t shift{0};
        for(auto const& c: components)
        {
            auto const& cadj = c.get().adjacency();
            for(std::size_t ich = 0; ich < c.get().nch(); ++ich)
            {
                for(std::size_t side = 0; side < 2; ++side)
                {
                    adj(side, shift + ich) = cadj(side, ich) < 0 ? cadj(side, ich) : cadj(side, ich) + long(shift);
                }
            }
            shift += c.get().nch();
        }
        return chunker_type(info_type::concatenate(infos), k, std::move(adj));
    }

    template<typename ValueType>
    inline auto merge(std::vector<chunker<ValueType>> const& chunkers) -> chunker<ValueType>
    {
        component_refs<ValueType> refs(std::cbegin(chunkers), std::cend(chunkers));
        return merge(refs);
    }

}   // namespace bieops::geometry

#endif   // BIEOPS_GEOMETRY_CHUNKER_HPP
