// --------------------------------
// See LICENCE file at project root
// File : geometry/chunkgraph.hpp
// --------------------------------
#ifndef BIEOPS_GEOMETRY_CHUNKGRAPH_HPP
#define BIEOPS_GEOMETRY_CHUNKGRAPH_HPP

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <xtensor/xtensor.hpp>

#include "bieops/geometry/chunker.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::geometry
{
    ///
    /// \brief chunkgraph is a set of curves (edges) joined at vertices.
    ///
    /// Each edge is discretized by its own chunker. The vertex positions and the end vertices
    /// of the edges are only consumed by the correction builders (corner corrections); for an
    /// operator apply, a chunkgraph is the ordered list of its edge chunkers.
    ///
    template<typename ValueType>
    class chunkgraph
    {
      public:
        using value_type = ValueType;
        using chunker_type = chunker<value_type>;
        using vertices_type = xt::xtensor<value_type, 2>;
        using edges_type = xt::xtensor<long, 2>;

        ///
        /// \param[in] vertices  vertex positions (2 x nv)
        /// \param[in] edgesendverts start and end vertex of each edge (2 x nedge), -1 for a closed edge
        /// \param[in] echnks the edge chunkers
        ///
        chunkgraph(vertices_type vertices, edges_type edgesendverts, std::vector<chunker_type> echnks)
          : m_vertices(std::move(vertices))
          , m_edgesendverts(std::move(edgesendverts))
          , m_echnks(std::move(echnks))
        {
            if(m_echnks.empty())
            {
                throw input_type_error("chunkgraph: a graph needs at least one edge.");
            }
            if(m_vertices.size() > 0 && m_vertices.shape()[0] != 2)
            {
                throw input_type_error("chunkgraph: the vertices must be a 2 x nv array.");
            }
            if(m_edgesendverts.shape()[0] != 2 || m_edgesendverts.shape()[1] != m_echnks.size())
            {
                throw input_type_error("chunkgraph: edgesendverts must be a 2 x nedge array.");
            }
            const long nv = m_vertices.size() == 0 ? 0 : long(m_vertices.shape()[1]);
            for(auto v: m_edgesendverts)
            {
                if(v >= nv)
                {
                    throw input_type_error("chunkgraph: edge end vertex out of range.");
                }
            }
        }

        [[nodiscard]] inline auto vertices() const noexcept -> vertices_type const& { return m_vertices; }
        [[nodiscard]] inline auto edgesendverts() const noexcept -> edges_type const& { return m_edgesendverts; }
        [[nodiscard]] inline auto echnks() const noexcept -> std::vector<chunker_type> const& { return m_echnks; }
        [[nodiscard]] inline auto nedges() const noexcept -> std::size_t { return m_echnks.size(); }

        /// \brief the edge chunkers, in edge order
        [[nodiscard]] inline auto components() const -> component_refs<value_type>
        {
            return component_refs<value_type>(std::cbegin(m_echnks), std::cend(m_echnks));
        }

      private:
        vertices_type m_vertices;
        edges_type m_edgesendverts;
        std::vector<chunker_type> m_echnks;
    };

}   // namespace bieops::geometry

#endif   // BIEOPS_GEOMETRY_CHUNKGRAPH_HPP
