// --------------------------------
// See LICENCE file at project root
// File : geometry/component_source.hpp
// --------------------------------
#ifndef BIEOPS_GEOMETRY_COMPONENT_SOURCE_HPP
#define BIEOPS_GEOMETRY_COMPONENT_SOURCE_HPP

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

#include "bieops/geometry/chunker.hpp"
#include "bieops/geometry/chunkgraph.hpp"
#include "bieops/meta/traits.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::geometry
{
    ///
    /// \brief component_list is a flat list of chunkers seen as one geometry.
    ///
    template<typename ValueType>
    class component_list
    {
      public:
        using value_type = ValueType;
        using chunker_type = chunker<value_type>;

        explicit component_list(std::vector<chunker_type> chunkers)
          : m_chunkers(std::move(chunkers))
        {
        }

        [[nodiscard]] inline auto size() const noexcept -> std::size_t { return m_chunkers.size(); }
        [[nodiscard]] inline auto at(std::size_t i) const -> chunker_type const& { return m_chunkers.at(i); }

        [[nodiscard]] inline auto components() const -> component_refs<value_type>
        {
            return component_refs<value_type>(std::cbegin(m_chunkers), std::cend(m_chunkers));
        }

      private:
        std::vector<chunker_type> m_chunkers;
    };

    namespace details
    {
        inline constexpr auto has_components_f = meta::is_valid([](auto&& g) -> decltype(g.components()) {});
    }

    /// \brief true if Geometry exposes components() (chunker, chunkgraph, component_list)
    template<typename Geometry>
    inline constexpr bool is_component_source_v =
      decltype(details::has_components_f(std::declval<Geometry const&>()))::value;

    ///
    /// \brief components extracts the ordered components of a geometry
    ///
    /// \param[in] geometry a chunker, a chunkgraph or a component_list
    /// \return the references on the components
    ///
    template<typename Geometry>
    inline auto components(Geometry const& geometry)
    {
        static_assert(is_component_source_v<Geometry>, "First input is not a chunker or chunkgraph object");
        auto refs = geometry.components();
        if(refs.empty())
        {
            throw input_type_error("First input has no geometric component.");
        }
        return refs;
    }

}   // namespace bieops::geometry

#endif   // BIEOPS_GEOMETRY_COMPONENT_SOURCE_HPP
