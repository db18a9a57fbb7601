// --------------------------------
// See LICENCE file at project root
// File : algorithms/layout.hpp
// --------------------------------
#ifndef BIEOPS_ALGORITHMS_LAYOUT_HPP
#define BIEOPS_ALGORITHMS_LAYOUT_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "bieops/algorithms/probe.hpp"
#include "bieops/geometry/chunker.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::algorithms
{
    ///
    /// \brief block_layout gives where each component starts in the flattened vectors
    ///
    /// The component i owns the entries [row_offsets[i], row_offsets[i+1]) of the output and the
    /// entries [col_offsets[i], col_offsets[i+1]) of the density. Offsets start at 0.
    ///
    struct block_layout
    {
        std::vector<std::size_t> row_offsets{};
        std::vector<std::size_t> col_offsets{};

        /// \brief output length
        [[nodiscard]] inline auto rows() const noexcept -> std::size_t
        {
            return row_offsets.empty() ? 0 : row_offsets.back();
        }
        /// \brief density length
        [[nodiscard]] inline auto cols() const noexcept -> std::size_t
        {
            return col_offsets.empty() ? 0 : col_offsets.back();
        }
        [[nodiscard]] inline auto size() const noexcept -> std::size_t
        {
            return row_offsets.empty() ? 0 : row_offsets.size() - 1;
        }

        [[nodiscard]] inline auto row_range(std::size_t i) const -> std::pair<std::size_t, std::size_t>
        {
            return {row_offsets.at(i), row_offsets.at(i + 1)};
        }
        [[nodiscard]] inline auto col_range(std::size_t j) const -> std::pair<std::size_t, std::size_t>
        {
            return {col_offsets.at(j), col_offsets.at(j + 1)};
        }
    };

    inline auto operator<<(std::ostream& os, block_layout const& layout) -> std::ostream&
    {
        os << "[layout] rows:";
        for(auto r: layout.row_offsets)
        {
            os << ' ' << r;
        }
        os << "\n[layout] cols:";
        for(auto c: layout.col_offsets)
        {
            os << ' ' << c;
        }
        return os << '\n';
    }

    /// \brief number of nodes of each component
    template<typename ValueType>
    inline auto point_counts(geometry::component_refs<ValueType> const& components) -> std::vector<std::size_t>
    {
        std::vector<std::size_t> npts;
        npts.reserve(components.size());
        for(auto const& c: components)
        {
            npts.push_back(c.get().npt());
        }
        return npts;
    }

    ///
    /// \brief make_layout computes the row and column offsets
    ///
    /// The column width of the source j is read on the pair (0, j), the row height of the target i on
    /// the pair (i, 0). See check_consistency for the other pairs.
    ///
    /// \param[in] opdims the operator dimensions
    /// \param[in] npts the number of nodes of each component
    ///
    inline auto make_layout(opdims_table const& opdims, std::vector<std::size_t> const& npts) -> block_layout
    {
        const std::size_t n = opdims.size();
        if(npts.size() != n)
        {
            throw shape_mismatch_error("make_layout: number of point counts", npts.size(), n);
        }
        block_layout layout{std::vector<std::size_t>(n + 1, 0), std::vector<std::size_t>(n + 1, 0)};
        for(std::size_t i = 0; i < n; ++i)
        {
            layout.col_offsets[i + 1] = layout.col_offsets[i] + npts[i] * opdims(0, i)[1];
            layout.row_offsets[i + 1] = layout.row_offsets[i] + npts[i] * opdims(i, 0)[0];
        }
        return layout;
    }

    ///
    /// \brief check_consistency verifies that the pairs sharing a target agree on the rows and the pairs
    /// sharing a source agree on the columns
    ///
    /// \throw shape_mismatch_error for the first pair violating it
    ///
    inline auto check_consistency(opdims_table const& opdims) -> void
    {
        const std::size_t n = opdims.size();
        for(std::size_t i = 0; i < n; ++i)
        {
            for(std::size_t j = 0; j < n; ++j)
            {
                if(opdims(i, j)[0] != opdims(i, 0)[0])
                {
                    throw shape_mismatch_error("Operator rows of the pair (" + std::to_string(i) + ", " +
                                                 std::to_string(j) + ") differ from the target component",
                                               opdims(i, j)[0], opdims(i, 0)[0]);
                }
                if(opdims(i, j)[1] != opdims(0, j)[1])
                {
                    throw shape_mismatch_error("Operator columns of the pair (" + std::to_string(i) + ", " +
                                                 std::to_string(j) + ") differ from the source component",
                                               opdims(i, j)[1], opdims(0, j)[1]);
                }
            }
        }
    }

}   // namespace bieops::algorithms

#endif   // BIEOPS_ALGORITHMS_LAYOUT_HPP
