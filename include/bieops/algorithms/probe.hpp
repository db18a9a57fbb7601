// --------------------------------
// See LICENCE file at project root
// File : algorithms/probe.hpp
// --------------------------------
#ifndef BIEOPS_ALGORITHMS_PROBE_HPP
#define BIEOPS_ALGORITHMS_PROBE_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "bieops/geometry/chunker.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/quadrature/smooth.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::algorithms
{
    using opdims_type = quadrature::opdims_type;

    ///
    /// \brief opdims_table stores the operator dimensions of every (target, source) pair of components
    ///
    class opdims_table
    {
      public:
        opdims_table() = default;
        explicit opdims_table(std::size_t n)
          : m_n(n)
          , m_dims(n * n, opdims_type{0, 0})
        {
        }

        [[nodiscard]] inline auto size() const noexcept -> std::size_t { return m_n; }

        inline auto operator()(std::size_t i, std::size_t j) const -> opdims_type const& { return m_dims[i * m_n + j]; }
        inline auto operator()(std::size_t i, std::size_t j) -> opdims_type& { return m_dims[i * m_n + j]; }

        inline auto operator==(opdims_table const& other) const -> bool
        {
            return m_n == other.m_n && m_dims == other.m_dims;
        }
        inline auto operator!=(opdims_table const& other) const -> bool { return !(*this == other); }

      private:
        std::size_t m_n{0};
        std::vector<opdims_type> m_dims{};
    };

    inline auto operator<<(std::ostream& os, opdims_table const& table) -> std::ostream&
    {
        for(std::size_t i = 0; i < table.size(); ++i)
        {
            os << "[opdims] target " << i << " :";
            for(std::size_t j = 0; j < table.size(); ++j)
            {
                os << " (" << table(i, j)[0] << ", " << table(i, j)[1] << ")";
            }
            os << '\n';
        }
        return os;
    }

    struct probe_result
    {
        opdims_table opdims{};
        /// every kernel in use has a fast routine
        bool fmm_all{true};
    };

    ///
    /// \brief probe_operator_dimensions evaluates each kernel in use once to get its block shape
    ///
    /// For the pair (target i, source j) the kernel is evaluated with the node 1 of component i as
    /// target and the node 0 of component j as source.
    ///
    /// \param[in] components the geometric components
    /// \param[in] kernels the resolved kernel descriptor
    /// \return the table of operator dimensions and the fmm availability
    ///
    template<typename ValueType>
    auto probe_operator_dimensions(geometry::component_refs<ValueType> const& components,
                                   kernels::kernel_lookup<ValueType> const& kernels) -> probe_result
    {
        const std::size_t n = components.size();
        probe_result res{opdims_table(n), true};

        for(std::size_t i = 0; i < n; ++i)
        {
            auto const& target = components[i].get();
            if(target.npt() < 2)
            {
                throw input_type_error("Geometric component " + std::to_string(i) + " has less than two nodes.");
            }
            auto const targinfo = target.info(1);
            for(std::size_t j = 0; j < n; ++j)
            {
                auto const srcinfo = components[j].get().info(0);
                auto const& kern = kernels(i, j);
                auto const block = kern.eval(srcinfo, targinfo);
                if(block.shape()[0] == 0 || block.shape()[1] == 0)
                {
                    throw shape_mismatch_error("Kernel " + kern.name() + " returns an empty block for the pair (" +
                                               std::to_string(i) + ", " + std::to_string(j) + ")");
                }
                res.opdims(i, j) = opdims_type{block.shape()[0], block.shape()[1]};
                res.fmm_all = res.fmm_all && kern.has_fmm();
            }
        }
        return res;
    }

}   // namespace bieops::algorithms

#endif   // BIEOPS_ALGORITHMS_PROBE_HPP
