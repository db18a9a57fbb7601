// --------------------------------
// See LICENCE file at project root
// File : algorithms/advisory.hpp
// --------------------------------
#ifndef BIEOPS_ALGORITHMS_ADVISORY_HPP
#define BIEOPS_ALGORITHMS_ADVISORY_HPP

#include <iostream>
#include <ostream>

#include <cpp_tools/colors/colorized.hpp>

#include "bieops/algorithms/probe.hpp"
#include "bieops/options/apply_options.hpp"

namespace bieops::algorithms
{
    ///
    /// \brief advise warns when some kernel in use has no fast routine
    ///
    /// The apply is still valid, it goes through the direct smooth summation.
    ///
    /// \return true if the acceleration is not available for every kernel
    ///
    template<typename ValueType>
    inline auto advise(probe_result const& probe, options::apply_options<ValueType> const& opts,
                       std::ostream& os = std::clog) -> bool
    {
        if(probe.fmm_all)
        {
            return false;
        }
        if(opts.verbose)
        {
            os << cpp_tools::colors::yellow
               << "WARNING matapply: this routine is only recommended if the fmm is defined for all the kernels in "
                  "use. Consider forming the dense matrix or using a fast direct solver instead."
               << cpp_tools::colors::reset << '\n';
        }
        return true;
    }

}   // namespace bieops::algorithms

#endif   // BIEOPS_ALGORITHMS_ADVISORY_HPP
