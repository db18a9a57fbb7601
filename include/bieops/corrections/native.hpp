// --------------------------------
// See LICENCE file at project root
// File : corrections/native.hpp
// --------------------------------
#ifndef BIEOPS_CORRECTIONS_NATIVE_HPP
#define BIEOPS_CORRECTIONS_NATIVE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "bieops/algorithms/layout.hpp"
#include "bieops/algorithms/probe.hpp"
#include "bieops/corrections/correction_matrix.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/matrix_kernels/mk_common.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::corrections
{
    ///
    /// \brief native_corrections builds the corrections of the smooth rule for smooth kernels
    ///
    /// With a smooth kernel the scaled Gauss-Legendre rule is accurate everywhere, the only missing term
    /// is the self interaction K(x_p, x_p) w_p that the smooth evaluator skips. It is stored on the
    /// diagonal block of each component.
    ///
    /// Log, pv and hs kernels on the diagonal blocks are rejected: their near and self quadrature
    /// (ggq, rcip) must come from another builder given to the operators. For the same reason the
    /// builder only answers options.quad == quadrature_method::native.
    ///
    struct native_corrections
    {
        template<typename Geometry, typename ValueType>
        auto operator()(Geometry const& geometry, kernels::kernel_descriptor<ValueType> const& kernel,
                        options::apply_options<ValueType> const& opts) const -> correction_matrix<ValueType>
        {
            if(!opts.corrections)
            {
                throw std::invalid_argument(
                  "native_corrections: only the corrections can be built (options.corrections must be true).");
            }
            if(opts.quad != options::quadrature_method::native)
            {
                throw std::invalid_argument("native_corrections: quadrature " + options::to_string(opts.quad) +
                                            " requested, it needs an external correction builder given to "
                                            "apply_operators (set options.quad to native for smooth kernels).");
            }
            auto const comps = geometry::components(geometry);
            kernels::kernel_lookup<ValueType> const lookup(kernel, comps.size());
            auto const probe = algorithms::probe_operator_dimensions(comps, lookup);
            algorithms::check_consistency(probe.opdims);
            auto const layout = algorithms::make_layout(probe.opdims, algorithms::point_counts(comps));

            std::vector<triplet<ValueType>> triplets;
            for(std::size_t i = 0; i < comps.size(); ++i)
            {
                auto const& kern = lookup(i, i);
                auto const sing = kern.singularity_or(opts.sing);
                if(sing != matrix_kernels::singularity::smooth)
                {
                    throw std::invalid_argument("native_corrections: kernel " + kern.name() + " is " +
                                                matrix_kernels::to_string(sing) +
                                                " singular, its corrections need an external builder given to "
                                                "apply_operators.");
                }

                auto const& c = comps[i].get();
                auto const [kn, km] = probe.opdims(i, i);
                const std::size_t k = c.k();
                const std::size_t row0 = layout.row_offsets[i];
                const std::size_t col0 = layout.col_offsets[i];
                auto const w = c.weights();
                triplets.reserve(triplets.size() + c.npt() * kn * km);

                for(std::size_t ich = 0; ich < c.nch(); ++ich)
                {
                    auto const info = c.chunk_info(ich);
                    auto const block = kern.eval(info, info);
                    if(block.shape()[0] != kn * k || block.shape()[1] != km * k)
                    {
                        throw shape_mismatch_error("native_corrections: block of kernel " + kern.name() +
                                                   " does not match the operator dimensions");
                    }
                    for(std::size_t j = 0; j < k; ++j)
                    {
                        const std::size_t p = ich * k + j;
                        // the l2 scaling sqrt(w_p)/sqrt(w_p) of a self term is 1
                        for(std::size_t a = 0; a < kn; ++a)
                        {
                            for(std::size_t b = 0; b < km; ++b)
                            {
                                triplets.emplace_back(int(row0 + p * kn + a), int(col0 + p * km + b),
                                                      block(j * kn + a, j * km + b) * w(p));
                            }
                        }
                    }
                }
            }

            correction_matrix<ValueType> cormat(Eigen::Index(layout.rows()), Eigen::Index(layout.cols()));
            cormat.setFromTriplets(triplets.begin(), triplets.end());
            return cormat;
        }
    };

}   // namespace bieops::corrections

#endif   // BIEOPS_CORRECTIONS_NATIVE_HPP
