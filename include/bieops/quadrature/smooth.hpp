// --------------------------------
// See LICENCE file at project root
// File : quadrature/smooth.hpp
// --------------------------------
#ifndef BIEOPS_QUADRATURE_SMOOTH_HPP
#define BIEOPS_QUADRATURE_SMOOTH_HPP

#include <array>
#include <cstddef>
#include <vector>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xtensor.hpp>

#include "bieops/geometry/chunker.hpp"
#include "bieops/kernels/kernel.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::quadrature
{
    /// (rows, cols) of the kernel block of one source/target pair
    using opdims_type = std::array<std::size_t, 2>;

    ///
    /// \brief smooth_evaluator applies the smooth quadrature rule of a chunker
    ///
    /// Computes, for every target t,
    /// \f$ u(t) = \sum_s K(t,s) w_s \sigma(s) \f$
    /// over all the nodes s of the source chunker with the weights \f$ w_s = w^{GL} |d(s)| \f$.
    /// Source and target at zero distance are skipped; their contribution belongs to the corrections.
    ///
    /// The kernel fast routine is used when it exists and either the acceleration is forced on, or it is
    /// automatic and ns*nt reaches fmm_threshold.
    ///
    struct smooth_evaluator
    {
        static constexpr std::size_t fmm_threshold{200 * 200};

        template<typename ValueType>
        [[nodiscard]] static auto use_fmm(kernels::kernel<ValueType> const& kern, std::size_t ns, std::size_t nt,
                                          options::acceleration accel) noexcept -> bool
        {
            if(!kern.has_fmm())
            {
                return false;
            }
            switch(accel)
            {
            case options::acceleration::forced_on:
                return true;
            case options::acceleration::forced_off:
                return false;
            case options::acceleration::automatic:
                return ns * nt >= fmm_threshold;
            }
            return false;
        }

        ///
        /// \param[in] source the source chunker
        /// \param[in] kern the kernel
        /// \param[in] opdims the dimension of the kernel block for one pair
        /// \param[in] density opdims[1]*npt values, point-major
        /// \param[in] targets the target points
        /// \param[in] opts eps and accel are read
        /// \return opdims[0]*nt values, point-major
        ///
        template<typename ValueType>
        auto operator()(geometry::chunker<ValueType> const& source, kernels::kernel<ValueType> const& kern,
                        opdims_type const& opdims, xt::xtensor<ValueType, 1> const& density,
                        geometry::point_info<ValueType> const& targets,
                        options::apply_options<ValueType> const& opts) const -> xt::xtensor<ValueType, 1>
        {
            using vector_type = xt::xtensor<ValueType, 1>;
            using shape_type = typename vector_type::shape_type;

            auto const [kn, km] = opdims;
            const std::size_t ns = source.npt();
            const std::size_t nt = targets.size();
            if(density.size() != km * ns)
            {
                throw shape_mismatch_error("smooth quadrature: density length", density.size(), km * ns);
            }

            auto const w = source.weights();
            vector_type wdens = density;
            for(std::size_t s = 0; s < ns; ++s)
            {
                for(std::size_t b = 0; b < km; ++b)
                {
                    wdens(s * km + b) *= w(s);
                }
            }

            if(use_fmm(kern, ns, nt, opts.accel))
            {
                auto pot = kern.fmm(opts.eps, source.info(), targets, wdens);
                if(pot.size() != kn * nt)
                {
                    throw shape_mismatch_error("smooth quadrature: fmm output length of kernel " + kern.name(),
                                               pot.size(), kn * nt);
                }
                return pot;
            }

            vector_type pot = xt::zeros<ValueType>(shape_type{kn * nt});
            auto const& rt = targets.r();
            auto const& rs = source.r();
            const std::size_t k = source.k();
            for(std::size_t ich = 0; ich < source.nch(); ++ich)
            {
                auto const block = kern.eval(source.chunk_info(ich), targets);
                if(block.shape()[0] != kn * nt || block.shape()[1] != km * k)
                {
                    throw shape_mismatch_error("smooth quadrature: block of kernel " + kern.name() +
                                               " does not match the operator dimensions");
                }
                for(std::size_t t = 0; t < nt; ++t)
                {
                    for(std::size_t j = 0; j < k; ++j)
                    {
                        const std::size_t s = ich * k + j;
                        if(rt(0, t) == rs(0, s) && rt(1, t) == rs(1, s))
                        {
                            continue;
                        }
                        for(std::size_t a = 0; a < kn; ++a)
                        {
                            ValueType acc{0.};
                            for(std::size_t b = 0; b < km; ++b)
                            {
                                acc += block(t * kn + a, j * km + b) * wdens(s * km + b);
                            }
                            pot(t * kn + a) += acc;
                        }
                    }
                }
            }
            return pot;
        }
    };

}   // namespace bieops::quadrature

#endif   // BIEOPS_QUADRATURE_SMOOTH_HPP
