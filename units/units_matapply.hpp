//
// Test doubles for the operator apply units
// -----------------------------------------
#ifndef BIEOPS_UNITS_MATAPPLY_HPP
#define BIEOPS_UNITS_MATAPPLY_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xtensor.hpp>

#include "bieops/algorithms/layout.hpp"
#include "bieops/algorithms/probe.hpp"
#include "bieops/container/point.hpp"
#include "bieops/corrections/correction_matrix.hpp"
#include "bieops/geometry/chunker.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/quadrature/smooth.hpp"
#include "bieops/utils/generate.hpp"

namespace units
{
    using value_type = double;
    using vector_type = xt::xtensor<value_type, 1>;
    using point_type = bieops::container::point<value_type, 2>;
    using chunker_type = bieops::geometry::chunker<value_type>;
    using info_type = bieops::geometry::point_info<value_type>;
    using kernel_type = bieops::kernels::kernel<value_type>;
    using matrix_type = typename kernel_type::matrix_type;
    using options_type = bieops::options::apply_options<value_type>;
    using cormat_type = bieops::corrections::correction_matrix<value_type>;

    inline auto make_vector(std::size_t n, value_type value) -> vector_type
    {
        vector_type v = xt::zeros<value_type>(vector_type::shape_type{n});
        v.fill(value);
        return v;
    }

    inline auto iota_vector(std::size_t n) -> vector_type
    {
        vector_type v = xt::zeros<value_type>(vector_type::shape_type{n});
        for(std::size_t i = 0; i < n; ++i)
        {
            v(i) = value_type(i + 1);
        }
        return v;
    }

    /// horizontal segment of 4 nodes (2 chunks of order 2) at height y
    inline auto small_segment(value_type y) -> chunker_type
    {
        return bieops::utils::segment<value_type>(point_type{0., y}, point_type{1., y}, 2, 2);
    }

    /// kernel returning 1 for coincident source and target, 0 otherwise
    inline auto identity_like() -> kernel_type
    {
        auto eval = [](info_type const& src, info_type const& targ) -> matrix_type
        {
            matrix_type block = xt::zeros<value_type>(matrix_type::shape_type{targ.size(), src.size()});
            for(std::size_t t = 0; t < targ.size(); ++t)
            {
                for(std::size_t s = 0; s < src.size(); ++s)
                {
                    if(targ.r()(0, t) == src.r()(0, s) && targ.r()(1, t) == src.r()(1, s))
                    {
                        block(t, s) = 1.;
                    }
                }
            }
            return block;
        };
        return kernel_type(eval, "identity_like", bieops::matrix_kernels::singularity::smooth);
    }

    ///
    /// \brief plain_sum_evaluator: u = K density over every node, no quadrature weight and no exclusion
    ///
    struct plain_sum_evaluator
    {
        std::shared_ptr<std::size_t> calls{std::make_shared<std::size_t>(0)};

        template<typename ValueType>
        auto operator()(bieops::geometry::chunker<ValueType> const& source,
                        bieops::kernels::kernel<ValueType> const& kern,
                        bieops::quadrature::opdims_type const& opdims, xt::xtensor<ValueType, 1> const& density,
                        bieops::geometry::point_info<ValueType> const& targets,
                        bieops::options::apply_options<ValueType> const& /*opts*/) const -> xt::xtensor<ValueType, 1>
        {
            ++(*calls);
            auto const block = kern.eval(source.info(), targets);
            xt::xtensor<ValueType, 1> u =
              xt::zeros<ValueType>(typename xt::xtensor<ValueType, 1>::shape_type{opdims[0] * targets.size()});
            for(std::size_t r = 0; r < block.shape()[0]; ++r)
            {
                for(std::size_t c = 0; c < block.shape()[1]; ++c)
                {
                    u(r) += block(r, c) * density(c);
                }
            }
            return u;
        }
    };

    /// smooth evaluator failing like a kernel evaluated on a degenerate geometry
    struct failing_evaluator
    {
        template<typename ValueType>
        auto operator()(bieops::geometry::chunker<ValueType> const& /*source*/,
                        bieops::kernels::kernel<ValueType> const& /*kern*/,
                        bieops::quadrature::opdims_type const& /*opdims*/,
                        xt::xtensor<ValueType, 1> const& /*density*/,
                        bieops::geometry::point_info<ValueType> const& /*targets*/,
                        bieops::options::apply_options<ValueType> const& /*opts*/) const -> xt::xtensor<ValueType, 1>
        {
            throw std::runtime_error("kernel evaluation failed: degenerate geometry");
        }
    };

    ///
    /// \brief zero_corrections builds an empty correction matrix and records how it was called
    ///
    struct zero_corrections
    {
        std::shared_ptr<std::size_t> calls{std::make_shared<std::size_t>(0)};
        std::shared_ptr<bool> corrections_requested{std::make_shared<bool>(false)};

        template<typename Geometry, typename ValueType>
        auto operator()(Geometry const& geometry, bieops::kernels::kernel_descriptor<ValueType> const& kernel,
                        bieops::options::apply_options<ValueType> const& opts) const
          -> bieops::corrections::correction_matrix<ValueType>
        {
            ++(*calls);
            *corrections_requested = opts.corrections;
            auto const comps = bieops::geometry::components(geometry);
            bieops::kernels::kernel_lookup<ValueType> const lookup(kernel, comps.size());
            auto const probe = bieops::algorithms::probe_operator_dimensions(comps, lookup);
            auto const layout =
              bieops::algorithms::make_layout(probe.opdims, bieops::algorithms::point_counts(comps));
            return bieops::corrections::correction_matrix<ValueType>(Eigen::Index(layout.rows()),
                                                                     Eigen::Index(layout.cols()));
        }
    };

    /// correction builder that must not be called
    struct throwing_corrections
    {
        template<typename Geometry, typename ValueType>
        auto operator()(Geometry const& /*geometry*/,
                        bieops::kernels::kernel_descriptor<ValueType> const& /*kernel*/,
                        bieops::options::apply_options<ValueType> const& /*opts*/) const
          -> bieops::corrections::correction_matrix<ValueType>
        {
            throw std::logic_error("the correction builder should not be called");
        }
    };

    ///
    /// \brief direct fast routine counting its calls
    ///
    /// Sums the kernel against the weighted density, coincident points excluded.
    ///
    inline auto counting_fmm(std::shared_ptr<std::size_t> calls, kernel_type const& kern) -> kernel_type::fmm_type
    {
        return [calls, kern](value_type /*eps*/, info_type const& src, info_type const& targ,
                             vector_type const& weighted_density) -> vector_type
        {
            ++(*calls);
            auto const block = kern.eval(src, targ);
            const std::size_t kn = block.shape()[0] / targ.size();
            const std::size_t km = block.shape()[1] / src.size();
            vector_type u = xt::zeros<value_type>(vector_type::shape_type{block.shape()[0]});
            for(std::size_t r = 0; r < block.shape()[0]; ++r)
            {
                for(std::size_t c = 0; c < block.shape()[1]; ++c)
                {
                    const std::size_t t = r / kn;
                    const std::size_t s = c / km;
                    if(targ.r()(0, t) == src.r()(0, s) && targ.r()(1, t) == src.r()(1, s))
                    {
                        continue;
                    }
                    u(r) += block(r, c) * weighted_density(c);
                }
            }
            return u;
        };
    }

}   // namespace units

#endif   // BIEOPS_UNITS_MATAPPLY_HPP
