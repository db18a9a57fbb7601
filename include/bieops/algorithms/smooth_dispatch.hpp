// --------------------------------
// See LICENCE file at project root
// File : algorithms/smooth_dispatch.hpp
// --------------------------------
#ifndef BIEOPS_ALGORITHMS_SMOOTH_DISPATCH_HPP
#define BIEOPS_ALGORITHMS_SMOOTH_DISPATCH_HPP

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xeval.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xtensor.hpp>
#include <xtensor/xview.hpp>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "bieops/algorithms/layout.hpp"
#include "bieops/algorithms/probe.hpp"
#include "bieops/geometry/chunker.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/options/options.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::algorithms::smooth
{
    ///
    /// \brief smooth_context gathers what the smooth pass reads, resolved once per apply
    ///
    template<typename ValueType>
    struct smooth_context
    {
        using value_type = ValueType;

        geometry::component_refs<value_type> const& components;
        kernels::kernel_lookup<value_type> const& kernels;
        opdims_table const& opdims;
        block_layout const& layout;
        options::apply_options<value_type> const& opts;
    };

    namespace details
    {
        template<typename ValueType>
        inline auto check_length(xt::xtensor<ValueType, 1> const& u, std::size_t expected, std::string const& what)
          -> void
        {
            if(u.size() != expected)
            {
                throw shape_mismatch_error("Smooth quadrature output length " + what, u.size(), expected);
            }
        }

        /// sqrt of the smooth weights repeated on each component of the operator, following offsets
        template<typename ValueType>
        inline auto sqrt_weights(geometry::component_refs<ValueType> const& components,
                                 std::vector<std::size_t> const& offsets) -> xt::xtensor<ValueType, 1>
        {
            using vector_type = xt::xtensor<ValueType, 1>;
            vector_type res = xt::zeros<ValueType>(typename vector_type::shape_type{offsets.back()});
            for(std::size_t i = 0; i < components.size(); ++i)
            {
                auto const& c = components[i].get();
                auto const w = xt::eval(xt::sqrt(c.weights()));
                const std::size_t dim = (offsets[i + 1] - offsets[i]) / c.npt();
                for(std::size_t p = 0; p < c.npt(); ++p)
                {
                    for(std::size_t a = 0; a < dim; ++a)
                    {
                        res(offsets[i] + p * dim + a) = w(p);
                    }
                }
            }
            return res;
        }
    }   // namespace details

    ///
    /// \brief merged_strategy: one kernel for every pair
    ///
    /// The components are merged into one chunker which is both the source and the target of a single
    /// smooth evaluation covering the whole output.
    ///
    struct merged_strategy
    {
        static constexpr auto name() noexcept -> std::string_view { return "merged"; }

        template<typename... S, typename ValueType, typename SmoothEvaluator>
        auto operator()(options::settings<S...> /*s*/, smooth_context<ValueType> const& ctx,
                        xt::xtensor<ValueType, 1> const& density, SmoothEvaluator const& evaluator) const
          -> xt::xtensor<ValueType, 1>
        {
            auto const& dims = ctx.opdims(0, 0);
            for(std::size_t i = 0; i < ctx.opdims.size(); ++i)
            {
                for(std::size_t j = 0; j < ctx.opdims.size(); ++j)
                {
                    if(ctx.opdims(i, j) != dims)
                    {
                        throw shape_mismatch_error("The kernel block of the pair (" + std::to_string(i) + ", " +
                                                   std::to_string(j) + ") differs from the pair (0, 0)");
                    }
                }
            }

            auto const& kern = ctx.kernels.single();
            if(ctx.components.size() == 1)
            {
                auto const& chnkr = ctx.components.front().get();
                auto u = evaluator(chnkr, kern, dims, density, chnkr.info(), ctx.opts);
                details::check_length(u, ctx.layout.rows(), "(merged)");
                return u;
            }
            auto const merged = geometry::merge(ctx.components);
            auto u = evaluator(merged, kern, dims, density, merged.info(), ctx.opts);
            details::check_length(u, ctx.layout.rows(), "(merged)");
            return u;
        }
    };

    ///
    /// \brief pairwise_strategy: one kernel per (target, source) pair
    ///
    /// The output slice of the target i is the sum over j, in increasing order, of the smooth evaluation
    /// with the source j, its density slice and the kernel (i, j). With the omp setting the targets are
    /// shared among the threads, each thread writes only the slices of its targets.
    ///
    struct pairwise_strategy
    {
        static constexpr auto name() noexcept -> std::string_view { return "pairwise"; }

        template<typename... S, typename ValueType, typename SmoothEvaluator>
        auto operator()(options::settings<S...> s, smooth_context<ValueType> const& ctx,
                        xt::xtensor<ValueType, 1> const& density, SmoothEvaluator const& evaluator) const
          -> xt::xtensor<ValueType, 1>
        {
            using vector_type = xt::xtensor<ValueType, 1>;
            const std::size_t n = ctx.components.size();
            vector_type u = xt::zeros<ValueType>(typename vector_type::shape_type{ctx.layout.rows()});

            auto accumulate_target = [&ctx, &density, &evaluator, &u, n](std::size_t i)
            {
                auto const& targinfo = ctx.components[i].get().info();
                auto const [rbeg, rend] = ctx.layout.row_range(i);
                auto slice = xt::view(u, xt::range(rbeg, rend));
                for(std::size_t j = 0; j < n; ++j)
                {
                    auto const [cbeg, cend] = ctx.layout.col_range(j);
                    vector_type dens_j = xt::view(density, xt::range(cbeg, cend));
                    auto const uij = evaluator(ctx.components[j].get(), ctx.kernels(i, j), ctx.opdims(i, j), dens_j,
                                               targinfo, ctx.opts);
                    details::check_length(uij, rend - rbeg,
                                          "of the pair (" + std::to_string(i) + ", " + std::to_string(j) + ")");
                    slice += uij;
                }
            };

#ifdef _OPENMP
            if constexpr(options::has(s, options::omp, options::omp_timit))
            {
                std::exception_ptr error{};
#pragma omp parallel for schedule(dynamic) shared(accumulate_target, error)
                for(std::size_t i = 0; i < n; ++i)
                {
                    try
                    {
                        accumulate_target(i);
                    }
                    catch(...)
                    {
#pragma omp critical(bieops_pairwise_error)
                        {
                            if(!error)
                            {
                                error = std::current_exception();
                            }
                        }
                    }
                }
                if(error)
                {
                    std::rethrow_exception(error);
                }
                return u;
            }
#endif
            for(std::size_t i = 0; i < n; ++i)
            {
                accumulate_target(i);
            }
            return u;
        }
    };

    using smooth_strategy = std::variant<merged_strategy, pairwise_strategy>;

    /// \brief merged strategy for a single kernel, pairwise strategy for a kernel matrix
    template<typename ValueType>
    inline auto select_strategy(kernels::kernel_lookup<ValueType> const& kernels) -> smooth_strategy
    {
        if(kernels.homogeneous())
        {
            return merged_strategy{};
        }
        return pairwise_strategy{};
    }

    ///
    /// \brief apply_smooth_quadrature computes the smooth contribution of the operator
    ///
    /// With options.l2scale the density is divided by sqrt(w) on each source block and the result is
    /// multiplied by sqrt(w) on each target block, as done for the corrections.
    ///
    /// \param[in] s the execution settings (seq, omp)
    /// \param[in] strategy the strategy selected by select_strategy
    /// \param[in] ctx the resolved geometry, kernels and layout
    /// \param[in] density the density (layout.cols() values)
    /// \param[in] evaluator the smooth evaluator
    /// \return the smooth contribution (layout.rows() values)
    ///
    template<typename... S, typename ValueType, typename SmoothEvaluator>
    inline auto apply_smooth_quadrature(options::settings<S...> s, smooth_strategy const& strategy,
                                        smooth_context<ValueType> const& ctx, xt::xtensor<ValueType, 1> const& density,
                                        SmoothEvaluator const& evaluator) -> xt::xtensor<ValueType, 1>
    {
        static_assert(
          options::support(s, options::_s(options::omp, options::omp_timit, options::seq, options::seq_timit)),
          "unsupported smooth quadrature options!");
        auto run = [&s, &ctx, &evaluator, &strategy](xt::xtensor<ValueType, 1> const& dens)
        { return std::visit([&](auto const& strat) { return strat(s, ctx, dens, evaluator); }, strategy); };

        if(!ctx.opts.l2scale)
        {
            return run(density);
        }
        auto const sw_cols = details::sqrt_weights(ctx.components, ctx.layout.col_offsets);
        auto const sw_rows = details::sqrt_weights(ctx.components, ctx.layout.row_offsets);
        xt::xtensor<ValueType, 1> scaled = density / sw_cols;
        xt::xtensor<ValueType, 1> u = run(scaled) * sw_rows;
        return u;
    }

}   // namespace bieops::algorithms::smooth

#endif   // BIEOPS_ALGORITHMS_SMOOTH_DISPATCH_HPP
