// --------------------------------
// See LICENCE file at project root
// File : algorithms/matapply.hpp
// --------------------------------
#ifndef BIEOPS_ALGORITHMS_MATAPPLY_HPP
#define BIEOPS_ALGORITHMS_MATAPPLY_HPP

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>

#include <cpp_tools/timers/simple_timer.hpp>

#include <xtensor/xtensor.hpp>

#include "bieops/algorithms/advisory.hpp"
#include "bieops/algorithms/layout.hpp"
#include "bieops/algorithms/probe.hpp"
#include "bieops/algorithms/smooth_dispatch.hpp"
#include "bieops/corrections/correction_matrix.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/meta/traits.hpp"
#include "bieops/operators/apply_operators.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/options/options.hpp"
#include "bieops/tools/bench.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::algorithms
{
    namespace details
    {
        /// kernel, kernel matrix, kernel descriptor or callable (source info, target info) -> block
        template<typename ValueType, typename Kernel>
        inline auto to_descriptor(Kernel const& kern) -> kernels::kernel_descriptor<ValueType>
        {
            using kernel_type = kernels::kernel<ValueType>;
            using info_type = typename kernel_type::info_type;
            if constexpr(std::is_same_v<Kernel, kernels::kernel_descriptor<ValueType>>)
            {
                return kern;
            }
            else if constexpr(std::is_same_v<Kernel, kernel_type> ||
                              std::is_same_v<Kernel, kernels::kernel_matrix<ValueType>>)
            {
                return kernels::kernel_descriptor<ValueType>{kern};
            }
            else if constexpr(std::is_invocable_r_v<typename kernel_type::matrix_type, Kernel const&,
                                                    info_type const&, info_type const&>)
            {
                return kernels::kernel_descriptor<ValueType>{kernel_type(typename kernel_type::eval_type(kern))};
            }
            else
            {
                static_assert(meta::always_false_v<Kernel>,
                              "Second input is not a kernel object, function handle, or matrix of kernels");
            }
        }
    }   // namespace details

    namespace impl
    {
        ///
        /// \brief matapply applies the boundary integral operator defined by a kernel to a density
        ///
        /// Computes u = A(kernel) density without forming A: the sparse corrections are applied to the
        /// density, then the smooth quadrature contribution is added.
        ///
        /// The density of the source component j is stored in [col_offsets[j], col_offsets[j+1]) and the
        /// result for the target component i in [row_offsets[i], row_offsets[i+1]), each slice point-major
        /// (opdims[1] values per node for the density, opdims[0] for the result).
        ///
        /// If cormat is empty it is built by the correction builder of ops with options.corrections = true
        /// and dropped at the end of the call. Reuse it by building it once with the builder and passing it,
        /// a given matrix is read in place.
        ///
        /// \param[in] s the execution settings (seq, omp, timit)
        /// \param[in] geometry a chunker, a chunkgraph or a component_list
        /// \param[in] kernel a kernel, a kernel matrix or a callable (source info, target info) -> block
        /// \param[in] density the density
        /// \param[in] cormat the corrections (matrix, optional or std::nullopt), built if empty
        /// \param[in] opts the apply options
        /// \param[in] ops the correction builder and the smooth evaluator
        /// \return the operator applied to the density
        ///
        template<typename... S, typename Geometry, typename Kernel, typename ValueType, typename CorrectionBuilder,
                 typename SmoothEvaluator>
        inline auto matapply(options::settings<S...> s, Geometry const& geometry, Kernel const& kernel,
                             xt::xtensor<ValueType, 1> const& density,
                             meta::non_deduced_t<corrections::correction_view<ValueType>> cormat,
                             meta::non_deduced_t<options::apply_options<ValueType>> const& opts,
                             operators::apply_operators<CorrectionBuilder, SmoothEvaluator> const& ops)
          -> xt::xtensor<ValueType, 1>
        {
            static_assert(
              options::support(s, options::_s(options::omp, options::omp_timit, options::seq, options::seq_timit)),
              "unsupported matapply options!");
            static_assert(geometry::is_component_source_v<Geometry>,
                          "First input is not a chunker or chunkgraph object");
            using value_type = ValueType;
            using vector_type = xt::xtensor<value_type, 1>;
            using timer_type = cpp_tools::timers::timer<std::chrono::nanoseconds>;
            std::unordered_map<std::string, timer_type> timers = {{"probe", timer_type()},
                                                                  {"layout", timer_type()},
                                                                  {"corrections", timer_type()},
                                                                  {"apply-corrections", timer_type()},
                                                                  {"smooth", timer_type()}};

            auto const descriptor = details::to_descriptor<value_type>(kernel);
            auto const components = geometry::components(geometry);
            kernels::kernel_lookup<value_type> const lookup(descriptor, components.size());

            if constexpr(options::has(s, options::timit))
            {
                timers["probe"].tic();
            }
            auto const probe = probe_operator_dimensions(components, lookup);
            if constexpr(options::has(s, options::timit))
            {
                timers["probe"].tac();
            }
            advise(probe, opts);

            if constexpr(options::has(s, options::timit))
            {
                timers["layout"].tic();
            }
            check_consistency(probe.opdims);
            auto const layout = make_layout(probe.opdims, point_counts(components));
            if constexpr(options::has(s, options::timit))
            {
                timers["layout"].tac();
            }
            if(density.size() != layout.cols())
            {
                throw shape_mismatch_error("Density length does not match the block layout", density.size(),
                                           layout.cols());
            }

            if constexpr(options::has(s, options::timit))
            {
                timers["corrections"].tic();
            }
            corrections::correction_matrix<value_type> built{};
            if(!cormat)
            {
                auto self_opts = opts;
                self_opts.corrections = true;
                built = ops.correction_builder()(geometry, descriptor, self_opts);
            }
            auto const& correction = cormat ? *cormat : built;
            corrections::check_shape(correction, layout.rows(), layout.cols());
            if constexpr(options::has(s, options::timit))
            {
                timers["corrections"].tac();
                timers["apply-corrections"].tic();
            }
            vector_type u = corrections::apply_corrections(correction, density);
            if constexpr(options::has(s, options::timit))
            {
                timers["apply-corrections"].tac();
                timers["smooth"].tic();
            }

            smooth::smooth_context<value_type> const ctx{components, lookup, probe.opdims, layout, opts};
            auto const strategy = smooth::select_strategy(lookup);
            u += smooth::apply_smooth_quadrature(s, strategy, ctx, density, ops.smooth_evaluator());
            if constexpr(options::has(s, options::timit))
            {
                timers["smooth"].tac();
                bench::print(timers);
            }
            return u;
        }

        template<typename... S, typename Geometry, typename Kernel, typename ValueType>
        inline auto matapply(options::settings<S...> s, Geometry const& geometry, Kernel const& kernel,
                             xt::xtensor<ValueType, 1> const& density,
                             meta::non_deduced_t<corrections::correction_view<ValueType>> cormat,
                             meta::non_deduced_t<options::apply_options<ValueType>> const& opts)
          -> xt::xtensor<ValueType, 1>
        {
            return matapply(s, geometry, kernel, density, cormat, opts, operators::apply_operators<>{});
        }

        template<typename... S, typename Geometry, typename Kernel, typename ValueType>
        inline auto matapply(options::settings<S...> s, Geometry const& geometry, Kernel const& kernel,
                             xt::xtensor<ValueType, 1> const& density,
                             meta::non_deduced_t<corrections::correction_view<ValueType>> cormat)
          -> xt::xtensor<ValueType, 1>
        {
            return matapply(s, geometry, kernel, density, cormat, options::apply_options<ValueType>{});
        }

        template<typename... S, typename Geometry, typename Kernel, typename ValueType>
        inline auto matapply(options::settings<S...> s, Geometry const& geometry, Kernel const& kernel,
                             xt::xtensor<ValueType, 1> const& density) -> xt::xtensor<ValueType, 1>
        {
            return matapply(s, geometry, kernel, density, std::nullopt, options::apply_options<ValueType>{});
        }

        template<typename Geometry, typename Kernel, typename ValueType, typename CorrectionBuilder,
                 typename SmoothEvaluator>
        inline auto matapply(Geometry const& geometry, Kernel const& kernel, xt::xtensor<ValueType, 1> const& density,
                             meta::non_deduced_t<corrections::correction_view<ValueType>> cormat,
                             meta::non_deduced_t<options::apply_options<ValueType>> const& opts,
                             operators::apply_operators<CorrectionBuilder, SmoothEvaluator> const& ops)
          -> xt::xtensor<ValueType, 1>
        {
            return matapply(options::settings<>{}, geometry, kernel, density, cormat, opts, ops);
        }

        template<typename Geometry, typename Kernel, typename ValueType>
        inline auto matapply(Geometry const& geometry, Kernel const& kernel, xt::xtensor<ValueType, 1> const& density,
                             meta::non_deduced_t<corrections::correction_view<ValueType>> cormat,
                             meta::non_deduced_t<options::apply_options<ValueType>> const& opts)
          -> xt::xtensor<ValueType, 1>
        {
            return matapply(options::settings<>{}, geometry, kernel, density, cormat, opts,
                            operators::apply_operators<>{});
        }

        template<typename Geometry, typename Kernel, typename ValueType>
        inline auto matapply(Geometry const& geometry, Kernel const& kernel, xt::xtensor<ValueType, 1> const& density,
                             meta::non_deduced_t<corrections::correction_view<ValueType>> cormat)
          -> xt::xtensor<ValueType, 1>
        {
            return matapply(options::settings<>{}, geometry, kernel, density, cormat,
                            options::apply_options<ValueType>{});
        }

        template<typename Geometry, typename Kernel, typename ValueType>
        inline auto matapply(Geometry const& geometry, Kernel const& kernel, xt::xtensor<ValueType, 1> const& density)
          -> xt::xtensor<ValueType, 1>
        {
            return matapply(options::settings<>{}, geometry, kernel, density, std::nullopt,
                            options::apply_options<ValueType>{});
        }
    }   // namespace impl

    BIEOPS_DECLARE_OPTIONED_CALLEE(matapply);

}   // namespace bieops::algorithms

#endif   // BIEOPS_ALGORITHMS_MATAPPLY_HPP
