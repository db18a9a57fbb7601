//
// Units for the matrix-free operator apply
// ----------------------------------------
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <cpp_tools/timers/simple_timer.hpp>

#include <xtensor/xeval.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xview.hpp>

#include "bieops/algorithms/matapply.hpp"
#include "bieops/corrections/correction_matrix.hpp"
#include "bieops/corrections/native.hpp"
#include "bieops/geometry/chunkgraph.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/matrix_kernels/laplace.hpp"
#include "bieops/matrix_kernels/others.hpp"
#include "bieops/operators/apply_operators.hpp"
#include "bieops/options/options.hpp"
#include "bieops/tools/bench.hpp"
#include "bieops/utils/errors.hpp"
#include "bieops/utils/generate.hpp"
#include "units_matapply.hpp"

using namespace bieops;
using units::point_type;

namespace
{
    auto quiet_options() -> units::options_type
    {
        units::options_type opts{};
        opts.quad = options::quadrature_method::native;
        opts.verbose = false;
        return opts;
    }

    auto double_layer() -> units::kernel_type
    {
        return kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
    }

    auto zero_kernel() -> units::kernel_type { return kernels::make_kernel<double>(matrix_kernels::others::zero<1, 1>{}); }

    auto two_circles() -> geometry::component_list<double>
    {
        return geometry::component_list<double>(
          {utils::circle<double>(1., point_type{0., 0.}, 4, 16), utils::circle<double>(0.5, point_type{4., 1.}, 3, 16)});
    }

    auto max_abs_diff(units::vector_type const& a, units::vector_type const& b) -> double
    {
        return xt::amax(xt::abs(a - b))();
    }
}   // namespace

TEST_CASE("corrections plus smooth part", "[composition]")
{
    auto opts = quiet_options();
    units::plain_sum_evaluator evaluator{};

    SECTION("constant kernel", "[constant]")
    {
        const double c{2.5};
        geometry::component_list<double> const geom({units::small_segment(0.), units::small_segment(1.)});
        auto const cst = kernels::make_kernel<double>(matrix_kernels::others::constant<>{c});
        auto const ops = operators::make_apply_operators(units::zero_corrections{}, evaluator);
        auto const u = algorithms::matapply(geom, cst, units::make_vector(8, 1.), units::cormat_type(8, 8), opts, ops);
        REQUIRE(u.size() == 8);
        for(std::size_t i = 0; i < 8; ++i)
        {
            REQUIRE(u(i) == Approx(c * 8.));
        }
        // merged: a single evaluation
        REQUIRE(*evaluator.calls == 1);
    }

    SECTION("identity blocks", "[identity]")
    {
        geometry::component_list<double> const geom({units::small_segment(0.), units::small_segment(1.)});
        kernels::kernel_matrix<double> const mat{{units::identity_like(), zero_kernel()},
                                                 {zero_kernel(), units::identity_like()}};
        auto const ops = operators::make_apply_operators(units::zero_corrections{}, evaluator);
        auto const density = units::iota_vector(8);
        auto const u = algorithms::matapply(geom, mat, density, std::nullopt, opts, ops);
        REQUIRE(max_abs_diff(u, density) == 0.);
        // pairwise: one evaluation per pair
        REQUIRE(*evaluator.calls == 4);
    }

    SECTION("zero corrections leave the smooth part", "[zero]")
    {
        auto const c = utils::circle<double>(1., point_type{0., 0.}, 3, 8);
        auto const density = units::iota_vector(c.npt());
        auto const u = algorithms::matapply(c, double_layer(), density, units::cormat_type(24, 24), opts);

        auto const smooth = quadrature::smooth_evaluator{}(c, double_layer(), {1, 1}, density, c.info(), opts);
        REQUIRE(max_abs_diff(u, smooth) == 0.);
    }

    SECTION("explicit corrections", "[explicit]")
    {
        auto const geom = two_circles();
        auto const density = units::iota_vector(geom.at(0).npt() + geom.at(1).npt());
        auto self_opts = opts;
        self_opts.corrections = true;
        auto const cormat = corrections::native_corrections{}(
          geom, kernels::kernel_descriptor<double>{double_layer()}, self_opts);

        auto const built = algorithms::matapply(geom, double_layer(), density, std::nullopt, opts);
        auto const given = algorithms::matapply(geom, double_layer(), density, cormat, opts);
        REQUIRE(max_abs_diff(built, given) < 1e-10);

        // given corrections are read in place
        corrections::correction_view<double> const view(cormat);
        REQUIRE(view.get() == &cormat);
        std::optional<units::cormat_type> const cached(cormat);
        REQUIRE(corrections::correction_view<double>(cached).get() == &(*cached));
        REQUIRE_FALSE(corrections::correction_view<double>(std::nullopt));
        auto const from_cache = algorithms::matapply(geom, double_layer(), density, cached, opts);
        REQUIRE(max_abs_diff(given, from_cache) == 0.);
    }
}

TEST_CASE("vector valued operators", "[vector]")
{
    auto opts = quiet_options();
    geometry::component_list<double> const geom({units::small_segment(0.), units::small_segment(1.)});
    auto const ops = operators::make_apply_operators(units::zero_corrections{}, units::plain_sum_evaluator{});

    SECTION("heterogeneous widths", "[pairwise]")
    {
        // value of the kernel (target i, source j), rows 1 then 2, columns 2 then 1
        const double values[2][2] = {{1.5, -2.}, {0.25, 3.}};
        kernels::kernel_matrix<double> const mat{
          {kernels::make_kernel<double>(matrix_kernels::others::constant<1, 2>{values[0][0]}),
           kernels::make_kernel<double>(matrix_kernels::others::constant<1, 1>{values[0][1]})},
          {kernels::make_kernel<double>(matrix_kernels::others::constant<2, 2>{values[1][0]}),
           kernels::make_kernel<double>(matrix_kernels::others::constant<2, 1>{values[1][1]})}};
        const std::size_t row_offsets[3] = {0, 4, 12};
        const std::size_t col_offsets[3] = {0, 8, 12};
        auto const density = units::iota_vector(12);

        units::vector_type expected = units::make_vector(12, 0.);
        for(std::size_t i = 0; i < 2; ++i)
        {
            for(std::size_t r = row_offsets[i]; r < row_offsets[i + 1]; ++r)
            {
                for(std::size_t j = 0; j < 2; ++j)
                {
                    for(std::size_t c = col_offsets[j]; c < col_offsets[j + 1]; ++c)
                    {
                        expected(r) += values[i][j] * density(c);
                    }
                }
            }
        }

        auto const u = algorithms::matapply[options::_s(options::seq)](geom, mat, density, std::nullopt, opts, ops);
        REQUIRE(u.size() == 12);
        for(std::size_t r = 0; r < 12; ++r)
        {
            REQUIRE(u(r) == Approx(expected(r)));
        }
        auto const v = algorithms::matapply[options::_s(options::omp)](geom, mat, density, std::nullopt, opts, ops);
        REQUIRE(max_abs_diff(u, v) == 0.);
        REQUIRE_THROWS_AS(algorithms::matapply(geom, mat, units::iota_vector(8), std::nullopt, opts, ops),
                          shape_mismatch_error);
    }

    SECTION("more rows than columns", "[merged]")
    {
        const double c{-0.5};
        auto const kern = kernels::make_kernel<double>(matrix_kernels::others::constant<2, 1>{c});
        auto const density = units::iota_vector(8);
        auto const u = algorithms::matapply(geom, kern, density, std::nullopt, opts, ops);
        REQUIRE(u.size() == 16);
        for(std::size_t r = 0; r < 16; ++r)
        {
            REQUIRE(u(r) == Approx(c * 36.));
        }
    }

    SECTION("two densities with l2 scaling", "[l2scale]")
    {
        auto const c = utils::circle<double>(1.5, point_type{0., 2.}, 4, 12);
        const std::size_t n = c.npt();
        opts.l2scale = true;
        auto const sw = xt::eval(xt::sqrt(c.weights()));
        units::vector_type const first = units::iota_vector(n);
        units::vector_type const second = sw;
        units::vector_type both = units::make_vector(2 * n, 0.);
        for(std::size_t p = 0; p < n; ++p)
        {
            both(2 * p) = first(p);
            both(2 * p + 1) = second(p);
        }

        auto const u_first = algorithms::matapply(c, double_layer(), first, std::nullopt, opts);
        auto const u_second = algorithms::matapply(c, double_layer(), second, std::nullopt, opts);
        auto const u = algorithms::matapply(
          c, kernels::make_kernel<double>(matrix_kernels::laplace::double_layer_mrhs{}), both, std::nullopt, opts);
        REQUIRE(u.size() == 2 * n);
        for(std::size_t p = 0; p < n; ++p)
        {
            REQUIRE(u(2 * p) == Approx(u_first(p)).margin(1e-12));
            REQUIRE(u(2 * p + 1) == Approx(u_second(p)).margin(1e-12));
            REQUIRE(u(2 * p + 1) == Approx(-0.5 * sw(p)).margin(1e-12));
        }
    }
}

TEST_CASE("correction builder calls", "[builder]")
{
    auto const opts = quiet_options();
    geometry::component_list<double> const geom({units::small_segment(0.), units::small_segment(1.)});
    auto const cst = kernels::make_kernel<double>(matrix_kernels::others::constant<>{});

    SECTION("given corrections are used as is", "[given]")
    {
        auto const ops = operators::make_apply_operators(units::throwing_corrections{}, units::plain_sum_evaluator{});
        REQUIRE_NOTHROW(algorithms::matapply(geom, cst, units::make_vector(8, 1.), units::cormat_type(8, 8), opts, ops));
        REQUIRE_THROWS_AS(algorithms::matapply(geom, cst, units::make_vector(8, 1.), std::nullopt, opts, ops),
                          std::logic_error);
    }

    SECTION("missing corrections are built", "[missing]")
    {
        units::zero_corrections builder{};
        auto const ops = operators::make_apply_operators(builder, units::plain_sum_evaluator{});
        REQUIRE_FALSE(opts.corrections);
        algorithms::matapply(geom, cst, units::make_vector(8, 1.), std::nullopt, opts, ops);
        REQUIRE(*builder.calls == 1);
        REQUIRE(*builder.corrections_requested);
    }

    SECTION("correction shape", "[shape]")
    {
        auto const ops = operators::make_apply_operators(units::throwing_corrections{}, units::plain_sum_evaluator{});
        REQUIRE_THROWS_AS(algorithms::matapply(geom, cst, units::make_vector(8, 1.), units::cormat_type(8, 7), opts, ops),
                          shape_mismatch_error);
    }
}

TEST_CASE("block isolation", "[isolation]")
{
    auto const opts = quiet_options();
    auto const geom = two_circles();
    kernels::kernel_matrix<double> const mat{{double_layer(), zero_kernel()}, {zero_kernel(), double_layer()}};
    const std::size_t n0 = geom.at(0).npt();
    const std::size_t n1 = geom.at(1).npt();

    auto density = units::iota_vector(n0 + n1);
    auto const u = algorithms::matapply(geom, mat, density, std::nullopt, opts);
    xt::view(density, xt::range(n0, n0 + n1)) = 0.;
    auto const v = algorithms::matapply(geom, mat, density, std::nullopt, opts);

    units::vector_type const u0 = xt::view(u, xt::range(0, n0));
    units::vector_type const v0 = xt::view(v, xt::range(0, n0));
    REQUIRE(max_abs_diff(u0, v0) == 0.);
    units::vector_type const v1 = xt::view(v, xt::range(n0, n0 + n1));
    REQUIRE(xt::amax(xt::abs(v1))() == 0.);
}

TEST_CASE("invalid inputs", "[errors]")
{
    auto const opts = quiet_options();
    auto const geom = two_circles();
    const std::size_t n = geom.at(0).npt() + geom.at(1).npt();

    SECTION("density length", "[density]")
    {
        REQUIRE_THROWS_AS(algorithms::matapply(geom, double_layer(), units::make_vector(n - 1, 1.), std::nullopt, opts),
                          shape_mismatch_error);
    }

    SECTION("empty geometry", "[geometry]")
    {
        geometry::component_list<double> const empty(std::vector<units::chunker_type>{});
        REQUIRE_THROWS_AS(algorithms::matapply(empty, double_layer(), units::make_vector(0, 1.), std::nullopt, opts),
                          input_type_error);
    }

    SECTION("default quadrature", "[ggq]")
    {
        // the default builder only provides native corrections
        units::options_type defaults{};
        defaults.verbose = false;
        REQUIRE_THROWS_AS(algorithms::matapply(geom, double_layer(), units::make_vector(n, 1.), std::nullopt, defaults),
                          std::invalid_argument);
    }

    SECTION("kernel matrix size", "[kernel]")
    {
        kernels::kernel_matrix<double> const mat{{double_layer(), double_layer(), double_layer()},
                                                 {double_layer(), double_layer(), double_layer()},
                                                 {double_layer(), double_layer(), double_layer()}};
        REQUIRE_THROWS_AS(algorithms::matapply(geom, mat, units::make_vector(n, 1.), std::nullopt, opts),
                          input_type_error);
    }

    SECTION("inconsistent blocks", "[blocks]")
    {
        auto const grad = kernels::make_kernel<double>(matrix_kernels::laplace::grad_single_layer{});
        kernels::kernel_matrix<double> const mat{{double_layer(), grad}, {double_layer(), double_layer()}};
        REQUIRE_THROWS_AS(algorithms::matapply(geom, mat, units::make_vector(n, 1.), std::nullopt, opts),
                          shape_mismatch_error);
    }
}

TEST_CASE("evaluation failures", "[failures]")
{
    auto const opts = quiet_options();
    auto const geom = two_circles();
    const std::size_t n = geom.at(0).npt() + geom.at(1).npt();
    auto const ops = operators::make_apply_operators(units::zero_corrections{}, units::failing_evaluator{});
    kernels::kernel_matrix<double> const mat{{double_layer(), double_layer()}, {double_layer(), double_layer()}};
    const std::string message{"kernel evaluation failed: degenerate geometry"};

    SECTION("merged", "[merged]")
    {
        REQUIRE_THROWS_WITH(algorithms::matapply[options::_s(options::seq)](geom, double_layer(),
                                                                              units::make_vector(n, 1.), std::nullopt,
                                                                              opts, ops),
                            message);
        REQUIRE_THROWS_WITH(algorithms::matapply[options::_s(options::omp)](geom, double_layer(),
                                                                              units::make_vector(n, 1.), std::nullopt,
                                                                              opts, ops),
                            message);
    }

    SECTION("pairwise", "[pairwise]")
    {
        REQUIRE_THROWS_WITH(algorithms::matapply[options::_s(options::seq)](geom, mat, units::make_vector(n, 1.),
                                                                              std::nullopt, opts, ops),
                            message);
        REQUIRE_THROWS_WITH(algorithms::matapply[options::_s(options::omp)](geom, mat, units::make_vector(n, 1.),
                                                                              std::nullopt, opts, ops),
                            message);
    }
}

TEST_CASE("strategies and settings agree", "[agreement]")
{
    auto const opts = quiet_options();
    auto const geom = two_circles();
    const std::size_t n = geom.at(0).npt() + geom.at(1).npt();
    auto const density = units::iota_vector(n);
    kernels::kernel_matrix<double> const mat{{double_layer(), double_layer()}, {double_layer(), double_layer()}};

    auto const merged = algorithms::matapply[options::_s(options::seq)](geom, double_layer(), density, std::nullopt, opts);
    auto const pairwise = algorithms::matapply[options::_s(options::seq)](geom, mat, density, std::nullopt, opts);
    auto const pairwise_omp = algorithms::matapply[options::_s(options::omp)](geom, mat, density, std::nullopt, opts);
    auto const merged_omp =
      algorithms::matapply[options::_s(options::omp)](geom, double_layer(), density, std::nullopt, opts);

    REQUIRE(max_abs_diff(merged, pairwise) < 1e-10);
    REQUIRE(max_abs_diff(pairwise, pairwise_omp) < 1e-14);
    REQUIRE(max_abs_diff(merged, merged_omp) < 1e-14);
}

TEST_CASE("double layer of a constant density", "[laplace]")
{
    auto opts = quiet_options();

    SECTION("one circle", "[circle]")
    {
        auto const c = utils::circle<double>(2., point_type{1., -1.}, 6, 16);
        auto const u = algorithms::matapply(c, double_layer(), units::make_vector(c.npt(), 1.), std::nullopt, opts);
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            REQUIRE(u(i) == Approx(-0.5).margin(1e-12));
        }
    }

    SECTION("separated circles", "[circles]")
    {
        auto const geom = two_circles();
        const std::size_t n = geom.at(0).npt() + geom.at(1).npt();
        auto const u = algorithms::matapply(geom, double_layer(), units::make_vector(n, 1.), std::nullopt, opts);
        for(std::size_t i = 0; i < n; ++i)
        {
            REQUIRE(u(i) == Approx(-0.5).margin(1e-10));
        }
    }

    SECTION("l2 scaled density", "[l2scale]")
    {
        auto const c = utils::circle<double>(1., point_type{0., 0.}, 5, 16);
        opts.l2scale = true;
        auto const sw = xt::eval(xt::sqrt(c.weights()));
        units::vector_type const density = sw;
        auto const u = algorithms::matapply(c, double_layer(), density, std::nullopt, opts);
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            REQUIRE(u(i) == Approx(-0.5 * sw(i)).margin(1e-12));
        }
    }

    SECTION("function handle", "[handle]")
    {
        auto const c = utils::circle<double>(1., point_type{0., 0.}, 4, 16);
        auto const kern = double_layer();
        auto handle = [kern](units::info_type const& src, units::info_type const& targ) -> units::matrix_type
        { return kern.eval(src, targ); };
        // kernels given by a handle take the singularity of the options
        opts.sing = matrix_kernels::singularity::smooth;
        auto const u = algorithms::matapply(c, handle, units::make_vector(c.npt(), 1.), std::nullopt, opts);
        REQUIRE(u(3) == Approx(-0.5).margin(1e-12));
    }
}

TEST_CASE("chunkgraph geometry", "[chunkgraph]")
{
    auto const opts = quiet_options();
    auto const e0 = utils::segment<double>(point_type{0., 0.}, point_type{1., 0.}, 2, 8);
    auto const e1 = utils::segment<double>(point_type{1., 0.}, point_type{1., 1.}, 2, 8);
    xt::xtensor<double, 2> vertices = {{0., 1., 1.}, {0., 0., 1.}};
    xt::xtensor<long, 2> edges = {{0, 1}, {1, 2}};
    geometry::chunkgraph<double> const graph(vertices, edges, {e0, e1});
    geometry::component_list<double> const list({e0, e1});

    auto const cst = kernels::make_kernel<double>(matrix_kernels::others::constant<>{});
    auto const density = units::iota_vector(32);
    auto const from_graph = algorithms::matapply(graph, cst, density, std::nullopt, opts);
    auto const from_list = algorithms::matapply(list, cst, density, std::nullopt, opts);
    REQUIRE(from_graph.size() == 32);
    REQUIRE(max_abs_diff(from_graph, from_list) == 0.);
}

TEST_CASE("timed apply", "[timit]")
{
    auto const opts = quiet_options();
    auto const c = utils::circle<double>(1., point_type{0., 0.}, 4, 16);
    auto const u = algorithms::matapply[options::_s(options::seq_timit)](c, double_layer(),
                                                                          units::make_vector(c.npt(), 1.),
                                                                          std::nullopt, opts);
    REQUIRE(u(0) == Approx(-0.5).margin(1e-12));

    using timer_type = cpp_tools::timers::timer<std::chrono::nanoseconds>;
    std::unordered_map<std::string, timer_type> timers = {{"probe", timer_type()}, {"smooth", timer_type()}};
    timers["probe"].tic();
    timers["probe"].tac();
    auto const overall = bench::print(timers);
    REQUIRE(overall == Approx(bench::compute(timers)));
    REQUIRE(overall >= 0.);
    REQUIRE(timers.size() == 2);
}

int main(int argc, char* argv[])
{
    // global setup...
    int result = Catch::Session().run(argc, argv);
    // global clean-up...
    return result;
}
