//
// Units for the operator dimensions and the block layout
// -------------------------------------------------------
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <memory>
#include <sstream>
#include <vector>

#include "bieops/algorithms/advisory.hpp"
#include "bieops/algorithms/layout.hpp"
#include "bieops/algorithms/probe.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/matrix_kernels/laplace.hpp"
#include "bieops/matrix_kernels/others.hpp"
#include "bieops/utils/errors.hpp"
#include "bieops/utils/generate.hpp"
#include "units_matapply.hpp"

using namespace bieops;

TEST_CASE("operator dimensions", "[probe]")
{
    using units::point_type;
    geometry::component_list<double> const geom({utils::segment<double>(point_type{0., 0.}, point_type{1., 0.}, 2, 4),
                                                 utils::circle<double>(1., point_type{3., 0.}, 3, 4),
                                                 utils::segment<double>(point_type{0., 2.}, point_type{1., 3.}, 1, 4)});
    auto const comps = geometry::components(geom);

    SECTION("scalar kernel", "[scalar]")
    {
        kernels::kernel_lookup<double> const lookup(
          kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{}), comps.size());
        auto const probe = algorithms::probe_operator_dimensions(comps, lookup);
        REQUIRE(probe.opdims.size() == 3);
        for(std::size_t i = 0; i < 3; ++i)
        {
            for(std::size_t j = 0; j < 3; ++j)
            {
                REQUIRE(probe.opdims(i, j) == algorithms::opdims_type{1, 1});
            }
        }
        REQUIRE_FALSE(probe.fmm_all);

        // probing twice gives the same table
        auto const again = algorithms::probe_operator_dimensions(comps, lookup);
        REQUIRE(again.opdims == probe.opdims);
        REQUIRE(again.fmm_all == probe.fmm_all);
    }

    SECTION("sample nodes", "[samples]")
    {
        auto seen = std::make_shared<std::vector<std::pair<double, double>>>();
        units::kernel_type const recorder(
          [seen](units::info_type const& s, units::info_type const& t) -> units::matrix_type
          {
              seen->emplace_back(t.r()(0, 0), s.r()(0, 0));
              return xt::zeros<double>(units::matrix_type::shape_type{t.size(), s.size()});
          });
        kernels::kernel_lookup<double> const lookup(recorder, comps.size());
        algorithms::probe_operator_dimensions(comps, lookup);
        REQUIRE(seen->size() == 9);
        // pair (1, 2): second node of the target, first node of the source
        REQUIRE((*seen)[1 * 3 + 2].first == comps[1].get().r()(0, 1));
        REQUIRE((*seen)[1 * 3 + 2].second == comps[2].get().r()(0, 0));
    }

    SECTION("heterogeneous dimensions", "[heterogeneous]")
    {
        auto const calls = std::make_shared<std::size_t>(0);
        auto grad = kernels::make_kernel<double>(matrix_kernels::laplace::grad_single_layer{});
        auto cst = kernels::make_kernel<double>(matrix_kernels::others::constant<2, 1>{1.});
        auto dl = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
        grad.set_fmm(units::counting_fmm(calls, grad));
        cst.set_fmm(units::counting_fmm(calls, cst));
        dl.set_fmm(units::counting_fmm(calls, dl));
        kernels::kernel_matrix<double> const mat{{grad, cst, grad}, {dl, dl, dl}, {cst, grad, cst}};
        kernels::kernel_lookup<double> const lookup(mat, comps.size());
        auto const probe = algorithms::probe_operator_dimensions(comps, lookup);
        REQUIRE(probe.fmm_all);
        REQUIRE(probe.opdims(0, 1) == algorithms::opdims_type{2, 1});
        REQUIRE(probe.opdims(1, 2) == algorithms::opdims_type{1, 1});
        REQUIRE_NOTHROW(algorithms::check_consistency(probe.opdims));

        auto const layout = algorithms::make_layout(probe.opdims, algorithms::point_counts(comps));
        REQUIRE(layout.row_offsets == std::vector<std::size_t>{0, 16, 28, 36});
        REQUIRE(layout.col_offsets == std::vector<std::size_t>{0, 8, 20, 24});
        REQUIRE(layout.rows() == 36);
        REQUIRE(layout.cols() == 24);
        REQUIRE(*calls == 0);
    }
}

TEST_CASE("block layout", "[layout]")
{
    SECTION("cumulative sums for scalar operators", "[scalar]")
    {
        algorithms::opdims_table table(4);
        for(std::size_t i = 0; i < 4; ++i)
        {
            for(std::size_t j = 0; j < 4; ++j)
            {
                table(i, j) = {1, 1};
            }
        }
        std::vector<std::size_t> const npts{5, 0, 7, 2};
        auto const layout = algorithms::make_layout(table, npts);
        REQUIRE(layout.row_offsets == std::vector<std::size_t>{0, 5, 5, 12, 14});
        REQUIRE(layout.col_offsets == layout.row_offsets);
        REQUIRE(layout.size() == 4);
        REQUIRE(layout.row_range(2) == std::pair<std::size_t, std::size_t>{5, 12});
        REQUIRE_THROWS_AS(algorithms::make_layout(table, {1, 2}), shape_mismatch_error);
    }

    SECTION("inconsistent operator dimensions", "[consistency]")
    {
        algorithms::opdims_table table(2);
        table(0, 0) = {2, 1};
        table(0, 1) = {2, 3};
        table(1, 0) = {1, 1};
        table(1, 1) = {1, 3};
        REQUIRE_NOTHROW(algorithms::check_consistency(table));

        table(1, 1) = {2, 3};
        REQUIRE_THROWS_AS(algorithms::check_consistency(table), shape_mismatch_error);
        table(1, 1) = {1, 1};
        REQUIRE_THROWS_AS(algorithms::check_consistency(table), shape_mismatch_error);
    }
}

TEST_CASE("advisory", "[advisory]")
{
    units::options_type opts{};
    std::stringstream out;

    algorithms::probe_result probe{algorithms::opdims_table(1), true};
    REQUIRE_FALSE(algorithms::advise(probe, opts, out));
    REQUIRE(out.str().empty());

    probe.fmm_all = false;
    REQUIRE(algorithms::advise(probe, opts, out));
    REQUIRE(out.str().find("WARNING") != std::string::npos);

    std::stringstream silent;
    opts.verbose = false;
    REQUIRE(algorithms::advise(probe, opts, silent));
    REQUIRE(silent.str().empty());
}

int main(int argc, char* argv[])
{
    // global setup...
    int result = Catch::Session().run(argc, argv);
    // global clean-up...
    return result;
}
