//
// Units for the corrections
// -------------------------
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

#include "bieops/corrections/correction_matrix.hpp"
#include "bieops/corrections/native.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/matrix_kernels/laplace.hpp"
#include "bieops/matrix_kernels/others.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/utils/errors.hpp"
#include "bieops/utils/generate.hpp"
#include "units_matapply.hpp"

using namespace bieops;

TEST_CASE("apply corrections", "[apply-corrections]")
{
    std::vector<corrections::triplet<double>> triplets{{0, 0, 2.}, {0, 2, -1.}, {1, 1, 3.}};
    units::cormat_type cormat(2, 3);
    cormat.setFromTriplets(triplets.begin(), triplets.end());

    auto const u = corrections::apply_corrections(cormat, units::iota_vector(3));
    REQUIRE(u.size() == 2);
    REQUIRE(u(0) == Approx(2. - 3.));
    REQUIRE(u(1) == Approx(6.));

    REQUIRE_THROWS_AS(corrections::apply_corrections(cormat, units::iota_vector(2)), shape_mismatch_error);
    REQUIRE_NOTHROW(corrections::check_shape(cormat, 2, 3));
    REQUIRE_THROWS_AS(corrections::check_shape(cormat, 3, 3), shape_mismatch_error);
    REQUIRE_THROWS_AS(corrections::check_shape(cormat, 2, 2), shape_mismatch_error);
}

TEST_CASE("native corrections", "[native]")
{
    using units::point_type;
    constexpr double pi{3.14159265358979323846};
    units::options_type opts{};
    opts.corrections = true;
    opts.quad = options::quadrature_method::native;
    corrections::native_corrections const builder{};

    SECTION("self terms of the double layer", "[double-layer]")
    {
        const double radius{0.5};
        auto const c = utils::circle<double>(radius, point_type{1., 1.}, 3, 8);
        auto const w = c.weights();
        auto const cormat =
          builder(c, kernels::kernel_descriptor<double>{kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{})},
                  opts);
        REQUIRE(cormat.rows() == 24);
        REQUIRE(cormat.cols() == 24);
        REQUIRE(cormat.nonZeros() == 24);
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            REQUIRE(cormat.coeff(Eigen::Index(i), Eigen::Index(i)) == Approx(-w(i) / (4. * pi * radius)));
        }

        // the scaling of a self term is one
        opts.l2scale = true;
        auto const scaled =
          builder(c, kernels::kernel_descriptor<double>{kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{})},
                  opts);
        REQUIRE(scaled.coeff(3, 3) == Approx(cormat.coeff(3, 3)));
    }

    SECTION("diagonal blocks of a kernel matrix", "[blocks]")
    {
        geometry::component_list<double> const geom(
          {utils::circle<double>(1., point_type{0., 0.}, 2, 4), utils::circle<double>(1., point_type{4., 0.}, 1, 4)});
        auto const mrhs = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer_mrhs{});
        auto const zero = kernels::make_kernel<double>(matrix_kernels::others::zero<2, 2>{});
        kernels::kernel_matrix<double> const mat{{mrhs, zero}, {zero, mrhs}};
        auto const cormat = builder(geom, kernels::kernel_descriptor<double>{mat}, opts);
        REQUIRE(cormat.rows() == 2 * 12);
        REQUIRE(cormat.cols() == 2 * 12);
        // 2 x 2 diagonal blocks per node, zeros off the diagonal are kept in the pattern
        REQUIRE(cormat.nonZeros() == 12 * 4);

        auto const w1 = geom.at(1).weights();
        // node 2 of the second circle, both densities
        REQUIRE(cormat.coeff(16 + 4, 16 + 4) == Approx(-w1(2) / (4. * pi)));
        REQUIRE(cormat.coeff(16 + 5, 16 + 5) == Approx(-w1(2) / (4. * pi)));
        REQUIRE(cormat.coeff(16 + 4, 16 + 5) == 0.);
        REQUIRE(cormat.coeff(0, 16) == 0.);
    }

    SECTION("singular kernels need another builder", "[singular]")
    {
        auto const c = utils::circle<double>(1., point_type{0., 0.}, 2, 8);
        auto const s = kernels::make_kernel<double>(matrix_kernels::laplace::single_layer{});
        REQUIRE_THROWS_AS(builder(c, kernels::kernel_descriptor<double>{s}, opts), std::invalid_argument);

        // kernels without classification take the default singularity
        units::kernel_type const handle(
          [](units::info_type const& src, units::info_type const& targ) -> units::matrix_type
          { return xt::zeros<double>(units::matrix_type::shape_type{targ.size(), src.size()}); });
        REQUIRE_THROWS_AS(builder(c, kernels::kernel_descriptor<double>{handle}, opts), std::invalid_argument);
        opts.sing = matrix_kernels::singularity::smooth;
        REQUIRE_NOTHROW(builder(c, kernels::kernel_descriptor<double>{handle}, opts));
    }

    SECTION("generalized gaussian quadrature needs another builder", "[ggq]")
    {
        auto const c = utils::circle<double>(1., point_type{0., 0.}, 2, 8);
        opts.quad = options::quadrature_method::ggq;
        REQUIRE_THROWS_AS(
          builder(c, kernels::kernel_descriptor<double>{kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{})},
                  opts),
          std::invalid_argument);
        // the default options ask for ggq
        units::options_type defaults{};
        defaults.corrections = true;
        REQUIRE_THROWS_WITH(
          builder(c, kernels::kernel_descriptor<double>{kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{})},
                  defaults),
          Catch::Contains("external correction builder"));
    }

    SECTION("corrections only", "[flag]")
    {
        auto const c = utils::circle<double>(1., point_type{0., 0.}, 2, 8);
        opts.corrections = false;
        REQUIRE_THROWS_AS(
          builder(c, kernels::kernel_descriptor<double>{kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{})},
                  opts),
          std::invalid_argument);
    }
}

int main(int argc, char* argv[])
{
    // global setup...
    int result = Catch::Session().run(argc, argv);
    // global clean-up...
    return result;
}
