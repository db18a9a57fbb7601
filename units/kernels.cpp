//
// Units for the kernels
// ---------------------
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

#include "bieops/geometry/point_info.hpp"
#include "bieops/kernels/kernel.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/matrix_kernels/laplace.hpp"
#include "bieops/matrix_kernels/mk_common.hpp"
#include "bieops/matrix_kernels/others.hpp"
#include "bieops/utils/errors.hpp"
#include "units_matapply.hpp"

using namespace bieops;

namespace
{
    constexpr double pi{3.14159265358979323846};

    /// node on the unit circle at angle t, counterclockwise parameterization
    inline auto circle_node(double t) -> geometry::node<double>
    {
        geometry::node<double> nd{};
        nd.r = {std::cos(t), std::sin(t)};
        nd.d = {-std::sin(t), std::cos(t)};
        nd.d2 = {-std::cos(t), -std::sin(t)};
        nd.n = {std::cos(t), std::sin(t)};
        return nd;
    }
}   // namespace

TEST_CASE("laplace matrix kernels", "[laplace]")
{
    auto const x = circle_node(0.3);
    auto const y = circle_node(2.1);
    auto const diff = x.r - y.r;
    const double r2 = diff.norm2();

    SECTION("single layer", "[single-layer]")
    {
        matrix_kernels::laplace::single_layer const s{};
        REQUIRE(s.evaluate(x, y)[0] == Approx(-std::log(std::sqrt(r2)) / (2. * pi)));
        REQUIRE(matrix_kernels::laplace::single_layer::singularity_tag == matrix_kernels::singularity::log);
    }

    SECTION("double layer", "[double-layer]")
    {
        matrix_kernels::laplace::double_layer const d{};
        REQUIRE(d.evaluate(x, y)[0] == Approx(-1. / (4. * pi)));
        // limit at coincident nodes
        REQUIRE(d.evaluate(x, x)[0] == Approx(-1. / (4. * pi)));
    }

    SECTION("normal derivative", "[sprime]")
    {
        matrix_kernels::laplace::normal_derivative const sp{};
        REQUIRE(sp.evaluate(x, y)[0] == Approx(-1. / (4. * pi)));
        REQUIRE(sp.evaluate(y, y)[0] == Approx(-1. / (4. * pi)));
    }

    SECTION("combined field", "[combined-field]")
    {
        matrix_kernels::laplace::combined_field const cf(2., -3.);
        auto const d = matrix_kernels::laplace::double_layer{}.evaluate(x, y)[0];
        auto const s = matrix_kernels::laplace::single_layer{}.evaluate(x, y)[0];
        REQUIRE(cf.evaluate(x, y)[0] == Approx(2. * d - 3. * s));
    }

    SECTION("gradient of the single layer", "[grad]")
    {
        matrix_kernels::laplace::grad_single_layer const g{};
        auto const val = g.evaluate(x, y);
        REQUIRE(val.size() == 2);
        REQUIRE(val[0] == Approx(-diff[0] / (2. * pi * r2)));
        REQUIRE(val[1] == Approx(-diff[1] / (2. * pi * r2)));
    }

    SECTION("two densities", "[mrhs]")
    {
        auto const val = matrix_kernels::laplace::double_layer_mrhs{}.evaluate(x, y);
        REQUIRE(val[0] == Approx(-1. / (4. * pi)));
        REQUIRE(val[1] == 0.);
        REQUIRE(val[2] == 0.);
        REQUIRE(val[3] == val[0]);
    }
}

TEST_CASE("runtime kernels", "[kernel]")
{
    auto const seg = units::small_segment(0.);
    auto const src = seg.info().subset(0, 3);
    auto const targ = seg.info().subset(1, 4);

    SECTION("block layout of a matrix kernel", "[block]")
    {
        auto const grad = kernels::make_kernel<double>(matrix_kernels::laplace::grad_single_layer{});
        REQUIRE(grad.name() == "laplace_grad_single_layer");
        REQUIRE(grad.singularity() == matrix_kernels::singularity::pv);
        REQUIRE_FALSE(grad.has_fmm());

        auto const block = grad.eval(src, targ);
        REQUIRE(block.shape()[0] == 2 * targ.size());
        REQUIRE(block.shape()[1] == src.size());
        // entry (t*kn+a, s*km+b)
        auto const val = matrix_kernels::laplace::grad_single_layer{}.evaluate(targ.node(2), src.node(0));
        REQUIRE(block(2 * 2 + 1, 0) == Approx(val[1]));

        auto const cst = kernels::make_kernel<double>(matrix_kernels::others::constant<3, 2>{4.});
        auto const cblock = cst.eval(src, targ);
        REQUIRE(cblock.shape()[0] == 9);
        REQUIRE(cblock.shape()[1] == 6);
        REQUIRE(cblock(8, 5) == 4.);
    }

    SECTION("function handle", "[handle]")
    {
        units::kernel_type const handle(
          [](units::info_type const& s, units::info_type const& t) -> units::matrix_type
          { return xt::ones<double>(units::matrix_type::shape_type{t.size(), s.size()}); });
        REQUIRE(handle.name() == "function_handle");
        REQUIRE_FALSE(handle.singularity().has_value());
        REQUIRE(handle.singularity_or(matrix_kernels::singularity::hs) == matrix_kernels::singularity::hs);
        REQUIRE(handle.eval(src, targ).shape()[1] == 3);
    }

    SECTION("empty kernel", "[empty]")
    {
        units::kernel_type const empty{};
        REQUIRE(empty.empty());
        REQUIRE_THROWS_AS(empty.eval(src, targ), input_type_error);
        REQUIRE_THROWS_AS(empty.fmm(1e-14, src, targ, units::make_vector(3, 1.)), std::runtime_error);
    }

    SECTION("singularity names", "[singularity]")
    {
        for(auto s: {matrix_kernels::singularity::smooth, matrix_kernels::singularity::log,
                     matrix_kernels::singularity::pv, matrix_kernels::singularity::hs})
        {
            REQUIRE(matrix_kernels::singularity_from_string(matrix_kernels::to_string(s)) == s);
        }
        REQUIRE_THROWS_AS(matrix_kernels::singularity_from_string("cauchy"), std::invalid_argument);
    }
}

TEST_CASE("kernel lookup", "[kernel-lookup]")
{
    auto const d = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
    auto const s = kernels::make_kernel<double>(matrix_kernels::laplace::single_layer{});
    auto const z = kernels::make_kernel<double>(matrix_kernels::others::zero<>{});

    SECTION("single kernel", "[single]")
    {
        kernels::kernel_lookup<double> const lookup(kernels::kernel_descriptor<double>{d}, 3);
        REQUIRE(lookup.homogeneous());
        REQUIRE(lookup(2, 1).name() == d.name());
        REQUIRE(lookup.single().name() == d.name());
    }

    SECTION("kernel matrix", "[matrix]")
    {
        kernels::kernel_matrix<double> const mat{{d, z}, {s, d}};
        kernels::kernel_lookup<double> const lookup(mat, 2);
        REQUIRE_FALSE(lookup.homogeneous());
        REQUIRE(lookup(0, 1).name() == "zero");
        REQUIRE(lookup(1, 0).name() == s.name());
        REQUIRE_THROWS_AS(lookup.single(), std::logic_error);

        // a 1 x 1 matrix is a single kernel
        kernels::kernel_lookup<double> const one(kernels::kernel_matrix<double>{{s}}, 4);
        REQUIRE(one.homogeneous());
        REQUIRE(one(3, 0).name() == s.name());
    }

    SECTION("invalid descriptors", "[invalid]")
    {
        kernels::kernel_matrix<double> const mat{{d, z}, {s, d}};
        REQUIRE_THROWS_AS(kernels::kernel_lookup<double>(mat, 3), input_type_error);

        kernels::kernel_matrix<double> holes(2, 2);
        holes(0, 0) = d;
        holes(1, 1) = d;
        holes(1, 0) = s;
        REQUIRE_THROWS_WITH(kernels::kernel_lookup<double>(holes, 2),
                            "Second input is not a kernel object, function handle, or matrix of kernels");
        REQUIRE_THROWS_AS(kernels::kernel_lookup<double>(kernels::kernel_descriptor<double>{units::kernel_type{}}, 1),
                          input_type_error);
        REQUIRE_THROWS_AS(kernels::kernel_matrix<double>(2, 2, {d, s, z}), shape_mismatch_error);
    }
}

int main(int argc, char* argv[])
{
    // global setup...
    int result = Catch::Session().run(argc, argv);
    // global clean-up...
    return result;
}
