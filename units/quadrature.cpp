//
// Units for the quadratures
// -------------------------
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cmath>
#include <memory>
#include <tuple>
#include <type_traits>

#include "bieops/kernels/kernel.hpp"
#include "bieops/matrix_kernels/laplace.hpp"
#include "bieops/matrix_kernels/others.hpp"
#include "bieops/quadrature/gauss_legendre.hpp"
#include "bieops/quadrature/smooth.hpp"
#include "bieops/utils/errors.hpp"
#include "bieops/utils/generate.hpp"
#include "units_matapply.hpp"

using namespace bieops;

TEMPLATE_TEST_CASE("gauss-legendre", "[gauss-legendre]", double, float)
{
    using value_type = TestType;
    const value_type tol = std::is_same_v<value_type, float> ? value_type(1e-5) : value_type(1e-13);

    SECTION("exact for polynomials of degree 2k-1", "[exactness]")
    {
        for(std::size_t k: {1, 2, 5, 16})
        {
            auto const [x, w] = quadrature::gauss_legendre<value_type>(k);
            REQUIRE(x.size() == k);
            for(std::size_t deg = 0; deg < 2 * k; ++deg)
            {
                value_type integral{0};
                for(std::size_t i = 0; i < k; ++i)
                {
                    integral += w(i) * std::pow(x(i), value_type(deg));
                }
                const value_type exact = deg % 2 == 1 ? value_type(0) : value_type(2) / value_type(deg + 1);
                REQUIRE(integral == Approx(exact).margin(tol));
            }
        }
    }

    SECTION("increasing symmetric nodes", "[nodes]")
    {
        auto const [x, w] = quadrature::gauss_legendre<value_type>(7);
        for(std::size_t i = 0; i + 1 < 7; ++i)
        {
            REQUIRE(x(i) < x(i + 1));
            REQUIRE(x(i) == Approx(-x(6 - i)));
            REQUIRE(w(i) == Approx(w(6 - i)));
        }
        REQUIRE(std::abs(x(3)) < tol);
    }

    SECTION("order zero", "[zero]")
    {
        REQUIRE_THROWS_AS(quadrature::gauss_legendre<value_type>(0), input_type_error);
    }
}

TEST_CASE("smooth evaluator", "[smooth]")
{
    using units::point_type;
    const double radius{2.};
    auto const c = utils::circle<double>(radius, point_type{0., 0.}, 4, 10);
    auto const w = c.weights();
    const double perimeter = 2. * 3.14159265358979323846 * radius;
    quadrature::smooth_evaluator const evaluator{};
    units::options_type opts{};

    SECTION("coincident nodes are skipped", "[self]")
    {
        auto const kern = kernels::make_kernel<double>(matrix_kernels::others::constant<>{1.});
        auto const u = evaluator(c, kern, {1, 1}, units::make_vector(c.npt(), 1.), c.info(), opts);
        REQUIRE(u.size() == c.npt());
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            REQUIRE(u(i) == Approx(perimeter - w(i)).epsilon(1e-12));
        }
    }

    SECTION("double layer of a constant density", "[double-layer]")
    {
        // off the diagonal D = -1/(4 pi R) on a circle
        auto const kern = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
        auto const u = evaluator(c, kern, {1, 1}, units::make_vector(c.npt(), 1.), c.info(), opts);
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            REQUIRE(u(i) == Approx(-0.5 + w(i) / (4. * 3.14159265358979323846 * radius)).epsilon(1e-12));
        }
    }

    SECTION("vector valued kernel", "[mrhs]")
    {
        auto const kern = kernels::make_kernel<double>(matrix_kernels::others::constant<2, 2>{1.});
        units::vector_type dens = units::make_vector(2 * c.npt(), 0.);
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            dens(2 * i) = 1.;
        }
        auto const u = evaluator(c, kern, {2, 2}, dens, c.info(), opts);
        REQUIRE(u.size() == 2 * c.npt());
        REQUIRE(u(0) == Approx(perimeter - w(0)));
        REQUIRE(u(1) == Approx(perimeter - w(0)));
    }

    SECTION("density length", "[shape]")
    {
        auto const kern = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
        REQUIRE_THROWS_AS(evaluator(c, kern, {1, 1}, units::make_vector(c.npt() + 1, 1.), c.info(), opts),
                          shape_mismatch_error);
        REQUIRE_THROWS_AS(evaluator(c, kern, {2, 1}, units::make_vector(c.npt(), 1.), c.info(), opts),
                          shape_mismatch_error);
    }

    SECTION("fmm dispatch", "[fmm]")
    {
        auto calls = std::make_shared<std::size_t>(0);
        auto kern = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
        kern.set_fmm(units::counting_fmm(calls, kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{})));
        auto const dens = units::iota_vector(c.npt());

        opts.accel = options::acceleration::forced_off;
        auto const direct = evaluator(c, kern, {1, 1}, dens, c.info(), opts);
        REQUIRE(*calls == 0);

        // 40 x 40 is below the automatic threshold
        opts.accel = options::acceleration::automatic;
        evaluator(c, kern, {1, 1}, dens, c.info(), opts);
        REQUIRE(*calls == 0);
        REQUIRE(quadrature::smooth_evaluator::use_fmm(kern, 200, 200, options::acceleration::automatic));
        REQUIRE_FALSE(quadrature::smooth_evaluator::use_fmm(kern, 200, 199, options::acceleration::automatic));

        opts.accel = options::acceleration::forced_on;
        auto const fast = evaluator(c, kern, {1, 1}, dens, c.info(), opts);
        REQUIRE(*calls == 1);
        for(std::size_t i = 0; i < c.npt(); ++i)
        {
            REQUIRE(fast(i) == Approx(direct(i)).epsilon(1e-12));
        }

        // no fast routine, direct summation whatever the policy
        auto const plain = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
        REQUIRE_FALSE(quadrature::smooth_evaluator::use_fmm(plain, 1000, 1000, options::acceleration::forced_on));
    }
}

int main(int argc, char* argv[])
{
    // global setup...
    int result = Catch::Session().run(argc, argv);
    // global clean-up...
    return result;
}
