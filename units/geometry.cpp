//
// Units for the geometry
// ----------------------
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cmath>
#include <vector>

#include <xtensor/xtensor.hpp>

#include "bieops/geometry/chunker.hpp"
#include "bieops/geometry/chunkgraph.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/utils/errors.hpp"
#include "bieops/utils/generate.hpp"
#include "units_matapply.hpp"

using namespace bieops;

static_assert(geometry::is_component_source_v<geometry::chunker<double>>);
static_assert(geometry::is_component_source_v<geometry::chunkgraph<double>>);
static_assert(geometry::is_component_source_v<geometry::component_list<double>>);
static_assert(!geometry::is_component_source_v<std::vector<double>>);

TEST_CASE("point_info", "[point-info]")
{
    using info_type = geometry::point_info<double>;

    SECTION("subset and concatenate", "[subset]")
    {
        info_type info(5);
        for(std::size_t i = 0; i < 5; ++i)
        {
            info.r()(0, i) = double(i);
            info.r()(1, i) = -double(i);
        }
        auto const sub = info.subset(1, 3);
        REQUIRE(sub.size() == 2);
        REQUIRE(sub.r()(0, 0) == 1.);
        REQUIRE(sub.r()(1, 1) == -2.);

        auto const cat = info_type::concatenate({info.subset(3, 5), info.subset(0, 3)});
        REQUIRE(cat.size() == 5);
        REQUIRE(cat.r()(0, 0) == 3.);
        REQUIRE(cat.r()(0, 2) == 0.);
        REQUIRE(cat.r()(0, 4) == 2.);
    }

    SECTION("wrong shapes", "[shapes]")
    {
        using array_type = info_type::array_type;
        array_type good = xt::zeros<double>(array_type::shape_type{2, 3});
        array_type bad = xt::zeros<double>(array_type::shape_type{2, 4});
        REQUIRE_THROWS_AS(info_type(good, good, bad, good), input_type_error);
    }
}

TEST_CASE("chunker", "[chunker]")
{
    using units::point_type;

    SECTION("circle", "[circle]")
    {
        const double radius{1.5};
        auto const c = utils::circle<double>(radius, point_type{0.5, -1.}, 8, 16);
        REQUIRE(c.k() == 16);
        REQUIRE(c.nch() == 8);
        REQUIRE(c.npt() == 128);

        // the smooth weights sum to the perimeter
        auto const w = c.weights();
        double length{0.};
        for(auto v: w)
        {
            length += v;
        }
        REQUIRE(length == Approx(2. * 3.14159265358979323846 * radius).epsilon(1e-13));

        // outward unit normals and curvature 1/R
        for(std::size_t i = 0; i < c.npt(); i += 7)
        {
            auto const nd = c.info().node(i);
            auto const radial = (nd.r - point_type{0.5, -1.}) * (1. / radius);
            REQUIRE(nd.n.dot(radial) == Approx(1.));
            REQUIRE(nd.curvature() == Approx(1. / radius));
        }

        // closed curve
        REQUIRE(c.adjacency()(0, 0) == 7);
        REQUIRE(c.adjacency()(1, 7) == 0);
    }

    SECTION("segment", "[segment]")
    {
        auto const s = utils::segment<double>(point_type{0., 0.}, point_type{3., 4.}, 3, 4);
        double length{0.};
        for(auto v: s.weights())
        {
            length += v;
        }
        REQUIRE(length == Approx(5.));
        REQUIRE(s.adjacency()(0, 0) == -1);
        REQUIRE(s.adjacency()(1, 2) == -1);
        REQUIRE(s.adjacency()(1, 0) == 1);
        // nodes ordered along the segment
        REQUIRE(s.r()(0, 0) < s.r()(0, 1));
        REQUIRE(s.r()(0, 3) < s.r()(0, 4));
    }

    SECTION("single node record", "[node]")
    {
        auto const s = units::small_segment(2.);
        auto const one = s.info(1);
        REQUIRE(one.size() == 1);
        REQUIRE(one.r()(0, 0) == s.r()(0, 1));
        REQUIRE_THROWS_AS(s.info(4), input_type_error);
    }

    SECTION("invalid chunkers", "[validation]")
    {
        geometry::point_info<double> info(6);
        REQUIRE_THROWS_AS(geometry::chunker<double>(info, 1), input_type_error);
        REQUIRE_THROWS_AS(geometry::chunker<double>(info, 4), input_type_error);
        REQUIRE_THROWS_AS(geometry::chunker<double>(geometry::point_info<double>(0), 2), input_type_error);
        REQUIRE_NOTHROW(geometry::chunker<double>(info, 3));
    }
}

TEST_CASE("merge", "[merge]")
{
    using units::point_type;
    auto const a = utils::circle<double>(1., point_type{0., 0.}, 3, 8);
    auto const b = utils::segment<double>(point_type{3., 0.}, point_type{4., 0.}, 2, 8);

    SECTION("order preserving", "[order]")
    {
        auto const m = geometry::merge(std::vector<geometry::chunker<double>>{a, b});
        REQUIRE(m.nch() == 5);
        REQUIRE(m.npt() == a.npt() + b.npt());
        REQUIRE(m.r()(0, 0) == a.r()(0, 0));
        REQUIRE(m.r()(0, a.npt()) == b.r()(0, 0));
        REQUIRE(m.d2()(1, a.npt() + 3) == b.d2()(1, 3));
        // adjacency of the second chunker is shifted, free ends stay free
        REQUIRE(m.adjacency()(0, 0) == 2);
        REQUIRE(m.adjacency()(0, 3) == -1);
        REQUIRE(m.adjacency()(1, 3) == 4);
        REQUIRE(m.adjacency()(1, 4) == -1);
    }

    SECTION("orders must agree", "[orders]")
    {
        auto const c = utils::segment<double>(point_type{3., 0.}, point_type{4., 0.}, 2, 6);
        REQUIRE_THROWS_AS(geometry::merge(std::vector<geometry::chunker<double>>{a, c}), input_type_error);
    }
}

TEST_CASE("component sources", "[components]")
{
    using units::point_type;
    auto const e0 = utils::segment<double>(point_type{0., 0.}, point_type{1., 0.}, 2, 4);
    auto const e1 = utils::segment<double>(point_type{1., 0.}, point_type{0., 1.}, 3, 4);

    SECTION("chunkgraph", "[chunkgraph]")
    {
        xt::xtensor<double, 2> verts = {{0., 1., 0.}, {0., 0., 1.}};
        xt::xtensor<long, 2> ends = {{0, 1}, {1, 2}};
        geometry::chunkgraph<double> graph(verts, ends, {e0, e1});
        auto const comps = geometry::components(graph);
        REQUIRE(comps.size() == 2);
        REQUIRE(comps[0].get().nch() == 2);
        REQUIRE(comps[1].get().nch() == 3);

        xt::xtensor<long, 2> out_of_range = {{0, 1}, {1, 3}};
        REQUIRE_THROWS_AS(geometry::chunkgraph<double>(verts, out_of_range, {e0, e1}), input_type_error);
        xt::xtensor<long, 2> one_edge = {{0}, {1}};
        REQUIRE_THROWS_AS(geometry::chunkgraph<double>(verts, one_edge, {e0, e1}), input_type_error);
    }

    SECTION("chunker and list", "[list]")
    {
        REQUIRE(geometry::components(e0).size() == 1);
        geometry::component_list<double> list({e0, e1, e0});
        auto const comps = geometry::components(list);
        REQUIRE(comps.size() == 3);
        REQUIRE(&comps[1].get() == &list.at(1));

        geometry::component_list<double> empty(std::vector<geometry::chunker<double>>{});
        REQUIRE_THROWS_AS(geometry::components(empty), input_type_error);
    }
}

int main(int argc, char* argv[])
{
    // global setup...
    int result = Catch::Session().run(argc, argv);
    // global clean-up...
    return result;
}
