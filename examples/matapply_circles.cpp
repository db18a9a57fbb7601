// --------------------------------
// See LICENCE file at project root
// File : examples/matapply_circles.cpp
// --------------------------------

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cpp_tools/cl_parser/tcli.hpp>
#include <cpp_tools/colors/colorized.hpp>
#include <cpp_tools/timers/simple_timer.hpp>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xtensor.hpp>

#include "bieops/algorithms/matapply.hpp"
#include "bieops/container/point.hpp"
#include "bieops/geometry/component_source.hpp"
#include "bieops/kernels/kernel.hpp"
#include "bieops/kernels/kernel_matrix.hpp"
#include "bieops/matrix_kernels/laplace.hpp"
#include "bieops/options/apply_options.hpp"
#include "bieops/options/options.hpp"
#include "bieops/utils/accurater.hpp"
#include "bieops/utils/generate.hpp"

// example:
// ./examples/RelWithDebInfo/matapply_circles --circles 4 --radius 1 --nch 16 -k 16 --kernel 0 --matrix --omp --check
namespace local_args
{
    struct circles : cpp_tools::cl_parser::required_tag
    {
        cpp_tools::cl_parser::str_vec flags = {"--circles", "-nc"};
        std::string description = "Number of circles (components).";
        using type = std::size_t;
        type def = 2;
    };

    struct radius
    {
        cpp_tools::cl_parser::str_vec flags = {"--radius", "-r"};
        std::string description = "Radius of the circles.";
        using type = double;
        type def = 1.;
    };

    struct nch
    {
        cpp_tools::cl_parser::str_vec flags = {"--nch"};
        std::string description = "Number of chunks per circle.";
        using type = std::size_t;
        type def = 8;
    };

    struct order
    {
        cpp_tools::cl_parser::str_vec flags = {"--order", "-k"};
        std::string description = "Number of Legendre nodes per chunk.";
        using type = std::size_t;
        type def = 16;
    };

    struct matrix_kernel
    {
        cpp_tools::cl_parser::str_vec flags = {"--kernel", "-mk"};
        std::string description = "Laplace kernel: 0 for the double layer, 1 for the normal derivative of the "
                                  "single layer.";
        using type = int;
        type def = 0;
    };

    struct quadrature
    {
        cpp_tools::cl_parser::str_vec flags = {"--quadrature", "-q"};
        std::string description = "Correction quadrature: native (self terms of smooth kernels) or ggq (needs an "
                                  "external builder).";
        using type = std::string;
        type def = "native";
    };

    struct kernel_matrix
    {
        using type = bool;
        /// flag, no value expected
        enum
        {
            flagged
        };
        cpp_tools::cl_parser::str_vec flags = {"--matrix"};
        std::string description = "Give the kernel as a matrix of kernels (one per pair of circles).";
    };

    struct use_omp
    {
        using type = bool;
        enum
        {
            flagged
        };
        cpp_tools::cl_parser::str_vec flags = {"--omp"};
        std::string description = "Apply the smooth pairs in parallel.";
    };

    struct timit
    {
        using type = bool;
        enum
        {
            flagged
        };
        cpp_tools::cl_parser::str_vec flags = {"--timit"};
        std::string description = "Print the time of each stage.";
    };

    struct check
    {
        using type = bool;
        enum
        {
            flagged
        };
        cpp_tools::cl_parser::str_vec flags = {"--check"};
        std::string description = "Compare both smooth strategies and the double layer identity D[1] = -1/2.";
    };

    struct verbose
    {
        using type = bool;
        enum
        {
            flagged
        };
        cpp_tools::cl_parser::str_vec flags = {"--verbose", "-v"};
        std::string description = "Print the advisory warnings.";
    };
}   // namespace local_args

template<typename MatrixKernel>
auto run(std::size_t ncircles, double radius, std::size_t nch, std::size_t k,
         bieops::options::quadrature_method quad, bool as_matrix, bool use_omp, bool timit, bool check, bool verbose)
  -> int
{
    using value_type = double;
    using point_type = bieops::container::point<value_type, 2>;
    using chunker_type = bieops::geometry::chunker<value_type>;
    using vector_type = xt::xtensor<value_type, 1>;
    namespace opt = bieops::options;

    cpp_tools::timers::timer time{};

    time.tic();
    std::vector<chunker_type> circles{};
    for(std::size_t i = 0; i < ncircles; ++i)
    {
        circles.push_back(bieops::utils::circle<value_type>(radius, point_type{3. * radius * value_type(i), 0.}, nch, k));
    }
    bieops::geometry::component_list<value_type> const geometry(circles);
    time.tac();
    std::cout << cpp_tools::colors::yellow << "Circles built in " << time.elapsed() << "ms\n"
              << cpp_tools::colors::reset;

    const MatrixKernel mk{};
    auto const kern = bieops::kernels::make_kernel<value_type>(mk);
    bieops::kernels::kernel_matrix<value_type> const mat(
      ncircles, ncircles, std::vector<bieops::kernels::kernel<value_type>>(ncircles * ncircles, kern));
    std::cout << cpp_tools::colors::blue << "<params> Kernel : " << mk.name() << (as_matrix ? " (matrix)" : "")
              << cpp_tools::colors::reset << '\n';

    bieops::options::apply_options<value_type> opts{};
    opts.quad = quad;
    opts.verbose = verbose;
    std::cout << cpp_tools::colors::blue << "<params> Options :\n" << opts << cpp_tools::colors::reset << '\n';

    const std::size_t n = ncircles * nch * k;
    vector_type density = xt::ones<value_type>(typename vector_type::shape_type{n});

    auto apply = [&](auto const& kernel)
    {
        if(use_omp && timit)
        {
            return bieops::algorithms::matapply[opt::_s(opt::omp_timit)](geometry, kernel, density, std::nullopt,
                                                                         opts);
        }
        if(use_omp)
        {
            return bieops::algorithms::matapply[opt::_s(opt::omp)](geometry, kernel, density, std::nullopt, opts);
        }
        if(timit)
        {
            return bieops::algorithms::matapply[opt::_s(opt::seq_timit)](geometry, kernel, density, std::nullopt,
                                                                         opts);
        }
        return bieops::algorithms::matapply[opt::_s(opt::seq)](geometry, kernel, density, std::nullopt, opts);
    };

    time.tic();
    vector_type const u = as_matrix ? apply(mat) : apply(kern);
    time.tac();
    std::cout << cpp_tools::colors::yellow << "Operator applied in " << time.elapsed() << "ms\n"
              << cpp_tools::colors::reset;
    std::cout << "u[0] = " << u(0) << "  u[n-1] = " << u(n - 1) << '\n';

    if(!check)
    {
        return EXIT_SUCCESS;
    }

    int status{EXIT_SUCCESS};
    vector_type const other = as_matrix ? apply(kern) : apply(mat);
    bieops::utils::accurater<value_type> strategies(u, other);
    std::cout << "merged / pairwise: " << strategies << '\n';
    if(strategies.get_relative_infinity_norm() > 1e-12)
    {
        std::cout << cpp_tools::colors::red << "The smooth strategies disagree\n" << cpp_tools::colors::reset;
        status = EXIT_FAILURE;
    }
    if(mk.name() == "laplace_double_layer")
    {
        vector_type const ref = xt::ones<value_type>(typename vector_type::shape_type{n}) * value_type(-0.5);
        bieops::utils::accurater<value_type> identity(ref, u);
        std::cout << "D[1] = -1/2: " << identity << '\n';
        if(identity.get_relative_infinity_norm() > 1e-10)
        {
            std::cout << cpp_tools::colors::red << "D[1] differs from -1/2\n" << cpp_tools::colors::reset;
            status = EXIT_FAILURE;
        }
    }
    return status;
}

auto main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) -> int
{
    //
    // Parameter handling
    auto parser = cpp_tools::cl_parser::make_parser(
      cpp_tools::cl_parser::help{}, local_args::circles{}, local_args::radius{}, local_args::nch{},
      local_args::order{}, local_args::quadrature{}, local_args::matrix_kernel{}, local_args::kernel_matrix{},
      local_args::use_omp{}, local_args::timit{}, local_args::check{}, local_args::verbose{});
    parser.parse(argc, argv);

    const std::size_t ncircles{parser.get<local_args::circles>()};
    std::cout << cpp_tools::colors::blue << "<params> Circles : " << ncircles << cpp_tools::colors::reset << '\n';
    const double radius{parser.get<local_args::radius>()};
    const std::size_t nch{parser.get<local_args::nch>()};
    const std::size_t k{parser.get<local_args::order>()};
    std::cout << cpp_tools::colors::blue << "<params> Chunks : " << nch << " of order " << k
              << cpp_tools::colors::reset << '\n';
    const int which_kernel{parser.get<local_args::matrix_kernel>()};
    const std::string quadrature{parser.get<local_args::quadrature>()};
    const bool as_matrix(parser.exists<local_args::kernel_matrix>());
    const bool use_omp(parser.exists<local_args::use_omp>());
    const bool timit(parser.exists<local_args::timit>());
    const bool check(parser.exists<local_args::check>());
    const bool verbose(parser.exists<local_args::verbose>());

    try
    {
        auto const quad = bieops::options::quadrature_method_from_string(quadrature);
        switch(which_kernel)
        {
        case 0:
            return run<bieops::matrix_kernels::laplace::double_layer>(ncircles, radius, nch, k, quad, as_matrix,
                                                                      use_omp, timit, check, verbose);
        case 1:
            return run<bieops::matrix_kernels::laplace::normal_derivative>(ncircles, radius, nch, k, quad,
                                                                           as_matrix, use_omp, timit, check, verbose);
        default:
            std::cerr << "Kernel not supported: " << which_kernel << '\n';
            return EXIT_FAILURE;
        }
    }
    catch(std::exception const& e)
    {
        std::cerr << cpp_tools::colors::red << "matapply_circles: " << e.what() << cpp_tools::colors::reset << '\n';
        return EXIT_FAILURE;
    }
}
