// --------------------------------
// See LICENCE file at project root
// File : options/apply_options.hpp
// --------------------------------
#ifndef BIEOPS_OPTIONS_APPLY_OPTIONS_HPP
#define BIEOPS_OPTIONS_APPLY_OPTIONS_HPP

#include <any>
#include <cstddef>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bieops/matrix_kernels/mk_common.hpp"

namespace bieops::options
{
    /// near and self quadrature family used by the correction builders
    enum struct quadrature_method
    {
        ggq,      //< generalized Gaussian quadrature
        native    //< scaled Gauss-Legendre, smooth kernels only
    };

    /// use of the kernel fast multipole routine by the smooth evaluator
    enum struct acceleration
    {
        automatic,   //< fmm if available and enough sources and targets
        forced_on,   //< fmm if available, whatever the sizes
        forced_off   //< direct summation
    };

    inline auto to_string(quadrature_method q) -> std::string
    {
        return q == quadrature_method::ggq ? "ggq" : "native";
    }

    inline auto quadrature_method_from_string(std::string const& s) -> quadrature_method
    {
        if(s == "ggq")
        {
            return quadrature_method::ggq;
        }
        if(s == "native")
        {
            return quadrature_method::native;
        }
        throw std::invalid_argument("Unknown quadrature method '" + s + "' (ggq or native).");
    }

    inline auto to_string(acceleration a) -> std::string
    {
        switch(a)
        {
        case acceleration::automatic:
            return "auto";
        case acceleration::forced_on:
            return "on";
        case acceleration::forced_off:
            return "off";
        }
        return "unknown";
    }

    inline auto acceleration_from_string(std::string const& s) -> acceleration
    {
        if(s == "auto")
        {
            return acceleration::automatic;
        }
        if(s == "on")
        {
            return acceleration::forced_on;
        }
        if(s == "off")
        {
            return acceleration::forced_off;
        }
        throw std::invalid_argument("Unknown acceleration policy '" + s + "' (auto, on or off).");
    }

    /// key of the auxiliary quadrature data, e.g. {ggq, log}
    using auxquads_key = std::pair<quadrature_method, matrix_kernels::singularity>;

    ///
    /// \brief apply_options gathers the runtime parameters of an operator apply
    ///
    /// The correction builder and the smooth evaluator receive the same record. The fields
    /// rcip, rcip_ignore, nsub_or_tol, adaptive_correction and auxquads are only read by the correction
    /// builders, they are passed through unchanged.
    ///
    template<typename ValueType>
    struct apply_options
    {
        using value_type = ValueType;

        quadrature_method quad{quadrature_method::ggq};
        /// singularity used when a kernel does not classify itself
        matrix_kernels::singularity sing{matrix_kernels::singularity::log};
        /// scale rows by sqrt(w) and columns by 1/sqrt(w)
        bool l2scale{false};
        acceleration accel{acceleration::automatic};
        /// tolerance of the fmm routines and of the adaptive corrections
        value_type eps{value_type(1.e-14)};
        /// build the corrections to the smooth rule only
        bool corrections{false};
        bool rcip{true};
        std::vector<std::size_t> rcip_ignore{};
        /// number of rcip levels or tolerance
        value_type nsub_or_tol{value_type(40)};
        bool adaptive_correction{false};
        /// precomputed auxiliary nodes and weights per (quadrature, singularity)
        std::map<auxquads_key, std::any> auxquads{};
        /// print the advisories
        bool verbose{true};
    };

    template<typename ValueType>
    inline auto operator<<(std::ostream& os, apply_options<ValueType> const& opts) -> std::ostream&
    {
        os << "[options] quad " << to_string(opts.quad) << ", sing " << matrix_kernels::to_string(opts.sing)
           << ", l2scale " << std::boolalpha << opts.l2scale << ", accel " << to_string(opts.accel) << ", eps "
           << opts.eps << ", corrections " << opts.corrections << std::noboolalpha;
        return os;
    }

}   // namespace bieops::options

#endif   // BIEOPS_OPTIONS_APPLY_OPTIONS_HPP
