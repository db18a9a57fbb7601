// --------------------------------
// See LICENCE file at project root
// File : matrix_kernels/mk_common.hpp
// --------------------------------
#ifndef BIEOPS_MATRIX_KERNELS_MK_COMMON_HPP
#define BIEOPS_MATRIX_KERNELS_MK_COMMON_HPP

#include <stdexcept>
#include <string>

namespace bieops::matrix_kernels
{
    /**
     * @brief type of singularity of a kernel at coincident source and target
     *
     * It selects the near and self quadrature used by the correction builders.
     */
    enum struct singularity
    {
        smooth,   //< smooth kernels
        log,      //< logarithmically singular kernels, or smooth times log plus smooth
        pv,       //< principal value singular kernels plus log
        hs        //< hypersingular kernels plus pv
    };

    inline auto to_string(singularity s) -> std::string
    {
        switch(s)
        {
        case singularity::smooth:
            return "smooth";
        case singularity::log:
            return "log";
        case singularity::pv:
            return "pv";
        case singularity::hs:
            return "hs";
        }
        return "unknown";
    }

    inline auto singularity_from_string(std::string const& s) -> singularity
    {
        if(s == "smooth")
        {
            return singularity::smooth;
        }
        if(s == "log")
        {
            return singularity::log;
        }
        if(s == "pv")
        {
            return singularity::pv;
        }
        if(s == "hs")
        {
            return singularity::hs;
        }
        throw std::invalid_argument("Unknown singularity type '" + s + "' (smooth, log, pv or hs).");
    }

}   // namespace bieops::matrix_kernels
#endif
