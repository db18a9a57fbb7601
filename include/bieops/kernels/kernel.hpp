// --------------------------------
// See LICENCE file at project root
// File : kernels/kernel.hpp
// --------------------------------
#ifndef BIEOPS_KERNELS_KERNEL_HPP
#define BIEOPS_KERNELS_KERNEL_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xtensor.hpp>

#include "bieops/geometry/point_info.hpp"
#include "bieops/matrix_kernels/mk_common.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::kernels
{
    ///
    /// \brief kernel is the runtime kernel object handed to the operators.
    ///
    /// A kernel evaluates the interaction block between a set of sources and a set of targets. For ns
    /// sources, nt targets and an operator of dimension kn x km the block has the shape
    /// (kn*nt) x (km*ns), the entry (t*kn+a, s*km+b) couples the component b of the source s to the
    /// component a of the target t.
    ///
    /// A kernel may also carry a fast multipole routine and its singularity type.
    ///
    template<typename ValueType>
    class kernel
    {
      public:
        using value_type = ValueType;
        using info_type = geometry::point_info<value_type>;
        using matrix_type = xt::xtensor<value_type, 2>;
        using vector_type = xt::xtensor<value_type, 1>;
        /// (source info, target info) -> (kn*nt) x (km*ns) block
        using eval_type = std::function<matrix_type(info_type const&, info_type const&)>;
        /// (eps, source info, target info, weighted density) -> potential at the targets
        using fmm_type = std::function<vector_type(value_type, info_type const&, info_type const&, vector_type const&)>;

        kernel() = default;

        explicit kernel(eval_type eval, std::string name = std::string("function_handle"),
                        std::optional<matrix_kernels::singularity> sing = std::nullopt, fmm_type fmm = fmm_type{})
          : m_name(std::move(name))
          , m_sing(sing)
          , m_eval(std::move(eval))
          , m_fmm(std::move(fmm))
        {
        }

        [[nodiscard]] inline auto name() const noexcept -> std::string const& { return m_name; }
        [[nodiscard]] inline auto singularity() const noexcept -> std::optional<matrix_kernels::singularity>
        {
            return m_sing;
        }
        /// \brief the singularity of the kernel or the default one if the kernel does not classify itself
        [[nodiscard]] inline auto singularity_or(matrix_kernels::singularity def) const noexcept
          -> matrix_kernels::singularity
        {
            return m_sing.value_or(def);
        }

        /// \brief true if the kernel cannot be evaluated
        [[nodiscard]] inline auto empty() const noexcept -> bool { return !static_cast<bool>(m_eval); }
        [[nodiscard]] inline auto has_fmm() const noexcept -> bool { return static_cast<bool>(m_fmm); }

        inline auto set_fmm(fmm_type fmm) -> kernel&
        {
            m_fmm = std::move(fmm);
            return *this;
        }

        ///
        /// \brief evaluates the interaction block
        ///
        /// \param[in] src the sources
        /// \param[in] targ the targets
        /// \return the (kn*nt) x (km*ns) block
        ///
        inline auto eval(info_type const& src, info_type const& targ) const -> matrix_type
        {
            if(empty())
            {
                throw input_type_error("Second input is not a kernel object, function handle, or matrix of kernels");
            }
            return m_eval(src, targ);
        }

        ///
        /// \brief fast evaluation of the potential generated by the weighted density
        ///
        /// Coincident source and target points are excluded from the sum.
        ///
        inline auto fmm(value_type eps, info_type const& src, info_type const& targ,
                        vector_type const& weighted_density) const -> vector_type
        {
            if(!has_fmm())
            {
                throw std::runtime_error("kernel " + m_name + " has no fmm routine.");
            }
            return m_fmm(eps, src, targ, weighted_density);
        }

      private:
        std::string m_name{};
        std::optional<matrix_kernels::singularity> m_sing{};
        eval_type m_eval{};
        fmm_type m_fmm{};
    };

    ///
    /// \brief make_kernel builds a runtime kernel from a matrix kernel
    ///
    /// The matrix kernel provides kn, km, name(), evaluate(target node, source node) and singularity_tag.
    ///
    /// \code
    /// auto d = kernels::make_kernel<double>(matrix_kernels::laplace::double_layer{});
    /// \endcode
    ///
    /// \param[in] mk the matrix kernel
    /// \param[in] fmm optional fast routine
    ///
    template<typename ValueType, typename MatrixKernel>
    inline auto make_kernel(MatrixKernel const& mk, typename kernel<ValueType>::fmm_type fmm = {})
      -> kernel<ValueType>
    {
        using kernel_type = kernel<ValueType>;
        using info_type = typename kernel_type::info_type;
        using matrix_type = typename kernel_type::matrix_type;
        static constexpr std::size_t kn{MatrixKernel::kn};
        static constexpr std::size_t km{MatrixKernel::km};

        auto eval = [mk](info_type const& src, info_type const& targ) -> matrix_type
        {
            const std::size_t ns = src.size();
            const std::size_t nt = targ.size();
            matrix_type block = xt::zeros<ValueType>(typename matrix_type::shape_type{kn * nt, km * ns});

            std::vector<typename info_type::node_type> sources;
            sources.reserve(ns);
            for(std::size_t s = 0; s < ns; ++s)
            {
                sources.push_back(src.node(s));
            }
            for(std::size_t t = 0; t < nt; ++t)
            {
                auto const x = targ.node(t);
                for(std::size_t s = 0; s < ns; ++s)
                {
                    auto const k = mk.evaluate(x, sources[s]);
                    for(std::size_t a = 0; a < kn; ++a)
                    {
                        for(std::size_t b = 0; b < km; ++b)
                        {
                            block(t * kn + a, s * km + b) = k[a * km + b];
                        }
                    }
                }
            }
            return block;
        };
        return kernel_type(std::move(eval), mk.name(), MatrixKernel::singularity_tag, std::move(fmm));
    }

}   // namespace bieops::kernels

#endif   // BIEOPS_KERNELS_KERNEL_HPP
