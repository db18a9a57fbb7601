// --------------------------------
// See LICENCE file at project root
// File : operators/apply_operators.hpp
// --------------------------------
#ifndef BIEOPS_OPERATORS_APPLY_OPERATORS_HPP
#define BIEOPS_OPERATORS_APPLY_OPERATORS_HPP

#include <utility>

#include "bieops/corrections/native.hpp"
#include "bieops/quadrature/smooth.hpp"

namespace bieops::operators
{
    ///
    /// \class apply_operators
    /// \brief The apply_operators class bundles the two collaborators of an operator apply
    ///
    ///  @tparam CorrectionBuilder builds the sparse corrections, called as
    ///          builder(geometry, kernel_descriptor, options)
    ///  @tparam SmoothEvaluator computes the smooth contribution, called as
    ///          evaluator(source chunker, kernel, opdims, density, target info, options)
    ///
    /// The following example keeps the default smooth evaluator and plugs a ggq correction builder
    /// \code
    ///   using operators_type = bieops::operators::apply_operators<my_ggq_builder>;
    ///   operators_type ops(my_ggq_builder{auxquads});
    /// \endcode
    template<typename CorrectionBuilder = corrections::native_corrections,
             typename SmoothEvaluator = quadrature::smooth_evaluator>
    class apply_operators
    {
      public:
        using correction_builder_type = CorrectionBuilder;
        using smooth_evaluator_type = SmoothEvaluator;

        apply_operators() = default;

        explicit apply_operators(correction_builder_type builder,
                                 smooth_evaluator_type evaluator = smooth_evaluator_type{})
          : m_builder(std::move(builder))
          , m_evaluator(std::move(evaluator))
        {
        }

        /// \brief correction builder accessor
        auto correction_builder() const -> correction_builder_type const& { return m_builder; }
        /// \brief smooth evaluator accessor
        auto smooth_evaluator() const -> smooth_evaluator_type const& { return m_evaluator; }

      private:
        correction_builder_type m_builder{};
        smooth_evaluator_type m_evaluator{};
    };

    /// \brief builds the operators from a correction builder and a smooth evaluator
    template<typename CorrectionBuilder, typename SmoothEvaluator>
    inline auto make_apply_operators(CorrectionBuilder builder, SmoothEvaluator evaluator)
      -> apply_operators<CorrectionBuilder, SmoothEvaluator>
    {
        return apply_operators<CorrectionBuilder, SmoothEvaluator>(std::move(builder), std::move(evaluator));
    }

}   // namespace bieops::operators

#endif   // BIEOPS_OPERATORS_APPLY_OPERATORS_HPP
