// --------------------------------
// See LICENCE file at project root
// File : corrections/correction_matrix.hpp
// --------------------------------
#ifndef BIEOPS_CORRECTIONS_CORRECTION_MATRIX_HPP
#define BIEOPS_CORRECTIONS_CORRECTION_MATRIX_HPP

#include <cstddef>
#include <optional>

#include <Eigen/Core>
#include <Eigen/SparseCore>

#include <xtensor/xbuilder.hpp>
#include <xtensor/xtensor.hpp>

#include "bieops/utils/errors.hpp"

namespace bieops::corrections
{
    /// sparse operator from the flattened density to the flattened output
    template<typename ValueType>
    using correction_matrix = Eigen::SparseMatrix<ValueType>;

    template<typename ValueType>
    using triplet = Eigen::Triplet<ValueType>;

    ///
    /// \brief correction_view refers to a correction matrix owned by the caller, or to none
    ///
    /// Built implicitly from std::nullopt, a correction matrix or an optional one, so that a cached matrix
    /// is used in place.
    ///
    template<typename ValueType>
    class correction_view
    {
      public:
        using matrix_type = correction_matrix<ValueType>;

        correction_view(std::nullopt_t) noexcept {}
        correction_view(matrix_type const& cormat) noexcept
          : m_cormat(&cormat)
        {
        }
        correction_view(std::optional<matrix_type> const& cormat) noexcept
          : m_cormat(cormat ? &(*cormat) : nullptr)
        {
        }

        explicit operator bool() const noexcept { return m_cormat != nullptr; }
        auto operator*() const noexcept -> matrix_type const& { return *m_cormat; }
        [[nodiscard]] auto get() const noexcept -> matrix_type const* { return m_cormat; }

      private:
        matrix_type const* m_cormat{nullptr};
    };

    /// \brief throws shape_mismatch_error if cormat is not rows x cols
    template<typename ValueType>
    inline auto check_shape(correction_matrix<ValueType> const& cormat, std::size_t rows, std::size_t cols) -> void
    {
        if(std::size_t(cormat.rows()) != rows)
        {
            throw shape_mismatch_error("Correction matrix rows", std::size_t(cormat.rows()), rows);
        }
        if(std::size_t(cormat.cols()) != cols)
        {
            throw shape_mismatch_error("Correction matrix columns", std::size_t(cormat.cols()), cols);
        }
    }

    ///
    /// \brief apply_corrections computes cormat * density
    ///
    /// \param[in] cormat the corrections
    /// \param[in] density a vector of cormat.cols() values
    /// \return a vector of cormat.rows() values
    ///
    template<typename ValueType>
    inline auto apply_corrections(correction_matrix<ValueType> const& cormat,
                                  xt::xtensor<ValueType, 1> const& density) -> xt::xtensor<ValueType, 1>
    {
        using vector_type = xt::xtensor<ValueType, 1>;
        using eigen_vector = Eigen::Matrix<ValueType, Eigen::Dynamic, 1>;

        if(density.size() != std::size_t(cormat.cols()))
        {
            throw shape_mismatch_error("Density length does not match the correction matrix", density.size(),
                                       std::size_t(cormat.cols()));
        }
        vector_type res = xt::zeros<ValueType>(typename vector_type::shape_type{std::size_t(cormat.rows())});
        Eigen::Map<const eigen_vector> in(density.data(), cormat.cols());
        Eigen::Map<eigen_vector> out(res.data(), cormat.rows());
        out.noalias() = cormat * in;
        return res;
    }

}   // namespace bieops::corrections

#endif   // BIEOPS_CORRECTIONS_CORRECTION_MATRIX_HPP
