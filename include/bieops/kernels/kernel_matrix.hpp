// --------------------------------
// See LICENCE file at project root
// File : kernels/kernel_matrix.hpp
// --------------------------------
#ifndef BIEOPS_KERNELS_KERNEL_MATRIX_HPP
#define BIEOPS_KERNELS_KERNEL_MATRIX_HPP

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "bieops/kernels/kernel.hpp"
#include "bieops/utils/errors.hpp"

namespace bieops::kernels
{
    ///
    /// \brief kernel_matrix is a table of kernels indexed by (target component, source component)
    ///
    /// Entries are stored by rows.
    ///
    template<typename ValueType>
    class kernel_matrix
    {
      public:
        using value_type = ValueType;
        using kernel_type = kernel<value_type>;

        kernel_matrix() = default;

        /// \brief rows x cols table of empty kernels
        kernel_matrix(std::size_t rows, std::size_t cols)
          : m_rows(rows)
          , m_cols(cols)
          , m_kernels(rows * cols)
        {
        }

        kernel_matrix(std::size_t rows, std::size_t cols, std::vector<kernel_type> kernels)
          : m_rows(rows)
          , m_cols(cols)
          , m_kernels(std::move(kernels))
        {
            if(m_kernels.size() != m_rows * m_cols)
            {
                throw shape_mismatch_error("kernel_matrix: wrong number of kernels", m_kernels.size(),
                                           m_rows * m_cols);
            }
        }

        /// \brief build from rows, e.g. {{k11, k12}, {k21, k22}}
        kernel_matrix(std::initializer_list<std::initializer_list<kernel_type>> rows)
          : m_rows(rows.size())
          , m_cols(rows.size() > 0 ? rows.begin()->size() : 0)
        {
            m_kernels.reserve(m_rows * m_cols);
            for(auto const& row: rows)
            {
                if(row.size() != m_cols)
                {
                    throw shape_mismatch_error("kernel_matrix: rows of different lengths", row.size(), m_cols);
                }
                m_kernels.insert(std::end(m_kernels), row.begin(), row.end());
            }
        }

        [[nodiscard]] inline auto rows() const noexcept -> std::size_t { return m_rows; }
        [[nodiscard]] inline auto cols() const noexcept -> std::size_t { return m_cols; }

        inline auto operator()(std::size_t i, std::size_t j) const -> kernel_type const&
        {
            return m_kernels[i * m_cols + j];
        }
        inline auto operator()(std::size_t i, std::size_t j) -> kernel_type& { return m_kernels[i * m_cols + j]; }

        inline auto at(std::size_t i, std::size_t j) const -> kernel_type const&
        {
            if(i >= m_rows || j >= m_cols)
            {
                throw std::out_of_range("kernel_matrix: index (" + std::to_string(i) + ", " + std::to_string(j) +
                                        ") out of range.");
            }
            return (*this)(i, j);
        }

      private:
        std::size_t m_rows{0};
        std::size_t m_cols{0};
        std::vector<kernel_type> m_kernels{};
    };

    /// \brief a single kernel for every pair of components or one kernel per pair
    template<typename ValueType>
    using kernel_descriptor = std::variant<kernel<ValueType>, kernel_matrix<ValueType>>;

    ///
    /// \brief kernel_lookup resolves a kernel descriptor once for n components
    ///
    /// The descriptor is validated at construction: the single kernel must be evaluable, a matrix must
    /// be n x n with evaluable entries. A 1 x 1 matrix is a single kernel.
    ///
    template<typename ValueType>
    class kernel_lookup
    {
      public:
        using value_type = ValueType;
        using kernel_type = kernel<value_type>;

        kernel_lookup(kernel_descriptor<value_type> const& descriptor, std::size_t ncomponents)
          : m_n(ncomponents)
        {
            if(auto const* single = std::get_if<kernel_type>(&descriptor))
            {
                m_kernels.push_back(*single);
            }
            else
            {
                auto const& mat = std::get<kernel_matrix<value_type>>(descriptor);
                if(mat.rows() == 1 && mat.cols() == 1)
                {
                    m_kernels.push_back(mat(0, 0));
                }
                else
                {
                    if(mat.rows() != m_n || mat.cols() != m_n)
                    {
                        throw input_type_error("Kernel matrix is " + std::to_string(mat.rows()) + " x " +
                                               std::to_string(mat.cols()) + " for " + std::to_string(m_n) +
                                               " geometric components.");
                    }
                    m_kernels.reserve(m_n * m_n);
                    for(std::size_t i = 0; i < m_n; ++i)
                    {
                        for(std::size_t j = 0; j < m_n; ++j)
                        {
                            m_kernels.push_back(mat(i, j));
                        }
                    }
                }
            }
            for(auto const& k: m_kernels)
            {
                if(k.empty())
                {
                    throw input_type_error(
                      "Second input is not a kernel object, function handle, or matrix of kernels");
                }
            }
        }

        /// \brief true if the same kernel applies between every pair of components
        [[nodiscard]] inline auto homogeneous() const noexcept -> bool { return m_kernels.size() == 1; }

        [[nodiscard]] inline auto size() const noexcept -> std::size_t { return m_n; }

        /// \brief the kernel of the homogeneous case
        [[nodiscard]] inline auto single() const -> kernel_type const&
        {
            if(!homogeneous())
            {
                throw std::logic_error("kernel_lookup: single() called on a per-pair kernel descriptor.");
            }
            return m_kernels.front();
        }

        /// \brief kernel between the target component i and the source component j
        inline auto operator()(std::size_t i, std::size_t j) const -> kernel_type const&
        {
            return homogeneous() ? m_kernels.front() : m_kernels[i * m_n + j];
        }

      private:
        std::size_t m_n{};
        std::vector<kernel_type> m_kernels{};
    };

}   // namespace bieops::kernels

#endif   // BIEOPS_KERNELS_KERNEL_MATRIX_HPP
