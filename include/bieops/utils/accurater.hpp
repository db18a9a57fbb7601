// --------------------------------
// See LICENCE file at project root
// File : utils/accurater.hpp
// --------------------------------
#ifndef BIEOPS_UTILS_ACCURATER_HPP
#define BIEOPS_UTILS_ACCURATER_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>

#include <xtensor/xtensor.hpp>

#include "bieops/utils/errors.hpp"

namespace bieops::utils
{
    /**
     * \class accurater
     * \brief computes the error between a reference vector and a vector
     */
    template<class real_type>
    class accurater
    {
        std::size_t _nb_elements{};   ///< number of elements used to compute the error
        real_type _l2_norm{};         ///< square of the l2-norm of the reference value
        real_type _l2_diff{};         ///< square of the l2-norm of the difference
        real_type _max{};             ///< infinity norm of the reference value
        real_type _max_diff{};        ///< infinity norm of the difference

      public:
        accurater() = default;

        accurater(xt::xtensor<real_type, 1> const& ref_values, xt::xtensor<real_type, 1> const& values)
        {
            this->add(ref_values, values);
        }

        /**
         * @brief Add |ref_value-value| to the current accurater
         */
        void add(const real_type& ref_value, const real_type& value)
        {
            _l2_diff += (value - ref_value) * (value - ref_value);
            _l2_norm += ref_value * ref_value;
            _max = std::max(_max, std::abs(ref_value));
            _max_diff = std::max(_max_diff, std::abs(ref_value - value));
            ++_nb_elements;
        }

        /**
         * @brief Add all the elements |ref_values[i]-values[i]| to the current accurater
         *
         * @throw shape_mismatch_error if the sizes differ
         */
        void add(xt::xtensor<real_type, 1> const& ref_values, xt::xtensor<real_type, 1> const& values)
        {
            if(values.size() != ref_values.size())
            {
                throw shape_mismatch_error("accurater: wrong size", values.size(), ref_values.size());
            }
            for(std::size_t idx = 0; idx < values.size(); ++idx)
            {
                this->add(ref_values(idx), values(idx));
            }
        }

        /** Get the l2 norm of the error sqrt( sum_i(ref_i-val_i)^2) */
        real_type get_l2_norm() const { return std::sqrt(_l2_diff); }
        /** Get the l2 norm of the reference vector */
        real_type get_ref_l2_norm() const { return std::sqrt(_l2_norm); }
        real_type get_ref_max() const { return _max; }
        auto get_nb_elements() const { return _nb_elements; }

        /** Get the root-mean-square error  */
        real_type get_rms_error() const { return std::sqrt(_l2_diff / static_cast<real_type>(_nb_elements)); }
        /**
         * @brief Get the infinity norm of the error max_i|ref_i-val_i|
         */
        real_type get_infinity_norm() const { return _max_diff; }
        /**
         * @brief Get the relative L2 norm of the error  sqrt( sum_i(ref_i-val_i)^2/sum_i(ref_i^2))
         *
         * The absolute norm is returned for a zero reference.
         */
        real_type get_relative_l2_norm() const
        {
            return _l2_norm == real_type(0) ? std::sqrt(_l2_diff) : std::sqrt(_l2_diff / _l2_norm);
        }
        /**
         * @brief Get the relative infinity norm of the error  max_i|ref_i-val_i|/max_i|ref_i|
         */
        real_type get_relative_infinity_norm() const { return _max == real_type(0) ? _max_diff : _max_diff / _max; }

        template<class StreamClass>
        friend StreamClass& operator<<(StreamClass& output, const accurater& inAccurater)
        {
            output << "[Error] Relative L2-norm = " << inAccurater.get_relative_l2_norm()
                   << " \t RMS norm = " << inAccurater.get_rms_error()
                   << " \t Relative  infinity norm = " << inAccurater.get_relative_infinity_norm();
            return output;
        }

        void reset()
        {
            _l2_norm = real_type(0);
            _l2_diff = real_type(0);
            _max = real_type(0);
            _max_diff = real_type(0);
            _nb_elements = 0;
        }
    };

}   // namespace bieops::utils

#endif   // BIEOPS_UTILS_ACCURATER_HPP
