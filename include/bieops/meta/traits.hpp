// --------------------------------
// See LICENCE file at project root
// File : meta/traits.hpp
// --------------------------------
#ifndef BIEOPS_META_TRAITS_HPP
#define BIEOPS_META_TRAITS_HPP

#include <type_traits>
#include <utility>

namespace bieops::meta
{
    namespace details
    {
        template<typename F, typename... Args, typename = decltype(std::declval<F&&>()(std::declval<Args&&>()...))>
        constexpr auto is_valid_impl(int)
        {
            return std::true_type{};
        }

        template<typename F, typename... Args>
        constexpr auto is_valid_impl(...)
        {
            return std::false_type{};
        }
    }   // namespace details

    /// \brief is_valid checks at compile time if an expression is well formed.
    ///
    /// \code
    /// constexpr auto has_size_f = meta::is_valid([](auto&& a) -> decltype(a.size()) {});
    /// static_assert(decltype(has_size_f(std::vector<int>{}))::value);
    /// \endcode
    struct is_valid_t
    {
        template<typename F>
        constexpr auto operator()(F&&) const
        {
            return [](auto&&... args) constexpr { return details::is_valid_impl<F&&, decltype(args)&&...>(int{}); };
        }
    };

    constexpr is_valid_t is_valid{};

    // Wrapper blocking template argument deduction
    template<typename T>
    struct identity
    {
        using type = T;
    };

    template<typename T>
    using non_deduced_t = typename identity<T>::type;

    template<typename T>
    inline constexpr bool always_false_v = false;

}   // namespace bieops::meta

#endif   // BIEOPS_META_TRAITS_HPP
