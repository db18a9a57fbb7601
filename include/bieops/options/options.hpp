// --------------------------------
// See LICENCE file at project root
// File : options/options.hpp
// --------------------------------
#ifndef BIEOPS_OPTIONS_OPTIONS_HPP
#define BIEOPS_OPTIONS_OPTIONS_HPP

#include <string_view>
#include <type_traits>
#include <utility>

namespace bieops::options
{
    template<typename D>
    struct setting
    {
        using type = setting<D>;
        using derived_type = D;

        constexpr auto value() const noexcept -> std::string_view { return static_cast<derived_type>(this)->value(); }
    };

    template<typename... S>
    struct settings : S...
    {
        using type = settings<S...>;

        template<typename... Setting>
        constexpr settings(Setting... /*s*/)
        {
        }
    };

    template<typename... S>
    settings(S... s) -> settings<typename S::type...>;

    template<typename... S>
    struct seq_
      : setting<seq_<S...>>
      , S...
    {
        using type = seq_<S...>;
        using inner_settings = settings<S...>;
        static constexpr auto value() noexcept -> std::string_view { return "seq"; };
    };

    template<typename... S>
    struct omp_
      : setting<omp_<S...>>
      , S...
    {
        using type = omp_<S...>;
        using inner_settings = settings<S...>;
        static constexpr auto value() noexcept -> std::string_view { return "omp"; };
    };

    struct timit_ : setting<timit_>
    {
        using type = timit_;
        static constexpr auto value() noexcept -> std::string_view { return "timit"; };
    };

    static constexpr auto omp = omp_{};
    static constexpr auto omp_timit = omp_<timit_>{};
    static constexpr auto seq = seq_{};
    static constexpr auto seq_timit = seq_<timit_>{};
    static constexpr auto timit = timit_{};

    /**
     * @brief Check if one of the settings s is inside s1
     *
     * Here we check if the settings op used for the algorithm contain omp.
     * \code {.c++}
     * has(bieops::options::_s(op), bieops::options::omp, bieops::options::omp_timit)
     * \endcode
     */
    template<typename... S1, typename... S2>
    static constexpr auto has(settings<S1...> s1, settings<S2...> /*s2*/) -> bool
    {
        return (... || std::is_base_of_v<S2, decltype(s1)>);
    }

    template<typename... S1, typename... S>
    static constexpr auto has(settings<S1...> s1, S... /*s*/) -> bool
    {
        return (... || std::is_base_of_v<S, decltype(s1)>);
    }

    /// @brief true if every setting of s1 is one of s2
    template<typename... S1, typename... S2>
    static constexpr auto support(settings<S1...> /*s1*/, settings<S2...> s2) -> bool
    {
        return (... && std::is_base_of_v<S1, decltype(s2)>);
    }

    template<typename... S>
    static constexpr auto _s(S... /*s*/)
    {
        return settings<S...>{};
    }

    template<typename... S>
    static constexpr auto _s(settings<S...> s)
    {
        return s;
    }
}   // namespace bieops::options

/// Declares the callable object NAME forwarding to impl::NAME, with the call syntaxes
/// NAME(args...) and NAME[options::_s(options::omp)](args...).
#define BIEOPS_DECLARE_OPTIONED_CALLEE(NAME)                                                                         \
    struct NAME##_                                                                                                   \
    {                                                                                                                \
        template<typename Arg, typename... Args>                                                                     \
        inline static constexpr auto call(Arg&& arg, Args&&... args)                                                 \
        {                                                                                                            \
            return impl::NAME(std::forward<Arg>(arg), std::forward<Args>(args)...);                                  \
        }                                                                                                            \
        template<typename... S>                                                                                      \
        inline auto constexpr operator[](bieops::options::settings<S...> s) const noexcept                          \
        {                                                                                                            \
            return [s](auto&&... args) { return NAME##_::call(s, std::forward<decltype(args)>(args)...); };          \
        }                                                                                                            \
        template<typename... Args>                                                                                   \
        inline auto constexpr operator()(Args&&... args) const                                                       \
        {                                                                                                            \
            return NAME##_::call(std::forward<Args>(args)...);                                                       \
        }                                                                                                            \
    };                                                                                                               \
    inline const NAME##_ NAME = {};

#endif   // BIEOPS_OPTIONS_OPTIONS_HPP
