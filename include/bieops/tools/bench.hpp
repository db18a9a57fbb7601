// --------------------------------
// See LICENCE file at project root
// File : tools/bench.hpp
// --------------------------------
#ifndef BIEOPS_TOOLS_BENCH_HPP
#define BIEOPS_TOOLS_BENCH_HPP

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>

#include <cpp_tools/timers/simple_timer.hpp>

namespace bieops::bench
{
    /// stages of an operator apply, in execution order
    inline const std::string stages[] = {"probe", "layout", "corrections", "apply-corrections", "smooth"};

    template<typename DurationType>
    inline auto compute(std::unordered_map<std::string, cpp_tools::timers::timer<DurationType>> const& timers)
      -> double
    {
        using duration_type = DurationType;
        static constexpr double unit_multiplier = static_cast<double>(
          duration_type::period::den);   // denominator of the ratio: milli = 10^3, micro = 10^6, nano = 10^9

        double overall{0.};
        for(auto const& e: timers)
        {
            auto timer = e.second;
            overall += double(timer.elapsed()) / unit_multiplier;
        }
        return overall;
    }

    /// \brief prints the time of each stage in seconds and returns the overall time
    template<typename DurationType>
    inline auto print(std::unordered_map<std::string, cpp_tools::timers::timer<DurationType>> const& timers)
      -> double
    {
        using duration_type = DurationType;
        static constexpr double unit_multiplier = static_cast<double>(duration_type::period::den);

        auto const overall = compute(timers);
        for(auto const& stage: stages)
        {
            auto const it = timers.find(stage);
            if(it == timers.end())
            {
                continue;
            }
            auto timer = it->second;
            std::cout << "[time][" << std::left << std::setw(18) << stage << "] : " << std::right
                      << double(timer.elapsed()) / unit_multiplier << '\n';
        }
        std::cout << "[time][full apply]          : " << overall << '\n';
        return overall;
    }
}   // namespace bieops::bench

#endif   // BIEOPS_TOOLS_BENCH_HPP
