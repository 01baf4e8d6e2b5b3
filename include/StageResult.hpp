#pragma once
#include <exception>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <boost/outcome.hpp>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

struct StageError
{
    std::string stage;
    std::string message;
};

// value() on a failed result throws bad_result_access_with<StageError>.
template <typename T>
using StageResult = outcome::basic_result<T, StageError, outcome::policy::throw_bad_result_access<StageError, void>>;

inline StageError stageError(std::string stage, std::string message)
{
    return StageError{std::move(stage), std::move(message)};
}

// Runs one pipeline stage. A failed result or an escaping exception is logged
// with the stage name and replaced by the stage's default output.
template <typename T, typename Fn>
T isolateStage(char const* stage, Fn&& fn)
{
    try
    {
        StageResult<T> result = std::forward<Fn>(fn)();
        if (result)
        {
            if constexpr (std::is_void_v<T>)
                return;
            else
                return std::move(result).value();
        }

        std::cerr << "[Stage:" << stage << "] failed: " << result.error().message << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Stage:" << stage << "] failed: " << e.what() << "\n";
    }

    if constexpr (!std::is_void_v<T>)
        return T{};
}
