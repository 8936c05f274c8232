// Copyright (C) 2025 The GroveDB C++ Authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <grovedb/core/config.hpp>

#include <grovedb/core/likely.h>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/operation_cost.hpp>

#include <type_traits>
#include <utility>

GROVEDB_NAMESPACE_BEGIN

/// A value together with the cost of producing it
template <class T>
struct [[nodiscard]] CostContext
{
    T value;
    OperationCost cost{};

    T unwrap_add_cost(OperationCost &acc) &&
    {
        acc += cost;
        return std::move(value);
    }

    template <class F>
    auto map(F &&f) && -> CostContext<std::invoke_result_t<F, T &&>>
    {
        return {std::forward<F>(f)(std::move(value)), std::move(cost)};
    }

    template <class F>
    auto flat_map(F &&f) && -> std::invoke_result_t<F, T &&>
    {
        auto inner = std::forward<F>(f)(std::move(value));
        inner.cost += cost;
        return inner;
    }

    CostContext add_cost(OperationCost const &extra) &&
    {
        cost += extra;
        return std::move(*this);
    }
};

template <class T>
using CostResult = CostContext<Result<T>>;

template <class T>
CostContext<std::decay_t<T>> wrap_with_cost(T &&value, OperationCost cost)
{
    return {std::forward<T>(value), std::move(cost)};
}

/// Collapses a nested context into one carrying both costs
template <class T>
CostContext<T> flatten(CostContext<CostContext<T>> &&nested)
{
    nested.value.cost += nested.cost;
    return std::move(nested.value);
}

/// Runs `f` on the value of a successful result; the result is unchanged
template <class T, class F>
CostResult<T> for_ok(CostResult<T> &&res, F &&f)
{
    if (res.value.has_value()) {
        std::forward<F>(f)(res.value.assume_value());
    }
    return std::move(res);
}

/// The accumulated cost if the result succeeded
template <class T>
Result<OperationCost> cost_as_result(CostResult<T> &&res)
{
    if (res.value.has_error()) {
        return std::move(res.value).as_failure();
    }
    return std::move(res.cost);
}

GROVEDB_NAMESPACE_END

/// Adds the cost of `expr` (a CostResult) to `cost`; on error returns the
/// error together with everything accumulated so far
#define GROVEDB_COST_TRY(cost, ...)                                            \
    ({                                                                         \
        auto &&grovedb_cost_try_res = (__VA_ARGS__);                           \
        (cost) += grovedb_cost_try_res.cost;                                   \
        if (GROVEDB_UNLIKELY(grovedb_cost_try_res.value.has_error())) {        \
            return {std::move(grovedb_cost_try_res.value).as_failure(), (cost)}; \
        }                                                                      \
        std::move(grovedb_cost_try_res.value).assume_value();                  \
    })

/// As GROVEDB_COST_TRY for a plain Result whose cost is already counted
#define GROVEDB_COST_TRY_NO_ADD(cost, ...)                                     \
    ({                                                                         \
        auto &&grovedb_cost_try_res = (__VA_ARGS__);                           \
        if (GROVEDB_UNLIKELY(grovedb_cost_try_res.has_error())) {              \
            return {std::move(grovedb_cost_try_res).as_failure(), (cost)};     \
        }                                                                      \
        std::move(grovedb_cost_try_res).assume_value();                        \
    })

/// As GROVEDB_COST_TRY, returning `into(error)` instead of the error itself
#define GROVEDB_COST_TRY_INTO(cost, into, ...)                                 \
    ({                                                                         \
        auto &&grovedb_cost_try_res = (__VA_ARGS__);                           \
        (cost) += grovedb_cost_try_res.cost;                                   \
        if (GROVEDB_UNLIKELY(grovedb_cost_try_res.value.has_error())) {        \
            return {(into)(std::move(grovedb_cost_try_res.value).error()),     \
                    (cost)};                                                   \
        }                                                                      \
        std::move(grovedb_cost_try_res.value).assume_value();                  \
    })

/// As GROVEDB_COST_TRY_NO_ADD but discards any accumulated cost
#define GROVEDB_COST_TRY_DEFAULT(...)                                          \
    ({                                                                         \
        auto &&grovedb_cost_try_res = (__VA_ARGS__);                           \
        if (GROVEDB_UNLIKELY(grovedb_cost_try_res.has_error())) {              \
            return {                                                           \
                std::move(grovedb_cost_try_res).as_failure(),                  \
                ::grovedb::OperationCost{}};                                   \
        }                                                                      \
        std::move(grovedb_cost_try_res).assume_value();                        \
    })
