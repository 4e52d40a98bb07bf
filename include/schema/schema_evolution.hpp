#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <functional>
#include <type_traits>

namespace relsync {

/**
 * @brief Run work(); on schema drift run evolve() and retry work() once
 *
 * Only UndefinedTableError and UndefinedColumnError trigger evolution.
 * A second failure of any kind propagates unchanged.
 */
template<typename Work, typename Evolve>
std::invoke_result_t<Work&> retry_on_schema_drift(Work&& work, Evolve&& evolve) {
    try {
        return std::invoke(work);
    } catch (const UndefinedTableError& e) {
        utils::log::info(std::format("Undefined table, evolving schema: {}", e.what()));
    } catch (const UndefinedColumnError& e) {
        utils::log::info(std::format("Undefined column, evolving schema: {}", e.what()));
    }

    std::invoke(evolve);
    return std::invoke(work);
}

} // namespace relsync
