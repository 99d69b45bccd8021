/**
 * @file Assert.cpp
 * @brief Contract violation reporting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "hop/core/Assert.hpp"
#include "hop/core/Log.hpp"

#include <cstdlib>
#include <format>

namespace hop::core::detail {

void contractViolation(const char *kind, const char *expr, std::source_location where)
{
    Log::fatal("contract", std::format("{} failed: \"{}\" at {}:{} in {}", kind, expr, where.file_name(),
                                       where.line(), where.function_name()));
    std::abort();
}

} // namespace hop::core::detail
