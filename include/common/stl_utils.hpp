#pragma once

namespace runner {

/**
 * @brief 将多个 lambda 组合成一个重载集合，配合 std::visit 使用
 * @code{.cpp}
 *     std::visit(overloaded{
 *         [](const python_strategy &) { ... },
 *         [](const c_strategy &) { ... }}, strategy);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace runner
