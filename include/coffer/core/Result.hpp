#ifndef INCLUDE_COFFER_CORE_RESULT_HPP
#define INCLUDE_COFFER_CORE_RESULT_HPP

#include <variant>

namespace coffer
{

// Success value or error code. Callers test with std::holds_alternative and extract with std::get.
template <class T, class E> using Result = std::variant<T, E>;

} // namespace coffer

#endif // INCLUDE_COFFER_CORE_RESULT_HPP
