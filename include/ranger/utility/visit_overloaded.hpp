#pragma once

#include <ranger/utility/overloaded.hpp>

#include <variant>

namespace Ranger
{
    template <typename... VariantTypes, typename... VisitFunctionTypes>
    auto visitOverloaded(std::variant<VariantTypes...> const& variant, VisitFunctionTypes&&... visitFunctions)
    {
        return std::visit(overloaded{std::forward<VisitFunctionTypes>(visitFunctions)...}, variant);
    }
} // namespace Ranger
