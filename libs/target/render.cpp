/**
 * @file render.cpp
 * @brief Debug rendering of function targets
 */

#include "stackless/render.hpp"

#include "stackless/function_target.hpp"

#include <format>
#include <limits>
#include <ranges>

namespace stackless {

namespace {

constexpr std::string_view kIndent = "    ";

[[nodiscard]] bool is_reference_type(const Type& type)
{
    return type.is_reference();
}

[[nodiscard]] Result<std::string> render_local_decl(const FunctionTarget& target,
                                                    TempIndex idx,
                                                    const TypeDisplayContext& ctx)
{
    auto name = target.local_name(idx);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto type = target.local_type(idx);
    if (!type) {
        return std::unexpected(type.error());
    }
    return std::format("{}: {}", *name, display_type(type->get(), ctx));
}

}  // namespace

Result<std::string> render_signature(const FunctionTarget& target)
{
    const auto& pool = target.symbol_pool();
    const auto ctx = target.type_display_context();

    std::string out = std::format("{}fun {}::{}",
                                  target.is_public() ? "pub " : "",
                                  pool.string(target.module_env().name()),
                                  pool.string(target.name()));

    const auto& tparams = target.type_parameters();
    if (!tparams.empty()) {
        out += '<';
        for (auto [i, param] : std::views::enumerate(tparams)) {
            if (i > 0) {
                out += ", ";
            }
            out += pool.string(param.name);
        }
        out += '>';
    }

    out += '(';
    for (TempIndex i = 0; i < target.parameter_count(); ++i) {
        auto decl = render_local_decl(target, i, ctx);
        if (!decl) {
            return std::unexpected(decl.error());
        }
        if (i > 0) {
            out += ", ";
        }
        out += *decl;
    }
    out += ')';

    const auto& returns = target.return_types();
    if (!returns.empty()) {
        out += ": ";
        if (returns.size() > 1) {
            out += '(';
        }
        for (auto [i, type] : std::views::enumerate(returns)) {
            if (i > 0) {
                out += ", ";
            }
            out += display_type(type, ctx);
        }
        if (returns.size() > 1) {
            out += ')';
        }
    }
    return out;
}

Result<std::string> render_function_target(const FunctionTarget& target)
{
    auto signature = render_signature(target);
    if (!signature) {
        return std::unexpected(signature.error());
    }
    std::string out = *signature + " {\n";

    const auto ctx = target.type_display_context();
    for (TempIndex i = target.parameter_count(); i < target.local_count(); ++i) {
        auto decl = render_local_decl(target, i, ctx);
        if (!decl) {
            return std::unexpected(decl.error());
        }
        out += std::format("{}var {}\n", kIndent, *decl);
    }

    // Annotation formatters are keyed by CodeOffset.
    constexpr std::size_t kMaxCodeSize = std::size_t{std::numeric_limits<CodeOffset>::max()} + 1;
    if (target.bytecode().size() > kMaxCodeSize) {
        return std::unexpected(Error::make(
            "IndexOutOfRange",
            std::format("Code of {} instructions exceeds the addressable {} offsets",
                        target.bytecode().size(),
                        kMaxCodeSize)));
    }

    const RefPredicate is_ref = is_reference_type;
    for (auto [offset, code] : std::views::enumerate(target.bytecode())) {
        const auto code_offset = static_cast<CodeOffset>(offset);
        for (const auto& formatter : target.annotation_formatters()) {
            auto text = formatter(target, code_offset);
            if (!text) {
                return std::unexpected(text.error());
            }
            if (text->has_value()) {
                out += std::format("{}// {}\n", kIndent, **text);
            }
        }
        auto inst = code.display(target, is_ref);
        if (!inst) {
            return std::unexpected(inst.error());
        }
        out += std::format("{}{}\n", kIndent, *inst);
    }
    out += "}\n";
    return out;
}

}  // namespace stackless
