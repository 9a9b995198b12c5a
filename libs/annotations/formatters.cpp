/**
 * @file formatters.cpp
 * @brief Debug formatters for pipeline annotations
 */

#include "stackless/annotation_formatters.hpp"

#include "stackless/annotations.hpp"
#include "stackless/function_target.hpp"

#include <format>
#include <ranges>
#include <set>
#include <string_view>
#include <vector>

namespace stackless {

namespace {

[[nodiscard]] Result<std::string> join_names(const FunctionTarget& target,
                                             const std::set<TempIndex>& temps)
{
    std::string out;
    for (auto [i, idx] : std::views::enumerate(temps)) {
        auto name = target.local_name(idx);
        if (!name) {
            return std::unexpected(name.error());
        }
        if (i > 0) {
            out += ", ";
        }
        out += *name;
    }
    return out;
}

[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string out;
    for (auto [i, part] : std::views::enumerate(parts)) {
        if (i > 0) {
            out += separator;
        }
        out += part;
    }
    return out;
}

[[nodiscard]] Result<std::string> display_definition(const FunctionTarget& target,
                                                     const Definition& def)
{
    if (def.kind == Definition::Kind::kConst) {
        return def.value.literal;
    }
    return target.local_name(def.alias);
}

}  // namespace

Result<std::optional<std::string>> format_livevar_annotation(const FunctionTarget& target,
                                                             CodeOffset offset)
{
    const auto* annotation = target.annotations().get<LiveVarAnnotation>();
    if (annotation == nullptr) {
        return std::nullopt;
    }
    auto it = annotation->at.find(offset);
    if (it == annotation->at.end()) {
        return std::nullopt;
    }
    auto names = join_names(target, it->second.before);
    if (!names) {
        return std::unexpected(names.error());
    }
    return std::format("live vars: {}", *names);
}

Result<std::optional<std::string>> format_borrow_annotation(const FunctionTarget& target,
                                                            CodeOffset offset)
{
    const auto* annotation = target.annotations().get<BorrowAnnotation>();
    if (annotation == nullptr) {
        return std::nullopt;
    }
    auto it = annotation->at.find(offset);
    if (it == annotation->at.end()) {
        return std::nullopt;
    }
    const BorrowInfo& info = it->second.before;
    auto refs = join_names(target, info.live_refs);
    if (!refs) {
        return std::unexpected(refs.error());
    }
    std::string out = std::format("live_refs: {}", *refs);
    if (!info.borrowed_by.empty()) {
        out += "; borrowed_by: ";
        bool first_edge = true;
        for (const auto& [parent, children] : info.borrowed_by) {
            auto parent_text = display_borrow_node(target, parent);
            if (!parent_text) {
                return std::unexpected(parent_text.error());
            }
            std::vector<std::string> child_texts;
            for (const auto& child : children) {
                auto child_text = display_borrow_node(target, child);
                if (!child_text) {
                    return std::unexpected(child_text.error());
                }
                child_texts.push_back(std::move(*child_text));
            }
            out += std::format(
                "{}{} -> {{{}}}", first_edge ? "" : ", ", *parent_text, join(child_texts, ", "));
            first_edge = false;
        }
    }
    return out;
}

Result<std::optional<std::string>> format_writeback_annotation(const FunctionTarget& target,
                                                               CodeOffset offset)
{
    const auto* annotation = target.annotations().get<WriteBackAnnotation>();
    if (annotation == nullptr) {
        return std::nullopt;
    }
    auto it = annotation->at.find(offset);
    if (it == annotation->at.end() || it->second.empty()) {
        return std::nullopt;
    }
    std::string out = "write_back: ";
    for (auto [i, obligation] : std::views::enumerate(it->second)) {
        auto node = display_borrow_node(target, obligation.target);
        if (!node) {
            return std::unexpected(node.error());
        }
        auto ref = target.local_name(obligation.reference);
        if (!ref) {
            return std::unexpected(ref.error());
        }
        out += std::format("{}{} <- {}", i > 0 ? ", " : "", *node, *ref);
    }
    return out;
}

Result<std::optional<std::string>> format_packref_annotation(const FunctionTarget& target,
                                                             CodeOffset offset)
{
    const auto* annotation = target.annotations().get<PackRefAnnotation>();
    if (annotation == nullptr) {
        return std::nullopt;
    }
    auto it = annotation->at.find(offset);
    if (it == annotation->at.end()) {
        return std::nullopt;
    }
    const PackRefInfo& info = it->second;
    std::vector<std::string> parts;
    if (!info.unpack_before.empty()) {
        auto names = join_names(target, info.unpack_before);
        if (!names) {
            return std::unexpected(names.error());
        }
        parts.push_back(std::format("unpack before: {}", *names));
    }
    if (!info.pack_after.empty()) {
        auto names = join_names(target, info.pack_after);
        if (!names) {
            return std::unexpected(names.error());
        }
        parts.push_back(std::format("pack after: {}", *names));
    }
    if (parts.empty()) {
        return std::nullopt;
    }
    return std::format("packref: {}", join(parts, "; "));
}

Result<std::optional<std::string>> format_lifetime_annotation(const FunctionTarget& target,
                                                              CodeOffset offset)
{
    const auto* annotation = target.annotations().get<LifetimeAnnotation>();
    if (annotation == nullptr) {
        return std::nullopt;
    }
    std::set<TempIndex> begins;
    std::set<TempIndex> ends;
    for (const auto& [temp, interval] : annotation->intervals) {
        if (interval.begin == offset) {
            begins.insert(temp);
        }
        if (interval.end == offset) {
            ends.insert(temp);
        }
    }
    if (begins.empty() && ends.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> parts;
    if (!begins.empty()) {
        auto names = join_names(target, begins);
        if (!names) {
            return std::unexpected(names.error());
        }
        parts.push_back(std::format("begin {}", *names));
    }
    if (!ends.empty()) {
        auto names = join_names(target, ends);
        if (!names) {
            return std::unexpected(names.error());
        }
        parts.push_back(std::format("end {}", *names));
    }
    return std::format("lifetime: {}", join(parts, "; "));
}

Result<std::optional<std::string>> format_reaching_def_annotation(const FunctionTarget& target,
                                                                  CodeOffset offset)
{
    const auto* annotation = target.annotations().get<ReachingDefAnnotation>();
    if (annotation == nullptr) {
        return std::nullopt;
    }
    auto it = annotation->at.find(offset);
    if (it == annotation->at.end() || it->second.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> entries;
    for (const auto& [temp, defs] : it->second) {
        auto name = target.local_name(temp);
        if (!name) {
            return std::unexpected(name.error());
        }
        std::vector<std::string> def_texts;
        for (const auto& def : defs) {
            auto text = display_definition(target, def);
            if (!text) {
                return std::unexpected(text.error());
            }
            def_texts.push_back(std::move(*text));
        }
        entries.push_back(std::format("{} -> {{{}}}", *name, join(def_texts, ", ")));
    }
    return std::format("reach: {}", join(entries, ", "));
}

void register_annotation_formatters_for_test(FunctionTarget& target)
{
    target.register_annotation_formatter(format_livevar_annotation);
    target.register_annotation_formatter(format_borrow_annotation);
    target.register_annotation_formatter(format_writeback_annotation);
    target.register_annotation_formatter(format_packref_annotation);
    target.register_annotation_formatter(format_lifetime_annotation);
    target.register_annotation_formatter(format_reaching_def_annotation);
}

}  // namespace stackless
