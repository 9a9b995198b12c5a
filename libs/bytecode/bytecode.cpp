/**
 * @file bytecode.cpp
 * @brief Stackless bytecode queries and display
 */

#include "stackless/bytecode.hpp"

#include "stackless/env.hpp"
#include "stackless/function_target.hpp"
#include "stackless/spec.hpp"

#include <format>
#include <ranges>

namespace stackless {

namespace {

template <typename... Fs>
struct Overloaded : Fs...
{
    using Fs::operator()...;
};

[[nodiscard]] Result<std::string>
display_temp(const FunctionTarget& target, TempIndex idx, const RefPredicate& is_ref)
{
    auto name = target.local_name(idx);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto type = target.local_type(idx);
    if (!type) {
        return std::unexpected(type.error());
    }
    if (is_ref && is_ref(type->get())) {
        return "&" + *name;
    }
    return *name;
}

[[nodiscard]] Result<std::string> display_temps(const FunctionTarget& target,
                                                const std::vector<TempIndex>& temps,
                                                const RefPredicate& is_ref)
{
    std::string out;
    for (auto [i, idx] : std::views::enumerate(temps)) {
        auto text = display_temp(target, idx, is_ref);
        if (!text) {
            return std::unexpected(text.error());
        }
        if (i > 0) {
            out += ", ";
        }
        out += *text;
    }
    return out;
}

[[nodiscard]] std::string display_type_actuals(const FunctionTarget& target,
                                               const std::vector<Type>& types)
{
    if (types.empty()) {
        return "";
    }
    const auto ctx = target.type_display_context();
    std::string out = "<";
    for (auto [i, type] : std::views::enumerate(types)) {
        if (i > 0) {
            out += ", ";
        }
        out += display_type(type, ctx);
    }
    out += '>';
    return out;
}

[[nodiscard]] std::string display_struct(const FunctionTarget& target, const Operation& op)
{
    return target.global_env().struct_display_name(op.struct_id) +
           display_type_actuals(target, op.type_actuals);
}

[[nodiscard]] std::string display_function(const FunctionTarget& target, const Operation& op)
{
    const auto& env = target.global_env();
    const auto* callee = env.function_env(op.function);
    std::string name;
    if (callee == nullptr) {
        name = std::format("?{}::?{}", op.function.module_id.value, op.function.id.value);
    } else {
        name = std::format("{}::{}",
                           env.symbol_pool().string(callee->module_env().name()),
                           env.symbol_pool().string(callee->name()));
    }
    return name + display_type_actuals(target, op.type_actuals);
}

/// Operation head as printed before the parenthesized operands.
[[nodiscard]] Result<std::string> display_operation(const FunctionTarget& target,
                                                    const Operation& op)
{
    using Kind = Operation::Kind;
    const std::string_view name = operation_kind_name(op.kind);
    switch (op.kind) {
        case Kind::kFunction:
            return display_function(target, op);
        case Kind::kPack:
        case Kind::kUnpack:
            return std::format("{} {}", name, display_struct(target, op));
        case Kind::kMoveTo:
        case Kind::kMoveFrom:
        case Kind::kExists:
        case Kind::kBorrowGlobal:
        case Kind::kGetGlobal:
            return std::format("{}<{}>", name, display_struct(target, op));
        case Kind::kBorrowField:
        case Kind::kGetField:
            return std::format("{}<{}>.{}", name, display_struct(target, op), op.field_offset);
        case Kind::kWriteBack: {
            auto node = display_borrow_node(target, op.node);
            if (!node) {
                return std::unexpected(node.error());
            }
            return std::format("{}[{}]", name, *node);
        }
        case Kind::kSplice: {
            std::string out = std::format("{}[", name);
            bool first = true;
            for (const auto& [field, temp] : op.splice) {
                auto text = target.local_name(temp);
                if (!text) {
                    return std::unexpected(text.error());
                }
                out += std::format("{}{} -> {}", first ? "" : ", ", field, *text);
                first = false;
            }
            out += ']';
            return out;
        }
        default:
            return std::string(name);
    }
}

[[nodiscard]] Result<std::string>
display_call(const FunctionTarget& target, const bc::Call& call, const RefPredicate& is_ref)
{
    auto dsts = display_temps(target, call.dsts, is_ref);
    if (!dsts) {
        return std::unexpected(dsts.error());
    }
    const std::string lhs = call.dsts.empty() ? "" : *dsts + " := ";

    if (is_binary_operation(call.op.kind) && call.srcs.size() == 2) {
        auto left = display_temp(target, call.srcs[0], is_ref);
        if (!left) {
            return std::unexpected(left.error());
        }
        auto right = display_temp(target, call.srcs[1], is_ref);
        if (!right) {
            return std::unexpected(right.error());
        }
        return std::format("{}{} {} {}", lhs, *left, operation_kind_name(call.op.kind), *right);
    }
    if (call.op.kind == Operation::Kind::kNot && call.srcs.size() == 1) {
        auto operand = display_temp(target, call.srcs[0], is_ref);
        if (!operand) {
            return std::unexpected(operand.error());
        }
        return std::format("{}!{}", lhs, *operand);
    }

    auto head = display_operation(target, call.op);
    if (!head) {
        return std::unexpected(head.error());
    }
    auto srcs = display_temps(target, call.srcs, is_ref);
    if (!srcs) {
        return std::unexpected(srcs.error());
    }
    return std::format("{}{}({})", lhs, *head, *srcs);
}

[[nodiscard]] Result<std::string> display_spec_block(const FunctionTarget& target,
                                                     const bc::SpecBlockRef& inst)
{
    auto block = target.spec_at(inst.block);
    if (!block) {
        return std::unexpected(block.error());
    }
    const auto& conditions = block->get().conditions;
    if (conditions.empty()) {
        return std::format("spec_block {}", inst.block.value);
    }
    std::string out = std::format("spec_block {} {{ ", inst.block.value);
    for (auto [i, condition] : std::views::enumerate(conditions)) {
        if (i > 0) {
            out += "; ";
        }
        out += display_condition(condition);
    }
    out += " }";
    return out;
}

}  // namespace

std::string_view operation_kind_name(Operation::Kind kind) noexcept
{
    using Kind = Operation::Kind;
    switch (kind) {
        case Kind::kFunction:
            return "call";
        case Kind::kPack:
            return "pack";
        case Kind::kUnpack:
            return "unpack";
        case Kind::kMoveTo:
            return "move_to";
        case Kind::kMoveFrom:
            return "move_from";
        case Kind::kExists:
            return "exists";
        case Kind::kBorrowGlobal:
            return "borrow_global";
        case Kind::kGetGlobal:
            return "get_global";
        case Kind::kBorrowLoc:
            return "borrow_local";
        case Kind::kBorrowField:
            return "borrow_field";
        case Kind::kGetField:
            return "get_field";
        case Kind::kReadRef:
            return "read_ref";
        case Kind::kWriteRef:
            return "write_ref";
        case Kind::kFreezeRef:
            return "freeze_ref";
        case Kind::kWriteBack:
            return "write_back";
        case Kind::kSplice:
            return "splice";
        case Kind::kUnpackRef:
            return "unpack_ref";
        case Kind::kPackRef:
            return "pack_ref";
        case Kind::kDestroy:
            return "destroy";
        case Kind::kCastU8:
            return "(u8)";
        case Kind::kCastU64:
            return "(u64)";
        case Kind::kCastU128:
            return "(u128)";
        case Kind::kNot:
            return "!";
        case Kind::kAdd:
            return "+";
        case Kind::kSub:
            return "-";
        case Kind::kMul:
            return "*";
        case Kind::kDiv:
            return "/";
        case Kind::kMod:
            return "%";
        case Kind::kBitOr:
            return "|";
        case Kind::kBitAnd:
            return "&";
        case Kind::kXor:
            return "^";
        case Kind::kShl:
            return "<<";
        case Kind::kShr:
            return ">>";
        case Kind::kLt:
            return "<";
        case Kind::kGt:
            return ">";
        case Kind::kLe:
            return "<=";
        case Kind::kGe:
            return ">=";
        case Kind::kOr:
            return "||";
        case Kind::kAnd:
            return "&&";
        case Kind::kEq:
            return "==";
        case Kind::kNeq:
            return "!=";
    }
    return "?";
}

bool is_binary_operation(Operation::Kind kind) noexcept
{
    using Kind = Operation::Kind;
    switch (kind) {
        case Kind::kAdd:
        case Kind::kSub:
        case Kind::kMul:
        case Kind::kDiv:
        case Kind::kMod:
        case Kind::kBitOr:
        case Kind::kBitAnd:
        case Kind::kXor:
        case Kind::kShl:
        case Kind::kShr:
        case Kind::kLt:
        case Kind::kGt:
        case Kind::kLe:
        case Kind::kGe:
        case Kind::kOr:
        case Kind::kAnd:
        case Kind::kEq:
        case Kind::kNeq:
            return true;
        default:
            return false;
    }
}

Result<std::string> display_borrow_node(const FunctionTarget& target, const BorrowNode& node)
{
    switch (node.kind) {
        case BorrowNode::Kind::kGlobalRoot:
            return std::format("GlobalRoot({})",
                               target.global_env().struct_display_name(node.resource));
        case BorrowNode::Kind::kLocalRoot:
        case BorrowNode::Kind::kReference: {
            auto name = target.local_name(node.temp);
            if (!name) {
                return std::unexpected(name.error());
            }
            return std::format("{}({})",
                               node.kind == BorrowNode::Kind::kLocalRoot ? "LocalRoot" : "Reference",
                               *name);
        }
    }
    return std::unexpected(Error::make("InvalidBorrowNode", "Unknown borrow node kind"));
}

AttrId Bytecode::attr_id() const noexcept
{
    return std::visit([](const auto& inst) { return inst.attr; }, m_inst);
}

std::vector<TempIndex> Bytecode::sources() const
{
    return std::visit(
        Overloaded{
            [](const bc::Assign& inst) { return std::vector<TempIndex>{inst.src}; },
            [](const bc::Call& inst) { return inst.srcs; },
            [](const bc::Ret& inst) { return inst.srcs; },
            [](const bc::Branch& inst) { return std::vector<TempIndex>{inst.cond}; },
            [](const bc::Abort& inst) { return std::vector<TempIndex>{inst.src}; },
            [](const auto&) { return std::vector<TempIndex>{}; },
        },
        m_inst);
}

std::vector<TempIndex> Bytecode::dests() const
{
    return std::visit(
        Overloaded{
            [](const bc::Assign& inst) { return std::vector<TempIndex>{inst.dst}; },
            [](const bc::Call& inst) { return inst.dsts; },
            [](const bc::Load& inst) { return std::vector<TempIndex>{inst.dst}; },
            [](const auto&) { return std::vector<TempIndex>{}; },
        },
        m_inst);
}

bool Bytecode::is_branch() const noexcept
{
    return std::holds_alternative<bc::Branch>(m_inst) || std::holds_alternative<bc::Jump>(m_inst) ||
           std::holds_alternative<bc::Ret>(m_inst) || std::holds_alternative<bc::Abort>(m_inst);
}

Result<std::string> Bytecode::display(const FunctionTarget& target, const RefPredicate& is_ref) const
{
    return std::visit(
        Overloaded{
            [&](const bc::Assign& inst) -> Result<std::string> {
                auto dst = display_temp(target, inst.dst, is_ref);
                if (!dst) {
                    return std::unexpected(dst.error());
                }
                auto src = display_temp(target, inst.src, is_ref);
                if (!src) {
                    return std::unexpected(src.error());
                }
                switch (inst.kind) {
                    case AssignKind::kCopy:
                        return std::format("{} := copy({})", *dst, *src);
                    case AssignKind::kMove:
                        return std::format("{} := move({})", *dst, *src);
                    case AssignKind::kStore:
                        return std::format("{} := {}", *dst, *src);
                }
                return std::unexpected(Error::make("InvalidInstruction", "Unknown assign kind"));
            },
            [&](const bc::Call& inst) { return display_call(target, inst, is_ref); },
            [&](const bc::Ret& inst) -> Result<std::string> {
                auto srcs = display_temps(target, inst.srcs, is_ref);
                if (!srcs) {
                    return std::unexpected(srcs.error());
                }
                return inst.srcs.empty() ? std::string("return ()") : std::format("return {}", *srcs);
            },
            [&](const bc::Load& inst) -> Result<std::string> {
                auto dst = display_temp(target, inst.dst, is_ref);
                if (!dst) {
                    return std::unexpected(dst.error());
                }
                return std::format("{} := {}", *dst, inst.value.literal);
            },
            [&](const bc::Branch& inst) -> Result<std::string> {
                auto cond = display_temp(target, inst.cond, is_ref);
                if (!cond) {
                    return std::unexpected(cond.error());
                }
                return std::format("if ({}) goto L{} else goto L{}",
                                   *cond,
                                   inst.then_label.value,
                                   inst.else_label.value);
            },
            [](const bc::Jump& inst) -> Result<std::string> {
                return std::format("goto L{}", inst.label.value);
            },
            [](const bc::LabelDef& inst) -> Result<std::string> {
                return std::format("label L{}", inst.label.value);
            },
            [&](const bc::Abort& inst) -> Result<std::string> {
                auto src = display_temp(target, inst.src, is_ref);
                if (!src) {
                    return std::unexpected(src.error());
                }
                return std::format("abort({})", *src);
            },
            [](const bc::Nop&) -> Result<std::string> { return std::string("nop"); },
            [&](const bc::SpecBlockRef& inst) { return display_spec_block(target, inst); },
        },
        m_inst);
}

}  // namespace stackless
