#pragma once

/**
 * @file bytecode.hpp
 * @brief Stackless bytecode instructions
 *
 * Instructions operate on numbered locals (temps) instead of an operand stack.
 * Every instruction carries an AttrId which stays with it when passes insert,
 * remove or reorder code; the AttrId, not the position, is the key for the
 * location map of a snapshot.
 */

#include "stackless/common.hpp"
#include "stackless/type.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stackless {

class FunctionTarget;

/// Reference-ness test applied to operand types during display.
using RefPredicate = std::function<bool(const Type&)>;

enum class AssignKind : std::uint8_t {
    kCopy,
    kMove,
    kStore,
};

struct Constant
{
    enum class Kind : std::uint8_t {
        kBool,
        kU8,
        kU64,
        kU128,
        kAddress,
        kByteArray,
    };

    Kind kind = Kind::kBool;
    /// Literal text as it should be displayed, e.g. `true`, `42`, `0x1`.
    std::string literal;

    friend auto operator<=>(const Constant&, const Constant&) = default;
};

/**
 * @brief Root or interior node of a borrow graph.
 *
 * Used by write-back instructions and by the borrow annotation.
 */
struct BorrowNode
{
    enum class Kind : std::uint8_t {
        kLocalRoot,
        kGlobalRoot,
        kReference,
    };

    Kind kind = Kind::kLocalRoot;
    TempIndex temp = 0;                  ///< kLocalRoot, kReference
    QualifiedId<StructId> resource{};    ///< kGlobalRoot

    friend auto operator<=>(const BorrowNode&, const BorrowNode&) = default;
};

struct Operation
{
    enum class Kind : std::uint8_t {
        // Calls and structs
        kFunction,
        kPack,
        kUnpack,
        // Global resources
        kMoveTo,
        kMoveFrom,
        kExists,
        kBorrowGlobal,
        kGetGlobal,
        // Borrows and references
        kBorrowLoc,
        kBorrowField,
        kGetField,
        kReadRef,
        kWriteRef,
        kFreezeRef,
        // Write-back elaboration
        kWriteBack,
        kSplice,
        kUnpackRef,
        kPackRef,
        kDestroy,
        // Casts
        kCastU8,
        kCastU64,
        kCastU128,
        // Unary / binary
        kNot,
        kAdd,
        kSub,
        kMul,
        kDiv,
        kMod,
        kBitOr,
        kBitAnd,
        kXor,
        kShl,
        kShr,
        kLt,
        kGt,
        kLe,
        kGe,
        kOr,
        kAnd,
        kEq,
        kNeq,
    };

    Kind kind = Kind::kFunction;
    QualifiedId<FunId> function{};          ///< kFunction
    QualifiedId<StructId> struct_id{};      ///< struct, global and field operations
    std::size_t field_offset = 0;           ///< kBorrowField, kGetField
    std::vector<Type> type_actuals;
    BorrowNode node{};                      ///< kWriteBack
    std::map<std::size_t, TempIndex> splice;  ///< kSplice: field offset -> temp

    friend bool operator==(const Operation&, const Operation&) = default;
};

[[nodiscard]] std::string_view operation_kind_name(Operation::Kind kind) noexcept;

/// True for operators displayed in infix form (`a + b`).
[[nodiscard]] bool is_binary_operation(Operation::Kind kind) noexcept;

/// `LocalRoot(x)`, `GlobalRoot(M::R)` or `Reference(r)`.
[[nodiscard]] Result<std::string> display_borrow_node(const FunctionTarget& target,
                                                      const BorrowNode& node);

namespace bc {

struct Assign
{
    AttrId attr;
    TempIndex dst = 0;
    TempIndex src = 0;
    AssignKind kind = AssignKind::kCopy;

    friend bool operator==(const Assign&, const Assign&) = default;
};

struct Call
{
    AttrId attr;
    std::vector<TempIndex> dsts;
    Operation op;
    std::vector<TempIndex> srcs;

    friend bool operator==(const Call&, const Call&) = default;
};

struct Ret
{
    AttrId attr;
    std::vector<TempIndex> srcs;

    friend bool operator==(const Ret&, const Ret&) = default;
};

struct Load
{
    AttrId attr;
    TempIndex dst = 0;
    Constant value;

    friend bool operator==(const Load&, const Load&) = default;
};

struct Branch
{
    AttrId attr;
    Label then_label;
    Label else_label;
    TempIndex cond = 0;

    friend bool operator==(const Branch&, const Branch&) = default;
};

struct Jump
{
    AttrId attr;
    Label label;

    friend bool operator==(const Jump&, const Jump&) = default;
};

struct LabelDef
{
    AttrId attr;
    Label label;

    friend bool operator==(const LabelDef&, const LabelDef&) = default;
};

struct Abort
{
    AttrId attr;
    TempIndex src = 0;

    friend bool operator==(const Abort&, const Abort&) = default;
};

struct Nop
{
    AttrId attr;

    friend bool operator==(const Nop&, const Nop&) = default;
};

struct SpecBlockRef
{
    AttrId attr;
    SpecBlockId block;

    friend bool operator==(const SpecBlockRef&, const SpecBlockRef&) = default;
};

}  // namespace bc

/**
 * @brief One stackless bytecode instruction.
 */
class Bytecode
{
public:
    using Variant = std::variant<bc::Assign,
                                 bc::Call,
                                 bc::Ret,
                                 bc::Load,
                                 bc::Branch,
                                 bc::Jump,
                                 bc::LabelDef,
                                 bc::Abort,
                                 bc::Nop,
                                 bc::SpecBlockRef>;

    template <typename Inst>
        requires std::is_constructible_v<Variant, Inst&&>
    Bytecode(Inst&& inst)  // NOLINT(google-explicit-constructor)
        : m_inst(std::forward<Inst>(inst))
    {}

    [[nodiscard]] const Variant& variant() const noexcept { return m_inst; }

    template <typename Inst>
    [[nodiscard]] const Inst* as() const noexcept
    {
        return std::get_if<Inst>(&m_inst);
    }

    [[nodiscard]] AttrId attr_id() const noexcept;

    /// Temps read by this instruction, in operand order.
    [[nodiscard]] std::vector<TempIndex> sources() const;

    /// Temps written by this instruction, in operand order.
    [[nodiscard]] std::vector<TempIndex> dests() const;

    [[nodiscard]] bool is_branch() const noexcept;

    /**
     * Renders the instruction for debug output.
     *
     * Temps are resolved to their names through `target`; temps whose type
     * satisfies `is_ref` are prefixed with `&`. Spec blocks are resolved
     * through `target.spec_at`, so a dangling block id is reported as an
     * error rather than printed.
     */
    [[nodiscard]] Result<std::string> display(const FunctionTarget& target,
                                              const RefPredicate& is_ref) const;

    friend bool operator==(const Bytecode&, const Bytecode&) = default;

private:
    Variant m_inst;
};

}  // namespace stackless
