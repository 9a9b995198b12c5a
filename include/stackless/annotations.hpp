#pragma once

/**
 * @file annotations.hpp
 * @brief Per-snapshot store of analysis results
 *
 * Each analysis of the pipeline owns exactly one kind and is the only writer
 * of that kind. A snapshot starts with an empty store; a pass that wants an
 * earlier result to survive into the snapshot it produces copies it over
 * explicitly (see FunctionTargetData::Builder::carry_annotation).
 */

#include "stackless/bytecode.hpp"
#include "stackless/common.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace stackless {

enum class AnalysisKind : std::uint8_t {
    kLiveVar,
    kBorrow,
    kLifetime,
    kPackRef,
    kReachingDef,
    kWriteBack,
};

[[nodiscard]] std::string_view analysis_kind_name(AnalysisKind kind) noexcept;

// ============================================================================
// Live variables
// ============================================================================

struct LiveVarInfo
{
    std::set<TempIndex> before;
    std::set<TempIndex> after;

    friend bool operator==(const LiveVarInfo&, const LiveVarInfo&) = default;
};

struct LiveVarAnnotation
{
    std::map<CodeOffset, LiveVarInfo> at;

    friend bool operator==(const LiveVarAnnotation&, const LiveVarAnnotation&) = default;
};

// ============================================================================
// Borrows
// ============================================================================

struct BorrowInfo
{
    std::set<TempIndex> live_refs;
    /// Edges of the borrow graph: parent -> nodes borrowing from it.
    std::map<BorrowNode, std::set<BorrowNode>> borrowed_by;

    friend bool operator==(const BorrowInfo&, const BorrowInfo&) = default;
};

struct BorrowInfoAtOffset
{
    BorrowInfo before;
    BorrowInfo after;

    friend bool operator==(const BorrowInfoAtOffset&, const BorrowInfoAtOffset&) = default;
};

struct BorrowAnnotation
{
    std::map<CodeOffset, BorrowInfoAtOffset> at;

    friend bool operator==(const BorrowAnnotation&, const BorrowAnnotation&) = default;
};

// ============================================================================
// Lifetimes
// ============================================================================

/// Closed range of positions during which a reference is alive.
struct LifetimeInterval
{
    CodeOffset begin = 0;
    CodeOffset end = 0;

    friend bool operator==(const LifetimeInterval&, const LifetimeInterval&) = default;
};

struct LifetimeAnnotation
{
    std::map<TempIndex, LifetimeInterval> intervals;

    friend bool operator==(const LifetimeAnnotation&, const LifetimeAnnotation&) = default;
};

// ============================================================================
// Reference packing
// ============================================================================

struct PackRefInfo
{
    /// References whose target is unpacked before the instruction.
    std::set<TempIndex> unpack_before;
    /// References whose target is packed again after the instruction.
    std::set<TempIndex> pack_after;

    friend bool operator==(const PackRefInfo&, const PackRefInfo&) = default;
};

struct PackRefAnnotation
{
    std::map<CodeOffset, PackRefInfo> at;

    friend bool operator==(const PackRefAnnotation&, const PackRefAnnotation&) = default;
};

// ============================================================================
// Reaching definitions
// ============================================================================

struct Definition
{
    enum class Kind : std::uint8_t {
        kAlias,
        kConst,
    };

    Kind kind = Kind::kAlias;
    TempIndex alias = 0;  ///< kAlias
    Constant value;       ///< kConst

    friend auto operator<=>(const Definition&, const Definition&) = default;
};

struct ReachingDefAnnotation
{
    /// Definitions reaching the instruction at each position, per temp.
    std::map<CodeOffset, std::map<TempIndex, std::set<Definition>>> at;

    friend bool operator==(const ReachingDefAnnotation&, const ReachingDefAnnotation&) = default;
};

// ============================================================================
// Write-back
// ============================================================================

struct WriteBackObligation
{
    BorrowNode target;
    TempIndex reference = 0;

    friend bool operator==(const WriteBackObligation&, const WriteBackObligation&) = default;
};

struct WriteBackAnnotation
{
    /// Obligations discharged after the instruction at each position.
    std::map<CodeOffset, std::vector<WriteBackObligation>> at;

    friend bool operator==(const WriteBackAnnotation&, const WriteBackAnnotation&) = default;
};

// ============================================================================
// Store
// ============================================================================

template <typename T>
struct AnnotationTraits;

template <>
struct AnnotationTraits<LiveVarAnnotation>
{
    static constexpr AnalysisKind kKind = AnalysisKind::kLiveVar;
};

template <>
struct AnnotationTraits<BorrowAnnotation>
{
    static constexpr AnalysisKind kKind = AnalysisKind::kBorrow;
};

template <>
struct AnnotationTraits<LifetimeAnnotation>
{
    static constexpr AnalysisKind kKind = AnalysisKind::kLifetime;
};

template <>
struct AnnotationTraits<PackRefAnnotation>
{
    static constexpr AnalysisKind kKind = AnalysisKind::kPackRef;
};

template <>
struct AnnotationTraits<ReachingDefAnnotation>
{
    static constexpr AnalysisKind kKind = AnalysisKind::kReachingDef;
};

template <>
struct AnnotationTraits<WriteBackAnnotation>
{
    static constexpr AnalysisKind kKind = AnalysisKind::kWriteBack;
};

template <typename T>
concept AnnotationPayloadType = requires { AnnotationTraits<T>::kKind; };

using AnnotationPayload = std::variant<LiveVarAnnotation,
                                       BorrowAnnotation,
                                       LifetimeAnnotation,
                                       PackRefAnnotation,
                                       ReachingDefAnnotation,
                                       WriteBackAnnotation>;

/**
 * @brief Heterogeneous map from analysis kind to that analysis' result.
 *
 * At most one payload per kind. The slot of a kind only ever holds the
 * payload type registered for it in AnnotationTraits, so `get` never hands
 * out a value of the wrong type.
 */
class Annotations
{
public:
    /// Installs `value`, replacing any earlier payload of the same kind.
    template <AnnotationPayloadType T>
    void set(T value)
    {
        m_entries.insert_or_assign(AnnotationTraits<T>::kKind, AnnotationPayload{std::move(value)});
    }

    /// Payload of kind T, or nullptr if the analysis has not run.
    template <AnnotationPayloadType T>
    [[nodiscard]] const T* get() const
    {
        auto it = m_entries.find(AnnotationTraits<T>::kKind);
        if (it == m_entries.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    [[nodiscard]] bool contains(AnalysisKind kind) const { return m_entries.contains(kind); }

    /// Kinds present, in enum order.
    [[nodiscard]] std::vector<AnalysisKind> kinds() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    /**
     * Copies the payload of `kind` from `other` into this store.
     * @return false if `other` has no payload of that kind
     */
    bool copy_from(const Annotations& other, AnalysisKind kind);

    friend bool operator==(const Annotations&, const Annotations&) = default;

private:
    std::map<AnalysisKind, AnnotationPayload> m_entries;
};

}  // namespace stackless
