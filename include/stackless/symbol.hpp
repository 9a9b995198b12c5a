#pragma once

/**
 * @file symbol.hpp
 * @brief Interned identifiers and the pool that owns their text
 */

#include <compare>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace stackless {

class SymbolPool;

/**
 * @brief Interned identifier.
 *
 * Symbols compare by interned identity. The text of a symbol is only
 * available through the pool which created it.
 */
class Symbol
{
public:
    Symbol() = default;

    [[nodiscard]] std::size_t id() const noexcept { return m_id; }

    /// Text of the symbol as stored in `pool`.
    [[nodiscard]] std::string_view display(const SymbolPool& pool) const;

    friend auto operator<=>(const Symbol&, const Symbol&) = default;

private:
    friend class SymbolPool;
    explicit Symbol(std::size_t id) noexcept
        : m_id(id)
    {}

    std::size_t m_id = 0;
};

/**
 * @brief Owner of symbol text.
 *
 * Interning the same string twice yields the same symbol. Strings are stored
 * in a deque so views handed out by `string()` stay valid while the pool lives.
 */
class SymbolPool
{
public:
    SymbolPool();

    SymbolPool(const SymbolPool&) = delete;
    SymbolPool& operator=(const SymbolPool&) = delete;

    [[nodiscard]] Symbol make(std::string_view text);

    /// Looks up an already interned string without creating it.
    [[nodiscard]] std::optional<Symbol> find(std::string_view text) const;

    [[nodiscard]] std::string_view string(Symbol symbol) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_strings.size(); }

private:
    std::deque<std::string> m_strings;
    std::unordered_map<std::string_view, std::size_t> m_index;
};

}  // namespace stackless
