/**
 * @file symbol.cpp
 * @brief Symbol interning
 */

#include "stackless/symbol.hpp"

namespace stackless {

std::string_view Symbol::display(const SymbolPool& pool) const
{
    return pool.string(*this);
}

SymbolPool::SymbolPool()
{
    // Slot 0 is the empty symbol so a default constructed Symbol is printable.
    m_strings.emplace_back();
    m_index.emplace(m_strings.back(), 0);
}

Symbol SymbolPool::make(std::string_view text)
{
    if (auto it = m_index.find(text); it != m_index.end()) {
        return Symbol{it->second};
    }
    const std::size_t id = m_strings.size();
    m_strings.emplace_back(text);
    m_index.emplace(m_strings.back(), id);
    return Symbol{id};
}

std::optional<Symbol> SymbolPool::find(std::string_view text) const
{
    auto it = m_index.find(text);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return Symbol{it->second};
}

std::string_view SymbolPool::string(Symbol symbol) const
{
    if (symbol.id() >= m_strings.size()) {
        return "<unknown symbol>";
    }
    return m_strings[symbol.id()];
}

}  // namespace stackless
