/**
 * @file annotations.cpp
 * @brief Annotation store
 */

#include "stackless/annotations.hpp"

namespace stackless {

std::string_view analysis_kind_name(AnalysisKind kind) noexcept
{
    switch (kind) {
        case AnalysisKind::kLiveVar:
            return "livevar";
        case AnalysisKind::kBorrow:
            return "borrow";
        case AnalysisKind::kLifetime:
            return "lifetime";
        case AnalysisKind::kPackRef:
            return "packref";
        case AnalysisKind::kReachingDef:
            return "reaching_def";
        case AnalysisKind::kWriteBack:
            return "writeback";
    }
    return "unknown";
}

std::vector<AnalysisKind> Annotations::kinds() const
{
    std::vector<AnalysisKind> result;
    result.reserve(m_entries.size());
    for (const auto& [kind, _] : m_entries) {
        result.push_back(kind);
    }
    return result;
}

bool Annotations::copy_from(const Annotations& other, AnalysisKind kind)
{
    auto it = other.m_entries.find(kind);
    if (it == other.m_entries.end()) {
        return false;
    }
    m_entries.insert_or_assign(kind, it->second);
    return true;
}

}  // namespace stackless
