#pragma once

#include <QList>
#include <QString>

#include <optional>

namespace cdir {

// Subsequence matcher used by the fuzzy listings.
//
// The pattern is split on whitespace into atoms; a haystack matches when
// every atom is found as an in-order (not necessarily contiguous) character
// subsequence. Comparison is case-insensitive and works on full Unicode code
// points. Higher scores mean tighter matches: consecutive characters and
// characters at word starts are rewarded, gaps are penalized.
class FuzzyMatcher {
public:
    explicit FuzzyMatcher(const QString& pattern);

    // True when the pattern has no atoms (only whitespace).
    bool isEmpty() const { return m_atoms.isEmpty(); }

    // Score of `haystack`, or nullopt if some atom does not match.
    std::optional<int> score(const QString& haystack) const;

    static constexpr int kMatchScore = 16;
    static constexpr int kConsecutiveBonus = 8;
    static constexpr int kBoundaryBonus = 10;
    static constexpr int kMaxGapPenalty = 5;

private:
    static std::optional<int> scoreAtom(const QList<uint>& atom, const QList<uint>& text);
    static bool isBoundary(const QList<uint>& text, int index);

    QList<QList<uint>> m_atoms;
};

} // namespace cdir
