#include "core/ranking/fuzzy_matcher.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace cdir {

FuzzyMatcher::FuzzyMatcher(const QString& pattern)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList parts = pattern.split(whitespace, Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        m_atoms.append(part.toCaseFolded().toUcs4());
    }
}

std::optional<int> FuzzyMatcher::score(const QString& haystack) const
{
    if (m_atoms.isEmpty()) {
        return std::nullopt;
    }

    const QList<uint> text = haystack.toCaseFolded().toUcs4();
    int total = 0;
    for (const QList<uint>& atom : m_atoms) {
        const std::optional<int> atomScore = scoreAtom(atom, text);
        if (!atomScore) {
            return std::nullopt;
        }
        total += *atomScore;
    }
    return total;
}

bool FuzzyMatcher::isBoundary(const QList<uint>& text, int index)
{
    if (index == 0) {
        return true;
    }
    switch (text.at(index - 1)) {
    case '/':
    case ' ':
    case '_':
    case '-':
    case '.':
        return true;
    default:
        return false;
    }
}

// Tries every occurrence of the atom's first character as a starting point
// and greedily matches the rest forward, keeping the best score.
std::optional<int> FuzzyMatcher::scoreAtom(const QList<uint>& atom, const QList<uint>& text)
{
    if (atom.isEmpty()) {
        return 0;
    }
    if (atom.size() > text.size()) {
        return std::nullopt;
    }

    std::optional<int> best;
    for (int start = 0; start < text.size(); ++start) {
        if (text.at(start) != atom.at(0)) {
            continue;
        }

        int score = kMatchScore + (isBoundary(text, start) ? kBoundaryBonus : 0);
        int previous = start;
        int atomIndex = 1;
        for (int i = start + 1; i < text.size() && atomIndex < atom.size(); ++i) {
            if (text.at(i) != atom.at(atomIndex)) {
                continue;
            }
            score += kMatchScore;
            if (i == previous + 1) {
                score += kConsecutiveBonus;
            } else {
                score -= std::min(i - previous - 1, kMaxGapPenalty);
            }
            if (isBoundary(text, i)) {
                score += kBoundaryBonus;
            }
            previous = i;
            ++atomIndex;
        }

        if (atomIndex < atom.size()) {
            // No later start can complete the atom either
            break;
        }
        if (!best || score > *best) {
            best = score;
        }
    }
    return best;
}

} // namespace cdir
