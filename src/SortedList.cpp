#include "SortedList.hpp"
#include "Text.hpp"
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

SortedList::SortedList(std::shared_ptr<const Collator> collator)
    : m_collator(std::move(collator)) {
    if (!m_collator) throw std::invalid_argument("SortedList needs a collator");
}

void SortedList::insert(const std::string& word) {
    m_words.insert(m_words.begin() + insertPosition(word), word);
}

std::size_t SortedList::insertPosition(const std::string& word) const {
    std::size_t low = 0, high = m_words.size();
    while (low < high) {
        std::size_t mid = low + (high - low) / 2;
        if (m_collator->compare(m_words[mid], word) < 0) low = mid + 1;
        else high = mid;
    }
    return low;
}

std::size_t SortedList::exactSearch(const std::string& word) const {
    std::ptrdiff_t low = 0, high = (std::ptrdiff_t)m_words.size() - 1;
    while (low <= high) {
        std::ptrdiff_t mid = low + (high - low) / 2;
        int cmp = m_collator->compare(m_words[mid], word);
        if (cmp < 0) {
            low = mid + 1;
        } else if (cmp > 0) {
            high = mid - 1;
        } else {
            // collation ignores case/accents, so confirm the bytes
            return (m_words[mid] == word) ? (std::size_t)mid : npos;
        }
    }
    return npos;
}

std::optional<std::string> SortedList::closestMatch(const std::string& word) const {
    if (m_words.empty()) return std::nullopt;

    std::ptrdiff_t low = 0, high = (std::ptrdiff_t)m_words.size() - 1;
    std::ptrdiff_t bestLower = -1; // closest smaller
    std::ptrdiff_t bestUpper = -1; // closest larger
    while (low <= high) {
        std::ptrdiff_t mid = low + (high - low) / 2;
        int cmp = m_collator->compare(m_words[mid], word);
        if (cmp < 0) {
            bestLower = mid;
            low = mid + 1;
        } else if (cmp > 0) {
            bestUpper = mid;
            high = mid - 1;
        } else {
            return m_words[mid];
        }
    }

    // upper bound first: a partly typed word is closer to what follows it
    if (bestUpper != -1) return m_words[bestUpper];
    return m_words[bestLower];
}

std::vector<std::string> SortedList::prefixMatches(const std::string& prefix) const {
    std::vector<std::string> matches;
    if (prefix.empty()) return matches;

    // collation order doesn't follow literal prefixes, so scan everything
    for (const auto& w : m_words) {
        if (w.compare(0, prefix.size(), prefix) == 0) matches.push_back(w);
    }

    std::stable_sort(matches.begin(), matches.end(), [this](const std::string& a, const std::string& b) {
        std::size_t la = Text::length(a), lb = Text::length(b);
        if (la != lb) return la < lb;
        return m_collator->compare(a, b) < 0;
    });
    return matches;
}

std::size_t SortedList::indexOf(const std::string& word) const {
    auto it = std::find(m_words.begin(), m_words.end(), word);
    return (it == m_words.end()) ? npos : (std::size_t)(it - m_words.begin());
}

std::ostream& operator<<(std::ostream& os, const SortedList& list) {
    os << '[';
    bool first = true;
    for (const auto& w : list) {
        if (!first) os << ", ";
        os << w;
        first = false;
    }
    return os << ']';
}
