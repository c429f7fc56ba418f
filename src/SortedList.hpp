#pragma once
#include "Collator.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Strings kept in ascending order under an injected Collator.
// Collation-equal entries may coexist; insertion goes to the lower bound.
class SortedList {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    explicit SortedList(std::shared_ptr<const Collator> collator);

    // mutation
    void insert(const std::string& word);
    void clear() { m_words.clear(); }

    // Leftmost index i with every element before i comparing less than word.
    std::size_t insertPosition(const std::string& word) const;

    // Binary search by collation. A collation-equal midpoint that isn't
    // literally equal ends the search with npos, even if a literal match
    // sits elsewhere in the equal run.
    std::size_t exactSearch(const std::string& word) const;

    // Collation-equal element if one is hit, else the smallest element
    // greater than word, else the largest smaller one. Empty only when the list is.
    std::optional<std::string> closestMatch(const std::string& word) const;

    // Elements whose bytes start with prefix, shortest first, then by collation.
    std::vector<std::string> prefixMatches(const std::string& prefix) const;

    bool contains(const std::string& word) const { return exactSearch(word) != npos; }

    // First literal match by linear scan
    std::size_t indexOf(const std::string& word) const;

    // expose
    std::size_t size() const { return m_words.size(); }
    bool empty() const { return m_words.empty(); }
    const std::string& operator[](std::size_t i) const { return m_words[i]; }
    const std::string& at(std::size_t i) const { return m_words.at(i); }
    const std::vector<std::string>& words() const { return m_words; }
    std::vector<std::string>::const_iterator begin() const { return m_words.begin(); }
    std::vector<std::string>::const_iterator end() const { return m_words.end(); }
    const Collator& collator() const { return *m_collator; }

    bool operator==(const SortedList& other) const { return m_words == other.m_words; }
    bool operator!=(const SortedList& other) const { return !(*this == other); }

private:
    std::shared_ptr<const Collator> m_collator;
    std::vector<std::string> m_words;
};

std::ostream& operator<<(std::ostream& os, const SortedList& list);
