#include "Collator.hpp"
#include "Text.hpp"

int PrimaryCollator::compare(const std::string& a, const std::string& b) const {
    std::u32string ka = Text::primaryKey(a);
    std::u32string kb = Text::primaryKey(b);
    int c = ka.compare(kb);
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

int BinaryCollator::compare(const std::string& a, const std::string& b) const {
    int c = a.compare(b);
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

LocaleCollator::LocaleCollator(const std::string& localeName)
    : LocaleCollator(std::locale(localeName.c_str())) {}

LocaleCollator::LocaleCollator(const std::locale& loc)
    : m_locale(loc), m_facet(&std::use_facet<std::collate<char>>(m_locale)) {}

int LocaleCollator::compare(const std::string& a, const std::string& b) const {
    return m_facet->compare(a.data(), a.data() + a.size(), b.data(), b.data() + b.size());
}
