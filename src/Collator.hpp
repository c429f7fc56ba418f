#pragma once
#include <locale>
#include <string>

// Total order over strings: negative, zero or positive like strcmp.
class Collator {
public:
    virtual ~Collator() = default;
    virtual int compare(const std::string& a, const std::string& b) const = 0;
};

// Case- and accent-insensitive (primary strength). Literal equality is
// still the caller's business; "Apple" and "apple" compare equal here.
class PrimaryCollator : public Collator {
public:
    int compare(const std::string& a, const std::string& b) const override;
};

// Byte order.
class BinaryCollator : public Collator {
public:
    int compare(const std::string& a, const std::string& b) const override;
};

// Delegates to the std::collate<char> facet of a locale.
// The facet compares at full (tertiary) strength: case and accent
// differences still separate "Apple" from "apple", so unlike PrimaryCollator
// they never form an equal run.
// Throws std::runtime_error for a locale name the system doesn't know.
class LocaleCollator : public Collator {
public:
    explicit LocaleCollator(const std::string& localeName);
    explicit LocaleCollator(const std::locale& loc);

    int compare(const std::string& a, const std::string& b) const override;

private:
    std::locale m_locale;
    const std::collate<char>* m_facet;
};
