#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

struct SamplerError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The word list path is not a readable regular file
struct ResourceNotFound : SamplerError {
    explicit ResourceNotFound(const std::string& path)
        : SamplerError("Resource not found: " + path), path(path) {}
    std::string path;
};

// Nothing usable was read (empty file, only blank lines, or zero requested)
struct EmptyWordList : SamplerError {
    EmptyWordList() : SamplerError("Word list is empty or invalid.") {}
};

// Picks random words from a one-word-per-line file in a single pass,
// holding at most `count` words in memory at once.
class WordSampler {
public:
    explicit WordSampler(std::string path);
    WordSampler(std::string path, std::uint64_t seed);

    // Up to `count` words; fewer only when the file has fewer.
    // Throws ResourceNotFound or EmptyWordList.
    std::vector<std::string> randomWords(std::size_t count);

    // Reservoir sampling over any stream. Lines are trimmed and lowercased;
    // blank ones don't count. Order of the result carries no meaning.
    static std::vector<std::string> sample(std::istream& in, std::size_t count, std::mt19937_64& rng);

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    std::mt19937_64 m_rng;
};
