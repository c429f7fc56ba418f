#include "WordSampler.hpp"
#include "Text.hpp"
#include <filesystem>
#include <fstream>
#include <utility>

WordSampler::WordSampler(std::string path)
    : m_path(std::move(path)) {
    std::random_device rd;
    m_rng.seed(rd());
}

WordSampler::WordSampler(std::string path, std::uint64_t seed)
    : m_path(std::move(path)), m_rng(seed) {}

std::vector<std::string> WordSampler::randomWords(std::size_t count) {
    // ifstream happily opens a directory; only a regular file is a word list
    std::error_code ec;
    if (!std::filesystem::is_regular_file(m_path, ec)) throw ResourceNotFound(m_path);
    std::ifstream in(m_path);
    if (!in) throw ResourceNotFound(m_path);

    auto reservoir = sample(in, count, m_rng);
    if (reservoir.empty()) throw EmptyWordList();
    return reservoir;
}

std::vector<std::string> WordSampler::sample(std::istream& in, std::size_t count, std::mt19937_64& rng) {
    std::vector<std::string> reservoir;
    reservoir.reserve(count);
    std::size_t index = 0; // qualifying lines seen so far
    std::string line;
    while (std::getline(in, line)) {
        auto w = Text::toLower(Text::trim(line));
        if (w.empty()) continue;

        if (index < count) {
            reservoir.push_back(std::move(w));
        } else {
            std::uniform_int_distribution<std::size_t> d(0, index);
            std::size_t slot = d(rng);
            if (slot < count) reservoir[slot] = std::move(w);
        }
        ++index;
    }
    return reservoir;
}
