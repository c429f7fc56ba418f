#include "WordSampler.hpp"
#include "Text.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

namespace {
    std::string writeFile(const std::string& name, const std::string& content) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
        return path;
    }

    std::string numberedLines(int n) {
        std::string s;
        for (int i = 0; i < n; ++i) s += "w" + std::to_string(i) + "\n";
        return s;
    }
}

TEST(WordSamplerTest, BlankSourceIsEmptyWordList) {
    WordSampler sampler(writeFile("blank_words.txt", "\n   \n\t\n\n"), 1);
    EXPECT_THROW(sampler.randomWords(5), EmptyWordList);
}

TEST(WordSamplerTest, EmptyFileIsEmptyWordList) {
    WordSampler sampler(writeFile("empty_words.txt", ""), 1);
    EXPECT_THROW(sampler.randomWords(5), EmptyWordList);
}

TEST(WordSamplerTest, MissingFileIsResourceNotFound) {
    std::string path = ::testing::TempDir() + "definitely_not_here/words.txt";
    WordSampler sampler(path, 1);
    try {
        sampler.randomWords(5);
        FAIL() << "expected ResourceNotFound";
    } catch (const ResourceNotFound& e) {
        EXPECT_EQ(e.path, path);
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
    }
}

TEST(WordSamplerTest, DirectoryIsResourceNotFound) {
    std::string dir = ::testing::TempDir() + "word_list_dir";
    std::filesystem::create_directories(dir);
    WordSampler sampler(dir, 1);
    EXPECT_THROW(sampler.randomWords(5), ResourceNotFound);
}

TEST(WordSamplerTest, ErrorsShareABase) {
    WordSampler sampler(::testing::TempDir() + "missing_again.txt", 1);
    EXPECT_THROW(sampler.randomWords(1), SamplerError);
}

TEST(WordSamplerTest, ZeroRequestedIsEmptyWordList) {
    WordSampler sampler(writeFile("some_words.txt", "one\ntwo\n"), 1);
    EXPECT_THROW(sampler.randomWords(0), EmptyWordList);
}

TEST(WordSamplerTest, FewerLinesThanRequested) {
    WordSampler sampler(writeFile("three_words.txt", "alpha\nbeta\ngamma\n"), 1);
    auto words = sampler.randomWords(5);
    std::sort(words.begin(), words.end());
    EXPECT_EQ(words, (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST(WordSamplerTest, LinesAreTrimmedAndLowercased) {
    std::istringstream in("  Apple \r\nBANANA\n\n \t\n Cherry");
    std::mt19937_64 rng(5);
    auto words = WordSampler::sample(in, 10, rng);
    std::sort(words.begin(), words.end());
    EXPECT_EQ(words, (std::vector<std::string>{"apple", "banana", "cherry"}));
}

TEST(WordSamplerTest, NonLatinLinesAreLowercased) {
    std::istringstream in("МОСКВА\nΑΘΗΝΑ\n");
    std::mt19937_64 rng(5);
    auto words = WordSampler::sample(in, 10, rng);
    std::sort(words.begin(), words.end());
    EXPECT_EQ(words, (std::vector<std::string>{"αθηνα", "москва"}));
}

TEST(WordSamplerTest, ExactCountOfDistinctSourceLines) {
    WordSampler sampler(writeFile("hundred_words.txt", numberedLines(100)), 99);
    for (int run = 0; run < 20; ++run) {
        auto words = sampler.randomWords(10);
        ASSERT_EQ(words.size(), 10u);
        std::set<std::string> uniq(words.begin(), words.end());
        EXPECT_EQ(uniq.size(), 10u);
        for (const auto& w : words) {
            int n = std::stoi(w.substr(1));
            EXPECT_TRUE(w[0] == 'w' && n >= 0 && n < 100) << w;
        }
    }
}

TEST(WordSamplerTest, EachLineEquallyLikely) {
    const int lines = 10, count = 3, runs = 20000;
    const std::string source = numberedLines(lines);
    std::mt19937_64 rng(12345);
    std::map<std::string, int> hits;
    for (int r = 0; r < runs; ++r) {
        std::istringstream in(source);
        for (const auto& w : WordSampler::sample(in, count, rng)) hits[w]++;
    }
    ASSERT_EQ(hits.size(), (std::size_t)lines);
    for (const auto& h : hits) {
        double freq = (double)h.second / runs;
        EXPECT_NEAR(freq, (double)count / lines, 0.03) << h.first;
    }
}

TEST(WordSamplerTest, SameSeedSameSample) {
    std::string path = writeFile("seeded_words.txt", numberedLines(50));
    WordSampler a(path, 2024), b(path, 2024);
    EXPECT_EQ(a.randomWords(7), b.randomWords(7));
}

TEST(WordSamplerTest, BundledWordList) {
    WordSampler sampler(std::string(WORDSHELF_ASSET_DIR) + "/words.txt", 42);
    auto words = sampler.randomWords(20);
    ASSERT_EQ(words.size(), 20u);
    for (const auto& w : words) {
        EXPECT_FALSE(w.empty());
        EXPECT_EQ(Text::toLower(w), w);
    }
}
