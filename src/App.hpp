#pragma once
#include "Collator.hpp"
#include "SortedList.hpp"
#include "WordSampler.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct AppConfig {
    std::string wordListPath = "assets/words.txt";
    std::string localeName;     // empty: primary-strength collator
    int sampleSize = 20;        // one of App::sampleSizes
    bool liveSearch = false;
    bool seeded = false;        // use `seed` for the sampler
    std::uint64_t seed = 0;
    unsigned width = 600;
    unsigned height = 600;
};

class App {
public:
    explicit App(const AppConfig& cfg);

    // actions (what the buttons do)
    void addManualWord(const std::string& raw);
    void addRandomWords(int count);
    void performSearch(const std::string& raw);
    void performLiveSearch(const std::string& raw);
    void clearList();

    // frame
    void update(float dt);
    void renderUI();

    // expose
    const SortedList& list() const { return m_list; }
    const std::string& header() const { return m_header; }
    const std::vector<std::string>& lines() const { return m_lines; }
    const std::string& message() const { return m_msg; }
    bool wantsToQuit() const { return m_wantsToQuit; }

    static const std::vector<int>& sampleSizes();

private:
    static std::shared_ptr<const Collator> makeCollator(const AppConfig& cfg);
    static WordSampler makeSampler(const AppConfig& cfg);
    static std::string entry(std::size_t index, const std::string& word);

    void showListing();
    void showMessage(const std::string& msg, bool error);

    // drawing helpers
    void topMenu();
    void drawForm();
    void drawListing();
    void footer();

private:
    AppConfig m_cfg;
    SortedList m_list;
    WordSampler m_sampler;

    // input buffers
    char m_addBuf[256] = {0};
    char m_searchBuf[256] = {0};
    int m_sampleIndex = 2;
    bool m_liveSearch = false;

    // what the listing pane shows
    std::string m_header;
    std::vector<std::string> m_lines;

    // status
    std::string m_msg;
    float m_msgTimer = 0.f;
    bool m_msgError = false;
    bool m_wantsToQuit = false;
};
