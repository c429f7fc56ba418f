#include "App.hpp"
#include "Text.hpp"
#include <imgui.h>
#include <algorithm>
#include <iostream>

namespace {
    ImVec4 colBg     = ImVec4(0.08f, 0.08f, 0.10f, 1.0f);
    ImVec4 colTitle  = ImVec4(0.8f, 0.8f, 1.0f, 1.0f);
    ImVec4 colHeader = ImVec4(0.85f, 0.65f, 0.15f, 1.0f);
    ImVec4 colError  = ImVec4(1.0f, 0.6f, 0.6f, 1.0f);
    ImVec4 colInfo   = ImVec4(0.6f, 1.0f, 0.6f, 1.0f);

    const char* sampleLabels[] = {
        "5 words", "10 words", "20 words", "50 words", "100 words", "200 words", "500 words"
    };

    const float labelW  = 110.f;
    const float fieldW  = 220.f;
    const float buttonW = 100.f;
}

const std::vector<int>& App::sampleSizes() {
    static const std::vector<int> sizes = {5, 10, 20, 50, 100, 200, 500};
    return sizes;
}

std::shared_ptr<const Collator> App::makeCollator(const AppConfig& cfg) {
    if (!cfg.localeName.empty()) {
        try {
            return std::make_shared<LocaleCollator>(cfg.localeName);
        } catch (const std::runtime_error& e) {
            std::cerr << "locale '" << cfg.localeName << "' unavailable (" << e.what()
                      << "), using primary collation\n";
        }
    }
    return std::make_shared<PrimaryCollator>();
}

WordSampler App::makeSampler(const AppConfig& cfg) {
    if (cfg.seeded) return WordSampler(cfg.wordListPath, cfg.seed);
    return WordSampler(cfg.wordListPath);
}

App::App(const AppConfig& cfg)
    : m_cfg(cfg), m_list(makeCollator(cfg)), m_sampler(makeSampler(cfg)), m_liveSearch(cfg.liveSearch) {
    const auto& sizes = sampleSizes();
    auto it = std::find(sizes.begin(), sizes.end(), m_cfg.sampleSize);
    if (it != sizes.end()) {
        m_sampleIndex = (int)(it - sizes.begin());
    } else {
        std::cerr << "sample size " << m_cfg.sampleSize << " not offered, using " << sizes[m_sampleIndex] << "\n";
        m_cfg.sampleSize = sizes[m_sampleIndex];
    }
    showListing();
}

std::string App::entry(std::size_t index, const std::string& word) {
    return std::to_string(index) + ": " + word;
}

void App::showListing() {
    m_header.clear();
    m_lines.clear();
    m_lines.reserve(m_list.size());
    for (std::size_t i = 0; i < m_list.size(); ++i) m_lines.push_back(entry(i, m_list[i]));
}

void App::showMessage(const std::string& msg, bool error) {
    m_msg = msg;
    m_msgError = error;
    m_msgTimer = error ? 4.0f : 2.0f;
}

void App::addManualWord(const std::string& raw) {
    std::string word = Text::normalize(raw);
    if (word.empty()) return;
    m_list.insert(word);
    showListing();
}

void App::addRandomWords(int count) {
    if (count <= 0) { showMessage("No random word option selected", true); return; }
    std::vector<std::string> words;
    try {
        words = m_sampler.randomWords((std::size_t)count);
    } catch (const SamplerError& e) {
        std::cerr << "random words: " << e.what() << "\n";
        showMessage(std::string("Error loading random words: ") + e.what(), true);
        return;
    } catch (const std::exception& e) {
        std::cerr << "random words: unexpected failure: " << e.what() << "\n";
        showMessage(std::string("Error loading random words: ") + e.what(), true);
        return;
    }

    int added = 0;
    for (const auto& w : words) {
        std::string word = Text::normalize(w);
        if (word.empty() || m_list.contains(word)) continue;
        m_list.insert(word);
        ++added;
    }
    showListing();
    showMessage("added " + std::to_string(added) + " of " + std::to_string(words.size()) + " sampled words", false);
}

void App::performSearch(const std::string& raw) {
    std::string query = Text::normalize(raw);
    if (query.empty()) { showListing(); return; }

    m_lines.clear();
    std::size_t exact = m_list.exactSearch(query);
    if (exact != SortedList::npos) {
        m_header = "(Exact Match)";
        m_lines.push_back(entry(exact, m_list[exact]));
        return;
    }

    std::size_t insertAt = m_list.insertPosition(query);
    auto closest = m_list.closestMatch(query);
    if (closest) {
        m_header = "(Closest Match)";
        m_lines.push_back("Insert Position: " + std::to_string(insertAt));
        m_lines.push_back(entry(m_list.indexOf(*closest), *closest));
    } else {
        m_header = "No match found. Would be inserted at index " + std::to_string(insertAt);
    }
}

void App::performLiveSearch(const std::string& raw) {
    std::string query = Text::normalize(raw);
    if (query.empty()) { showListing(); return; }

    m_lines.clear();
    auto matches = m_list.prefixMatches(query);
    if (matches.empty()) {
        m_header = "No matches found.";
        return;
    }
    m_header = "(Live Matches)";
    for (const auto& m : matches) m_lines.push_back(entry(m_list.indexOf(m), m));
}

void App::clearList() {
    m_list.clear();
    showListing();
}

void App::update(float dt) {
    if (m_msgTimer > 0.f) { m_msgTimer -= dt; if (m_msgTimer < 0.f) m_msgTimer = 0.f; }
}

void App::topMenu() {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("list")) {
            if (ImGui::MenuItem("add random")) {
                addRandomWords(sampleSizes()[m_sampleIndex]);
            }
            if (ImGui::MenuItem("clear")) {
                clearList();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("quit")) {
                m_wantsToQuit = true;
            }
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("settings")) {
            ImGui::Checkbox("live search", &m_liveSearch);
            ImGui::SetNextItemWidth(fieldW);
            ImGui::Combo("random count", &m_sampleIndex, sampleLabels, IM_ARRAYSIZE(sampleLabels));
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }
}

void App::drawForm() {
    // Add Word
    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted("Add Word:");
    ImGui::SameLine(labelW);
    ImGui::SetNextItemWidth(fieldW);
    bool enter = ImGui::InputText("##add", m_addBuf, sizeof(m_addBuf), ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::SameLine();
    if (ImGui::Button("Add##manual", ImVec2(buttonW, 0)) || enter) {
        addManualWord(m_addBuf);
        m_addBuf[0] = '\0';
    }

    // Add Random
    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted("Add Random:");
    ImGui::SameLine(labelW);
    ImGui::SetNextItemWidth(fieldW);
    ImGui::Combo("##random", &m_sampleIndex, sampleLabels, IM_ARRAYSIZE(sampleLabels));
    ImGui::SameLine();
    if (ImGui::Button("Add##random", ImVec2(buttonW, 0))) {
        addRandomWords(sampleSizes()[m_sampleIndex]);
    }

    // Search
    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted("Search:");
    ImGui::SameLine(labelW);
    ImGui::SetNextItemWidth(fieldW);
    if (ImGui::InputText("##search", m_searchBuf, sizeof(m_searchBuf)) && m_liveSearch) {
        performLiveSearch(m_searchBuf);
    }

    // action row, centred
    ImGui::Dummy(ImVec2(0, 6));
    float rowW = 3 * buttonW + 2 * ImGui::GetStyle().ItemSpacing.x + 140.f;
    float startX = (ImGui::GetContentRegionAvail().x - rowW) * 0.5f;
    if (startX > 0) {
        ImGui::Dummy(ImVec2(startX, 0));
        ImGui::SameLine();
    }
    if (ImGui::Button("Quit", ImVec2(buttonW, 0))) m_wantsToQuit = true;
    ImGui::SameLine();
    if (ImGui::Button("Clear List", ImVec2(buttonW, 0))) clearList();
    ImGui::SameLine();
    if (ImGui::Button("Search", ImVec2(buttonW, 0))) performSearch(m_searchBuf);
    ImGui::SameLine();
    ImGui::Checkbox("Live Search", &m_liveSearch);
}

void App::drawListing() {
    float footerH = ImGui::GetFrameHeightWithSpacing() * 2.f;
    ImGui::BeginChild("listing", ImVec2(0, -footerH), true);
    if (!m_header.empty()) {
        ImGui::PushStyleColor(ImGuiCol_Text, colHeader);
        ImGui::TextUnformatted(m_header.c_str());
        ImGui::PopStyleColor();
    }
    ImGuiListClipper clipper;
    clipper.Begin((int)m_lines.size());
    while (clipper.Step()) {
        for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i) {
            ImGui::TextUnformatted(m_lines[i].c_str());
        }
    }
    ImGui::EndChild();
}

void App::footer() {
    ImGui::TextDisabled("%zu words  |  collation: %s  |  source: %s",
        m_list.size(), m_cfg.localeName.empty() ? "primary" : m_cfg.localeName.c_str(),
        m_sampler.path().c_str());

    if (m_msgTimer > 0.f && !m_msg.empty()) {
        ImGui::PushStyleColor(ImGuiCol_Text, m_msgError ? colError : colInfo);
        ImGui::TextWrapped("%s", m_msg.c_str());
        ImGui::PopStyleColor();
    }
}

void App::renderUI() {
    ImGui::PushStyleColor(ImGuiCol_WindowBg, colBg);
    ImGui::Begin("##root", nullptr,
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoBringToFrontOnFocus);
    ImGui::SetWindowPos(ImVec2(0, 0));
    ImGui::SetWindowSize(ImGui::GetIO().DisplaySize);

    topMenu();
    ImGui::SetCursorPosY(30.f);

    // title
    ImGui::PushStyleColor(ImGuiCol_Text, colTitle);
    ImGui::SetWindowFontScale(1.6f);
    const char* title = "Sorted Word List Manager";
    float titleW = ImGui::CalcTextSize(title).x;
    ImGui::SetCursorPosX((ImGui::GetWindowSize().x - titleW) * 0.5f);
    ImGui::TextUnformatted(title);
    ImGui::SetWindowFontScale(1.0f);
    ImGui::PopStyleColor();
    ImGui::Dummy(ImVec2(0, 6));

    drawForm();
    ImGui::Separator();
    drawListing();
    footer();

    ImGui::End();
    ImGui::PopStyleColor();
}
