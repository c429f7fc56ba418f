#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <imgui-SFML.h>
#include <iostream>
#include "App.hpp"
#include "Options.hpp"

int main(int argc, char** argv) {
    AppConfig cfg;
    switch (parseOptions(argc, argv, cfg, std::cout, std::cerr)) {
        case ParseResult::Help: return 0;
        case ParseResult::Error: return 2;
        case ParseResult::Run: break;
    }

    sf::RenderWindow window(sf::VideoMode(cfg.width, cfg.height), "Sorted Word List");
    window.setFramerateLimit(60);
    ImGui::SFML::Init(window);

    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameRounding = 6.f;
    style.ScrollbarRounding = 8.f;
    style.WindowRounding = 8.f;

    App app(cfg);

    sf::Clock deltaClock;
    bool wantQuit = false;

    while (window.isOpen() && !wantQuit) {
        sf::Event event{};
        while (window.pollEvent(event)) {
            ImGui::SFML::ProcessEvent(event);
            if (event.type == sf::Event::Closed) window.close();
            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape) wantQuit = true;
        }

        float dt = deltaClock.restart().asSeconds();
        ImGui::SFML::Update(window, sf::seconds(dt));
        app.update(dt);

        if (app.wantsToQuit()) {
            wantQuit = true;
        }

        window.clear(sf::Color(20, 20, 26));
        app.renderUI();
        ImGui::SFML::Render(window);
        window.display();
    }

    ImGui::SFML::Shutdown();
    return 0;
}
