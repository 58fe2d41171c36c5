/**
 * @file RedlineApp.cpp
 * @brief Implementation of the RedlineApp class.
 */
#include "app/RedlineApp.hpp"

#include "ui/UiRenderer.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaProposalSource.hpp"

namespace redline::app {

namespace {

std::string FindFontPath(const std::vector<const char*>& candidates) {
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return {};
}

void LoadFonts(ImGuiIO& io) {
    const float baseFontSize = 16.0f;

    const std::vector<const char*> baseCandidates = {
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/TTF/NotoSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    const std::vector<const char*> emojiCandidates = {
        "/usr/share/fonts/google-noto-emoji-fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/TTF/NotoEmoji-Regular.ttf",
    };

    std::string basePath = FindFontPath(baseCandidates);
    ImFont* baseFont = nullptr;
    if (!basePath.empty()) {
        baseFont = io.Fonts->AddFontFromFileTTF(basePath.c_str(), baseFontSize);
    }
    if (!baseFont) {
        baseFont = io.Fonts->AddFontDefault();
    }
    io.FontDefault = baseFont;

    std::string emojiPath = FindFontPath(emojiCandidates);
    if (emojiPath.empty()) {
        std::cerr << "[RedlineApp] WARNING: No Emoji font found in system paths. Suggestion icons will not render." << std::endl;
        return;
    }

    ImFontConfig config;
    config.MergeMode = true;
    config.PixelSnapH = true;

    static const ImWchar emojiRanges[] = {
        0x2000, 0x3000,   // Punctuation, Dingbats (writing hand, sparkles)
        0x1F300, 0x1FAFF, // Emoji (face with monocle)
        0
    };

    ImFontGlyphRangesBuilder builder;
    builder.AddRanges(io.Fonts->GetGlyphRangesDefault());
    builder.AddRanges(emojiRanges);
    static ImVector<ImWchar> ranges; // Must outlive the atlas build
    ranges.clear();
    builder.BuildRanges(&ranges);

    io.Fonts->AddFontFromFileTTF(emojiPath.c_str(), baseFontSize, &config, ranges.Data);
}

std::string ReadDocument(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[RedlineApp] Cannot open " << path << std::endl;
        return {};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

RedlineApp::RedlineApp(std::string documentPath) : m_documentPath(std::move(documentPath)) {}

bool RedlineApp::Init() {
    // Composition Root
    auto config = infrastructure::ConfigLoader::Load();
    auto source = std::make_shared<infrastructure::OllamaProposalSource>(
        infrastructure::OllamaClient(config.ollamaHost, config.ollamaPort), config.model);

    application::SessionSettings settings;
    settings.historyDebounce = config.historyDebounce;
    settings.analysisDebounce = config.analysisDebounce;
    settings.historyDepth = config.historyDepth;

    std::string initialText = m_documentPath.empty() ? std::string() : ReadDocument(m_documentPath);
    m_state.Initialize(initialText, settings, source);
    m_state.AppendLog("[SYSTEM] Model: " + config.model + " @ " + config.ollamaHost + ":" +
                      std::to_string(config.ollamaPort) + "\n");

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    const char* glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow("Redline", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 720, window_flags);
    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    LoadFonts(io);
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForOpenGL failed.\n");
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        std::fprintf(stderr, "ImGui_ImplOpenGL3_Init failed.\n");
        return false;
    }
    m_imguiInitialized = true;

    return true;
}

void RedlineApp::Shutdown() {
    if (m_imguiInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiInitialized = false;
    }

    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int RedlineApp::Run() {
    if (!Init()) {
        Shutdown();
        return -1;
    }

    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) done = true;
        }

        m_state.Update(domain::Clock::now());

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ui::DrawUI(m_state);
        if (m_state.ui.requestExit) {
            done = true;
        }

        ImGui::Render();
        ImGuiIO& io = ImGui::GetIO();
        glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
        glClearColor(0.10f, 0.10f, 0.10f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);
    }

    Shutdown();
    return 0;
}

} // namespace redline::app
