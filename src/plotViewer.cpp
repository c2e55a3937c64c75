#include <algorithm>
#include <cstdio>
#include <string>

#include <GLFW/glfw3.h>

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include "implot.h"

#include "plotViewer.hpp"

namespace ACC{

    void PlotViewer::emit(const Figure& fig){
        figures_.push_back(fig);
    }

    // ImPlot wants float or double arrays of equal length
    static void draw_panel(const Panel& p, float width){
        const float height = 200.0f;
        if (!ImPlot::BeginPlot(p.title.c_str(), ImVec2(width, height))) return;

        ImPlot::SetupAxes(p.xlabel.c_str(), p.ylabel.c_str(), ImPlotAxisFlags_AutoFit,
                          p.y_min < p.y_max ? ImPlotAxisFlags_None : ImPlotAxisFlags_AutoFit);
        if (p.y_min < p.y_max) {
            ImPlot::SetupAxisLimits(ImAxis_Y1, p.y_min, p.y_max, ImGuiCond_Always);
        }
        for (const auto& s : p.series) {
            const int count = static_cast<int>(std::min(s.x.size(), s.y.size()));
            if (count > 0) ImPlot::PlotLine(s.label.c_str(), s.x.data(), s.y.data(), count);
        }
        ImPlot::EndPlot();
    }

    bool PlotViewer::show(){
        if (figures_.empty()) return true;

        // ----------------------
        // GLFW + OpenGL init
        // ----------------------
        if (!glfwInit()) {
            std::fprintf(stderr, "[viewer] Failed to initialize GLFW\n");
            return false;
        }

        const char* glsl_version = "#version 150";
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

        GLFWwindow* window = glfwCreateWindow(1200, 900, "Accelerometer preprocessing", nullptr, nullptr);
        if (!window) {
            std::fprintf(stderr, "[viewer] Failed to create GLFW window\n");
            glfwTerminate();
            return false;
        }
        glfwMakeContextCurrent(window);
        glfwSwapInterval(1);

        // ----------------------
        // ImGui + ImPlot init
        // ----------------------
        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init(glsl_version);

        ImPlot::CreateContext();

        // one figure at a time, picked from the list on the left
        int selected = 0;

        // ----------------------
        // Main UI loop
        // ----------------------
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();
            const ImGuiViewport* vp = ImGui::GetMainViewport();

            ImGuiWindowFlags flags =
                ImGuiWindowFlags_NoMove
                | ImGuiWindowFlags_NoResize
                | ImGuiWindowFlags_NoCollapse;

            const float list_w = 300.0f;
            ImGui::SetNextWindowPos(vp->WorkPos, ImGuiCond_Always);
            ImGui::SetNextWindowSize(ImVec2(list_w, vp->WorkSize.y), ImGuiCond_Always);
            ImGui::Begin("Figures", nullptr, flags);
            for (int i = 0; i < static_cast<int>(figures_.size()); ++i) {
                const std::string item = figures_[i].title + "##" + std::to_string(i);
                if (ImGui::Selectable(item.c_str(), selected == i)) selected = i;
            }
            ImGui::End();

            const Figure& fig = figures_[selected];
            ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + list_w, vp->WorkPos.y), ImGuiCond_Always);
            ImGui::SetNextWindowSize(ImVec2(vp->WorkSize.x - list_w, vp->WorkSize.y), ImGuiCond_Always);
            ImGui::Begin("Plot", nullptr, flags);
            ImGui::Text("%s", fig.title.c_str());
            const float plot_w = ImGui::GetContentRegionAvail().x;
            for (const auto& p : fig.panels) {
                draw_panel(p, plot_w);
            }
            ImGui::End();

            // Render
            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);

            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            glfwSwapBuffers(window);
        }

        // ----------------------
        // Shutdown
        // ----------------------
        ImPlot::DestroyContext();
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        glfwDestroyWindow(window);
        glfwTerminate();
        return true;
    }
}
