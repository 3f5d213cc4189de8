/**
 * @file DashboardRenderer.cpp
 * @brief Tabs of the Equilibra dashboard. Renders engine output, never alters it.
 */
#include "ui/DashboardRenderer.hpp"

#include "imgui.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace equilibra::ui {

using namespace equilibra::domain;

namespace {

const ImVec4 kGreen(0.4f, 0.9f, 0.4f, 1.0f);
const ImVec4 kYellow(1.0f, 0.85f, 0.3f, 1.0f);
const ImVec4 kOrange(1.0f, 0.6f, 0.2f, 1.0f);
const ImVec4 kRed(1.0f, 0.35f, 0.35f, 1.0f);
const ImVec4 kMuted(0.6f, 0.6f, 0.6f, 1.0f);

ImVec4 ActionColor(DecisionAction action) {
    switch (action) {
        case DecisionAction::Prioritize: return kGreen;
        case DecisionAction::Maintain: return ImVec4(0.8f, 0.8f, 0.8f, 1.0f);
        case DecisionAction::Downgrade: return kYellow;
        case DecisionAction::Defer: return kOrange;
        case DecisionAction::Skip: return kRed;
    }
    return kMuted;
}

ImVec4 SeverityColor(RiskSeverity severity) {
    switch (severity) {
        case RiskSeverity::Low: return kGreen;
        case RiskSeverity::Moderate: return kYellow;
        case RiskSeverity::High: return kOrange;
        case RiskSeverity::Critical: return kRed;
    }
    return kMuted;
}

ImVec4 CouncilColor(CouncilAction action) {
    switch (action) {
        case CouncilAction::Proceed: return kGreen;
        case CouncilAction::Modify: return kYellow;
        case CouncilAction::Skip: return kRed;
    }
    return kMuted;
}

std::string TaskLabel(const PlannedTask& task) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), "%s (%d min, %.0f%%)", task.name.c_str(),
                  task.durationMinutes, task.intensity * 100.0);
    return buffer;
}

void DrawDecisionTable(const TradeOffDecision& decision) {
    const ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_Resizable;
    if (!ImGui::BeginTable("Decisions", 5, flags)) return;

    ImGui::TableSetupColumn("Category");
    ImGui::TableSetupColumn("Priority");
    ImGui::TableSetupColumn("Action");
    ImGui::TableSetupColumn("Task");
    ImGui::TableSetupColumn("Reasoning");
    ImGui::TableHeadersRow();

    for (const auto& d : decision.decisions) {
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted(CategoryToString(d.category).c_str());
        ImGui::TableSetColumnIndex(1);
        ImGui::Text("%.2f", d.priorityScore);
        ImGui::TableSetColumnIndex(2);
        ImGui::TextColored(ActionColor(d.action), "%s", ActionToString(d.action).c_str());
        ImGui::TableSetColumnIndex(3);
        ImGui::TextUnformatted(TaskLabel(d.originalTask).c_str());
        if (d.adjustedTask) {
            ImGui::TextColored(kYellow, "-> %s", TaskLabel(*d.adjustedTask).c_str());
        }
        ImGui::TableSetColumnIndex(4);
        ImGui::TextWrapped("%s", d.reasoning.c_str());
    }
    ImGui::EndTable();
}

void DrawDailyDecisionTab(DashboardState& app, const DashboardResults& results) {
    auto& in = app.inputs;
    ImGui::Text("Today's state");
    ImGui::SliderFloat("Sleep (h)", &in.sleepHours, 0.0f, 12.0f, "%.1f");
    ImGui::SliderInt("Energy", &in.energyLevel, 1, 10);
    const char* stressItems[] = {"LOW", "MEDIUM", "HIGH"};
    ImGui::Combo("Stress", &in.stressIndex, stressItems, IM_ARRAYSIZE(stressItems));
    ImGui::SliderFloat("Time available (h)", &in.timeAvailableHours, 0.0f, 8.0f, "%.2f");
    ImGui::SliderFloat("Sleep debt (h)", &in.sleepDebtHours, 0.0f, 20.0f, "%.1f");
    ImGui::SliderInt("High-effort streak", &in.consecutiveHighEffortDays, 0, 10);

    if (ImGui::CollapsingHeader("Planned tasks")) {
        for (size_t i = 0; i < app.plannedTasks.size(); ++i) {
            auto& task = app.plannedTasks[i];
            ImGui::PushID(static_cast<int>(i));
            ImGui::Text("%s / %s", CategoryToString(task.category).c_str(), task.name.c_str());
            ImGui::SetNextItemWidth(120);
            ImGui::InputInt("min", &task.durationMinutes);
            task.durationMinutes = std::max(1, task.durationMinutes);
            ImGui::SameLine();
            ImGui::SetNextItemWidth(160);
            float intensity = static_cast<float>(task.intensity);
            if (ImGui::SliderFloat("intensity", &intensity, 0.0f, 1.0f, "%.2f")) {
                task.intensity = intensity;
            }
            ImGui::PopID();
        }
        if (ImGui::Button("Reset sample plan")) {
            app.plannedTasks = SamplePlannedTasks();
        }
    }

    const bool busy = app.IsBusy(application::TaskType::DecisionCycle);
    if (busy) ImGui::BeginDisabled();
    if (ImGui::Button("Run decision cycle", ImVec2(220, 36))) {
        app.RunDecision();
    }
    if (busy) {
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::TextColored(kYellow, "Deciding...");
    }

    ImGui::Separator();
    if (!results.lastCycle) {
        ImGui::TextColored(kMuted, "No decision yet.");
        return;
    }

    const auto& cycle = *results.lastCycle;
    const auto& decision = cycle.decision;
    ImGui::Text("Decision %s  |  confidence %.0f%%  |  readiness %d",
                decision.id.c_str(), decision.confidenceScore * 100.0, decision.state.readinessScore());

    if (cycle.constraints.empty()) {
        ImGui::TextColored(kGreen, "No active constraints");
    } else {
        ImGui::Text("Active constraints:");
        for (const auto& c : cycle.constraints.items()) {
            ImGui::BulletText("%s (%.2f) - %s", ConstraintKindToString(c.kind).c_str(), c.severity, c.description.c_str());
        }
    }

    if (ImGui::CollapsingHeader("Priorities")) {
        for (const auto& [category, weight] : decision.priorities) {
            ImGui::ProgressBar(static_cast<float>(weight), ImVec2(200, 0));
            ImGui::SameLine();
            ImGui::Text("%s %.3f", CategoryToString(category).c_str(), weight);
        }
        for (const auto& adj : decision.priorityAdjustments) {
            ImGui::TextColored(kMuted, "%s: %s %+.3f", adj.source.c_str(), CategoryToString(adj.category).c_str(), adj.delta);
        }
    }

    DrawDecisionTable(decision);
    ImGui::TextWrapped("%s", decision.reasoningSummary.c_str());

    if (!decision.futureImpacts.empty()) {
        ImGui::Text("Future impacts:");
        for (const auto& impact : decision.futureImpacts) {
            ImGui::BulletText("[%s, %d day(s)] %s", impact.adjustmentType.c_str(), impact.daysAffected, impact.description.c_str());
        }
    }

    if (cycle.narrative) {
        ImGui::Separator();
        ImGui::Text("Narrative%s", cycle.narrative->generatedByModel ? " (model)" : "");
        ImGui::TextWrapped("%s", cycle.narrative->explanation.c_str());
        ImGui::TextColored(kMuted, "%s", cycle.narrative->temporalAnalysis.c_str());
        ImGui::TextColored(kMuted, "%s", cycle.narrative->contextAssessment.c_str());
    }
}

void DrawCouncilTab(DashboardState& app, const DashboardResults& results) {
    ImGui::InputText("Activity", app.council.activity, sizeof(app.council.activity));
    ImGui::InputText("Goal", app.council.goal, sizeof(app.council.goal));
    ImGui::Checkbox("Evaluate agents in parallel", &app.council.parallel);
    ImGui::TextColored(kMuted, "Uses the state from the Daily Decision tab.");
    if (ImGui::Button("Convene council", ImVec2(220, 36))) {
        app.ConsultCouncil();
    }

    ImGui::Separator();
    if (!results.consensus) {
        ImGui::TextColored(kMuted, "The council has not met yet.");
        return;
    }
    const auto& c = *results.consensus;
    ImGui::TextColored(CouncilColor(c.finalAction), "%s", CouncilActionToString(c.finalAction).c_str());
    ImGui::SameLine();
    ImGui::ProgressBar(static_cast<float>(c.consensusLevel), ImVec2(200, 0));

    if (ImGui::BeginTable("Votes", 4, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Agent");
        ImGui::TableSetupColumn("Vote");
        ImGui::TableSetupColumn("Confidence");
        ImGui::TableSetupColumn("Reasoning");
        ImGui::TableHeadersRow();
        for (const auto& vote : c.votes) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted(AgentDisplayName(vote.agent).c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::TextColored(CouncilColor(vote.action), "%s", CouncilActionToString(vote.action).c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::Text("%.2f", vote.confidence);
            ImGui::TableSetColumnIndex(3);
            ImGui::TextWrapped("%s", vote.reasoning.c_str());
        }
        ImGui::EndTable();
    }

    if (!c.dissentingOpinions.empty()) {
        ImGui::Text("Dissent:");
        for (const auto& d : c.dissentingOpinions) {
            ImGui::BulletText("%s", d.c_str());
        }
    }
}

void DrawForecastTab(DashboardState& app, const DashboardResults& results) {
    const bool busy = app.IsBusy(application::TaskType::Narrative);
    if (busy) ImGui::BeginDisabled();
    if (ImGui::Button("Refresh forecast & patterns", ImVec2(260, 36))) {
        app.RefreshInsights();
    }
    if (busy) ImGui::EndDisabled();

    if (results.forecast) {
        const auto& f = *results.forecast;
        ImGui::Separator();
        ImGui::Text("Burnout risk:");
        ImGui::SameLine();
        ImGui::TextColored(SeverityColor(f.severity), "%d / 100 (%s)", f.riskScore, SeverityToString(f.severity).c_str());
        if (f.daysToCrisis) {
            ImGui::Text("Estimated days to crisis: %d", *f.daysToCrisis);
        }
        if (f.interventionNeeded) {
            ImGui::TextColored(kRed, "Intervention recommended");
        }
        for (const auto& factor : f.primaryFactors) {
            ImGui::BulletText("%s", factor.c_str());
        }
    }

    if (results.weeklyReport) {
        const auto& r = *results.weeklyReport;
        ImGui::Separator();
        ImGui::Text("Weekly report (%d days, %d decisions, %s)", r.windowDays, r.totalDecisions,
                    PatternStatusToString(r.status).c_str());
        for (const auto& [category, rates] : r.categories) {
            ImGui::BulletText("%s: %.1f%% skipped, %.1f%% downgraded", CategoryToString(category).c_str(),
                              rates.skipRate, rates.downgradeRate);
        }
        static const char* kWeekdays[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
        if (ImGui::BeginTable("Weekdays", 8, ImGuiTableFlags_Borders)) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted("skip rate");
            for (int i = 0; i < 7; ++i) {
                ImGui::TableSetColumnIndex(i + 1);
                ImGui::Text("%s %.0f%%", kWeekdays[i], r.weekdays[static_cast<size_t>(i)].skipRate * 100.0);
            }
            ImGui::EndTable();
        }
        for (const auto& rec : r.recommendations) {
            ImGui::BulletText("%s", rec.c_str());
        }
        if (!results.weeklyInsight.empty()) {
            ImGui::TextWrapped("%s", results.weeklyInsight.c_str());
        }
    }

    if (results.statistics) {
        const auto& s = *results.statistics;
        ImGui::Separator();
        ImGui::Text("History: %d decisions", s.totalDecisions);
        for (const auto& [action, count] : s.actionDistribution) {
            ImGui::BulletText("%s: %d", action.c_str(), count);
        }
        if (!s.topConstraints.empty()) {
            ImGui::Text("Most frequent constraints:");
            for (const auto& [name, count] : s.topConstraints) {
                ImGui::BulletText("%s x%d", name.c_str(), count);
            }
        }
    }

    if (results.lastAdjustment && !results.lastAdjustment->adaptations.empty()) {
        ImGui::Separator();
        ImGui::Text("Last plan adjustments:");
        for (const auto& task : results.lastAdjustment->tasks) {
            ImGui::BulletText("%s", TaskLabel(task).c_str());
        }
        for (const auto& a : results.lastAdjustment->adaptations) {
            ImGui::TextColored(kYellow, "%s", a.patternDetected.c_str());
            ImGui::SameLine();
            ImGui::TextWrapped("%s", a.adaptationMade.c_str());
        }
    }
}

void DrawSimulationTab(DashboardState& app, const DashboardResults& results) {
    const auto& scenarios = application::WeekSimulationService::Scenarios();
    std::vector<const char*> names;
    for (const auto& s : scenarios) names.push_back(s.name.c_str());

    ImGui::Combo("Scenario", &app.simulation.scenarioIndex, names.data(), static_cast<int>(names.size()));
    const int index = std::clamp(app.simulation.scenarioIndex, 0, static_cast<int>(scenarios.size()) - 1);
    ImGui::TextColored(kMuted, "%s", scenarios[static_cast<size_t>(index)].description.c_str());
    ImGui::SliderInt("Days", &app.simulation.days, 1, 14);
    ImGui::SliderFloat("Time per day (h)", &app.simulation.timeAvailableHours, 0.25f, 6.0f, "%.2f");

    const bool busy = app.IsBusy(application::TaskType::Simulation);
    if (busy) ImGui::BeginDisabled();
    if (ImGui::Button("Simulate", ImVec2(220, 36))) {
        app.RunSimulation();
    }
    if (busy) ImGui::EndDisabled();

    if (results.simulationDays.empty()) return;

    std::vector<float> readiness;
    for (const auto& day : results.simulationDays) readiness.push_back(static_cast<float>(day.readiness));
    ImGui::PlotLines("Readiness", readiness.data(), static_cast<int>(readiness.size()), 0, nullptr, 0.0f, 100.0f, ImVec2(0, 80));

    if (ImGui::BeginTable("SimDays", 6, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Day");
        ImGui::TableSetupColumn("Sleep / Energy / Stress");
        ImGui::TableSetupColumn("Debt");
        ImGui::TableSetupColumn("Constraints");
        ImGui::TableSetupColumn("Fitness");
        ImGui::TableSetupColumn("Summary");
        ImGui::TableHeadersRow();
        for (const auto& day : results.simulationDays) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::Text("%d", day.day);
            ImGui::TableSetColumnIndex(1);
            ImGui::Text("%.1fh / %d / %s", day.state.sleepHours, day.state.energyLevel,
                        StressToString(day.state.stressLevel).c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::Text("%.1fh", day.state.sleepDebtHours);
            ImGui::TableSetColumnIndex(3);
            ImGui::Text("%zu", day.decision.activeConstraints.size());
            ImGui::TableSetColumnIndex(4);
            if (const auto* fitness = day.decision.decisionFor(HealthCategory::Fitness)) {
                ImGui::TextColored(ActionColor(fitness->action), "%s", ActionToString(fitness->action).c_str());
            }
            ImGui::TableSetColumnIndex(5);
            ImGui::TextWrapped("%s", day.decision.reasoningSummary.c_str());
        }
        ImGui::EndTable();
    }

    if (results.simulation) {
        const auto& f = results.simulation->forecast;
        ImGui::TextColored(SeverityColor(f.severity), "End of run burnout risk: %d (%s)", f.riskScore,
                           SeverityToString(f.severity).c_str());
    }
}

} // namespace

void DrawDashboard(DashboardState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("Main", NULL, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_MenuBar);

    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Export session", nullptr, false, app.services.logStore != nullptr)) {
                app.ExportSession();
            }
            if (ImGui::MenuItem("Clear history")) {
                app.ClearHistory();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Quit")) {
                app.requestExit = true;
            }
            ImGui::EndMenu();
        }
        if (app.services.taskManager) {
            for (const auto& task : app.services.taskManager->GetActiveTasks()) {
                ImGui::Separator();
                ImGui::Text("[%s] %s %d%%", application::TaskTypeToString(task->type), task->description.c_str(), static_cast<int>(task->progress.load() * 100.0f));
            }
        }
        ImGui::EndMenuBar();
    }

    // One copy per frame so background jobs never block on the renderer.
    DashboardResults results;
    {
        std::lock_guard<std::mutex> lock(app.resultsMutex);
        results = app.results;
    }

    if (ImGui::BeginTabBar("MainTabs")) {
        if (ImGui::BeginTabItem("Daily Decision")) {
            DrawDailyDecisionTab(app, results);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Council")) {
            DrawCouncilTab(app, results);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Forecast & Patterns")) {
            DrawForecastTab(app, results);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Week Simulation")) {
            DrawSimulationTab(app, results);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Log")) {
            ImGui::BeginChild("Log", ImVec2(0, 0), true);
            std::string logSnapshot = app.GetLogSnapshot();
            ImGui::TextUnformatted(logSnapshot.c_str());
            if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
                ImGui::SetScrollHereY(1.0f);
            ImGui::EndChild();
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }

    ImGui::End();
}

} // namespace equilibra::ui
