#undef NDEBUG
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include "application/TemplateNarrativeService.hpp"
#include "domain/services/ConstraintEvaluator.hpp"
#include "domain/services/PlanAdjuster.hpp"
#include "domain/services/TradeOffEngine.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaNarrativeAdapter.hpp"

using namespace equilibra::domain;
using equilibra::application::TemplateNarrativeService;
using equilibra::domain::services::ConstraintEvaluator;
using equilibra::domain::services::PlanAdjuster;
using equilibra::domain::services::TradeOffEngine;
using equilibra::infrastructure::OllamaClient;
using equilibra::infrastructure::OllamaNarrativeAdapter;

int main() {
    std::cout << "[Test] Starting Narrative Fallback Test..." << std::endl;

    StateSnapshot s;
    s.sleepHours = 4.5;
    s.energyLevel = 3;
    s.stressLevel = StressLevel::High;
    s.timeAvailableHours = 1.0;
    const auto decision = TradeOffEngine().decide(s, ConstraintEvaluator::evaluate(s), SamplePlannedTasks());

    auto templates = std::make_shared<TemplateNarrativeService>();
    const auto expected = templates->explainDecision(decision);
    assert(!expected.explanation.empty());
    assert(!expected.generatedByModel);
    assert(expected.contextAssessment.rfind("Risk Level: High", 0) == 0);

    std::cout << "[Test] Unreachable model server..." << std::endl;
    // Nothing listens on port 1.
    OllamaNarrativeAdapter adapter(templates, std::make_unique<OllamaClient>("127.0.0.1", 1, 1, 1), "test-model");
    assert(adapter.name() == "ollama:test-model");

    const auto start = std::chrono::steady_clock::now();
    const auto narrative = adapter.explainDecision(decision);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    assert(!narrative.generatedByModel);
    assert(narrative.explanation == expected.explanation);
    assert(narrative.temporalAnalysis == expected.temporalAnalysis);
    assert(adapter.fallbackCount() == 1);

    const auto report = PlanAdjuster().weeklyReport({decision}, 0);
    assert(adapter.weeklyInsight(report) == templates->weeklyInsight(report));
    assert(adapter.fallbackCount() == 2);

    // Bytes that are not UTF-8 in a task name still produce a narrative.
    {
        auto tasks = SamplePlannedTasks();
        tasks[0].name = "HIIT \xff\xfe";
        const auto odd = TradeOffEngine().decide(s, ConstraintEvaluator::evaluate(s), tasks);
        const auto oddNarrative = adapter.explainDecision(odd);
        assert(!oddNarrative.explanation.empty());
        assert(adapter.fallbackCount() == 3);
    }

    std::cout << "[Test] Parsing model output..." << std::endl;
    assert(!OllamaNarrativeAdapter::ParseNarrative("not json at all"));
    assert(!OllamaNarrativeAdapter::ParseNarrative("[1, 2, 3]"));
    assert(!OllamaNarrativeAdapter::ParseNarrative(R"({"explanation": ""})"));
    assert(!OllamaNarrativeAdapter::ParseNarrative(R"({"explanation": 42})"));

    auto parsed = OllamaNarrativeAdapter::ParseNarrative(
        R"({"explanation": "Rest wins today.", "temporal_analysis": "Back to training Friday."})");
    assert(parsed);
    assert(parsed->generatedByModel);
    assert(parsed->explanation == "Rest wins today.");
    assert(parsed->temporalAnalysis == "Back to training Friday.");
    assert(parsed->contextAssessment.empty());

    std::cout << "[PASS] Narrative Fallback Test Passed" << std::endl;
    return 0;
}
