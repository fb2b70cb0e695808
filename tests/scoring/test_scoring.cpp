#include "stylint/rules.hpp"
#include "stylint/scoring.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace stylint::scoring::test {

namespace {

Finding raw(std::string_view rule_id, std::string function = "f", bool partial = false)
{
    Finding finding;
    finding.rule_id = std::string(rule_id);
    finding.function = std::move(function);
    finding.location = SourceLocation{.file = "src/lib.rs", .line = 10, .col = 5};
    finding.description = "raw";
    finding.partial = partial;
    return finding;
}

Finding classified(Category category, Severity severity)
{
    Finding finding;
    finding.category = category;
    finding.severity = severity;
    return finding;
}

ir::Operation op(ir::OperationKind kind)
{
    return ir::Operation{.location = {}, .loop_depth = 0, .kind = std::move(kind)};
}

ir::Function entry(std::string name, std::string doc = {})
{
    ir::Function function;
    function.name = std::move(name);
    function.visibility = ir::Visibility::kExternal;
    function.doc = std::move(doc);
    return function;
}

}  // namespace

TEST(RiskTest, Names)
{
    EXPECT_EQ(to_string(Risk::kMinimal), "minimal");
    EXPECT_EQ(to_string(Risk::kModerate), "moderate");
    EXPECT_EQ(parse_risk("critical"), Risk::kCritical);
    EXPECT_EQ(parse_risk("severe"), std::nullopt);
}

TEST(ClassifyTest, SeverityComesFromCatalog)
{
    auto findings = classify({raw(rules::kReentrancy), raw(rules::kReentrancy, "g", true), raw(rules::kNamingConvention)});
    ASSERT_TRUE(findings) << findings.error().message;
    ASSERT_EQ(findings->size(), 3U);

    EXPECT_EQ((*findings)[0].category, Category::kSecurity);
    EXPECT_EQ((*findings)[0].severity, Severity::kCritical);
    EXPECT_FALSE((*findings)[0].remediation.empty());
    EXPECT_TRUE((*findings)[0].stable_id.starts_with("sha256:"));

    // Partial matches drop one level.
    EXPECT_EQ((*findings)[1].severity, Severity::kHigh);

    EXPECT_EQ((*findings)[2].category, Category::kQuality);
    EXPECT_EQ((*findings)[2].severity, Severity::kInfo);
}

TEST(ClassifyTest, PartialInfoStaysInfo)
{
    auto findings = classify({raw(rules::kMissingDocumentation, "f", true)});
    ASSERT_TRUE(findings);
    EXPECT_EQ((*findings)[0].severity, Severity::kInfo);
}

TEST(ClassifyTest, DetectorRemediationIsKept)
{
    Finding finding = raw(rules::kAccessControl);
    finding.remediation = "Restrict setFee to the owner.";
    auto findings = classify({finding});
    ASSERT_TRUE(findings);
    EXPECT_EQ((*findings)[0].remediation, "Restrict setFee to the owner.");
}

TEST(ClassifyTest, StableIdIgnoresDescription)
{
    Finding first = raw(rules::kUnusedStorage, "");
    Finding second = first;
    second.description = "reworded";
    Finding moved = first;
    moved.location.line = 11;

    auto findings = classify({first, second, moved});
    ASSERT_TRUE(findings);
    EXPECT_EQ((*findings)[0].stable_id, (*findings)[1].stable_id);
    EXPECT_NE((*findings)[0].stable_id, (*findings)[2].stable_id);
}

TEST(ClassifyTest, InvalidRuleIds)
{
    auto empty = classify({raw("")});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, "InvalidFinding");

    auto unknown = classify({raw(rules::kReentrancy), raw("security.made-up")});
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, "InvalidFinding");
    EXPECT_EQ(unknown.error().message, "unknown rule id 'security.made-up'");
    ASSERT_TRUE(unknown.error().location);
    EXPECT_EQ(unknown.error().location->line, 10);
}

TEST(CategoryScoreTest, PenaltiesPerCategory)
{
    EXPECT_EQ(penalty(Severity::kCritical), 40);
    EXPECT_EQ(penalty(Severity::kInfo), 1);

    const std::vector<Finding> findings = {
        classified(Category::kSecurity, Severity::kHigh),
        classified(Category::kSecurity, Severity::kMedium),
        classified(Category::kPerformance, Severity::kLow),
        classified(Category::kQuality, Severity::kCritical),
    };
    EXPECT_EQ(category_score(findings, Category::kSecurity), 70);
    EXPECT_EQ(category_score(findings, Category::kPerformance), 96);
    EXPECT_EQ(category_score({}, Category::kSecurity), 100);

    const std::vector<Finding> many(3, classified(Category::kSecurity, Severity::kCritical));
    EXPECT_EQ(category_score(many, Category::kSecurity), 0);
}

TEST(FunctionQualityTest, DocumentationComplexityAndHandling)
{
    ir::Function function = entry("withdraw", "Withdraw funds.");
    function.operations = {
        op(ir::Branch{.condition = "ok", .guard = ir::GuardKind::kNone, .reverts = true, .subjects = {}}),
        op(ir::ExternalCall{.kind = ir::CallKind::kCall, .result_checked = true}),
        op(ir::ExternalCall{.kind = ir::CallKind::kCall, .result_checked = false}),
    };
    const auto quality = score_function(function, ir::Dialect::kSolidity, 10);
    EXPECT_TRUE(quality.documented);
    EXPECT_EQ(quality.complexity, 2);
    EXPECT_EQ(quality.fallible, 2);
    EXPECT_EQ(quality.handled, 1);
    EXPECT_EQ(quality.score, 40 + 30 + 15);
}

TEST(FunctionQualityTest, WrappingArithmeticIsFallible)
{
    const auto arithmetic = [](ir::ArithmeticOp op, bool checked) {
        return ir::Arithmetic{.op = op, .checked = checked, .sink = ir::ArithmeticSink::kStorage, .operand_reads_storage = false};
    };
    ir::Function function = entry("accrue", "Accrues interest.");
    function.operations = {
        op(arithmetic(ir::ArithmeticOp::kAdd, true)),
        op(arithmetic(ir::ArithmeticOp::kMul, false)),
        op(arithmetic(ir::ArithmeticOp::kSub, false)),
        op(arithmetic(ir::ArithmeticOp::kDiv, false)),
        op(arithmetic(ir::ArithmeticOp::kMod, false)),
        op(ir::ExternalCall{.kind = ir::CallKind::kCall, .result_checked = true}),
    };
    const auto quality = score_function(function, ir::Dialect::kStylusRust, 10);
    EXPECT_EQ(quality.fallible, 4);
    EXPECT_EQ(quality.handled, 2);
    EXPECT_EQ(quality.score, 40 + 30 + 15);

    // Checked arithmetic everywhere earns full handling marks.
    function.operations = {op(arithmetic(ir::ArithmeticOp::kAdd, true)), op(arithmetic(ir::ArithmeticOp::kPow, true))};
    EXPECT_EQ(score_function(function, ir::Dialect::kSolidity, 10).score, 100);
}

TEST(FunctionQualityTest, ComplexityAboveThresholdScalesDown)
{
    ir::Function function = entry("route", "   ");
    for (int i = 0; i < 11; ++i) {
        function.operations.push_back(op(ir::Branch{}));
    }
    const auto quality = score_function(function, ir::Dialect::kStylusRust, 10);
    EXPECT_FALSE(quality.documented);
    EXPECT_EQ(quality.complexity, 12);
    // 0 for docs, 30 * 10 / 12 for complexity, full marks for handling.
    EXPECT_EQ(quality.score, 25 + 30);
}

TEST(FunctionQualityTest, InternalAndBytecodeFunctionsAreDocExempt)
{
    ir::Function helper = entry("helper");
    helper.visibility = ir::Visibility::kInternal;
    EXPECT_EQ(score_function(helper, ir::Dialect::kSolidity, 10).score, 100);

    EXPECT_EQ(score_function(entry("user_entrypoint"), ir::Dialect::kWasm, 10).score, 100);
    EXPECT_EQ(score_function(entry("user_entrypoint"), ir::Dialect::kSolidity, 10).score, 60);
}

TEST(QualitySummaryTest, AverageAndCoverage)
{
    ir::ContractModel model;
    model.dialect = ir::Dialect::kSolidity;
    model.functions = {entry("a", "Documented."), entry("b")};
    ir::Function helper = entry("c");
    helper.visibility = ir::Visibility::kPrivate;
    model.functions.push_back(helper);

    const auto summary = score_quality(model, 10);
    ASSERT_EQ(summary.functions.size(), 3U);
    EXPECT_EQ(summary.score, (100 + 60 + 100) / 3);
    EXPECT_EQ(summary.documentation_coverage, 50);

    const auto empty = score_quality(ir::ContractModel{}, 10);
    EXPECT_EQ(empty.score, 0);
    EXPECT_TRUE(empty.functions.empty());
}

TEST(OverallRiskTest, WorstSeverityDecides)
{
    EXPECT_EQ(overall_risk({}, 3), Risk::kMinimal);
    EXPECT_EQ(overall_risk({classified(Category::kQuality, Severity::kInfo)}, 3), Risk::kMinimal);
    EXPECT_EQ(overall_risk({classified(Category::kQuality, Severity::kLow)}, 3), Risk::kLow);
    EXPECT_EQ(overall_risk({classified(Category::kSecurity, Severity::kHigh)}, 3), Risk::kHigh);
    EXPECT_EQ(overall_risk({classified(Category::kSecurity, Severity::kHigh)}, 0), Risk::kMinimal);
}

TEST(OverallRiskTest, DenseFindingsEscalateOnce)
{
    const std::vector<Finding> mediums(2, classified(Category::kPerformance, Severity::kMedium));
    EXPECT_EQ(overall_risk(mediums, 2), Risk::kModerate);
    EXPECT_EQ(overall_risk(mediums, 1), Risk::kHigh);

    const std::vector<Finding> lows(10, classified(Category::kQuality, Severity::kLow));
    EXPECT_EQ(overall_risk(lows, 1), Risk::kLow);

    const std::vector<Finding> criticals(5, classified(Category::kSecurity, Severity::kCritical));
    EXPECT_EQ(overall_risk(criticals, 1), Risk::kCritical);
}

TEST(ScoreTest, ModelWithoutFunctionsScoresZero)
{
    const auto summary = score(ir::ContractModel{}, {classified(Category::kSecurity, Severity::kCritical)}, 10);
    EXPECT_EQ(summary.scores.security, 0);
    EXPECT_EQ(summary.scores.performance, 0);
    EXPECT_EQ(summary.scores.quality, 0);
    EXPECT_EQ(summary.risk, Risk::kMinimal);
}

TEST(ScoreTest, CombinesCategoriesAndQuality)
{
    ir::ContractModel model;
    model.dialect = ir::Dialect::kSolidity;
    model.functions = {entry("a", "Documented.")};
    const auto summary = score(model,
                               {classified(Category::kSecurity, Severity::kMedium),
                                classified(Category::kPerformance, Severity::kLow)},
                               10);
    EXPECT_EQ(summary.scores.security, 90);
    EXPECT_EQ(summary.scores.performance, 96);
    EXPECT_EQ(summary.scores.quality, 100);
    EXPECT_EQ(summary.risk, Risk::kModerate);

    const nlohmann::json j = summary.scores;
    EXPECT_EQ(j.at("security"), 90);
    EXPECT_EQ(j.at("quality"), 100);
    const nlohmann::json quality = summary.quality;
    EXPECT_EQ(quality.at("documentation_coverage"), 100);
    EXPECT_EQ(quality.at("functions")[0].at("function"), "a");
}

}  // namespace stylint::scoring::test
