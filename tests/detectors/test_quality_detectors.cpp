#include "detector_fixture.hpp"

#include "stylint/rules.hpp"

#include <string>

#include <gtest/gtest.h>

namespace stylint::detectors::test {

namespace {

constexpr const char* kVault = R"(
pragma solidity ^0.8.0;
interface IToken {
    function transfer(address to, uint256 amount) external returns (bool);
}
contract Vault {
    uint256 total;
    uint256 Bad_Slot;
    uint256 stale;
    uint256 MAX_SUPPLY;
    event Deposited(uint256 amount);

    /// @notice Deposit funds.
    function deposit(uint256 amount) external {
        require(total + amount <= MAX_SUPPLY);
        total += amount;
        emit Deposited(amount);
    }

    function set_total(uint256 v) external {
        total = v;
    }

    function pay(IToken token, address to) external {
        token.transfer(to, 1);
    }

    function bump(uint256 a, uint256 b) external pure returns (uint256) {
        unchecked { return a * b + 1; }
    }

    /// Picks a bucket.
    function pick(uint256 x) external pure returns (uint256) {
        if (x == 1) { return 1; }
        if (x == 2) { return 2; }
        return 3;
    }

    function helper() internal view returns (uint256) {
        return total;
    }
}
)";

}  // namespace

TEST(DocumentationDetectorTest, UndocumentedEntryPoints)
{
    const auto findings = findings_of("documentation", solidity(kVault));
    ASSERT_EQ(findings.size(), 3U);
    EXPECT_EQ(findings[0].rule_id, rules::kMissingDocumentation);
    EXPECT_EQ(findings[0].category, Category::kQuality);
    EXPECT_EQ(findings[0].description, "external function `set_total` has no doc comment");
    EXPECT_EQ(findings[1].function, "pay");
    EXPECT_EQ(findings[2].function, "bump");
}

TEST(DocumentationDetectorTest, BytecodeIsExempt)
{
    ir::ContractModel model;
    model.name = "Module";
    model.dialect = ir::Dialect::kWasm;
    model.file = "build/module.wasm";
    ir::Function entry;
    entry.name = "UserEntrypoint";
    entry.visibility = ir::Visibility::kPublic;
    model.functions.push_back(entry);

    EXPECT_TRUE(findings_of("documentation", model).empty());
    EXPECT_TRUE(findings_of("naming-convention", model).empty());
}

TEST(ComplexityDetectorTest, BranchesAboveThreshold)
{
    const auto model = solidity(kVault);
    EXPECT_TRUE(findings_of("complexity", model).empty());

    const auto findings = findings_of("complexity", model, DetectorOptions{.gas_cost_threshold = 100000,
                                                                          .complexity_threshold = 2,
                                                                          .trusted_targets = {}});
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].rule_id, rules::kHighComplexity);
    EXPECT_EQ(findings[0].function, "pick");
    EXPECT_EQ(findings[0].description, "cyclomatic complexity 3 exceeds 2");
}

TEST(ErrorHandlingDetectorTest, IgnoredResultsAndUncheckedArithmetic)
{
    const auto findings = findings_of("error-handling", solidity(kVault));
    ASSERT_EQ(findings.size(), 2U);

    EXPECT_EQ(findings[0].rule_id, rules::kUncheckedCallResult);
    EXPECT_EQ(findings[0].function, "pay");
    EXPECT_EQ(findings[0].description, "result of call to `token` is ignored");

    EXPECT_EQ(findings[1].rule_id, rules::kQualityUncheckedArithmetic);
    EXPECT_EQ(findings[1].function, "bump");
    EXPECT_EQ(findings[1].description, "2 unchecked arithmetic operation(s)");
    EXPECT_EQ(findings[1].location.line, 29);
}

TEST(NamingConventionDetectorTest, SolidityMixedCase)
{
    const auto findings = findings_of("naming-convention", solidity(kVault));
    ASSERT_EQ(findings.size(), 2U);
    EXPECT_EQ(findings[0].description, "function `set_total` is not mixedCase");
    EXPECT_EQ(findings[0].function, "set_total");
    // Constants in UPPER_CASE are accepted, mixed styles are not.
    EXPECT_EQ(findings[1].description, "storage slot `Bad_Slot` is not mixedCase");
    EXPECT_TRUE(findings[1].function.empty());
}

TEST(NamingConventionDetectorTest, RustSnakeCaseAndContractName)
{
    const auto findings = findings_of("naming-convention", rust(R"(
sol_storage! {
    #[entrypoint]
    pub struct token_store {
        uint256 total_supply;
    }
}

#[public]
impl token_store {
    pub fn total_supply(&self) -> U256 {
        self.total_supply.get()
    }

    pub fn mintTo(&mut self, amount: U256) {
        self.total_supply.set(amount);
    }
}
)"));
    ASSERT_EQ(findings.size(), 2U);
    EXPECT_EQ(findings[0].description, "contract `token_store` is not PascalCase");
    EXPECT_EQ(findings[0].location.line, 1);
    EXPECT_EQ(findings[0].location.col, 1);
    EXPECT_EQ(findings[1].description, "function `mintTo` is not snake_case");
}

TEST(MissingEventDetectorTest, StateChangeWithoutEvent)
{
    const auto findings = findings_of("missing-event", solidity(kVault));
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].rule_id, rules::kMissingEvent);
    EXPECT_EQ(findings[0].description, "`set_total` writes storage but emits no event");
}

TEST(MissingEventDetectorTest, EventFromInternalCallCounts)
{
    const auto findings = findings_of("missing-event", solidity(R"(
pragma solidity ^0.8.0;
contract Counter {
    uint256 count;
    event Bumped(uint256 count);
    function bump() external {
        count += 1;
        _announce();
    }
    function _announce() internal { emit Bumped(count); }
}
)"));
    EXPECT_TRUE(findings.empty());
}

TEST(UnusedStorageDetectorTest, SlotsNeverTouched)
{
    const auto findings = findings_of("unused-storage", solidity(kVault));
    ASSERT_EQ(findings.size(), 2U);
    EXPECT_EQ(findings[0].description, "storage slot `Bad_Slot` is never read or written");
    EXPECT_EQ(findings[1].description, "storage slot `stale` is never read or written");
    EXPECT_EQ(findings[1].location.line, 9);
}

}  // namespace stylint::detectors::test
