#include "stylint/common.hpp"
#include "stylint/frontend.hpp"

#include <string>

#include <gtest/gtest.h>

namespace stylint::frontend::test {

namespace {

constexpr const char* kCounter = R"(
pragma solidity ^0.8.0;
contract Counter {
    uint256 count;
    function bump() external { count += 1; }
}
)";

}  // namespace

TEST(BuildModelTest, DetectDialect)
{
    EXPECT_EQ(detect_dialect("use stylus_sdk::prelude::*;\n"), ir::Dialect::kStylusRust);
    EXPECT_EQ(detect_dialect("sol_storage! { pub struct A { uint256 x; } }"), ir::Dialect::kStylusRust);
    EXPECT_EQ(detect_dialect(kCounter), ir::Dialect::kSolidity);
    EXPECT_EQ(detect_dialect("  abstract contract Base {}\n"), ir::Dialect::kSolidity);
    EXPECT_EQ(detect_dialect("library Math {}"), ir::Dialect::kSolidity);
    // "contract" inside a line does not count as a declaration.
    EXPECT_EQ(detect_dialect("// this contract is written in Rust\nfn main() {}"), ir::Dialect::kStylusRust);
    EXPECT_EQ(detect_dialect(std::string_view("\0asm\x01\0\0\0", 8)), ir::Dialect::kWasm);
}

TEST(BuildModelTest, AutoDialectDispatches)
{
    auto model = build_model(kCounter, ir::Dialect::kAuto, {.file_path = "Counter.sol"});
    ASSERT_TRUE(model) << model.error().message;
    EXPECT_EQ(model->dialect, ir::Dialect::kSolidity);
    EXPECT_EQ(model->name, "Counter");
}

TEST(BuildModelTest, EmptyInputFails)
{
    auto model = build_model("", ir::Dialect::kAuto, {.file_path = "src/lib.rs"});
    ASSERT_FALSE(model);
    EXPECT_EQ(model.error().code, "ParseError");
    ASSERT_TRUE(model.error().location);
    EXPECT_EQ(model.error().location->file, "src/lib.rs");
}

TEST(BuildModelTest, MissingPathUsesPlaceholder)
{
    auto model = build_model(kCounter, ir::Dialect::kSolidity);
    ASSERT_TRUE(model) << model.error().message;
    EXPECT_EQ(model->file, "<input>");
    EXPECT_EQ(model->functions[0].location.file, "<input>");
}

TEST(BuildModelTest, PathIsNormalizedAgainstRepoRoot)
{
    auto model = build_model(kCounter,
                             ir::Dialect::kSolidity,
                             {.file_path = "/work/repo/./contracts/../contracts/Counter.sol",
                              .repo_root = "/work/repo",
                              .contract_name = {}});
    ASSERT_TRUE(model) << model.error().message;
    EXPECT_EQ(model->file, "contracts/Counter.sol");
    EXPECT_EQ(model->slots[0].location.file, "contracts/Counter.sol");
}

TEST(BuildModelTest, InputDigestCoversSourceBytes)
{
    auto model = build_model(kCounter, ir::Dialect::kSolidity, {.file_path = "Counter.sol"});
    ASSERT_TRUE(model);
    EXPECT_EQ(model->input_digest, common::sha256_prefixed(kCounter));

    const std::string edited = std::string(kCounter) + "\n";
    auto other = build_model(edited, ir::Dialect::kSolidity, {.file_path = "Counter.sol"});
    ASSERT_TRUE(other);
    EXPECT_NE(other->input_digest, model->input_digest);
}

TEST(BuildModelTest, NameFallsBackToFileStem)
{
    auto model = build_model("pragma solidity ^0.8.0;\ninterface IToken { function f() external; }\n",
                             ir::Dialect::kSolidity,
                             {.file_path = "contracts/Token.sol"});
    ASSERT_TRUE(model) << model.error().message;
    EXPECT_EQ(model->name, "Token");
    EXPECT_TRUE(model->functions.empty());
}

TEST(BuildModelTest, NothingRecoveredFails)
{
    auto model = build_model("pragma solidity ^0.8.0;\ncontract Broken {\n    function bad(uint256 x {\n    }\n}\n",
                             ir::Dialect::kSolidity,
                             {.file_path = "Broken.sol"});
    ASSERT_FALSE(model);
    EXPECT_EQ(model.error().code, "ParseError");
    EXPECT_EQ(model.error().message,
              "no function could be recovered (1 skipped region(s)); first: "
              "unterminated parameter list in function 'bad'");
    ASSERT_TRUE(model.error().location);
    EXPECT_EQ(model.error().location->line, 3);
}

TEST(BuildModelTest, LocationsIndexFunctions)
{
    auto model = build_model(kCounter, ir::Dialect::kSolidity, {.file_path = "Counter.sol"});
    ASSERT_TRUE(model);
    ASSERT_EQ(model->locations.size(), 1U);
    EXPECT_EQ(model->locations.at("bump").line, 5);
}

TEST(BuildModelTest, OverloadsKeepTheirOwnLocationsAndCallSites)
{
    auto model = build_model(R"(pragma solidity ^0.8.0;
contract Relay {
    function send(address to) external {
        payable(to).transfer(1);
    }
    function send(address to, uint256 amount) external {
        payable(to).transfer(amount);
    }
}
)",
                             ir::Dialect::kSolidity,
                             {.file_path = "Relay.sol"});
    ASSERT_TRUE(model) << model.error().message;
    ASSERT_EQ(model->functions.size(), 2U);
    ASSERT_EQ(model->locations.size(), 2U);
    EXPECT_EQ(model->locations.at("send@3").line, 3);
    EXPECT_EQ(model->locations.at("send@6").line, 6);
    ASSERT_EQ(model->call_sites.size(), 2U);
    EXPECT_EQ(model->call_sites[0].function_index, 0U);
    EXPECT_EQ(model->call_sites[1].function_index, 1U);
    EXPECT_EQ(model->call_sites[1].location.line, 7);
}

}  // namespace stylint::frontend::test
