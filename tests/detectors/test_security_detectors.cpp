#include "detector_fixture.hpp"

#include "stylint/rules.hpp"

#include <string>

#include <gtest/gtest.h>

namespace stylint::detectors::test {

namespace {

constexpr const char* kBank = R"(
pragma solidity ^0.8.0;
contract Bank {
    mapping(address => uint256) balances;
    uint256 credits;
    bool locked;

    modifier nonReentrant() {
        require(!locked);
        locked = true;
        _;
        locked = false;
    }

    function withdraw(uint256 amount) external {
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok);
        balances[msg.sender] -= amount;
    }

    function safeWithdraw(uint256 amount) external nonReentrant {
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok);
        balances[msg.sender] -= amount;
    }

    function viaHelper(uint256 amount) external {
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok);
        _credit();
    }

    function _credit() internal {
        credits += 1;
    }

    function effectsFirst(uint256 amount) external {
        balances[msg.sender] -= amount;
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok);
    }
}
)";

constexpr const char* kRegistry = R"(
pragma solidity ^0.8.0;
contract Registry {
    address owner;
    uint256 fee;
    uint256 supply;
    mapping(address => uint256) balances;

    modifier onlyOwner() {
        require(msg.sender == owner);
        _;
    }

    function setFee(uint256 f) external { fee = f; }
    function setFeeGuarded(uint256 f) external onlyOwner { fee = f; }
    function setFeeInline(uint256 f) external {
        require(msg.sender == owner);
        fee = f;
    }
    function deposit() external payable { balances[msg.sender] += msg.value; }
    function credit(address to, uint256 amount) external { balances[to] += amount; }
    function mint(uint256 amount) external { supply += amount; }
    function configure(uint256 f) external { _store(f); }
    function _store(uint256 f) internal { fee = f; }
    function peek() external view returns (uint256) { return fee; }
}
)";

constexpr const char* kRouter = R"(
pragma solidity ^0.8.0;
interface IToken {
    function approve(address spender, uint256 amount) external returns (bool);
}
contract Router {
    address implementation;
    mapping(address => bool) allowed;

    function forward(bytes calldata data) external {
        (bool ok, ) = implementation.delegatecall(data);
        require(ok);
    }

    function approveFor(address token, address spender) external {
        require(IToken(token).approve(spender, 1));
    }

    function guardedCall(address target, bytes calldata data) external {
        require(allowed[target]);
        (bool ok, ) = target.call(data);
        require(ok);
    }

    function refund() external {
        (bool ok, ) = msg.sender.call("");
        require(ok);
    }
}
)";

constexpr const char* kRustProxy = R"(
sol_storage! {
    #[entrypoint]
    pub struct Proxy {
        address implementation;
    }
}

#[public]
impl Proxy {
    pub fn forward(&mut self, data: Vec<u8>) -> Result<Vec<u8>, Vec<u8>> {
        let target = self.implementation.get();
        unsafe { RawCall::new_delegate().call(target, &data) }
    }

    pub fn peek(&self, token: Address) -> Result<Vec<u8>, Vec<u8>> {
        static_call(Call::new(), token, &[])
    }
}
)";

}  // namespace

TEST(ReentrancyDetectorTest, WriteAfterCall)
{
    const auto findings = findings_of("reentrancy", solidity(kBank));
    ASSERT_EQ(findings.size(), 2U);

    EXPECT_EQ(findings[0].rule_id, rules::kReentrancy);
    EXPECT_EQ(findings[0].function, "withdraw");
    EXPECT_EQ(findings[0].severity, Severity::kCritical);
    EXPECT_EQ(findings[0].category, Category::kSecurity);
    EXPECT_EQ(findings[0].description,
              "value_transfer to `msg.sender` is followed by a write to storage slot `balances`");
    EXPECT_FALSE(findings[0].partial);
    EXPECT_FALSE(findings[0].remediation.empty());
    EXPECT_EQ(findings[0].location.file, "contracts/Test.sol");

    // Reached only through an internal call.
    EXPECT_EQ(findings[1].function, "viaHelper");
    EXPECT_TRUE(findings[1].partial);
    EXPECT_NE(findings[1].description.find("`_credit`"), std::string::npos);
}

TEST(ReentrancyDetectorTest, AccessControlledCallIsSkipped)
{
    const auto findings = findings_of("reentrancy", solidity(R"(
pragma solidity ^0.8.0;
contract Treasury {
    address owner;
    uint256 paid;
    function pay(address to, uint256 amount) external {
        require(msg.sender == owner);
        (bool ok, ) = to.call{value: amount}("");
        require(ok);
        paid += amount;
    }
}
)"));
    EXPECT_TRUE(findings.empty());
}

TEST(ReentrancyDetectorTest, ReentrancyGuardSuppressesFinding)
{
    const auto model = solidity(R"(
pragma solidity ^0.8.0;
contract Vault is ReentrancyGuard {
    mapping(address => uint256) balances;

    function guardedWithdraw(uint256 amount) external nonReentrant {
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok);
        balances[msg.sender] -= amount;
    }

    function openWithdraw(uint256 amount) external {
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok);
        balances[msg.sender] -= amount;
    }
}
)");
    const auto* guarded = model.find_function("guardedWithdraw");
    ASSERT_NE(guarded, nullptr);
    EXPECT_TRUE(guarded->has_modifier(ir::ModifierKind::kReentrancyGuard));

    const auto findings = findings_of("reentrancy", model);
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].function, "openWithdraw");
}

TEST(AccessControlDetectorTest, UnguardedWrites)
{
    const auto findings = findings_of("access-control", solidity(kRegistry));
    ASSERT_EQ(findings.size(), 4U);

    EXPECT_EQ(findings[0].function, "setFee");
    EXPECT_EQ(findings[0].severity, Severity::kHigh);
    EXPECT_EQ(findings[0].description, "writes privileged slot `fee` without an access-control check");

    EXPECT_EQ(findings[1].function, "credit");
    EXPECT_EQ(findings[1].description, "writes `balances[to]` keyed by a caller-supplied parameter");

    EXPECT_EQ(findings[2].function, "mint");
    EXPECT_FALSE(findings[2].partial);

    EXPECT_EQ(findings[3].function, "configure");
    EXPECT_TRUE(findings[3].partial);
    EXPECT_EQ(findings[3].description, "reaches a write to privileged slot `fee` through internal calls");
}

TEST(ArithmeticOverflowDetectorTest, LegacyCompilerArithmetic)
{
    const std::string source = R"(
pragma solidity ^0.7.6;
contract Legacy {
    uint256 total;
    function add(uint256 a) external { total = total + a; }
    function scaled() external view returns (uint256) {
        uint256 x = total * 2;
        return x;
    }
    function ratio(uint256 a, uint256 b) external pure returns (uint256) { return a / b; }
}
)";
    const auto findings = findings_of("arithmetic-overflow", solidity(source));
    ASSERT_EQ(findings.size(), 2U);
    EXPECT_EQ(findings[0].rule_id, rules::kUncheckedArithmetic);
    EXPECT_EQ(findings[0].function, "add");
    EXPECT_EQ(findings[0].description, "unchecked add result is used as a stored value");
    EXPECT_FALSE(findings[0].partial);
    EXPECT_EQ(findings[1].function, "scaled");
    EXPECT_EQ(findings[1].description, "unchecked mul on a value read from storage");
    EXPECT_TRUE(findings[1].partial);

    std::string checked = source;
    checked.replace(checked.find("^0.7.6"), 6, "^0.8.4");
    EXPECT_TRUE(findings_of("arithmetic-overflow", solidity(checked)).empty());
}

TEST(TrustBoundaryDetectorTest, UnvalidatedTargets)
{
    const auto model = solidity(kRouter);
    const auto findings = findings_of("trust-boundary", model);
    ASSERT_EQ(findings.size(), 2U);

    EXPECT_EQ(findings[0].rule_id, rules::kUnvalidatedDelegatecall);
    EXPECT_EQ(findings[0].severity, Severity::kCritical);
    EXPECT_EQ(findings[0].function, "forward");
    EXPECT_EQ(findings[0].description, "delegate_call to `implementation` (storage) is not validated against an allow-list");

    EXPECT_EQ(findings[1].rule_id, rules::kTrustBoundary);
    EXPECT_EQ(findings[1].function, "approveFor");
    EXPECT_FALSE(findings[1].partial);

    const auto trusted = findings_of("trust-boundary", model, DetectorOptions{.gas_cost_threshold = 100000,
                                                                              .complexity_threshold = 10,
                                                                              .trusted_targets = {"implementation"}});
    ASSERT_EQ(trusted.size(), 1U);
    EXPECT_EQ(trusted[0].function, "approveFor");
}

TEST(TrustBoundaryDetectorTest, StaticCallIsPartial)
{
    const auto findings = findings_of("trust-boundary", rust(kRustProxy));
    ASSERT_EQ(findings.size(), 2U);
    EXPECT_EQ(findings[0].rule_id, rules::kUnvalidatedDelegatecall);
    EXPECT_EQ(findings[0].function, "forward");
    EXPECT_EQ(findings[1].rule_id, rules::kTrustBoundary);
    EXPECT_EQ(findings[1].function, "peek");
    EXPECT_TRUE(findings[1].partial);
}

TEST(TxOriginDetectorTest, OriginComparison)
{
    const auto findings = findings_of("tx-origin", solidity(R"(
pragma solidity ^0.8.0;
contract Wallet {
    address owner;
    function sweep(address to) external {
        require(tx.origin == owner);
        payable(to).transfer(1);
    }
    function ownerOnly() external view returns (bool) {
        return msg.sender == owner;
    }
}
)"));
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].rule_id, rules::kTxOriginAuth);
    EXPECT_EQ(findings[0].function, "sweep");
    EXPECT_EQ(findings[0].description, "authorization compares tx.origin: `tx.origin == owner`");
}

TEST(TimestampDetectorTest, StateChangingFunctionsOnly)
{
    const auto findings = findings_of("timestamp-dependence", solidity(R"(
pragma solidity ^0.8.0;
contract Auction {
    uint256 deadline;
    uint256 highest;
    function bid(uint256 amount) external {
        require(block.timestamp < deadline);
        highest = amount;
    }
    function open() external view returns (bool) {
        return block.timestamp < deadline;
    }
}
)"));
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].function, "bid");
    EXPECT_EQ(findings[0].severity, Severity::kMedium);
    EXPECT_EQ(findings[0].description, "state-changing function reads the block timestamp");
}

TEST(UnsafeCodeDetectorTest, AssemblyAndUnsafeBlocks)
{
    const auto solidity_findings = findings_of("unsafe-code", solidity(R"(
pragma solidity ^0.8.0;
contract Raw {
    function poke() external {
        assembly { sstore(0, 1) }
    }
}
)"));
    ASSERT_EQ(solidity_findings.size(), 1U);
    EXPECT_EQ(solidity_findings[0].description, "inline assembly bypasses compiler safety checks");
    EXPECT_EQ(solidity_findings[0].location.line, 5);

    const auto rust_findings = findings_of("unsafe-code", rust(kRustProxy));
    ASSERT_EQ(rust_findings.size(), 1U);
    EXPECT_EQ(rust_findings[0].function, "forward");
    EXPECT_EQ(rust_findings[0].description, "unsafe block bypasses compiler safety checks");
}

TEST(SecurityDetectorsTest, CancelledBudgetStopsDetector)
{
    const Budget budget;
    budget.cancel();
    auto findings = run_detector("reentrancy", solidity(kBank), {}, budget);
    ASSERT_FALSE(findings);
    EXPECT_EQ(findings.error().code, "DetectorTimeout");
    EXPECT_EQ(findings.error().message, "reentrancy: time budget exhausted");
}

}  // namespace stylint::detectors::test
