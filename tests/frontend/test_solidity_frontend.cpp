#include "stylint/frontend.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

namespace stylint::frontend::test {

namespace {

ir::ContractModel build(std::string_view source, std::string contract_name = {})
{
    auto model = build_model(source,
                             ir::Dialect::kSolidity,
                             {.file_path = "contracts/Vault.sol", .repo_root = {}, .contract_name = contract_name});
    EXPECT_TRUE(model) << model.error().message;
    return model ? *model : ir::ContractModel{};
}

template <typename T>
std::vector<T> ops_of(const ir::Function& function)
{
    std::vector<T> found;
    for (const auto& op : function.operations) {
        if (const auto* value = std::get_if<T>(&op.kind)) {
            found.push_back(*value);
        }
    }
    return found;
}

template <typename T>
std::ptrdiff_t index_of(const ir::Function& function)
{
    auto it = std::ranges::find_if(function.operations,
                                   [](const ir::Operation& op) { return std::holds_alternative<T>(op.kind); });
    return it == function.operations.end() ? -1 : std::distance(function.operations.begin(), it);
}

constexpr const char* kVault = R"(
// SPDX-License-Identifier: MIT
pragma solidity ^0.8.19;

interface IOracle {
    function price() external view returns (uint256);
}

contract Ownable {
    address public owner;

    modifier onlyOwner() {
        require(msg.sender == owner, "not owner");
        _;
    }
}

contract Vault is Ownable {
    mapping(address => uint256) public balances;
    uint256[] public history;
    uint256 public constant FEE = 3;
    IOracle public oracle;

    event Withdrawn(address indexed user, uint256 amount);

    /// @notice Withdraw the caller's balance.
    function withdraw(uint256 amount) external {
        require(balances[msg.sender] >= amount, "insufficient");
        (bool ok, ) = msg.sender.call{value: amount}("");
        require(ok, "failed");
        balances[msg.sender] -= amount;
        emit Withdrawn(msg.sender, amount);
    }

    function setOwner(address next) external onlyOwner {
        owner = next;
    }

    function quote() public view returns (uint256) {
        return oracle.price() * 2;
    }

    function total() internal pure returns (uint256) {
        return 1;
    }
}
)";

}  // namespace

TEST(SolidityFrontendTest, SelectsLastContractAndInheritsState)
{
    const auto model = build(kVault);
    EXPECT_EQ(model.name, "Vault");
    EXPECT_EQ(model.dialect, ir::Dialect::kSolidity);

    ASSERT_EQ(model.slots.size(), 4U);
    EXPECT_EQ(model.slots[0].name, "owner");
    EXPECT_EQ(model.slots[1].name, "balances");
    EXPECT_EQ(model.slots[1].kind, ir::SlotKind::kMapping);
    EXPECT_EQ(model.slots[2].name, "history");
    EXPECT_EQ(model.slots[2].kind, ir::SlotKind::kArray);
    EXPECT_EQ(model.slots[3].name, "oracle");
    EXPECT_EQ(model.slots[3].kind, ir::SlotKind::kValue);
    // Constants occupy no storage.
    EXPECT_EQ(model.find_slot("FEE"), nullptr);
}

TEST(SolidityFrontendTest, SlotAccessSummary)
{
    const auto model = build(kVault);
    EXPECT_EQ(model.find_slot("owner")->access, ir::AccessPattern::kWriteOnly);
    EXPECT_EQ(model.find_slot("balances")->access, ir::AccessPattern::kReadWrite);
    EXPECT_EQ(model.find_slot("history")->access, ir::AccessPattern::kUnused);
    EXPECT_EQ(model.find_slot("oracle")->access, ir::AccessPattern::kReadOnly);
    EXPECT_EQ(model.find_slot("oracle")->readers, (std::vector<std::string>{"quote"}));
}

TEST(SolidityFrontendTest, FunctionsDocsAndVisibility)
{
    const auto model = build(kVault);
    ASSERT_EQ(model.functions.size(), 4U);
    EXPECT_EQ(model.functions[0].name, "withdraw");
    EXPECT_EQ(model.functions[0].doc, "@notice Withdraw the caller's balance.");
    EXPECT_EQ(model.functions[0].visibility, ir::Visibility::kExternal);
    EXPECT_EQ(model.functions[0].params, (std::vector<std::string>{"amount"}));
    EXPECT_TRUE(model.functions[1].doc.empty());

    const auto* quote = model.find_function("quote");
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(quote->visibility, ir::Visibility::kPublic);
    EXPECT_EQ(quote->mutability, ir::Mutability::kView);

    const auto* total = model.find_function("total");
    ASSERT_NE(total, nullptr);
    EXPECT_EQ(total->visibility, ir::Visibility::kInternal);
    EXPECT_EQ(total->mutability, ir::Mutability::kPure);
    EXPECT_TRUE(total->operations.empty());
}

TEST(SolidityFrontendTest, InheritedModifierIsClassifiedFromItsBody)
{
    const auto model = build(kVault);
    const auto* set_owner = model.find_function("setOwner");
    ASSERT_NE(set_owner, nullptr);
    ASSERT_EQ(set_owner->modifiers.size(), 1U);
    EXPECT_EQ(set_owner->modifiers[0].name, "onlyOwner");
    EXPECT_TRUE(set_owner->has_modifier(ir::ModifierKind::kAccessControl));

    ASSERT_EQ(set_owner->operations.size(), 1U);
    const auto* write = std::get_if<ir::StorageWrite>(&set_owner->operations[0].kind);
    ASSERT_NE(write, nullptr);
    EXPECT_EQ(write->slot, "owner");
}

TEST(SolidityFrontendTest, WithdrawCallsBeforeWriting)
{
    const auto model = build(kVault);
    const auto& withdraw = model.functions[0];

    const auto calls = ops_of<ir::ExternalCall>(withdraw);
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls[0].kind, ir::CallKind::kValueTransfer);
    EXPECT_EQ(calls[0].target, "msg.sender");
    EXPECT_EQ(calls[0].target_source, ir::ValueSource::kSender);
    EXPECT_EQ(calls[0].method, "call");
    // The bool flag is inspected by require(ok).
    EXPECT_TRUE(calls[0].result_checked);

    const auto call_at = index_of<ir::ExternalCall>(withdraw);
    const auto write_at = index_of<ir::StorageWrite>(withdraw);
    ASSERT_GE(call_at, 0);
    ASSERT_GE(write_at, 0);
    EXPECT_LT(call_at, write_at);
    // The guard read happens before the call.
    EXPECT_LT(index_of<ir::StorageRead>(withdraw), call_at);

    const auto branches = ops_of<ir::Branch>(withdraw);
    ASSERT_EQ(branches.size(), 2U);
    EXPECT_EQ(branches[0].guard, ir::GuardKind::kInputValidation);
    EXPECT_TRUE(branches[0].reverts);

    const auto events = ops_of<ir::EventEmission>(withdraw);
    ASSERT_EQ(events.size(), 1U);
    EXPECT_EQ(events[0].event, "Withdrawn");

    const auto arithmetic = ops_of<ir::Arithmetic>(withdraw);
    ASSERT_EQ(arithmetic.size(), 1U);
    EXPECT_EQ(arithmetic[0].op, ir::ArithmeticOp::kSub);
    EXPECT_TRUE(arithmetic[0].checked);
    EXPECT_EQ(arithmetic[0].sink, ir::ArithmeticSink::kStorage);
}

TEST(SolidityFrontendTest, InterfaceStateVariableCall)
{
    const auto model = build(kVault);
    const auto* quote = model.find_function("quote");
    ASSERT_NE(quote, nullptr);
    const auto calls = ops_of<ir::ExternalCall>(*quote);
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls[0].kind, ir::CallKind::kCall);
    EXPECT_EQ(calls[0].target, "oracle");
    EXPECT_EQ(calls[0].target_source, ir::ValueSource::kStorage);
    EXPECT_EQ(calls[0].method, "price");
    EXPECT_TRUE(calls[0].result_checked);

    ASSERT_EQ(model.call_sites.size(), 2U);
    EXPECT_EQ(model.call_sites[0].function, "withdraw");
    EXPECT_EQ(model.call_sites[1].function, "quote");
}

TEST(SolidityFrontendTest, NamedContractSelection)
{
    const auto ownable = build(kVault, "Ownable");
    EXPECT_EQ(ownable.name, "Ownable");
    EXPECT_TRUE(ownable.functions.empty());
    ASSERT_EQ(ownable.slots.size(), 1U);
    EXPECT_EQ(ownable.slots[0].name, "owner");

    const auto missing = build(kVault, "Missing");
    EXPECT_EQ(missing.name, "Missing");
    EXPECT_TRUE(missing.functions.empty());
    EXPECT_TRUE(missing.slots.empty());
}

TEST(SolidityFrontendTest, PragmaAndUncheckedBlocks)
{
    const auto current = build(R"(
pragma solidity 0.8.20;
contract Counter {
    uint256 count;
    function bump(uint256 by) public {
        count += by;
        unchecked { count = count + 1; }
    }
}
)");
    ASSERT_EQ(current.functions.size(), 1U);
    const auto arithmetic = ops_of<ir::Arithmetic>(current.functions[0]);
    ASSERT_EQ(arithmetic.size(), 2U);
    EXPECT_TRUE(arithmetic[0].checked);
    EXPECT_FALSE(arithmetic[1].checked);

    const auto legacy = build(R"(
pragma solidity ^0.7.6;
contract Old {
    function mul(uint256 a, uint256 b) public pure returns (uint256) {
        return a * b;
    }
}
)");
    ASSERT_EQ(legacy.functions.size(), 1U);
    const auto legacy_ops = ops_of<ir::Arithmetic>(legacy.functions[0]);
    ASSERT_EQ(legacy_ops.size(), 1U);
    EXPECT_EQ(legacy_ops[0].op, ir::ArithmeticOp::kMul);
    EXPECT_FALSE(legacy_ops[0].checked);

    const auto unversioned = build(R"(
contract Plain {
    function mul(uint256 a, uint256 b) public pure returns (uint256) {
        return a * b;
    }
}
)");
    ASSERT_EQ(unversioned.functions.size(), 1U);
    const auto plain_ops = ops_of<ir::Arithmetic>(unversioned.functions[0]);
    ASSERT_EQ(plain_ops.size(), 1U);
    EXPECT_TRUE(plain_ops[0].checked);
}

TEST(SolidityFrontendTest, StorageBoundLoop)
{
    const auto model = build(R"(
pragma solidity ^0.8.0;
contract Payroll {
    address[] employees;
    mapping(address => uint256) paid;
    function payAll(uint256 amount) external {
        for (uint256 i = 0; i < employees.length; i++) {
            paid[employees[i]] += amount;
        }
    }
}
)");
    ASSERT_EQ(model.functions.size(), 1U);
    const auto& pay_all = model.functions[0];
    const auto loop_at = index_of<ir::Loop>(pay_all);
    ASSERT_EQ(loop_at, 1);
    const auto& loop = std::get<ir::Loop>(pay_all.operations[1].kind);
    EXPECT_TRUE(loop.storage_bound);
    EXPECT_EQ(loop.body_begin, 2U);
    EXPECT_EQ(loop.body_end, pay_all.operations.size());
    EXPECT_EQ(pay_all.operations[0].loop_depth, 0);
    EXPECT_EQ(pay_all.operations[1].loop_depth, 0);

    const auto write_at = index_of<ir::StorageWrite>(pay_all);
    ASSERT_GT(write_at, 1);
    EXPECT_EQ(pay_all.operations[static_cast<std::size_t>(write_at)].loop_depth, 1);
    const auto writes = ops_of<ir::StorageWrite>(pay_all);
    ASSERT_EQ(writes.size(), 1U);
    EXPECT_EQ(writes[0].slot, "paid");
    EXPECT_EQ(writes[0].key_source, ir::ValueSource::kStorage);
}

TEST(SolidityFrontendTest, LowLevelCallsAndUnsafeCode)
{
    const auto model = build(R"(
pragma solidity ^0.8.0;
interface IToken {
    function transfer(address to, uint256 amount) external returns (bool);
    function approve(address spender, uint256 amount) external returns (bool);
}
contract Proxy {
    address implementation;
    function forward(bytes calldata data) external {
        (bool ok, ) = implementation.delegatecall(data);
        require(ok);
    }
    function pay(IToken token, address to) external {
        token.transfer(to, 1);
        payable(to).transfer(1);
    }
    function approveAll(address feed, address to) external {
        IToken(feed).approve(to, 1);
    }
    function auth() external view {
        require(tx.origin == msg.sender);
    }
    function raw() external {
        assembly { sstore(0, 1) }
    }
    function pack(uint256 n) external pure returns (bytes memory) {
        uint256[] memory xs = new uint256[](n);
        return abi.encode(xs);
    }
}
)");
    ASSERT_EQ(model.functions.size(), 6U);

    const auto forward = ops_of<ir::ExternalCall>(*model.find_function("forward"));
    ASSERT_EQ(forward.size(), 1U);
    EXPECT_EQ(forward[0].kind, ir::CallKind::kDelegateCall);
    EXPECT_EQ(forward[0].target, "implementation");
    EXPECT_EQ(forward[0].target_source, ir::ValueSource::kStorage);
    EXPECT_TRUE(forward[0].result_checked);

    const auto pay = ops_of<ir::ExternalCall>(*model.find_function("pay"));
    ASSERT_EQ(pay.size(), 2U);
    EXPECT_EQ(pay[0].kind, ir::CallKind::kCall);
    EXPECT_EQ(pay[0].target, "token");
    EXPECT_EQ(pay[0].target_source, ir::ValueSource::kParameter);
    // ERC-20 transfer reports failure through its bool result, which is dropped here.
    EXPECT_FALSE(pay[0].result_checked);
    EXPECT_EQ(pay[1].kind, ir::CallKind::kValueTransfer);
    EXPECT_EQ(pay[1].target, "to");
    EXPECT_TRUE(pay[1].result_checked);

    const auto approve = ops_of<ir::ExternalCall>(*model.find_function("approveAll"));
    ASSERT_EQ(approve.size(), 1U);
    EXPECT_EQ(approve[0].target, "feed");
    EXPECT_EQ(approve[0].method, "approve");
    EXPECT_FALSE(approve[0].result_checked);

    const auto& auth = *model.find_function("auth");
    const auto env = ops_of<ir::EnvironmentRead>(auth);
    ASSERT_EQ(env.size(), 2U);
    EXPECT_EQ(env[0].kind, ir::EnvironmentKind::kOrigin);
    EXPECT_EQ(env[1].kind, ir::EnvironmentKind::kSender);
    const auto guards = ops_of<ir::Branch>(auth);
    ASSERT_EQ(guards.size(), 1U);
    EXPECT_EQ(guards[0].guard, ir::GuardKind::kTxOrigin);

    const auto& raw = *model.find_function("raw");
    EXPECT_EQ(raw.unsafe_regions.size(), 1U);
    const auto opaque = ops_of<ir::OpaqueOperation>(raw);
    ASSERT_EQ(opaque.size(), 1U);
    EXPECT_EQ(opaque[0].mnemonic, "assembly");

    const auto allocations = ops_of<ir::MemoryAllocation>(*model.find_function("pack"));
    ASSERT_EQ(allocations.size(), 2U);
    EXPECT_TRUE(allocations[0].preallocated);
    EXPECT_FALSE(allocations[1].preallocated);
    EXPECT_EQ(allocations[1].description, "abi.encode");
}

TEST(SolidityFrontendTest, ModifiersAndSpecialFunctions)
{
    const auto model = build(R"(
pragma solidity ^0.8.0;
contract Guarded {
    bool private locked;
    address owner;
    modifier nonReentrant() {
        require(!locked);
        locked = true;
        _;
        locked = false;
    }
    modifier logged() { _; }
    constructor() { owner = msg.sender; }
    receive() external payable {}
    fallback() external {}
    function a() external nonReentrant logged {}
    function b() private {}
    function c() public payable {}
}
)");
    ASSERT_EQ(model.functions.size(), 6U);
    EXPECT_EQ(model.functions[0].name, "constructor");
    EXPECT_EQ(model.functions[0].visibility, ir::Visibility::kInternal);
    EXPECT_EQ(model.functions[1].name, "receive");
    EXPECT_EQ(model.functions[1].visibility, ir::Visibility::kExternal);
    EXPECT_EQ(model.functions[1].mutability, ir::Mutability::kPayable);
    EXPECT_EQ(model.functions[2].name, "fallback");
    EXPECT_EQ(model.functions[2].visibility, ir::Visibility::kExternal);

    const auto& a = model.functions[3];
    ASSERT_EQ(a.modifiers.size(), 2U);
    EXPECT_EQ(a.modifiers[0].kind, ir::ModifierKind::kReentrancyGuard);
    EXPECT_EQ(a.modifiers[1].name, "logged");
    EXPECT_EQ(a.modifiers[1].kind, ir::ModifierKind::kOther);

    EXPECT_EQ(model.functions[4].visibility, ir::Visibility::kPrivate);
    EXPECT_FALSE(model.functions[4].is_entry_point());
    EXPECT_EQ(model.functions[5].mutability, ir::Mutability::kPayable);
    EXPECT_TRUE(model.functions[5].has_modifier(ir::ModifierKind::kPayable));
}

TEST(SolidityFrontendTest, StoragePointerWritesResolveToSlot)
{
    const auto model = build(R"(
pragma solidity ^0.8.0;
contract Stakes {
    struct Stake { uint256 amount; uint256 since; }
    mapping(address => Stake) stakes;
    function top(uint256 more) external {
        Stake storage s = stakes[msg.sender];
        s.amount += more;
    }
}
)");
    ASSERT_EQ(model.functions.size(), 1U);
    const auto writes = ops_of<ir::StorageWrite>(model.functions[0]);
    ASSERT_EQ(writes.size(), 1U);
    EXPECT_EQ(writes[0].slot, "stakes");
    EXPECT_EQ(model.find_slot("stakes")->access, ir::AccessPattern::kReadWrite);
}

TEST(SolidityFrontendTest, MalformedFunctionIsSkipped)
{
    const auto model = build(R"(
pragma solidity ^0.8.0;
contract Broken {
    uint256 value;
    function good() public { value = 1; }
    function bad(uint256 x public { value = x; }
    function later() public view returns (uint256) { return value; }
}
)");
    ASSERT_EQ(model.functions.size(), 2U);
    EXPECT_EQ(model.functions[0].name, "good");
    EXPECT_EQ(model.functions[1].name, "later");
    ASSERT_EQ(model.diagnostics.size(), 1U);
    EXPECT_EQ(model.diagnostics[0].code, "ParseError");
    EXPECT_EQ(model.diagnostics[0].message, "unterminated parameter list in function 'bad'");
    ASSERT_TRUE(model.diagnostics[0].location);
    EXPECT_EQ(model.diagnostics[0].location->line, 6);
}

TEST(SolidityFrontendTest, TruncatedStringKeepsEarlierFunctions)
{
    const auto model = build(R"(
pragma solidity ^0.8.0;
contract Cut {
    uint256 value;
    function good() public { value = 1; }
    function bad() public { require(value > 0, "never closed
)");
    ASSERT_EQ(model.functions.size(), 1U);
    EXPECT_EQ(model.functions[0].name, "good");
    const auto has = [&model](std::string_view message, int line) {
        return std::ranges::any_of(model.diagnostics, [&](const ir::Diagnostic& d) {
            return d.code == "ParseError" && d.message == message && d.location && d.location->line == line;
        });
    };
    EXPECT_TRUE(has("unterminated string literal", 6));
    EXPECT_TRUE(has("unterminated body in function 'bad'", 6));
}

}  // namespace stylint::frontend::test
