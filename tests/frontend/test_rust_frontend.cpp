#include "stylint/frontend.hpp"

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

namespace stylint::frontend::test {

namespace {

ir::ContractModel build(std::string_view source)
{
    auto model = build_model(source, ir::Dialect::kStylusRust, {.file_path = "src/lib.rs"});
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

constexpr const char* kBank = R"(
use stylus_sdk::prelude::*;

sol_interface! {
    interface IVault {
        function notify(address user, uint256 amount) external;
    }
}

sol_storage! {
    #[entrypoint]
    pub struct Bank {
        mapping(address => uint256) balances;
        uint256 total;
    }
}

const TREASURY: Address = address!("0x0000000000000000000000000000000000000001");

#[public]
impl Bank {
    /// Pays out the caller's balance.
    pub fn withdraw(&mut self) -> Result<(), Vec<u8>> {
        let amount = self.balances.get(msg::sender());
        IVault::new(TREASURY).notify(Call::new_in(self), msg::sender(), amount)?;
        self.balances.insert(msg::sender(), U256::ZERO);
        Ok(())
    }

    pub fn total(&self) -> U256 {
        self.total.get()
    }

    pub fn scale(value: U256) -> U256 {
        value * U256::from(2)
    }

    #[payable]
    pub fn deposit(&mut self) {
        self.total += msg::value();
    }

    fn helper(&self) {}
}
)";

}  // namespace

TEST(RustFrontendTest, SolStorageSlots)
{
    const auto model = build(kBank);
    EXPECT_EQ(model.name, "Bank");
    EXPECT_EQ(model.dialect, ir::Dialect::kStylusRust);
    ASSERT_EQ(model.slots.size(), 2U);
    EXPECT_EQ(model.slots[0].name, "balances");
    EXPECT_EQ(model.slots[0].type, "mapping(address => uint256)");
    EXPECT_EQ(model.slots[0].kind, ir::SlotKind::kMapping);
    EXPECT_EQ(model.slots[1].name, "total");
    EXPECT_EQ(model.slots[1].kind, ir::SlotKind::kValue);
}

TEST(RustFrontendTest, VisibilityAndMutability)
{
    const auto model = build(kBank);
    ASSERT_EQ(model.functions.size(), 5U);

    const auto* withdraw = model.find_function("withdraw");
    ASSERT_NE(withdraw, nullptr);
    EXPECT_EQ(withdraw->visibility, ir::Visibility::kPublic);
    EXPECT_EQ(withdraw->mutability, ir::Mutability::kNone);
    EXPECT_EQ(withdraw->doc, "Pays out the caller's balance.");

    EXPECT_EQ(model.find_function("total")->mutability, ir::Mutability::kView);
    EXPECT_EQ(model.find_function("scale")->mutability, ir::Mutability::kPure);
    EXPECT_EQ(model.find_function("scale")->params, std::vector<std::string>{"value"});

    const auto* deposit = model.find_function("deposit");
    ASSERT_NE(deposit, nullptr);
    EXPECT_EQ(deposit->mutability, ir::Mutability::kPayable);
    EXPECT_TRUE(deposit->has_modifier(ir::ModifierKind::kPayable));

    const auto* helper = model.find_function("helper");
    ASSERT_NE(helper, nullptr);
    EXPECT_EQ(helper->visibility, ir::Visibility::kInternal);
    EXPECT_FALSE(helper->is_entry_point());
}

TEST(RustFrontendTest, WithdrawOperationOrder)
{
    const auto model = build(kBank);
    const auto* withdraw = model.find_function("withdraw");
    ASSERT_NE(withdraw, nullptr);

    const auto read = index_of<ir::StorageRead>(*withdraw);
    const auto call = index_of<ir::ExternalCall>(*withdraw);
    const auto write = index_of<ir::StorageWrite>(*withdraw);
    ASSERT_GE(read, 0);
    ASSERT_GE(call, 0);
    ASSERT_GE(write, 0);
    EXPECT_LT(read, call);
    EXPECT_LT(call, write);

    const auto reads = ops_of<ir::StorageRead>(*withdraw);
    ASSERT_EQ(reads.size(), 1U);
    EXPECT_EQ(reads[0].slot, "balances");
    EXPECT_EQ(reads[0].key, "msg::sender()");
    EXPECT_EQ(reads[0].key_source, ir::ValueSource::kSender);

    const auto writes = ops_of<ir::StorageWrite>(*withdraw);
    ASSERT_EQ(writes.size(), 1U);
    EXPECT_EQ(writes[0].slot, "balances");
    EXPECT_EQ(writes[0].key_source, ir::ValueSource::kSender);
}

TEST(RustFrontendTest, TypedInterfaceCall)
{
    const auto model = build(kBank);
    const auto calls = ops_of<ir::ExternalCall>(*model.find_function("withdraw"));
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls[0].kind, ir::CallKind::kCall);
    EXPECT_EQ(calls[0].target, "TREASURY");
    EXPECT_EQ(calls[0].target_source, ir::ValueSource::kConstant);
    EXPECT_EQ(calls[0].method, "notify");
    EXPECT_TRUE(calls[0].result_checked);

    ASSERT_EQ(model.call_sites.size(), 1U);
    EXPECT_EQ(model.call_sites[0].function, "withdraw");
}

TEST(RustFrontendTest, CompoundAssignmentReadsThenWrites)
{
    const auto model = build(kBank);
    const auto* deposit = model.find_function("deposit");
    ASSERT_NE(deposit, nullptr);

    const auto envs = ops_of<ir::EnvironmentRead>(*deposit);
    ASSERT_EQ(envs.size(), 1U);
    EXPECT_EQ(envs[0].kind, ir::EnvironmentKind::kValue);

    const auto arithmetic = ops_of<ir::Arithmetic>(*deposit);
    ASSERT_EQ(arithmetic.size(), 1U);
    EXPECT_EQ(arithmetic[0].op, ir::ArithmeticOp::kAdd);
    EXPECT_EQ(arithmetic[0].sink, ir::ArithmeticSink::kStorage);
    EXPECT_FALSE(arithmetic[0].checked);

    EXPECT_LT(index_of<ir::StorageRead>(*deposit), index_of<ir::Arithmetic>(*deposit));
    EXPECT_LT(index_of<ir::Arithmetic>(*deposit), index_of<ir::StorageWrite>(*deposit));
}

TEST(RustFrontendTest, SlotAccessSummary)
{
    const auto model = build(kBank);
    const auto* balances = model.find_slot("balances");
    ASSERT_NE(balances, nullptr);
    EXPECT_EQ(balances->access, ir::AccessPattern::kReadWrite);
    EXPECT_EQ(balances->readers, std::vector<std::string>{"withdraw"});

    const auto* total = model.find_slot("total");
    ASSERT_NE(total, nullptr);
    EXPECT_EQ(total->readers, (std::vector<std::string>{"deposit", "total"}));
    EXPECT_EQ(total->writers, std::vector<std::string>{"deposit"});
}

TEST(RustFrontendTest, StorageAttributeStruct)
{
    const auto model = build(R"(
#[storage]
#[entrypoint]
pub struct Counter {
    count: StorageU256,
    owners: StorageMap<Address, StorageBool>,
    history: StorageVec<StorageU256>,
}

#[public]
impl Counter {
    pub fn increment(&mut self) {
        let current = self.count.get();
        self.count.set(current + U256::from(1));
    }
}
)");
    EXPECT_EQ(model.name, "Counter");
    ASSERT_EQ(model.slots.size(), 3U);
    EXPECT_EQ(model.slots[0].kind, ir::SlotKind::kValue);
    EXPECT_EQ(model.slots[1].kind, ir::SlotKind::kMapping);
    EXPECT_EQ(model.slots[2].kind, ir::SlotKind::kArray);
    EXPECT_EQ(model.find_slot("owners")->access, ir::AccessPattern::kUnused);

    const auto* increment = model.find_function("increment");
    ASSERT_NE(increment, nullptr);
    const auto writes = ops_of<ir::StorageWrite>(*increment);
    ASSERT_EQ(writes.size(), 1U);
    EXPECT_EQ(writes[0].slot, "count");
    EXPECT_TRUE(writes[0].key.empty());
}

TEST(RustFrontendTest, RawCallsAndTargets)
{
    const auto model = build(R"(
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

    pub fn pay(&mut self, to: Address, amount: U256) {
        transfer_eth(to, amount);
    }

    pub fn peek(&self, token: Address) -> Result<Vec<u8>, Vec<u8>> {
        static_call(Call::new(), token, &[])
    }
}
)");
    const auto* forward = model.find_function("forward");
    ASSERT_NE(forward, nullptr);
    const auto forward_calls = ops_of<ir::ExternalCall>(*forward);
    ASSERT_EQ(forward_calls.size(), 1U);
    EXPECT_EQ(forward_calls[0].kind, ir::CallKind::kDelegateCall);
    EXPECT_EQ(forward_calls[0].target, "target");
    EXPECT_EQ(forward_calls[0].target_source, ir::ValueSource::kStorage);
    EXPECT_EQ(forward->unsafe_regions.size(), 1U);

    const auto pay_calls = ops_of<ir::ExternalCall>(*model.find_function("pay"));
    ASSERT_EQ(pay_calls.size(), 1U);
    EXPECT_EQ(pay_calls[0].kind, ir::CallKind::kValueTransfer);
    EXPECT_EQ(pay_calls[0].target_source, ir::ValueSource::kParameter);
    EXPECT_FALSE(pay_calls[0].result_checked);

    const auto peek_calls = ops_of<ir::ExternalCall>(*model.find_function("peek"));
    ASSERT_EQ(peek_calls.size(), 1U);
    EXPECT_EQ(peek_calls[0].kind, ir::CallKind::kStaticCall);
    EXPECT_EQ(peek_calls[0].target, "token");
    EXPECT_TRUE(peek_calls[0].result_checked);
}

TEST(RustFrontendTest, GuardsLoopsAndEvents)
{
    const auto model = build(R"(
sol_storage! {
    #[entrypoint]
    pub struct Registry {
        address owner;
        address[] members;
        uint256 limit;
    }
}

#[public]
impl Registry {
    pub fn add(&mut self, member: Address) -> Result<(), Vec<u8>> {
        if msg::sender() != self.owner.get() {
            return Err(b"not owner".to_vec());
        }
        for i in 0..self.limit.get() {
            self.members.push(member);
        }
        evm::log(MemberAdded { member });
        Ok(())
    }
}
)");
    const auto* add = model.find_function("add");
    ASSERT_NE(add, nullptr);

    const auto branches = ops_of<ir::Branch>(*add);
    ASSERT_EQ(branches.size(), 1U);
    EXPECT_EQ(branches[0].guard, ir::GuardKind::kAccessControl);
    EXPECT_TRUE(branches[0].reverts);

    const auto loops = ops_of<ir::Loop>(*add);
    ASSERT_EQ(loops.size(), 1U);
    EXPECT_TRUE(loops[0].storage_bound);
    EXPECT_LT(loops[0].body_begin, loops[0].body_end);

    const auto loop_index = static_cast<std::size_t>(index_of<ir::Loop>(*add));
    const auto& body_op = add->operations[loops[0].body_begin];
    EXPECT_EQ(body_op.loop_depth, add->operations[loop_index].loop_depth + 1);

    const auto events = ops_of<ir::EventEmission>(*add);
    ASSERT_EQ(events.size(), 1U);
    EXPECT_EQ(events[0].event, "MemberAdded");
}

TEST(RustFrontendTest, MacrosAndAllocations)
{
    const auto model = build(R"(
#[storage]
#[entrypoint]
pub struct Book {
    entries: StorageVec<StorageU256>,
}

#[public]
impl Book {
    pub fn collect(&self, n: U256) -> Vec<U256> {
        require!(n > U256::ZERO, "empty");
        let mut out = Vec::new();
        let mut sized = Vec::with_capacity(4);
        for i in 0..4 {
            out.push(U256::from(i));
            sized.push(U256::from(i));
        }
        custom_magic!(out);
        out
    }
}
)");
    const auto* collect = model.find_function("collect");
    ASSERT_NE(collect, nullptr);

    const auto branches = ops_of<ir::Branch>(*collect);
    ASSERT_EQ(branches.size(), 1U);
    EXPECT_TRUE(branches[0].reverts);
    EXPECT_EQ(branches[0].guard, ir::GuardKind::kInputValidation);

    const auto allocations = ops_of<ir::MemoryAllocation>(*collect);
    ASSERT_EQ(allocations.size(), 4U);
    EXPECT_FALSE(allocations[0].preallocated);
    EXPECT_TRUE(allocations[1].preallocated);
    EXPECT_EQ(allocations[2].description, "grow out");
    EXPECT_FALSE(allocations[2].preallocated);
    EXPECT_TRUE(allocations[3].preallocated);

    const auto opaque = ops_of<ir::OpaqueOperation>(*collect);
    ASSERT_EQ(opaque.size(), 1U);
    EXPECT_EQ(opaque[0].mnemonic, "custom_magic!");
}

TEST(RustFrontendTest, EnvironmentAccessors)
{
    const auto model = build(R"(
#[storage]
#[entrypoint]
pub struct Clock {
    last: StorageU256,
}

#[public]
impl Clock {
    pub fn tick(&mut self) {
        let now = block::timestamp();
        let origin = tx::origin();
        let caller = self.vm().msg_sender();
        self.last.set(U256::from(now));
    }
}
)");
    const auto envs = ops_of<ir::EnvironmentRead>(*model.find_function("tick"));
    ASSERT_EQ(envs.size(), 3U);
    EXPECT_EQ(envs[0].kind, ir::EnvironmentKind::kTimestamp);
    EXPECT_EQ(envs[1].kind, ir::EnvironmentKind::kOrigin);
    EXPECT_EQ(envs[2].kind, ir::EnvironmentKind::kSender);
}

TEST(RustFrontendTest, CheckedArithmeticMethods)
{
    const auto model = build(R"(
#[storage]
#[entrypoint]
pub struct Math {
    value: StorageU256,
}

#[public]
impl Math {
    pub fn bump(&mut self, by: U256) -> Option<U256> {
        self.value.get().checked_add(by)
    }
}
)");
    const auto arithmetic = ops_of<ir::Arithmetic>(*model.find_function("bump"));
    ASSERT_EQ(arithmetic.size(), 1U);
    EXPECT_TRUE(arithmetic[0].checked);
    EXPECT_EQ(arithmetic[0].op, ir::ArithmeticOp::kAdd);
}

TEST(RustFrontendTest, MalformedFunctionIsSkipped)
{
    const auto model = build(R"(
#[storage]
#[entrypoint]
pub struct Vault {
    balance: StorageU256,
}

#[public]
impl Vault {
    pub fn deposit(&mut self, amount: U256) {
        self.balance.set(amount);
    }

    pub fn broken(&mut self, amount: U256 {
        self.balance.set(amount);
    }
}
)");
    ASSERT_EQ(model.functions.size(), 1U);
    EXPECT_EQ(model.functions[0].name, "deposit");
    ASSERT_EQ(model.diagnostics.size(), 1U);
    EXPECT_EQ(model.diagnostics[0].code, "ParseError");
    EXPECT_EQ(model.diagnostics[0].message, "unterminated parameter list in function 'broken'");
    ASSERT_TRUE(model.diagnostics[0].location);
    EXPECT_EQ(model.diagnostics[0].location->file, "src/lib.rs");
}

TEST(RustFrontendTest, LocationsArePerFunction)
{
    const auto model = build(kBank);
    ASSERT_TRUE(model.locations.contains("withdraw"));
    EXPECT_EQ(model.locations.at("withdraw").file, "src/lib.rs");
    EXPECT_GT(model.locations.at("withdraw").line, 0);
    EXPECT_EQ(model.locations.at("withdraw"), model.find_function("withdraw")->location);
}

}  // namespace stylint::frontend::test
