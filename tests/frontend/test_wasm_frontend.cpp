#include "stylint/frontend.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

namespace stylint::frontend::test {

namespace {

// Section and name sizes below stay under 128 bytes, so each LEB128 length is one byte.
std::string bytes(std::initializer_list<std::uint8_t> values)
{
    std::string out;
    for (std::uint8_t value : values) {
        out.push_back(static_cast<char>(value));
    }
    return out;
}

std::string name(std::string_view text)
{
    return bytes({static_cast<std::uint8_t>(text.size())}) + std::string(text);
}

std::string section(std::uint8_t id, const std::string& content)
{
    return bytes({id, static_cast<std::uint8_t>(content.size())}) + content;
}

std::string function_import(std::string_view module, std::string_view field)
{
    return name(module) + name(field) + bytes({0x00, 0x00});
}

std::string body(const std::string& code)
{
    // No local declarations.
    return bytes({static_cast<std::uint8_t>(code.size() + 1), 0x00}) + code;
}

std::string header()
{
    return bytes({0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00});
}

/// Custom "name" section naming function 6 "helper".
std::string helper_names()
{
    const std::string map = bytes({0x01, 0x06}) + name("helper");
    return name("name") + bytes({0x01, static_cast<std::uint8_t>(map.size())}) + map;
}

/// Imports: 0 msg_sender, 1 storage_load_bytes32, 2 storage_store_bytes32, 3 call_contract, 4 env.debug.
/// Defined: 5 user_entrypoint (exported), 6 helper (named in the name section).
std::string counter_module(const std::string& helper_code = bytes({0x0b}), const std::string& names = helper_names())
{
    const std::string imports = bytes({0x05}) + function_import("vm_hooks", "msg_sender")
                                + function_import("vm_hooks", "storage_load_bytes32")
                                + function_import("vm_hooks", "storage_store_bytes32")
                                + function_import("vm_hooks", "call_contract") + function_import("env", "debug");
    const std::string entry = bytes({
        0x10, 0x00,  // call msg_sender
        0x04, 0x40,  // if
        0x00,        // unreachable
        0x0b,        // end
        0x03, 0x40,  // loop
        0x10, 0x01,  // call storage_load_bytes32
        0x41, 0x01,  // i32.const 1
        0x6a,        // i32.add
        0x10, 0x03,  // call call_contract
        0x1a,        // drop
        0x0d, 0x00,  // br_if 0
        0x0b,        // end loop
        0x10, 0x02,  // call storage_store_bytes32
        0x10, 0x06,  // call helper
        0x10, 0x04,  // call env.debug
        0x0b,        // end
    });
    const std::string code = bytes({0x02}) + body(entry) + body(helper_code);
    const std::string exports = bytes({0x01}) + name("user_entrypoint") + bytes({0x00, 0x05});
    return header() + section(1, bytes({0x01, 0x60, 0x00, 0x00})) + section(2, imports)
           + section(3, bytes({0x02, 0x00, 0x00})) + section(7, exports) + section(10, code) + section(0, names);
}

Result<ir::ContractModel> decode(const std::string& module, std::string contract_name = {})
{
    return build_model(module,
                       ir::Dialect::kWasm,
                       {.file_path = "build/counter.wasm", .repo_root = {}, .contract_name = contract_name});
}

}  // namespace

TEST(WasmFrontendTest, DetectsModuleByMagic)
{
    EXPECT_EQ(detect_dialect(counter_module()), ir::Dialect::kWasm);
}

TEST(WasmFrontendTest, FunctionsAndNames)
{
    auto model = decode(counter_module());
    ASSERT_TRUE(model) << model.error().message;
    EXPECT_EQ(model->name, "counter");
    EXPECT_EQ(model->dialect, ir::Dialect::kWasm);
    ASSERT_EQ(model->functions.size(), 2U);
    EXPECT_EQ(model->functions[0].name, "user_entrypoint");
    EXPECT_EQ(model->functions[0].visibility, ir::Visibility::kPublic);
    EXPECT_EQ(model->functions[1].name, "helper");
    EXPECT_EQ(model->functions[1].visibility, ir::Visibility::kPrivate);
    EXPECT_TRUE(model->functions[1].operations.empty());
    EXPECT_TRUE(model->diagnostics.empty());

    auto named = decode(counter_module(), "Counter");
    ASSERT_TRUE(named);
    EXPECT_EQ(named->name, "Counter");
}

TEST(WasmFrontendTest, HostCallsBecomeOperations)
{
    auto model = decode(counter_module());
    ASSERT_TRUE(model) << model.error().message;
    const auto& ops = model->functions[0].operations;
    ASSERT_EQ(ops.size(), 10U);

    const auto* sender = std::get_if<ir::EnvironmentRead>(&ops[0].kind);
    ASSERT_NE(sender, nullptr);
    EXPECT_EQ(sender->kind, ir::EnvironmentKind::kSender);

    const auto* guard = std::get_if<ir::Branch>(&ops[1].kind);
    ASSERT_NE(guard, nullptr);
    EXPECT_TRUE(guard->reverts);
    EXPECT_EQ(guard->guard, ir::GuardKind::kAccessControl);
    EXPECT_EQ(guard->subjects, (std::vector<std::string>{"sender"}));

    const auto* loop = std::get_if<ir::Loop>(&ops[2].kind);
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->body_begin, 3U);
    EXPECT_EQ(loop->body_end, 7U);

    const auto* read = std::get_if<ir::StorageRead>(&ops[3].kind);
    ASSERT_NE(read, nullptr);
    EXPECT_EQ(ops[3].loop_depth, 1);
    EXPECT_TRUE(read->key.starts_with("<stack@"));

    const auto* add = std::get_if<ir::Arithmetic>(&ops[4].kind);
    ASSERT_NE(add, nullptr);
    EXPECT_EQ(add->op, ir::ArithmeticOp::kAdd);
    EXPECT_FALSE(add->checked);

    const auto* call = std::get_if<ir::ExternalCall>(&ops[5].kind);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->kind, ir::CallKind::kCall);
    // The status is dropped right after the call.
    EXPECT_FALSE(call->result_checked);

    const auto* loop_exit = std::get_if<ir::Branch>(&ops[6].kind);
    ASSERT_NE(loop_exit, nullptr);
    EXPECT_EQ(loop_exit->guard, ir::GuardKind::kNone);

    ASSERT_TRUE(std::holds_alternative<ir::StorageWrite>(ops[7].kind));
    EXPECT_EQ(ops[7].loop_depth, 0);

    const auto* internal = std::get_if<ir::InternalCall>(&ops[8].kind);
    ASSERT_NE(internal, nullptr);
    EXPECT_EQ(internal->callee, "helper");

    const auto* opaque = std::get_if<ir::OpaqueOperation>(&ops[9].kind);
    ASSERT_NE(opaque, nullptr);
    EXPECT_EQ(opaque->mnemonic, "env::debug");

    EXPECT_EQ(ops[0].location.line, 0);
    EXPECT_GT(ops[0].location.col, 8);
    ASSERT_EQ(model->call_sites.size(), 1U);
}

TEST(WasmFrontendTest, UndecodableFunctionIsSkipped)
{
    auto model = decode(counter_module(bytes({0xff})));
    ASSERT_TRUE(model) << model.error().message;
    ASSERT_EQ(model->functions.size(), 1U);
    EXPECT_EQ(model->functions[0].name, "user_entrypoint");
    ASSERT_EQ(model->diagnostics.size(), 1U);
    EXPECT_EQ(model->diagnostics[0].code, "ParseError");
    EXPECT_EQ(model->diagnostics[0].message, "skipped function 'helper': unsupported opcode 0xff");
}

TEST(WasmFrontendTest, OversizedNameSubsectionIsIgnored)
{
    // Function-name subsection claims 0x7f bytes; the section holds far fewer.
    const std::string names = name("name") + bytes({0x01, 0x7f, 0x01, 0x06}) + name("helper");
    auto model = decode(counter_module(bytes({0x0b}), names));
    ASSERT_TRUE(model) << model.error().message;
    ASSERT_EQ(model->functions.size(), 2U);
    EXPECT_EQ(model->functions[0].name, "user_entrypoint");
    EXPECT_EQ(model->functions[1].name, "func_6");

    // A subsection size running to the end of the input is rejected the same way.
    const std::string tail = name("name") + bytes({0x01, 0xff, 0xff, 0x01});
    auto truncated = decode(counter_module(bytes({0x0b}), tail));
    ASSERT_TRUE(truncated) << truncated.error().message;
    EXPECT_EQ(truncated->functions[1].name, "func_6");
}

TEST(WasmFrontendTest, BadHeader)
{
    auto truncated = decode(bytes({0x00, 0x61, 0x73, 0x6d}));
    ASSERT_FALSE(truncated);
    EXPECT_EQ(truncated.error().code, "ParseError");
    EXPECT_EQ(truncated.error().message, "truncated WASM header");

    auto magic = decode(bytes({0x00, 0x61, 0x73, 0x00, 0x01, 0x00, 0x00, 0x00}));
    ASSERT_FALSE(magic);
    EXPECT_EQ(magic.error().message, "bad WASM magic");

    auto version = decode(bytes({0x00, 0x61, 0x73, 0x6d, 0x02, 0x00, 0x00, 0x00}));
    ASSERT_FALSE(version);
    EXPECT_EQ(version.error().message, "unsupported WASM version");
}

TEST(WasmFrontendTest, TruncatedSectionFails)
{
    // Code section declares 32 bytes but carries two.
    auto model = decode(header() + bytes({0x0a, 0x20, 0x01, 0x00}));
    ASSERT_FALSE(model);
    EXPECT_EQ(model.error().code, "ParseError");
    ASSERT_TRUE(model.error().location);
    EXPECT_EQ(model.error().location->line, 0);
}

TEST(WasmFrontendTest, EmptyModuleHasNoFunctions)
{
    auto model = decode(header());
    ASSERT_TRUE(model) << model.error().message;
    EXPECT_TRUE(model->functions.empty());
    EXPECT_TRUE(model->diagnostics.empty());
}

}  // namespace stylint::frontend::test
