/**
 * @file wasm_frontend.cpp
 * @brief WASM module decoder for compiled Stylus contracts
 *
 * Decodes the type, import, function, export, code and custom "name"
 * sections. Calls to Stylus vm_hooks imports become storage, call,
 * environment, event and allocation operations; integer arithmetic and
 * structured control flow map to their IR kinds.
 *
 * Locations use line 0 and the byte offset of the instruction as column.
 */

#include "frontends.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stylint::frontend {

namespace {

constexpr std::array<std::uint8_t, 4> kMagic = {0x00, 0x61, 0x73, 0x6d};
constexpr std::array<std::uint8_t, 4> kVersion = {0x01, 0x00, 0x00, 0x00};

enum SectionId : std::uint8_t {
    kCustomSection = 0,
    kTypeSection = 1,
    kImportSection = 2,
    kFunctionSection = 3,
    kExportSection = 7,
    kCodeSection = 10,
};

/// Host functions that carry no analysis-relevant effect.
constexpr std::array<std::string_view, 22> kBenignHooks = {
    "read_args",        "write_result",     "storage_flush_cache", "msg_reentrant",
    "native_keccak256", "return_data_size", "read_return_data",    "contract_address",
    "chainid",          "block_basefee",    "block_coinbase",      "block_gas_limit",
    "tx_gas_price",     "tx_ink_price",     "evm_gas_left",        "evm_ink_left",
    "account_balance",  "account_code",     "account_code_size",   "account_codehash",
    "math_div",         "math_mod",
};

class Reader
{
public:
    Reader(std::string_view bytes, std::size_t begin, std::size_t end, const std::string& file)
        : m_bytes(bytes)
        , m_pos(begin)
        , m_end(end)
        , m_file(file)
    {}

    [[nodiscard]] std::size_t pos() const { return m_pos; }
    [[nodiscard]] bool at_end() const { return m_pos >= m_end; }
    [[nodiscard]] std::size_t remaining() const { return m_pos < m_end ? m_end - m_pos : 0; }

    [[nodiscard]] Result<std::uint8_t> byte()
    {
        if (m_pos >= m_end) {
            return std::unexpected(truncated());
        }
        return static_cast<std::uint8_t>(m_bytes[m_pos++]);
    }

    [[nodiscard]] std::optional<std::uint8_t> peek() const
    {
        if (m_pos >= m_end) {
            return std::nullopt;
        }
        return static_cast<std::uint8_t>(m_bytes[m_pos]);
    }

    [[nodiscard]] Result<std::uint64_t> leb_u(int max_bits = 32)
    {
        std::uint64_t value = 0;
        int shift = 0;
        while (true) {
            auto b = byte();
            if (!b) {
                return std::unexpected(b.error());
            }
            value |= static_cast<std::uint64_t>(*b & 0x7f) << shift;
            shift += 7;
            if ((*b & 0x80) == 0) {
                return value;
            }
            if (shift >= max_bits + 7) {
                return std::unexpected(malformed("LEB128 integer too long"));
            }
        }
    }

    [[nodiscard]] Result<std::int64_t> leb_s(int max_bits)
    {
        std::int64_t value = 0;
        int shift = 0;
        std::uint8_t b = 0;
        do {
            auto next = byte();
            if (!next) {
                return std::unexpected(next.error());
            }
            b = *next;
            if (shift < 64) {
                value |= static_cast<std::int64_t>(static_cast<std::uint64_t>(b & 0x7f) << shift);
            }
            shift += 7;
            if (shift >= max_bits + 7 && (b & 0x80) != 0) {
                return std::unexpected(malformed("LEB128 integer too long"));
            }
        } while ((b & 0x80) != 0);
        if (shift < 64 && (b & 0x40) != 0) {
            value |= static_cast<std::int64_t>(~std::uint64_t{0} << shift);
        }
        return value;
    }

    [[nodiscard]] Result<std::string> name()
    {
        auto size = leb_u();
        if (!size) {
            return std::unexpected(size.error());
        }
        if (*size > m_end - m_pos) {
            return std::unexpected(truncated());
        }
        std::string text(m_bytes.substr(m_pos, *size));
        m_pos += *size;
        return text;
    }

    [[nodiscard]] VoidResult skip(std::uint64_t count)
    {
        if (count > m_end - m_pos) {
            return std::unexpected(truncated());
        }
        m_pos += count;
        return {};
    }

    [[nodiscard]] Error malformed(std::string reason) const
    {
        return Error::at(std::string(error_code::kParseError), std::move(reason), location());
    }

    [[nodiscard]] SourceLocation location() const
    {
        return SourceLocation{.file = m_file, .line = 0, .col = static_cast<int>(m_pos)};
    }

private:
    [[nodiscard]] Error truncated() const { return malformed("unexpected end of module"); }

    std::string_view m_bytes;
    std::size_t m_pos;
    std::size_t m_end;
    const std::string& m_file;
};

struct Import
{
    std::string module;
    std::string field;
};

struct Section
{
    std::uint8_t id = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
};

struct BodyRange
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

[[nodiscard]] std::optional<ir::ArithmeticOp> arithmetic_of(std::uint8_t opcode)
{
    switch (opcode) {
        case 0x6a:
        case 0x7c:
            return ir::ArithmeticOp::kAdd;
        case 0x6b:
        case 0x7d:
            return ir::ArithmeticOp::kSub;
        case 0x6c:
        case 0x7e:
            return ir::ArithmeticOp::kMul;
        case 0x6d:
        case 0x6e:
        case 0x7f:
        case 0x80:
            return ir::ArithmeticOp::kDiv;
        case 0x6f:
        case 0x70:
        case 0x81:
        case 0x82:
            return ir::ArithmeticOp::kMod;
        case 0x74:
        case 0x86:
            return ir::ArithmeticOp::kShl;
        default:
            return std::nullopt;
    }
}

[[nodiscard]] std::optional<ir::EnvironmentKind> environment_hook(std::string_view field)
{
    if (field == "msg_sender") {
        return ir::EnvironmentKind::kSender;
    }
    if (field == "msg_value") {
        return ir::EnvironmentKind::kValue;
    }
    if (field == "tx_origin") {
        return ir::EnvironmentKind::kOrigin;
    }
    if (field == "block_timestamp") {
        return ir::EnvironmentKind::kTimestamp;
    }
    if (field == "block_number") {
        return ir::EnvironmentKind::kBlockNumber;
    }
    return std::nullopt;
}

class BodyDecoder
{
public:
    BodyDecoder(Reader& reader,
                ir::Function& function,
                const std::vector<Import>& imports,
                const std::vector<std::string>& function_names,
                const std::string& file)
        : m_reader(reader)
        , m_function(function)
        , m_imports(imports)
        , m_function_names(function_names)
        , m_file(file)
    {}

    [[nodiscard]] VoidResult decode()
    {
        auto local_groups = m_reader.leb_u();
        if (!local_groups) {
            return std::unexpected(local_groups.error());
        }
        for (std::uint64_t i = 0; i < *local_groups; ++i) {
            auto count = m_reader.leb_u();
            if (!count) {
                return std::unexpected(count.error());
            }
            auto type = m_reader.byte();
            if (!type) {
                return std::unexpected(type.error());
            }
        }
        while (!m_reader.at_end()) {
            auto step = instruction();
            if (!step) {
                return step;
            }
        }
        if (!m_blocks.empty()) {
            return std::unexpected(m_reader.malformed("function body ends inside a block"));
        }
        return {};
    }

private:
    enum class BlockKind {
        kBlock,
        kLoop,
        kIf,
    };

    struct OpenBlock
    {
        BlockKind kind = BlockKind::kBlock;
        std::size_t loop_index = 0;
    };

    [[nodiscard]] int loop_depth() const
    {
        return static_cast<int>(std::ranges::count(m_blocks, BlockKind::kLoop, &OpenBlock::kind));
    }

    std::size_t emit(std::size_t offset, ir::OperationKind kind)
    {
        m_function.operations.push_back(
            ir::Operation{.location = SourceLocation{.file = m_file, .line = 0, .col = static_cast<int>(offset)},
                          .loop_depth = loop_depth(),
                          .kind = std::move(kind)});
        return m_function.operations.size() - 1;
    }

    void emit_branch(std::size_t offset, std::string condition, bool reverts)
    {
        std::vector<std::string> subjects;
        ir::GuardKind guard = ir::GuardKind::kNone;
        if (m_origin_since_branch) {
            subjects.emplace_back("origin");
            guard = ir::GuardKind::kTxOrigin;
        }
        if (m_sender_since_branch) {
            subjects.insert(subjects.begin(), "sender");
            if (guard == ir::GuardKind::kNone) {
                guard = ir::GuardKind::kAccessControl;
            }
        }
        if (guard == ir::GuardKind::kNone && reverts) {
            guard = ir::GuardKind::kInputValidation;
        }
        emit(offset,
             ir::Branch{.condition = std::move(condition), .guard = guard, .reverts = reverts, .subjects = subjects});
        m_sender_since_branch = false;
        m_origin_since_branch = false;
    }

    [[nodiscard]] VoidResult block_type()
    {
        auto next = m_reader.peek();
        if (!next) {
            return std::unexpected(m_reader.malformed("missing block type"));
        }
        if (*next == 0x40 || (*next >= 0x6f && *next <= 0x7f)) {
            auto skipped = m_reader.byte();
            if (!skipped) {
                return std::unexpected(skipped.error());
            }
            return {};
        }
        auto index = m_reader.leb_s(33);
        if (!index) {
            return std::unexpected(index.error());
        }
        return {};
    }

    [[nodiscard]] VoidResult skip_u32s(int count)
    {
        for (int i = 0; i < count; ++i) {
            auto value = m_reader.leb_u();
            if (!value) {
                return std::unexpected(value.error());
            }
        }
        return {};
    }

    [[nodiscard]] VoidResult call(std::size_t offset, std::uint64_t index)
    {
        if (index >= m_imports.size()) {
            const std::string& callee = index < m_function_names.size() ? m_function_names[index]
                                                                        : std::format("func_{}", index);
            emit(offset, ir::InternalCall{.callee = callee});
            return {};
        }
        const Import& import = m_imports[index];
        const std::string& field = import.field;
        if (import.module != "vm_hooks") {
            emit(offset, ir::OpaqueOperation{.mnemonic = std::format("{}::{}", import.module, field)});
            return {};
        }
        const std::string stack_key = std::format("<stack@{}>", offset);
        if (field == "storage_load_bytes32") {
            emit(offset, ir::StorageRead{.slot = "storage", .key = stack_key, .key_source = ir::ValueSource::kLocal});
        } else if (field == "storage_store_bytes32" || field == "storage_cache_bytes32") {
            emit(offset, ir::StorageWrite{.slot = "storage", .key = stack_key, .key_source = ir::ValueSource::kLocal});
        } else if (field == "call_contract" || field == "delegate_call_contract" || field == "static_call_contract") {
            ir::CallKind kind = ir::CallKind::kCall;
            if (field == "delegate_call_contract") {
                kind = ir::CallKind::kDelegateCall;
            } else if (field == "static_call_contract") {
                kind = ir::CallKind::kStaticCall;
            }
            // A status that is immediately dropped was never inspected.
            const bool dropped = m_reader.peek() == std::optional<std::uint8_t>{0x1a};
            emit(offset,
                 ir::ExternalCall{.kind = kind,
                                  .target = stack_key,
                                  .target_source = ir::ValueSource::kLocal,
                                  .method = field,
                                  .args = "",
                                  .result_checked = !dropped});
        } else if (auto env = environment_hook(field)) {
            emit(offset, ir::EnvironmentRead{.kind = *env});
            m_sender_since_branch = m_sender_since_branch || *env == ir::EnvironmentKind::kSender;
            m_origin_since_branch = m_origin_since_branch || *env == ir::EnvironmentKind::kOrigin;
        } else if (field == "emit_log") {
            emit(offset, ir::EventEmission{.event = "log"});
        } else if (field == "pay_for_memory_grow") {
            emit(offset, ir::MemoryAllocation{.description = field, .preallocated = false});
        } else if (!std::ranges::contains(kBenignHooks, field)) {
            emit(offset, ir::OpaqueOperation{.mnemonic = "vm_hooks::" + field});
        }
        return {};
    }

    [[nodiscard]] VoidResult instruction()
    {
        const std::size_t offset = m_reader.pos();
        auto opcode = m_reader.byte();
        if (!opcode) {
            return std::unexpected(opcode.error());
        }
        if (auto op = arithmetic_of(*opcode)) {
            emit(offset,
                 ir::Arithmetic{.op = *op, .checked = false, .sink = ir::ArithmeticSink::kNone, .operand_reads_storage = false});
            return {};
        }
        switch (*opcode) {
            case 0x02:  // block
                m_blocks.push_back(OpenBlock{.kind = BlockKind::kBlock, .loop_index = 0});
                return block_type();
            case 0x03: {  // loop
                auto type = block_type();
                if (!type) {
                    return type;
                }
                const std::size_t index = emit(offset,
                                               ir::Loop{.header = "loop",
                                                        .storage_bound = false,
                                                        .body_begin = m_function.operations.size() + 1,
                                                        .body_end = m_function.operations.size() + 1});
                m_blocks.push_back(OpenBlock{.kind = BlockKind::kLoop, .loop_index = index});
                return {};
            }
            case 0x04: {  // if
                auto type = block_type();
                if (!type) {
                    return type;
                }
                const bool reverts = m_reader.peek() == std::optional<std::uint8_t>{0x00};
                emit_branch(offset, "if", reverts);
                m_blocks.push_back(OpenBlock{.kind = BlockKind::kIf, .loop_index = 0});
                return {};
            }
            case 0x0b:  // end
                if (!m_blocks.empty()) {
                    const OpenBlock block = m_blocks.back();
                    m_blocks.pop_back();
                    if (block.kind == BlockKind::kLoop) {
                        std::get<ir::Loop>(m_function.operations[block.loop_index].kind).body_end =
                            m_function.operations.size();
                    }
                }
                return {};
            case 0x0c:  // br
                return skip_u32s(1);
            case 0x0d:  // br_if
                emit_branch(offset, "br_if", false);
                return skip_u32s(1);
            case 0x0e: {  // br_table
                auto targets = m_reader.leb_u();
                if (!targets) {
                    return std::unexpected(targets.error());
                }
                for (std::uint64_t i = 0; i <= *targets; ++i) {
                    auto label = m_reader.leb_u();
                    if (!label) {
                        return std::unexpected(label.error());
                    }
                }
                emit_branch(offset, "br_table", false);
                return {};
            }
            case 0x10:    // call
            case 0x12: {  // return_call
                auto index = m_reader.leb_u();
                if (!index) {
                    return std::unexpected(index.error());
                }
                return call(offset, *index);
            }
            case 0x11:  // call_indirect
            case 0x13:  // return_call_indirect
                emit(offset, ir::OpaqueOperation{.mnemonic = "call_indirect"});
                return skip_u32s(2);
            case 0x1c: {  // select t*
                auto count = m_reader.leb_u();
                if (!count) {
                    return std::unexpected(count.error());
                }
                return m_reader.skip(*count);
            }
            case 0x20:
            case 0x21:
            case 0x22:
            case 0x23:
            case 0x24:
            case 0x25:
            case 0x26:
            case 0xd2:
                return skip_u32s(1);
            case 0x3f:  // memory.size
                return skip_u32s(1);
            case 0x40:  // memory.grow
                emit(offset, ir::MemoryAllocation{.description = "memory.grow", .preallocated = false});
                return skip_u32s(1);
            case 0x41: {
                auto value = m_reader.leb_s(32);
                if (!value) {
                    return std::unexpected(value.error());
                }
                return {};
            }
            case 0x42: {
                auto value = m_reader.leb_s(64);
                if (!value) {
                    return std::unexpected(value.error());
                }
                return {};
            }
            case 0x43:
                return m_reader.skip(4);
            case 0x44:
                return m_reader.skip(8);
            case 0xd0:
                return m_reader.skip(1);
            case 0xfc:
                return prefixed(offset);
            default:
                break;
        }
        if (*opcode <= 0x01 || *opcode == 0x05 || *opcode == 0x0f || *opcode == 0x1a || *opcode == 0x1b
            || (*opcode >= 0x45 && *opcode <= 0xc4) || *opcode == 0xd1) {
            return {};
        }
        if (*opcode >= 0x28 && *opcode <= 0x3e) {  // load/store memarg
            return skip_u32s(2);
        }
        return std::unexpected(Error::at(std::string(error_code::kParseError),
                                         std::format("unsupported opcode 0x{:02x}", *opcode),
                                         SourceLocation{.file = m_file, .line = 0, .col = static_cast<int>(offset)}));
    }

    [[nodiscard]] VoidResult prefixed(std::size_t offset)
    {
        auto sub = m_reader.leb_u();
        if (!sub) {
            return std::unexpected(sub.error());
        }
        switch (*sub) {
            case 8:  // memory.init
                if (auto data = skip_u32s(1); !data) {
                    return data;
                }
                return m_reader.skip(1);
            case 9:   // data.drop
            case 13:  // elem.drop
            case 15:  // table.grow
            case 16:  // table.size
            case 17:  // table.fill
                return skip_u32s(1);
            case 10:  // memory.copy
                return m_reader.skip(2);
            case 11:  // memory.fill
                return m_reader.skip(1);
            case 12:  // table.init
            case 14:  // table.copy
                return skip_u32s(2);
            default:
                if (*sub <= 7) {  // trunc_sat
                    return {};
                }
                return std::unexpected(Error::at(std::string(error_code::kParseError),
                                                 std::format("unsupported opcode 0xfc {}", *sub),
                                                 SourceLocation{.file = m_file, .line = 0, .col = static_cast<int>(offset)}));
        }
    }

    Reader& m_reader;
    ir::Function& m_function;
    const std::vector<Import>& m_imports;
    const std::vector<std::string>& m_function_names;
    const std::string& m_file;
    std::vector<OpenBlock> m_blocks;
    bool m_sender_since_branch = false;
    bool m_origin_since_branch = false;
};

class ModuleDecoder
{
public:
    ModuleDecoder(std::string_view bytes, const ParseContext& context)
        : m_bytes(bytes)
        , m_context(context)
    {}

    [[nodiscard]] Result<ir::ContractModel> run()
    {
        if (auto header = check_header(); !header) {
            return std::unexpected(header.error());
        }
        if (auto sections = split_sections(); !sections) {
            return std::unexpected(sections.error());
        }
        for (const Section& section : m_sections) {
            VoidResult decoded;
            switch (section.id) {
                case kImportSection:
                    decoded = decode_imports(section);
                    break;
                case kFunctionSection:
                    decoded = decode_functions(section);
                    break;
                case kExportSection:
                    decoded = decode_exports(section);
                    break;
                case kCodeSection:
                    decoded = decode_code(section);
                    break;
                case kCustomSection:
                    decode_custom(section);
                    break;
                default:
                    break;
            }
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
        }
        return build();
    }

private:
    [[nodiscard]] VoidResult check_header() const
    {
        const auto location = SourceLocation{.file = m_context.file, .line = 0, .col = 0};
        if (m_bytes.size() < 8) {
            return std::unexpected(
                Error::at(std::string(error_code::kParseError), "truncated WASM header", location));
        }
        for (std::size_t i = 0; i < 4; ++i) {
            if (static_cast<std::uint8_t>(m_bytes[i]) != kMagic[i]) {
                return std::unexpected(
                    Error::at(std::string(error_code::kParseError), "bad WASM magic", location));
            }
            if (static_cast<std::uint8_t>(m_bytes[4 + i]) != kVersion[i]) {
                return std::unexpected(Error::at(std::string(error_code::kParseError),
                                                 "unsupported WASM version",
                                                 SourceLocation{.file = m_context.file, .line = 0, .col = 4}));
            }
        }
        return {};
    }

    [[nodiscard]] VoidResult split_sections()
    {
        Reader reader(m_bytes, 8, m_bytes.size(), m_context.file);
        while (!reader.at_end()) {
            auto id = reader.byte();
            if (!id) {
                return std::unexpected(id.error());
            }
            auto size = reader.leb_u();
            if (!size) {
                return std::unexpected(size.error());
            }
            const std::size_t begin = reader.pos();
            if (auto skipped = reader.skip(*size); !skipped) {
                return std::unexpected(
                    Error::at(std::string(error_code::kParseError),
                              std::format("section {} is truncated ({} bytes declared)", *id, *size),
                              SourceLocation{.file = m_context.file, .line = 0, .col = static_cast<int>(begin)}));
            }
            m_sections.push_back(Section{.id = *id, .begin = begin, .end = reader.pos()});
        }
        return {};
    }

    [[nodiscard]] VoidResult decode_imports(const Section& section)
    {
        Reader reader(m_bytes, section.begin, section.end, m_context.file);
        auto count = reader.leb_u();
        if (!count) {
            return std::unexpected(count.error());
        }
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto module = reader.name();
            if (!module) {
                return std::unexpected(module.error());
            }
            auto field = reader.name();
            if (!field) {
                return std::unexpected(field.error());
            }
            auto kind = reader.byte();
            if (!kind) {
                return std::unexpected(kind.error());
            }
            switch (*kind) {
                case 0x00: {
                    auto type = reader.leb_u();
                    if (!type) {
                        return std::unexpected(type.error());
                    }
                    m_imports.push_back(Import{.module = std::move(*module), .field = std::move(*field)});
                    break;
                }
                case 0x01: {  // table: reftype + limits
                    auto reftype = reader.byte();
                    if (!reftype) {
                        return std::unexpected(reftype.error());
                    }
                    if (auto limits = skip_limits(reader); !limits) {
                        return limits;
                    }
                    break;
                }
                case 0x02:
                    if (auto limits = skip_limits(reader); !limits) {
                        return limits;
                    }
                    break;
                case 0x03: {
                    auto valtype = reader.byte();
                    if (!valtype) {
                        return std::unexpected(valtype.error());
                    }
                    auto mutability = reader.byte();
                    if (!mutability) {
                        return std::unexpected(mutability.error());
                    }
                    break;
                }
                default:
                    return std::unexpected(reader.malformed(std::format("unknown import kind {}", *kind)));
            }
        }
        return {};
    }

    [[nodiscard]] static VoidResult skip_limits(Reader& reader)
    {
        auto flags = reader.byte();
        if (!flags) {
            return std::unexpected(flags.error());
        }
        auto min = reader.leb_u(64);
        if (!min) {
            return std::unexpected(min.error());
        }
        if ((*flags & 0x01) != 0) {
            auto max = reader.leb_u(64);
            if (!max) {
                return std::unexpected(max.error());
            }
        }
        return {};
    }

    [[nodiscard]] VoidResult decode_functions(const Section& section)
    {
        Reader reader(m_bytes, section.begin, section.end, m_context.file);
        auto count = reader.leb_u();
        if (!count) {
            return std::unexpected(count.error());
        }
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto type = reader.leb_u();
            if (!type) {
                return std::unexpected(type.error());
            }
        }
        m_defined_count = *count;
        return {};
    }

    [[nodiscard]] VoidResult decode_exports(const Section& section)
    {
        Reader reader(m_bytes, section.begin, section.end, m_context.file);
        auto count = reader.leb_u();
        if (!count) {
            return std::unexpected(count.error());
        }
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto name = reader.name();
            if (!name) {
                return std::unexpected(name.error());
            }
            auto kind = reader.byte();
            if (!kind) {
                return std::unexpected(kind.error());
            }
            auto index = reader.leb_u();
            if (!index) {
                return std::unexpected(index.error());
            }
            if (*kind == 0x00) {
                m_exports.emplace(*index, std::move(*name));
            }
        }
        return {};
    }

    [[nodiscard]] VoidResult decode_code(const Section& section)
    {
        Reader reader(m_bytes, section.begin, section.end, m_context.file);
        auto count = reader.leb_u();
        if (!count) {
            return std::unexpected(count.error());
        }
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto size = reader.leb_u();
            if (!size) {
                return std::unexpected(size.error());
            }
            const std::size_t begin = reader.pos();
            if (auto skipped = reader.skip(*size); !skipped) {
                return std::unexpected(skipped.error());
            }
            m_bodies.push_back(BodyRange{.begin = begin, .end = reader.pos()});
        }
        return {};
    }

    /// Function names from the "name" section; a malformed one is ignored.
    void decode_custom(const Section& section)
    {
        Reader reader(m_bytes, section.begin, section.end, m_context.file);
        auto name = reader.name();
        if (!name || *name != "name") {
            return;
        }
        while (!reader.at_end()) {
            auto id = reader.byte();
            auto size = id ? reader.leb_u() : Result<std::uint64_t>(std::unexpected(id.error()));
            if (!size) {
                return;
            }
            const std::size_t begin = reader.pos();
            // Subsection sizes come from the input; bound them by the section.
            if (*size > reader.remaining()) {
                return;
            }
            if (*id != 1) {
                if (!reader.skip(*size)) {
                    return;
                }
                continue;
            }
            Reader names(m_bytes, begin, begin + *size, m_context.file);
            auto count = names.leb_u();
            for (std::uint64_t i = 0; count && i < *count; ++i) {
                auto index = names.leb_u();
                auto function_name = index ? names.name() : Result<std::string>(std::unexpected(index.error()));
                if (!function_name) {
                    return;
                }
                m_names[*index] = std::move(*function_name);
            }
            if (!reader.skip(*size)) {
                return;
            }
        }
    }

    [[nodiscard]] Result<ir::ContractModel> build()
    {
        ir::ContractModel model;
        model.name = m_context.contract_name;

        const std::size_t total = m_imports.size() + m_defined_count;
        std::vector<std::string> function_names(total);
        for (std::size_t index = 0; index < total; ++index) {
            if (auto it = m_names.find(index); it != m_names.end()) {
                function_names[index] = it->second;
            } else if (auto exported = m_exports.find(index); exported != m_exports.end()) {
                function_names[index] = exported->second;
            } else if (index < m_imports.size()) {
                function_names[index] = m_imports[index].field;
            } else {
                function_names[index] = std::format("func_{}", index);
            }
        }

        if (m_bodies.size() != m_defined_count) {
            model.diagnostics.push_back(
                ir::Diagnostic{.code = std::string(error_code::kParseError),
                               .message = std::format("function section declares {} functions, code section has {}",
                                                      m_defined_count, m_bodies.size()),
                               .location = SourceLocation{.file = m_context.file, .line = 0, .col = 0}});
        }

        const std::size_t decodable = std::min<std::size_t>(m_bodies.size(), m_defined_count);
        for (std::size_t i = 0; i < decodable; ++i) {
            const std::size_t index = m_imports.size() + i;
            const BodyRange& body = m_bodies[i];
            ir::Function function;
            function.name = function_names[index];
            function.location = SourceLocation{.file = m_context.file, .line = 0, .col = static_cast<int>(body.begin)};
            function.visibility = m_exports.contains(index) ? ir::Visibility::kPublic : ir::Visibility::kPrivate;
            function.mutability = ir::Mutability::kNone;

            Reader reader(m_bytes, body.begin, body.end, m_context.file);
            BodyDecoder decoder(reader, function, m_imports, function_names, m_context.file);
            if (auto decoded = decoder.decode(); !decoded) {
                model.diagnostics.push_back(ir::Diagnostic{
                    .code = decoded.error().code,
                    .message = std::format("skipped function '{}': {}", function.name, decoded.error().message),
                    .location = decoded.error().location});
                continue;
            }
            model.functions.push_back(std::move(function));
        }
        return model;
    }

    std::string_view m_bytes;
    const ParseContext& m_context;
    std::vector<Section> m_sections;
    std::vector<Import> m_imports;
    std::uint64_t m_defined_count = 0;
    std::map<std::uint64_t, std::string> m_exports;
    std::map<std::uint64_t, std::string> m_names;
    std::vector<BodyRange> m_bodies;
};

}  // namespace

Result<ir::ContractModel> decode_wasm(std::string_view bytes, const ParseContext& context)
{
    return ModuleDecoder(bytes, context).run();
}

}  // namespace stylint::frontend
