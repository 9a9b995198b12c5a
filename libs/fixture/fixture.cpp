/**
 * @file fixture.cpp
 * @brief JSON fixture loading and snapshot export
 */

#include "stackless/fixture.hpp"

#include "stackless/annotations.hpp"
#include "stackless/bytecode.hpp"
#include "stackless/env.hpp"
#include "stackless/function_target.hpp"
#include "stackless/function_targets_holder.hpp"
#include "stackless/spec.hpp"
#include "stackless/type.hpp"
#include "stackless/version.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stackless {

namespace {

using nlohmann::json;

[[nodiscard]] std::unexpected<Error> invalid(std::string message)
{
    return std::unexpected(Error::make("InvalidFixture", std::move(message)));
}

/// Reads a non-negative integer that fits in T. Anything else is rejected.
template <typename T>
[[nodiscard]] Result<T> read_unsigned(const json& j, std::string_view what)
{
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    if (j.is_number_unsigned() && j.get<std::uint64_t>() <= kMax) {
        return static_cast<T>(j.get<std::uint64_t>());
    }
    if (j.is_number_integer() && j.get<std::int64_t>() >= 0
        && static_cast<std::uint64_t>(j.get<std::int64_t>()) <= kMax)
    {
        return static_cast<T>(j.get<std::int64_t>());
    }
    return invalid(std::format("{} must be an integer in [0, {}], got {}", what, kMax, j.dump()));
}

[[nodiscard]] Result<const json*> require_array(const json& j, std::string_view what)
{
    if (!j.is_array()) {
        return invalid(std::format("{} must be an array", what));
    }
    return &j;
}

// ============================================================================
// Names
// ============================================================================

struct QualifiedName
{
    std::string module;
    std::string member;
};

[[nodiscard]] Result<QualifiedName> split_qualified(std::string_view text)
{
    const auto pos = text.find("::");
    if (pos == std::string_view::npos || pos == 0 || pos + 2 >= text.size()) {
        return invalid(std::format("Expected a qualified name M::x, got '{}'", text));
    }
    return QualifiedName{.module = std::string(text.substr(0, pos)),
                         .member = std::string(text.substr(pos + 2))};
}

[[nodiscard]] Result<const ModuleEnv*> resolve_module(const GlobalEnv& env, std::string_view name)
{
    const ModuleEnv* mod = env.find_module(name);
    if (mod == nullptr) {
        return invalid(std::format("Unknown module '{}'", name));
    }
    return mod;
}

[[nodiscard]] Result<QualifiedId<StructId>> resolve_struct(const GlobalEnv& env,
                                                           std::string_view text)
{
    auto name = split_qualified(text);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto mod = resolve_module(env, name->module);
    if (!mod) {
        return std::unexpected(mod.error());
    }
    std::optional<StructId> id;
    if (auto symbol = env.symbol_pool().find(name->member)) {
        id = (*mod)->find_struct(*symbol);
    }
    if (!id) {
        return invalid(std::format("Unknown struct '{}'", text));
    }
    return QualifiedId<StructId>{.module_id = (*mod)->id(), .id = *id};
}

[[nodiscard]] Result<QualifiedId<FunId>> resolve_function(const GlobalEnv& env,
                                                          std::string_view text)
{
    auto name = split_qualified(text);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto mod = resolve_module(env, name->module);
    if (!mod) {
        return std::unexpected(mod.error());
    }
    const FunctionEnv* func_env = (*mod)->find_function(name->member);
    if (func_env == nullptr) {
        return invalid(std::format("Unknown function '{}'", text));
    }
    return func_env->qualified_id();
}

// ============================================================================
// Types, conditions, declarations
// ============================================================================

constexpr std::array kPrimitives{
    PrimitiveType::kBool,
    PrimitiveType::kU8,
    PrimitiveType::kU64,
    PrimitiveType::kU128,
    PrimitiveType::kAddress,
    PrimitiveType::kSigner,
    PrimitiveType::kNum,
    PrimitiveType::kRange,
};

constexpr std::array kConditionKinds{
    ConditionKind::kRequires,
    ConditionKind::kEnsures,
    ConditionKind::kAbortsIf,
    ConditionKind::kModifies,
    ConditionKind::kAssert,
    ConditionKind::kAssume,
    ConditionKind::kInvariant,
};

[[nodiscard]] Result<Type> parse_type(const json& j, const GlobalEnv& env);

[[nodiscard]] Result<std::vector<Type>> parse_types(const json& j, const GlobalEnv& env)
{
    if (auto checked = require_array(j, "Type list"); !checked) {
        return std::unexpected(checked.error());
    }
    std::vector<Type> types;
    types.reserve(j.size());
    for (const auto& item : j) {
        auto type = parse_type(item, env);
        if (!type) {
            return std::unexpected(type.error());
        }
        types.push_back(std::move(*type));
    }
    return types;
}

Result<Type> parse_type(const json& j, const GlobalEnv& env)
{
    if (j.is_string()) {
        const auto& name = j.get_ref<const std::string&>();
        for (auto prim : kPrimitives) {
            if (primitive_name(prim) == name) {
                return Type::primitive(prim);
            }
        }
        return invalid(std::format("Unknown primitive type '{}'", name));
    }
    if (!j.is_object()) {
        return invalid(std::format("Malformed type {}", j.dump()));
    }
    if (j.contains("vector")) {
        auto element = parse_type(j.at("vector"), env);
        if (!element) {
            return std::unexpected(element.error());
        }
        return Type::vector(std::move(*element));
    }
    if (j.contains("ref") || j.contains("mut_ref")) {
        const bool is_mut = j.contains("mut_ref");
        auto target = parse_type(j.at(is_mut ? "mut_ref" : "ref"), env);
        if (!target) {
            return std::unexpected(target.error());
        }
        return Type::reference(is_mut, std::move(*target));
    }
    if (j.contains("param")) {
        auto index = read_unsigned<std::uint16_t>(j.at("param"), "Type parameter index");
        if (!index) {
            return std::unexpected(index.error());
        }
        return Type::type_parameter(*index);
    }
    if (j.contains("struct")) {
        auto id = resolve_struct(env, j.at("struct").get<std::string>());
        if (!id) {
            return std::unexpected(id.error());
        }
        auto args = parse_types(j.value("args", json::array()), env);
        if (!args) {
            return std::unexpected(args.error());
        }
        return Type::structure(*id, std::move(*args));
    }
    if (j.contains("tuple")) {
        auto members = parse_types(j.at("tuple"), env);
        if (!members) {
            return std::unexpected(members.error());
        }
        return Type::tuple(std::move(*members));
    }
    return invalid(std::format("Malformed type {}", j.dump()));
}

[[nodiscard]] Loc parse_loc(const json& j)
{
    return Loc{.file = j.value("file", std::string{}),
               .line = j.value("line", 0),
               .col = j.value("col", 0)};
}

[[nodiscard]] Result<Condition> parse_condition(const json& j)
{
    const auto kind_name = j.at("kind").get<std::string>();
    for (auto kind : kConditionKinds) {
        if (condition_kind_name(kind) == kind_name) {
            return Condition{.kind = kind,
                             .loc = j.contains("loc") ? parse_loc(j.at("loc")) : Loc{},
                             .expression = j.at("expr").get<std::string>()};
        }
    }
    return invalid(std::format("Unknown condition kind '{}'", kind_name));
}

[[nodiscard]] Result<std::vector<Condition>> parse_conditions(const json& j)
{
    if (auto checked = require_array(j, "Condition list"); !checked) {
        return std::unexpected(checked.error());
    }
    std::vector<Condition> conditions;
    for (const auto& item : j) {
        auto condition = parse_condition(item);
        if (!condition) {
            return std::unexpected(condition.error());
        }
        conditions.push_back(std::move(*condition));
    }
    return conditions;
}

[[nodiscard]] Result<Spec> parse_spec(const json& j)
{
    Spec spec;
    auto conditions = parse_conditions(j.value("conditions", json::array()));
    if (!conditions) {
        return std::unexpected(conditions.error());
    }
    spec.conditions = std::move(*conditions);
    for (const auto& block : j.value("on_impl", json::array())) {
        auto block_conditions = parse_conditions(block.at("conditions"));
        if (!block_conditions) {
            return std::unexpected(block_conditions.error());
        }
        auto offset = read_unsigned<CodeOffset>(block.at("offset"), "Spec block offset");
        if (!offset) {
            return std::unexpected(offset.error());
        }
        if (!spec.on_impl.emplace(*offset, SpecBlock{std::move(*block_conditions)}).second) {
            return invalid(std::format("Duplicate spec block at code offset {}", *offset));
        }
    }
    return spec;
}

[[nodiscard]] Result<PragmaMap> parse_pragmas(const json& j)
{
    if (!j.is_object()) {
        return invalid("Pragmas must be an object");
    }
    PragmaMap pragmas;
    for (const auto& item : j.items()) {
        pragmas.emplace(item.key(), item.value().get<bool>());
    }
    return pragmas;
}

[[nodiscard]] Result<std::vector<LocalDecl>> parse_local_decls(const json& j, GlobalEnv& env)
{
    if (auto checked = require_array(j, "Local list"); !checked) {
        return std::unexpected(checked.error());
    }
    std::vector<LocalDecl> decls;
    for (const auto& item : j) {
        auto type = parse_type(item.at("type"), env);
        if (!type) {
            return std::unexpected(type.error());
        }
        decls.push_back(LocalDecl{.name = env.symbol_pool().make(item.at("name").get<std::string>()),
                                  .type = std::move(*type)});
    }
    return decls;
}

[[nodiscard]] Result<FunctionDecl> parse_function_decl(const json& j, GlobalEnv& env)
{
    FunctionDecl decl;
    decl.name = env.symbol_pool().make(j.at("name").get<std::string>());
    decl.loc = j.contains("loc") ? parse_loc(j.at("loc")) : Loc{};
    decl.is_native = j.value("native", false);
    decl.is_public = j.value("public", false);
    for (const auto& param : j.value("type_params", json::array())) {
        decl.type_params.push_back(TypeParameter{env.symbol_pool().make(param.get<std::string>())});
    }

    auto params = parse_local_decls(j.value("params", json::array()), env);
    if (!params) {
        return std::unexpected(params.error());
    }
    decl.params = std::move(*params);

    auto locals = parse_local_decls(j.value("locals", json::array()), env);
    if (!locals) {
        return std::unexpected(locals.error());
    }
    decl.locals = std::move(*locals);

    auto returns = parse_types(j.value("returns", json::array()), env);
    if (!returns) {
        return std::unexpected(returns.error());
    }
    decl.return_types = std::move(*returns);

    for (const auto& resource : j.value("acquires", json::array())) {
        auto id = resolve_struct(env, resource.get<std::string>());
        if (!id) {
            return std::unexpected(id.error());
        }
        decl.acquires.push_back(*id);
    }

    auto spec = parse_spec(j.value("spec", json::object()));
    if (!spec) {
        return std::unexpected(spec.error());
    }
    decl.spec = std::move(*spec);

    auto pragmas = parse_pragmas(j.value("pragmas", json::object()));
    if (!pragmas) {
        return std::unexpected(pragmas.error());
    }
    decl.pragmas = std::move(*pragmas);
    return decl;
}

[[nodiscard]] Result<std::unique_ptr<GlobalEnv>> build_environment(const json& fixture)
{
    if (fixture.value("schema_version", std::string{}) != kFixtureSchemaVersion) {
        return invalid(std::format("Unsupported fixture schema version, expected {}",
                                   kFixtureSchemaVersion));
    }
    const auto& modules = fixture.at("modules");
    if (auto checked = require_array(modules, "modules"); !checked) {
        return std::unexpected(checked.error());
    }

    auto env = std::make_unique<GlobalEnv>();

    // Structs of every module first, so signatures may refer to any of them.
    std::vector<ModuleEnv*> module_envs;
    for (const auto& module_json : modules) {
        const auto name = module_json.at("name").get<std::string>();
        if (env->find_module(name) != nullptr) {
            return invalid(std::format("Duplicate module '{}'", name));
        }
        auto pragmas = parse_pragmas(module_json.value("pragmas", json::object()));
        if (!pragmas) {
            return std::unexpected(pragmas.error());
        }
        ModuleEnv& mod = env->add_module(env->symbol_pool().make(name), std::move(*pragmas));
        for (const auto& struct_json : module_json.value("structs", json::array())) {
            const Symbol struct_name = env->symbol_pool().make(struct_json.get<std::string>());
            if (mod.find_struct(struct_name)) {
                return invalid(std::format("Duplicate struct '{}::{}'",
                                           name,
                                           env->symbol_pool().string(struct_name)));
            }
            (void)mod.add_struct(struct_name);
        }
        module_envs.push_back(&mod);
    }

    for (std::size_t i = 0; i < module_envs.size(); ++i) {
        ModuleEnv* mod = module_envs[i];
        const auto& module_json = modules.at(i);
        for (const auto& function_json : module_json.value("functions", json::array())) {
            const auto name = function_json.at("name").get<std::string>();
            if (mod->find_function(name) != nullptr) {
                return invalid(std::format("Duplicate function '{}::{}'",
                                           module_json.at("name").get<std::string>(),
                                           name));
            }
            auto decl = parse_function_decl(function_json, *env);
            if (!decl) {
                return std::unexpected(decl.error());
            }
            if (auto id = mod->add_function(std::move(*decl)); !id) {
                return std::unexpected(id.error());
            }
        }
    }
    return env;
}

// ============================================================================
// Code
// ============================================================================

/// Resolves temp references, by index or by name, against a fixed local count.
class TempResolver
{
public:
    TempResolver(const FunctionEnv& func_env, std::size_t local_count)
        : m_func_env(func_env)
        , m_local_count(local_count)
    {}

    [[nodiscard]] Result<TempIndex> operator()(const json& j) const
    {
        if (j.is_number()) {
            auto idx = read_unsigned<TempIndex>(j, "Local index");
            if (!idx) {
                return std::unexpected(idx.error());
            }
            if (*idx >= m_local_count) {
                return invalid(
                    std::format("Local index {} out of range (local count {})", *idx, m_local_count));
            }
            return *idx;
        }
        if (j.is_string()) {
            const auto& name = j.get_ref<const std::string&>();
            for (TempIndex idx = 0; idx < m_local_count; ++idx) {
                if (m_func_env.local_name(idx) == name) {
                    return idx;
                }
            }
            return invalid(std::format("Unknown local '{}'", name));
        }
        return invalid(std::format("Malformed local reference {}", j.dump()));
    }

    [[nodiscard]] Result<std::vector<TempIndex>> list(const json& j) const
    {
        if (auto checked = require_array(j, "Local list"); !checked) {
            return std::unexpected(checked.error());
        }
        std::vector<TempIndex> temps;
        for (const auto& item : j) {
            auto idx = (*this)(item);
            if (!idx) {
                return std::unexpected(idx.error());
            }
            temps.push_back(*idx);
        }
        return temps;
    }

    [[nodiscard]] Result<std::set<TempIndex>> set(const json& j) const
    {
        auto temps = list(j);
        if (!temps) {
            return std::unexpected(temps.error());
        }
        return std::set<TempIndex>(temps->begin(), temps->end());
    }

private:
    const FunctionEnv& m_func_env;
    std::size_t m_local_count;
};

[[nodiscard]] Result<Operation::Kind> parse_operation_kind(std::string_view name)
{
    for (auto raw = static_cast<int>(Operation::Kind::kFunction);
         raw <= static_cast<int>(Operation::Kind::kNeq);
         ++raw) {
        const auto kind = static_cast<Operation::Kind>(raw);
        if (operation_kind_name(kind) == name) {
            return kind;
        }
    }
    return invalid(std::format("Unknown operation '{}'", name));
}

[[nodiscard]] Result<BorrowNode> parse_borrow_node(const json& j,
                                                   const GlobalEnv& env,
                                                   const TempResolver& resolve)
{
    if (j.contains("global_root")) {
        auto resource = resolve_struct(env, j.at("global_root").get<std::string>());
        if (!resource) {
            return std::unexpected(resource.error());
        }
        return BorrowNode{.kind = BorrowNode::Kind::kGlobalRoot, .temp = 0, .resource = *resource};
    }
    const bool is_root = j.contains("local_root");
    if (!is_root && !j.contains("reference")) {
        return invalid(std::format("Malformed borrow node {}", j.dump()));
    }
    auto temp = resolve(j.at(is_root ? "local_root" : "reference"));
    if (!temp) {
        return std::unexpected(temp.error());
    }
    return BorrowNode{.kind = is_root ? BorrowNode::Kind::kLocalRoot : BorrowNode::Kind::kReference,
                      .temp = *temp,
                      .resource = {}};
}

[[nodiscard]] Result<Operation> parse_operation(const json& j,
                                                const GlobalEnv& env,
                                                const TempResolver& resolve)
{
    Operation op;
    if (j.is_string()) {
        auto kind = parse_operation_kind(j.get_ref<const std::string&>());
        if (!kind) {
            return std::unexpected(kind.error());
        }
        op.kind = *kind;
        return op;
    }

    auto kind = parse_operation_kind(j.at("kind").get<std::string>());
    if (!kind) {
        return std::unexpected(kind.error());
    }
    op.kind = *kind;
    if (j.contains("function")) {
        auto fun = resolve_function(env, j.at("function").get<std::string>());
        if (!fun) {
            return std::unexpected(fun.error());
        }
        op.function = *fun;
    }
    if (j.contains("struct")) {
        auto id = resolve_struct(env, j.at("struct").get<std::string>());
        if (!id) {
            return std::unexpected(id.error());
        }
        op.struct_id = *id;
    }
    if (j.contains("field")) {
        auto field = read_unsigned<std::size_t>(j.at("field"), "Field offset");
        if (!field) {
            return std::unexpected(field.error());
        }
        op.field_offset = *field;
    }
    auto types = parse_types(j.value("types", json::array()), env);
    if (!types) {
        return std::unexpected(types.error());
    }
    op.type_actuals = std::move(*types);
    if (j.contains("node")) {
        auto node = parse_borrow_node(j.at("node"), env, resolve);
        if (!node) {
            return std::unexpected(node.error());
        }
        op.node = *node;
    }
    for (const auto& entry : j.value("splice", json::array())) {
        auto temp = resolve(entry.at("temp"));
        if (!temp) {
            return std::unexpected(temp.error());
        }
        auto field = read_unsigned<std::size_t>(entry.at("field"), "Splice field offset");
        if (!field) {
            return std::unexpected(field.error());
        }
        op.splice.insert_or_assign(*field, *temp);
    }
    return op;
}

[[nodiscard]] Result<Constant> parse_constant(const json& j)
{
    static constexpr std::array<std::pair<std::string_view, Constant::Kind>, 6> kKinds{{
        {"bool", Constant::Kind::kBool},
        {"u8", Constant::Kind::kU8},
        {"u64", Constant::Kind::kU64},
        {"u128", Constant::Kind::kU128},
        {"address", Constant::Kind::kAddress},
        {"bytearray", Constant::Kind::kByteArray},
    }};
    const auto type_name = j.at("type").get<std::string>();
    const auto match =
        std::ranges::find(kKinds, type_name, &std::pair<std::string_view, Constant::Kind>::first);
    if (match == kKinds.end()) {
        return invalid(std::format("Unknown constant type '{}'", type_name));
    }
    const auto& value = j.at("value");
    std::string literal;
    if (value.is_string()) {
        literal = value.get<std::string>();
    } else if (value.is_boolean()) {
        literal = value.get<bool>() ? "true" : "false";
    } else if (value.is_number_integer()) {
        literal = value.dump();
    } else {
        return invalid(std::format("Malformed constant value {}", value.dump()));
    }
    return Constant{.kind = match->second, .literal = std::move(literal)};
}

[[nodiscard]] Result<Bytecode> parse_instruction(const json& j,
                                                 std::size_t offset,
                                                 const GlobalEnv& env,
                                                 const TempResolver& resolve)
{
    AttrId attr{offset};
    if (j.contains("attr")) {
        auto value = read_unsigned<std::size_t>(j.at("attr"), "Instruction attribute");
        if (!value) {
            return std::unexpected(value.error());
        }
        attr.value = *value;
    }
    const auto op = j.at("op").get<std::string>();

    if (op == "assign") {
        auto dst = resolve(j.at("dst"));
        auto src = resolve(j.at("src"));
        if (!dst || !src) {
            return std::unexpected(!dst ? dst.error() : src.error());
        }
        const auto kind_name = j.value("kind", std::string{"copy"});
        AssignKind kind = AssignKind::kCopy;
        if (kind_name == "move") {
            kind = AssignKind::kMove;
        } else if (kind_name == "store") {
            kind = AssignKind::kStore;
        } else if (kind_name != "copy") {
            return invalid(std::format("Unknown assign kind '{}'", kind_name));
        }
        return bc::Assign{.attr = attr, .dst = *dst, .src = *src, .kind = kind};
    }
    if (op == "call") {
        auto dsts = resolve.list(j.value("dsts", json::array()));
        if (!dsts) {
            return std::unexpected(dsts.error());
        }
        auto srcs = resolve.list(j.value("srcs", json::array()));
        if (!srcs) {
            return std::unexpected(srcs.error());
        }
        auto operation = parse_operation(j.at("operation"), env, resolve);
        if (!operation) {
            return std::unexpected(operation.error());
        }
        return bc::Call{.attr = attr,
                        .dsts = std::move(*dsts),
                        .op = std::move(*operation),
                        .srcs = std::move(*srcs)};
    }
    if (op == "ret") {
        auto srcs = resolve.list(j.value("srcs", json::array()));
        if (!srcs) {
            return std::unexpected(srcs.error());
        }
        return bc::Ret{.attr = attr, .srcs = std::move(*srcs)};
    }
    if (op == "load") {
        auto dst = resolve(j.at("dst"));
        if (!dst) {
            return std::unexpected(dst.error());
        }
        auto value = parse_constant(j);
        if (!value) {
            return std::unexpected(value.error());
        }
        return bc::Load{.attr = attr, .dst = *dst, .value = std::move(*value)};
    }
    if (op == "branch") {
        auto cond = resolve(j.at("cond"));
        if (!cond) {
            return std::unexpected(cond.error());
        }
        auto then_label = read_unsigned<std::size_t>(j.at("then"), "Branch label");
        auto else_label = read_unsigned<std::size_t>(j.at("else"), "Branch label");
        if (!then_label || !else_label) {
            return std::unexpected(!then_label ? then_label.error() : else_label.error());
        }
        return bc::Branch{.attr = attr,
                          .then_label = Label{*then_label},
                          .else_label = Label{*else_label},
                          .cond = *cond};
    }
    if (op == "jump" || op == "label") {
        auto label = read_unsigned<std::size_t>(j.at("label"), "Label");
        if (!label) {
            return std::unexpected(label.error());
        }
        if (op == "jump") {
            return bc::Jump{.attr = attr, .label = Label{*label}};
        }
        return bc::LabelDef{.attr = attr, .label = Label{*label}};
    }
    if (op == "abort") {
        auto src = resolve(j.at("src"));
        if (!src) {
            return std::unexpected(src.error());
        }
        return bc::Abort{.attr = attr, .src = *src};
    }
    if (op == "nop") {
        return bc::Nop{.attr = attr};
    }
    if (op == "spec_block") {
        auto block = read_unsigned<std::size_t>(j.at("block"), "Spec block id");
        if (!block) {
            return std::unexpected(block.error());
        }
        return bc::SpecBlockRef{.attr = attr, .block = SpecBlockId{*block}};
    }
    return invalid(std::format("Unknown instruction '{}' at offset {}", op, offset));
}

[[nodiscard]] Result<std::vector<Bytecode>> parse_code(const json& j,
                                                       const GlobalEnv& env,
                                                       const TempResolver& resolve)
{
    if (auto checked = require_array(j, "code"); !checked) {
        return std::unexpected(checked.error());
    }
    std::vector<Bytecode> code;
    code.reserve(j.size());
    for (std::size_t offset = 0; offset < j.size(); ++offset) {
        auto inst = parse_instruction(j.at(offset), offset, env, resolve);
        if (!inst) {
            return std::unexpected(inst.error());
        }
        code.push_back(std::move(*inst));
    }
    return code;
}

// ============================================================================
// Annotations
// ============================================================================

[[nodiscard]] Result<BorrowInfo> parse_borrow_info(const json& j,
                                                   const GlobalEnv& env,
                                                   const TempResolver& resolve)
{
    BorrowInfo info;
    auto refs = resolve.set(j.value("live_refs", json::array()));
    if (!refs) {
        return std::unexpected(refs.error());
    }
    info.live_refs = std::move(*refs);
    for (const auto& edge : j.value("borrowed_by", json::array())) {
        auto parent = parse_borrow_node(edge.at("parent"), env, resolve);
        if (!parent) {
            return std::unexpected(parent.error());
        }
        auto& children = info.borrowed_by[*parent];
        for (const auto& child_json : edge.at("children")) {
            auto child = parse_borrow_node(child_json, env, resolve);
            if (!child) {
                return std::unexpected(child.error());
            }
            children.insert(*child);
        }
    }
    return info;
}

[[nodiscard]] Result<Definition> parse_definition(const json& j, const TempResolver& resolve)
{
    if (j.contains("const")) {
        auto value = parse_constant(j.at("const"));
        if (!value) {
            return std::unexpected(value.error());
        }
        return Definition{.kind = Definition::Kind::kConst, .alias = 0, .value = std::move(*value)};
    }
    auto alias = resolve(j.at("alias"));
    if (!alias) {
        return std::unexpected(alias.error());
    }
    return Definition{.kind = Definition::Kind::kAlias, .alias = *alias, .value = {}};
}

[[nodiscard]] VoidResult parse_annotation(std::string_view kind,
                                          const json& entries,
                                          const GlobalEnv& env,
                                          const TempResolver& resolve,
                                          Annotations& out)
{
    if (auto checked = require_array(entries, kind); !checked) {
        return std::unexpected(checked.error());
    }

    if (kind == analysis_kind_name(AnalysisKind::kLiveVar)) {
        LiveVarAnnotation annotation;
        for (const auto& entry : entries) {
            auto before = resolve.set(entry.value("before", json::array()));
            auto after = resolve.set(entry.value("after", json::array()));
            if (!before || !after) {
                return std::unexpected(!before ? before.error() : after.error());
            }
            auto offset = read_unsigned<CodeOffset>(entry.at("offset"), "Annotation offset");
            if (!offset) {
                return std::unexpected(offset.error());
            }
            annotation.at.insert_or_assign(
                *offset,
                LiveVarInfo{.before = std::move(*before), .after = std::move(*after)});
        }
        out.set(std::move(annotation));
        return {};
    }
    if (kind == analysis_kind_name(AnalysisKind::kBorrow)) {
        BorrowAnnotation annotation;
        for (const auto& entry : entries) {
            auto before = parse_borrow_info(entry.value("before", json::object()), env, resolve);
            auto after = parse_borrow_info(entry.value("after", json::object()), env, resolve);
            if (!before || !after) {
                return std::unexpected(!before ? before.error() : after.error());
            }
            auto offset = read_unsigned<CodeOffset>(entry.at("offset"), "Annotation offset");
            if (!offset) {
                return std::unexpected(offset.error());
            }
            annotation.at.insert_or_assign(
                *offset,
                BorrowInfoAtOffset{.before = std::move(*before), .after = std::move(*after)});
        }
        out.set(std::move(annotation));
        return {};
    }
    if (kind == analysis_kind_name(AnalysisKind::kLifetime)) {
        LifetimeAnnotation annotation;
        for (const auto& entry : entries) {
            auto temp = resolve(entry.at("temp"));
            if (!temp) {
                return std::unexpected(temp.error());
            }
            auto begin = read_unsigned<CodeOffset>(entry.at("begin"), "Lifetime begin");
            auto end = read_unsigned<CodeOffset>(entry.at("end"), "Lifetime end");
            if (!begin || !end) {
                return std::unexpected(!begin ? begin.error() : end.error());
            }
            annotation.intervals.insert_or_assign(*temp, LifetimeInterval{.begin = *begin, .end = *end});
        }
        out.set(std::move(annotation));
        return {};
    }
    if (kind == analysis_kind_name(AnalysisKind::kPackRef)) {
        PackRefAnnotation annotation;
        for (const auto& entry : entries) {
            auto unpack = resolve.set(entry.value("unpack_before", json::array()));
            auto pack = resolve.set(entry.value("pack_after", json::array()));
            if (!unpack || !pack) {
                return std::unexpected(!unpack ? unpack.error() : pack.error());
            }
            auto offset = read_unsigned<CodeOffset>(entry.at("offset"), "Annotation offset");
            if (!offset) {
                return std::unexpected(offset.error());
            }
            annotation.at.insert_or_assign(
                *offset,
                PackRefInfo{.unpack_before = std::move(*unpack), .pack_after = std::move(*pack)});
        }
        out.set(std::move(annotation));
        return {};
    }
    if (kind == analysis_kind_name(AnalysisKind::kReachingDef)) {
        ReachingDefAnnotation annotation;
        for (const auto& entry : entries) {
            auto temp = resolve(entry.at("temp"));
            if (!temp) {
                return std::unexpected(temp.error());
            }
            auto offset = read_unsigned<CodeOffset>(entry.at("offset"), "Annotation offset");
            if (!offset) {
                return std::unexpected(offset.error());
            }
            auto& defs = annotation.at[*offset][*temp];
            for (const auto& def_json : entry.at("defs")) {
                auto def = parse_definition(def_json, resolve);
                if (!def) {
                    return std::unexpected(def.error());
                }
                defs.insert(std::move(*def));
            }
        }
        out.set(std::move(annotation));
        return {};
    }
    if (kind == analysis_kind_name(AnalysisKind::kWriteBack)) {
        WriteBackAnnotation annotation;
        for (const auto& entry : entries) {
            auto offset = read_unsigned<CodeOffset>(entry.at("offset"), "Annotation offset");
            if (!offset) {
                return std::unexpected(offset.error());
            }
            auto& obligations = annotation.at[*offset];
            for (const auto& obligation_json : entry.at("obligations")) {
                auto node = parse_borrow_node(obligation_json.at("target"), env, resolve);
                if (!node) {
                    return std::unexpected(node.error());
                }
                auto reference = resolve(obligation_json.at("reference"));
                if (!reference) {
                    return std::unexpected(reference.error());
                }
                obligations.push_back(WriteBackObligation{.target = *node, .reference = *reference});
            }
        }
        out.set(std::move(annotation));
        return {};
    }
    return invalid(std::format("Unknown annotation kind '{}'", kind));
}

// ============================================================================
// Derived state
// ============================================================================

struct GeneratedBlock
{
    std::optional<SpecBlockId> id;
    SpecBlock block;
};

/// State a fixture attaches on top of the initial snapshot.
struct DerivedState
{
    std::vector<Type> temps;
    std::vector<std::pair<TempIndex, std::size_t>> ref_params;
    std::vector<GeneratedBlock> generated_spec_blocks;
    Annotations annotations;

    [[nodiscard]] bool empty() const noexcept
    {
        return temps.empty() && ref_params.empty() && generated_spec_blocks.empty()
               && annotations.empty();
    }
};

/// Installs fixture-provided state as the successor of the initial snapshot.
class FixtureProcessor final : public FunctionTargetProcessor
{
public:
    explicit FixtureProcessor(DerivedState state)
        : m_state(std::move(state))
    {}

    [[nodiscard]] std::string_view name() const override { return "fixture"; }

    [[nodiscard]] Result<std::shared_ptr<const FunctionTargetData>>
    process(const FunctionTarget& target) override
    {
        auto builder = target.data().rewrite();
        for (auto& type : m_state.temps) {
            builder.add_local(std::move(type));
        }
        for (const auto& [param, ret] : m_state.ref_params) {
            if (auto added = builder.add_ref_param(param, ret); !added) {
                return std::unexpected(added.error());
            }
        }
        for (auto& generated : m_state.generated_spec_blocks) {
            if (!generated.id) {
                builder.add_generated_spec_block(std::move(generated.block));
                continue;
            }
            if (auto added = builder.set_generated_spec_block(*generated.id, std::move(generated.block));
                !added)
            {
                return std::unexpected(added.error());
            }
        }
        builder.annotations() = std::move(m_state.annotations);
        return std::move(builder).finish();
    }

private:
    DerivedState m_state;
};

[[nodiscard]] Result<DerivedState> parse_derived_state(const json& function_json,
                                                       const GlobalEnv& env,
                                                       const TempResolver& resolve,
                                                       std::vector<Type> temps)
{
    DerivedState state;
    state.temps = std::move(temps);
    for (const auto& entry : function_json.value("ref_params", json::array())) {
        auto param = resolve(entry.at("param"));
        if (!param) {
            return std::unexpected(param.error());
        }
        auto ret = read_unsigned<std::size_t>(entry.at("return"), "Ref-param return index");
        if (!ret) {
            return std::unexpected(ret.error());
        }
        state.ref_params.emplace_back(*param, *ret);
    }
    for (const auto& entry : function_json.value("generated_spec_blocks", json::array())) {
        auto conditions = parse_conditions(entry.at("conditions"));
        if (!conditions) {
            return std::unexpected(conditions.error());
        }
        GeneratedBlock generated{.id = std::nullopt, .block = SpecBlock{std::move(*conditions)}};
        if (entry.contains("id")) {
            auto id = read_unsigned<std::size_t>(entry.at("id"), "Spec block id");
            if (!id) {
                return std::unexpected(id.error());
            }
            generated.id = SpecBlockId{*id};
        }
        state.generated_spec_blocks.push_back(std::move(generated));
    }
    const auto annotations = function_json.value("annotations", json::object());
    for (const auto& item : annotations.items()) {
        if (auto parsed = parse_annotation(item.key(), item.value(), env, resolve, state.annotations);
            !parsed)
        {
            return std::unexpected(parsed.error());
        }
    }
    return state;
}

[[nodiscard]] VoidResult build_targets(const json& fixture,
                                       const GlobalEnv& env,
                                       FunctionTargetsHolder& holder)
{
    for (const auto& module_json : fixture.at("modules")) {
        auto mod = resolve_module(env, module_json.at("name").get<std::string>());
        if (!mod) {
            return std::unexpected(mod.error());
        }
        for (const auto& function_json : module_json.value("functions", json::array())) {
            if (!function_json.contains("code")) {
                continue;
            }
            const auto name = function_json.at("name").get<std::string>();
            const FunctionEnv* func_env = (*mod)->find_function(name);
            if (func_env == nullptr) {
                return invalid(std::format("Function '{}' is not part of the environment", name));
            }

            auto temps = parse_types(function_json.value("temps", json::array()), env);
            if (!temps) {
                return std::unexpected(temps.error());
            }
            const TempResolver resolve(*func_env, func_env->local_count() + temps->size());

            auto code = parse_code(function_json.at("code"), env, resolve);
            if (!code) {
                return std::unexpected(code.error());
            }
            std::map<AttrId, Loc> locations;
            for (const auto& entry : function_json.value("locations", json::array())) {
                auto attr = read_unsigned<std::size_t>(entry.at("attr"), "Location attribute");
                if (!attr) {
                    return std::unexpected(attr.error());
                }
                locations.insert_or_assign(AttrId{*attr}, parse_loc(entry.at("loc")));
            }
            std::map<SpecBlockId, CodeOffset> given;
            for (const auto& entry : function_json.value("given_spec_blocks", json::array())) {
                auto id = read_unsigned<std::size_t>(entry.at("id"), "Spec block id");
                auto offset = read_unsigned<CodeOffset>(entry.at("offset"), "Spec block offset");
                if (!id || !offset) {
                    return std::unexpected(!id ? id.error() : offset.error());
                }
                given.insert_or_assign(SpecBlockId{*id}, *offset);
            }
            auto state = parse_derived_state(function_json, env, resolve, std::move(*temps));
            if (!state) {
                return std::unexpected(state.error());
            }

            if (auto added = holder.add_target(
                    *func_env, std::move(*code), std::move(locations), std::move(given));
                !added)
            {
                return added;
            }
            if (state->empty()) {
                continue;
            }
            // The function is either fully loaded or absent.
            FixtureProcessor processor(std::move(*state));
            if (auto rewritten = holder.rewrite(func_env->qualified_id(), processor); !rewritten) {
                holder.remove(func_env->qualified_id());
                return rewritten;
            }
        }
    }
    return {};
}

}  // namespace

Result<nlohmann::json> read_fixture_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open fixture file: " + path.string()));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse fixture file " + path.string() + ": " + ex.what()));
    }
}

Result<std::unique_ptr<GlobalEnv>> load_environment(const nlohmann::json& fixture)
{
    try {
        return build_environment(fixture);
    } catch (const nlohmann::json::exception& ex) {
        return invalid(std::format("Malformed fixture: {}", ex.what()));
    }
}

VoidResult load_targets(const nlohmann::json& fixture,
                        const GlobalEnv& env,
                        FunctionTargetsHolder& holder)
{
    try {
        return build_targets(fixture, env, holder);
    } catch (const nlohmann::json::exception& ex) {
        return invalid(std::format("Malformed fixture: {}", ex.what()));
    }
}

Result<nlohmann::json> to_json(const FunctionTarget& target)
{
    const auto& pool = target.symbol_pool();
    const auto ctx = target.type_display_context();

    json out = json::object();
    out["schema_version"] = kDumpFormatVersion;
    out["function"] = std::format("{}::{}",
                                  pool.string(target.module_env().name()),
                                  pool.string(target.name()));
    out["generation"] = target.data().generation();
    out["public"] = target.is_public();
    out["native"] = target.is_native();

    json locals = json::array();
    for (TempIndex idx = 0; idx < target.local_count(); ++idx) {
        auto name = target.local_name(idx);
        if (!name) {
            return std::unexpected(name.error());
        }
        auto type = target.local_type(idx);
        if (!type) {
            return std::unexpected(type.error());
        }
        locals.push_back({
            {"index", idx},
            {"name", *name},
            {"type", display_type(type->get(), ctx)},
            {"parameter", idx < target.parameter_count()},
        });
    }
    out["locals"] = std::move(locals);

    json returns = json::array();
    for (const auto& type : target.return_types()) {
        returns.push_back(display_type(type, ctx));
    }
    out["returns"] = std::move(returns);

    const RefPredicate is_ref = [](const Type& type) { return type.is_reference(); };
    json code = json::array();
    for (const auto& inst : target.bytecode()) {
        auto text = inst.display(target, is_ref);
        if (!text) {
            return std::unexpected(text.error());
        }
        code.push_back(std::move(*text));
    }
    out["code"] = std::move(code);

    json ref_params = json::array();
    for (const auto& [param, ret] : target.data().ref_param_map()) {
        auto name = target.local_name(param);
        if (!name) {
            return std::unexpected(name.error());
        }
        ref_params.push_back({
            {"param", *name},
            {"return", ret},
        });
    }
    out["ref_params"] = std::move(ref_params);

    json given = json::array();
    for (const auto& [id, offset] : target.data().given_spec_blocks()) {
        given.push_back({
            {"id", id.value},
            {"offset", offset},
        });
    }
    out["given_spec_blocks"] = std::move(given);

    json generated = json::array();
    for (const auto& [id, block] : target.data().generated_spec_blocks()) {
        json conditions = json::array();
        for (const auto& condition : block.conditions) {
            conditions.push_back(display_condition(condition));
        }
        generated.push_back({
            {"id", id.value},
            {"conditions", std::move(conditions)},
        });
    }
    out["generated_spec_blocks"] = std::move(generated);

    json kinds = json::array();
    for (auto kind : target.annotations().kinds()) {
        kinds.push_back(analysis_kind_name(kind));
    }
    out["annotations"] = std::move(kinds);
    return out;
}

}  // namespace stackless
