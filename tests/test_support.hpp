#pragma once

/**
 * @file test_support.hpp
 * @brief Environment builders shared by the unit tests
 */

#include "stackless/bytecode.hpp"
#include "stackless/env.hpp"
#include "stackless/function_target_data.hpp"
#include "stackless/type.hpp"

#include <map>
#include <memory>
#include <string_view>
#include <vector>

namespace stackless::test {

[[nodiscard]] Type u64_type();
[[nodiscard]] Type bool_type();
[[nodiscard]] Type ref_type(Type target);
[[nodiscard]] Type mut_ref_type(Type target);

/**
 * @brief A global environment with one module `M` declaring struct `S`.
 *
 * Helpers throw std::runtime_error when the library rejects the input, which
 * fails the calling test.
 */
class TestEnv
{
public:
    TestEnv();

    [[nodiscard]] GlobalEnv& env() noexcept { return *m_env; }
    [[nodiscard]] ModuleEnv& module_env() noexcept { return *m_module; }
    [[nodiscard]] QualifiedId<StructId> struct_s() const noexcept { return m_struct_s; }

    [[nodiscard]] Symbol symbol(std::string_view text);
    [[nodiscard]] LocalDecl local(std::string_view name, Type type);

    [[nodiscard]] FunctionDecl decl(std::string_view name,
                                    std::vector<LocalDecl> params,
                                    std::vector<LocalDecl> locals = {},
                                    std::vector<Type> returns = {},
                                    bool is_public = true);

    const FunctionEnv& add(FunctionDecl decl);

    [[nodiscard]] static std::shared_ptr<const FunctionTargetData>
    initial(const FunctionEnv& func_env,
            std::vector<Bytecode> code,
            std::map<SpecBlockId, CodeOffset> given_spec_blocks = {});

private:
    std::unique_ptr<GlobalEnv> m_env;
    ModuleEnv* m_module = nullptr;
    QualifiedId<StructId> m_struct_s{};
};

}  // namespace stackless::test
