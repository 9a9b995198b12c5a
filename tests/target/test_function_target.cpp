/**
 * @file test_function_target.cpp
 * @brief Function target queries
 */

#include "stackless/function_target.hpp"

#include "test_support.hpp"

#include <memory>
#include <string>

#include <gtest/gtest.h>

namespace stackless::target::test {

using stackless::test::bool_type;
using stackless::test::mut_ref_type;
using stackless::test::ref_type;
using stackless::test::TestEnv;
using stackless::test::u64_type;

TEST(FunctionTargetTest, LocalTypeOutOfRangeIsAnError)
{
    TestEnv t;
    const auto& fun = t.add(t.decl("f",
                                   {t.local("a", u64_type()), t.local("b", bool_type())},
                                   {t.local("c", u64_type())}));
    FunctionTarget target(fun, TestEnv::initial(fun, {}));
    ASSERT_EQ(target.local_count(), 3U);

    auto in_range = target.local_type(1);
    ASSERT_TRUE(in_range.has_value());
    EXPECT_EQ(in_range->get(), bool_type());

    auto out_of_range = target.local_type(5);
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, "IndexOutOfRange");

    auto name = target.local_name(3);
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code, "IndexOutOfRange");
}

TEST(FunctionTargetTest, LocalTypeReflectsCurrentSnapshot)
{
    TestEnv t;
    const auto& fun = t.add(t.decl("f", {t.local("a", u64_type())}));
    const auto initial = TestEnv::initial(fun, {});
    auto builder = initial->rewrite();
    const TempIndex temp = builder.add_local(ref_type(u64_type()));
    FunctionTarget target(fun, std::move(builder).finish());

    EXPECT_EQ(target.local_count(), 2U);
    EXPECT_EQ(target.user_local_count(), 1U);
    for (TempIndex idx = 0; idx < target.local_count(); ++idx) {
        auto type = target.local_type(idx);
        ASSERT_TRUE(type.has_value());
        EXPECT_EQ(type->get(), target.data().local_types()[idx]);
    }
    EXPECT_EQ(target.local_name(temp), "$t1");
}

TEST(FunctionTargetTest, LocalIndexRoundTrip)
{
    TestEnv t;
    const auto& fun = t.add(t.decl("f",
                                   {t.local("a", u64_type()), t.local("b", bool_type())},
                                   {t.local("c", u64_type()), t.local("d", u64_type())}));
    const auto initial = TestEnv::initial(fun, {});
    auto builder = initial->rewrite();
    builder.add_local(u64_type());
    FunctionTarget target(fun, std::move(builder).finish());

    for (TempIndex idx = 0; idx < target.local_count(); ++idx) {
        auto name = target.local_name(idx);
        ASSERT_TRUE(name.has_value());
        EXPECT_EQ(target.local_index(*name), idx) << *name;
    }
    EXPECT_EQ(target.local_index(t.symbol("c")), 2U);
    EXPECT_EQ(target.local_index("nope"), std::nullopt);
}

TEST(FunctionTargetTest, CallEndsLifetime)
{
    TestEnv t;
    const Type param = Type::type_parameter(0);

    // public f(x: &mut T): T
    auto f_decl = t.decl("f", {t.local("x", mut_ref_type(param))}, {}, {param});
    f_decl.type_params.push_back(TypeParameter{t.symbol("T")});
    const auto& f = t.add(std::move(f_decl));
    // public g(): &T
    auto g_decl = t.decl("g", {}, {}, {ref_type(param)});
    g_decl.type_params.push_back(TypeParameter{t.symbol("T")});
    const auto& g = t.add(std::move(g_decl));
    // private h(): u64
    const auto& h = t.add(t.decl("h", {}, {}, {u64_type()}, false));
    // public k()
    const auto& k = t.add(t.decl("k", {}));
    // public m(): (u64, &u64)
    const auto& m = t.add(t.decl("m", {}, {}, {u64_type(), ref_type(u64_type())}));

    EXPECT_TRUE(FunctionTarget(f, TestEnv::initial(f, {})).call_ends_lifetime());
    EXPECT_FALSE(FunctionTarget(g, TestEnv::initial(g, {})).call_ends_lifetime());
    EXPECT_FALSE(FunctionTarget(h, TestEnv::initial(h, {})).call_ends_lifetime());
    EXPECT_TRUE(FunctionTarget(k, TestEnv::initial(k, {})).call_ends_lifetime());
    EXPECT_FALSE(FunctionTarget(m, TestEnv::initial(m, {})).call_ends_lifetime());
}

TEST(FunctionTargetTest, ReturnTypeAndReturnIndex)
{
    TestEnv t;
    const auto& fun = t.add(
        t.decl("f", {t.local("x", mut_ref_type(u64_type()))}, {}, {bool_type(), u64_type()}));
    const auto initial = TestEnv::initial(fun, {});
    auto builder = initial->rewrite();
    ASSERT_TRUE(builder.add_ref_param(0, 1).has_value());
    FunctionTarget target(fun, std::move(builder).finish());

    EXPECT_EQ(target.return_count(), 2U);
    ASSERT_TRUE(target.return_type(0).has_value());
    EXPECT_EQ(target.return_type(0)->get(), bool_type());
    EXPECT_EQ(target.return_type(2).error().code, "IndexOutOfRange");

    EXPECT_EQ(target.return_index(0), 1U);
    EXPECT_EQ(target.return_index(1), std::nullopt);
    EXPECT_TRUE(target.is_mutating());
}

TEST(FunctionTargetTest, SpecAtPrefersGivenThenGenerated)
{
    TestEnv t;
    auto decl = t.decl("f", {t.local("x", u64_type())});
    decl.spec.on_impl[1] =
        SpecBlock{{Condition{.kind = ConditionKind::kAssert, .loc = {}, .expression = "x > 0"}}};
    const auto& fun = t.add(std::move(decl));

    const auto initial =
        TestEnv::initial(fun, {bc::Nop{}, bc::SpecBlockRef{}}, {{SpecBlockId{0}, 1}});
    auto builder = initial->rewrite();
    const SpecBlock generated{
        {Condition{.kind = ConditionKind::kAssume, .loc = {}, .expression = "x == 1"}}};
    const SpecBlockId generated_id = builder.add_generated_spec_block(generated);
    FunctionTarget target(fun, std::move(builder).finish());

    EXPECT_EQ(generated_id.value, 1U);
    auto given = target.spec_at(SpecBlockId{0});
    ASSERT_TRUE(given.has_value());
    EXPECT_EQ(given->get().conditions.front().expression, "x > 0");

    auto synthesized = target.spec_at(generated_id);
    ASSERT_TRUE(synthesized.has_value());
    EXPECT_EQ(synthesized->get(), generated);

    auto missing = target.spec_at(SpecBlockId{9});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "BlockNotFound");
}

TEST(FunctionTargetTest, BytecodeLocFallsBackToFunctionLoc)
{
    TestEnv t;
    const auto& fun = t.add(t.decl("f", {}));
    const Loc inst_loc{.file = "m.move", .line = 7, .col = 5};
    auto data = FunctionTargetData::create(fun, {bc::Nop{}}, {{AttrId{0}, inst_loc}});
    ASSERT_TRUE(data.has_value());
    FunctionTarget target(fun, *data);

    EXPECT_EQ(target.bytecode_loc(AttrId{0}), inst_loc);
    EXPECT_EQ(target.bytecode_loc(AttrId{1}), fun.loc());
}

TEST(FunctionTargetTest, BindRejectsForeignSnapshot)
{
    TestEnv t;
    const auto& f = t.add(t.decl("f", {}));
    const auto& g = t.add(t.decl("g", {}));

    auto foreign = FunctionTarget::bind(f, TestEnv::initial(g, {}));
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().code, "InvalidSnapshot");

    auto null_snapshot = FunctionTarget::bind(f, nullptr);
    ASSERT_FALSE(null_snapshot.has_value());

    auto bound = FunctionTarget::bind(f, TestEnv::initial(f, {}));
    ASSERT_TRUE(bound.has_value());
    EXPECT_EQ(bound->id(), f.id());
}

TEST(FunctionTargetTest, PragmaAndIdentityForwarding)
{
    TestEnv t;
    auto decl = t.decl("f", {});
    decl.pragmas = PragmaMap{{"verify", false}};
    const auto& fun = t.add(std::move(decl));
    FunctionTarget target(fun, TestEnv::initial(fun, {}));

    EXPECT_FALSE(target.is_pragma_true("verify", [] { return true; }));
    EXPECT_TRUE(target.is_pragma_true("other", [] { return true; }));
    EXPECT_EQ(target.symbol_pool().string(target.name()), "f");
    EXPECT_EQ(&target.global_env(), &t.env());
    EXPECT_TRUE(target.is_public());
    EXPECT_FALSE(target.is_native());
}

TEST(FunctionTargetTest, FormatterRegistryIsAppendOnly)
{
    TestEnv t;
    const auto& fun = t.add(t.decl("f", {}));
    FunctionTarget target(fun, TestEnv::initial(fun, {}));

    const AnnotationFormatter formatter = [](const FunctionTarget&, CodeOffset)
        -> Result<std::optional<std::string>> { return std::string("note"); };
    target.register_annotation_formatter(formatter);
    target.register_annotation_formatter(formatter);
    EXPECT_EQ(target.annotation_formatters().size(), 2U);
}

}  // namespace stackless::target::test
