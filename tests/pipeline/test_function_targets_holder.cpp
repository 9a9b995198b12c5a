/**
 * @file test_function_targets_holder.cpp
 * @brief Snapshot lineage and pipeline execution
 */

#include "stackless/function_targets_holder.hpp"

#include "stackless/annotation_formatters.hpp"

#include "test_support.hpp"

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <gtest/gtest.h>

namespace stackless::pipeline::test {

using stackless::test::bool_type;
using stackless::test::mut_ref_type;
using stackless::test::TestEnv;
using stackless::test::u64_type;

namespace {

using ProcessFn =
    std::function<Result<std::shared_ptr<const FunctionTargetData>>(const FunctionTarget&)>;

/// Pass whose behavior is supplied by the test.
class LambdaProcessor : public FunctionTargetProcessor
{
public:
    LambdaProcessor(std::string name, ProcessFn fn)
        : m_name(std::move(name))
        , m_fn(std::move(fn))
    {}

    [[nodiscard]] std::string_view name() const override { return m_name; }

    [[nodiscard]] Result<std::shared_ptr<const FunctionTargetData>>
    process(const FunctionTarget& target) override
    {
        ++calls;
        return m_fn(target);
    }

    void register_formatters(FunctionTarget& target) const override
    {
        target.register_annotation_formatter(format_livevar_annotation);
    }

    int calls = 0;

private:
    std::string m_name;
    ProcessFn m_fn;
};

/// Appends one u64 temp and a live-var annotation mentioning it.
Result<std::shared_ptr<const FunctionTargetData>> append_temp(const FunctionTarget& target)
{
    auto builder = target.data().rewrite();
    const TempIndex temp = builder.add_local(u64_type());
    builder.annotations().set(LiveVarAnnotation{.at = {{0, LiveVarInfo{.before = {temp}, .after = {}}}}});
    return std::move(builder).finish();
}

Result<std::shared_ptr<const FunctionTargetData>> fail_with(std::string code)
{
    return std::unexpected(Error::make(std::move(code), "pass failed"));
}

class HolderTest : public ::testing::Test
{
protected:
    HolderTest()
        : m_f(add_f(m_env))
        , m_g(m_env.add(m_env.decl("g", {m_env.local("b", bool_type())})))
    {}

    static const FunctionEnv& add_f(TestEnv& env)
    {
        auto decl = env.decl("f",
                             {env.local("x", mut_ref_type(u64_type())), env.local("y", u64_type())},
                             {},
                             {u64_type()});
        decl.spec.on_impl[1] = SpecBlock{
            {Condition{.kind = ConditionKind::kAssert, .loc = {}, .expression = "y > 0"}}};
        return env.add(std::move(decl));
    }

    void add_f_target()
    {
        ASSERT_TRUE(m_holder
                        .add_target(m_f,
                                    {bc::Nop{.attr = AttrId{0}},
                                     bc::SpecBlockRef{.attr = AttrId{1}, .block = SpecBlockId{0}}},
                                    {},
                                    {{SpecBlockId{0}, 1}})
                        .has_value());
    }

    TestEnv m_env;
    const FunctionEnv& m_f;
    const FunctionEnv& m_g;
    FunctionTargetsHolder m_holder;
};

}  // namespace

TEST_F(HolderTest, AddTargetStoresInitialSnapshot)
{
    add_f_target();

    EXPECT_TRUE(m_holder.contains(m_f.qualified_id()));
    EXPECT_FALSE(m_holder.contains(m_g.qualified_id()));

    auto data = m_holder.data(m_f.qualified_id());
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ((*data)->generation(), 0U);
    EXPECT_EQ((*data)->code().size(), 2U);

    auto history = m_holder.history(m_f.qualified_id());
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 1U);

    auto target = m_holder.target(m_f.qualified_id());
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->id(), m_f.id());
    EXPECT_TRUE(target->annotation_formatters().empty());
}

TEST_F(HolderTest, DuplicateTargetIsRejected)
{
    add_f_target();
    auto again = m_holder.add_target(m_f, {});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, "DuplicateTarget");

    auto history = m_holder.history(m_f.qualified_id());
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 1U);
}

TEST_F(HolderTest, InvalidGivenBlockFailsAddTarget)
{
    auto added = m_holder.add_target(m_g, {}, {}, {{SpecBlockId{0}, 0}});
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, "BlockNotFound");
    EXPECT_FALSE(m_holder.contains(m_g.qualified_id()));
}

TEST_F(HolderTest, UnknownFunctionIsTargetNotFound)
{
    EXPECT_EQ(m_holder.data(m_g.qualified_id()).error().code, "TargetNotFound");
    EXPECT_EQ(m_holder.history(m_g.qualified_id()).error().code, "TargetNotFound");
    EXPECT_EQ(m_holder.target(m_g.qualified_id()).error().code, "TargetNotFound");

    LambdaProcessor pass("append", append_temp);
    auto rewritten = m_holder.rewrite(m_g.qualified_id(), pass);
    ASSERT_FALSE(rewritten.has_value());
    EXPECT_EQ(rewritten.error().code, "TargetNotFound");
    EXPECT_EQ(pass.calls, 0);
}

TEST_F(HolderTest, FunctionsAreListedInIdOrder)
{
    ASSERT_TRUE(m_holder.add_target(m_g, {}).has_value());
    add_f_target();

    const auto functions = m_holder.functions();
    ASSERT_EQ(functions.size(), 2U);
    EXPECT_EQ(functions[0], m_f.qualified_id());
    EXPECT_EQ(functions[1], m_g.qualified_id());
}

TEST_F(HolderTest, RemoveDropsWholeLineage)
{
    add_f_target();
    LambdaProcessor pass("append", append_temp);
    ASSERT_TRUE(m_holder.rewrite(m_f.qualified_id(), pass).has_value());
    auto kept = m_holder.data(m_f.qualified_id());
    ASSERT_TRUE(kept.has_value());

    EXPECT_TRUE(m_holder.remove(m_f.qualified_id()));
    EXPECT_FALSE(m_holder.contains(m_f.qualified_id()));
    EXPECT_TRUE(m_holder.functions().empty());
    EXPECT_EQ(m_holder.history(m_f.qualified_id()).error().code, "TargetNotFound");
    EXPECT_FALSE(m_holder.remove(m_f.qualified_id()));

    // Snapshots handed out earlier stay valid, and the function can be added again.
    EXPECT_EQ((*kept)->generation(), 1U);
    add_f_target();
    EXPECT_EQ(m_holder.history(m_f.qualified_id())->size(), 1U);
}

TEST_F(HolderTest, RewriteAppendsSuccessor)
{
    add_f_target();
    LambdaProcessor pass("append", append_temp);

    ASSERT_TRUE(m_holder.rewrite(m_f.qualified_id(), pass).has_value());
    ASSERT_TRUE(m_holder.rewrite(m_f.qualified_id(), pass).has_value());

    auto history = m_holder.history(m_f.qualified_id());
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 3U);
    EXPECT_EQ((*history)[0]->local_types().size(), 2U);
    EXPECT_EQ((*history)[1]->local_types().size(), 3U);
    EXPECT_EQ((*history)[2]->local_types().size(), 4U);
    EXPECT_EQ((*history)[2]->generation(), 2U);

    auto target = m_holder.target(m_f.qualified_id());
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->local_name(3), "$t3");
}

TEST_F(HolderTest, GivenBlocksAreIdenticalAcrossLineage)
{
    add_f_target();
    LambdaProcessor generate("generate", [](const FunctionTarget& target)
                                             -> Result<std::shared_ptr<const FunctionTargetData>> {
        auto builder = target.data().rewrite();
        const SpecBlockId id = builder.add_generated_spec_block(SpecBlock{
            {Condition{.kind = ConditionKind::kAssume, .loc = {}, .expression = "x == y"}}});
        EXPECT_EQ(id.value, 1U);
        return std::move(builder).finish();
    });
    LambdaProcessor append("append", append_temp);
    std::array<FunctionTargetProcessor*, 2> passes{&generate, &append};
    ASSERT_TRUE(run_pipeline(m_holder, m_f.qualified_id(), passes).has_value());

    auto history = m_holder.history(m_f.qualified_id());
    ASSERT_TRUE(history.has_value());
    for (const auto& snapshot : *history) {
        EXPECT_EQ(snapshot->given_spec_blocks(), history->front()->given_spec_blocks());
    }
    // The generated block survives the later pass.
    EXPECT_EQ(history->back()->generated_spec_blocks().size(), 1U);
    EXPECT_TRUE(history->back()->generated_spec_blocks().contains(SpecBlockId{1}));
}

TEST_F(HolderTest, ForeignSnapshotIsLineageViolation)
{
    add_f_target();
    ASSERT_TRUE(m_holder.add_target(m_g, {}).has_value());
    auto g_data = m_holder.data(m_g.qualified_id());
    ASSERT_TRUE(g_data.has_value());

    const auto foreign = *g_data;
    LambdaProcessor pass("foreign", [foreign](const FunctionTarget&)
                                        -> Result<std::shared_ptr<const FunctionTargetData>> {
        auto builder = foreign->rewrite();
        return std::move(builder).finish();
    });

    auto result = m_holder.rewrite(m_f.qualified_id(), pass);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "LineageViolation");
    EXPECT_NE(result.error().message.find("Pass 'foreign' on M::f"), std::string::npos);
    EXPECT_EQ(m_holder.history(m_f.qualified_id())->size(), 1U);
}

TEST_F(HolderTest, StaleSnapshotIsLineageViolation)
{
    add_f_target();
    LambdaProcessor append("append", append_temp);
    ASSERT_TRUE(m_holder.rewrite(m_f.qualified_id(), append).has_value());

    // Rebuilding from the initial snapshot drops the temp added by `append`.
    auto initial = (*m_holder.history(m_f.qualified_id()))[0];
    LambdaProcessor stale("stale", [initial](const FunctionTarget&)
                                      -> Result<std::shared_ptr<const FunctionTargetData>> {
        auto builder = initial->rewrite();
        return std::move(builder).finish();
    });

    auto result = m_holder.rewrite(m_f.qualified_id(), stale);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "LineageViolation");
    EXPECT_EQ(m_holder.history(m_f.qualified_id())->size(), 2U);
}

TEST_F(HolderTest, FreshSnapshotIsLineageViolation)
{
    add_f_target();
    LambdaProcessor pass("recreate", [this](const FunctionTarget&)
                                         -> Result<std::shared_ptr<const FunctionTargetData>> {
        return FunctionTargetData::create(m_f, {});
    });

    auto result = m_holder.rewrite(m_f.qualified_id(), pass);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "LineageViolation");
}

TEST_F(HolderTest, NullSnapshotIsLineageViolation)
{
    add_f_target();
    LambdaProcessor pass("null", [](const FunctionTarget&)
                                     -> Result<std::shared_ptr<const FunctionTargetData>> {
        return std::shared_ptr<const FunctionTargetData>{};
    });

    auto result = m_holder.rewrite(m_f.qualified_id(), pass);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "LineageViolation");
}

TEST_F(HolderTest, PipelineStopsAtFirstFailure)
{
    add_f_target();
    LambdaProcessor first("first", append_temp);
    LambdaProcessor broken("broken", [](const FunctionTarget&) { return fail_with("PassFailed"); });
    LambdaProcessor last("last", append_temp);
    std::array<FunctionTargetProcessor*, 3> passes{&first, &broken, &last};

    auto result = run_pipeline(m_holder, m_f.qualified_id(), passes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "PassFailed");
    EXPECT_EQ(first.calls, 1);
    EXPECT_EQ(broken.calls, 1);
    EXPECT_EQ(last.calls, 0);
    EXPECT_EQ(m_holder.history(m_f.qualified_id())->size(), 2U);
}

TEST_F(HolderTest, TargetWithFormattersRegistersInPipelineOrder)
{
    add_f_target();
    LambdaProcessor append("append", append_temp);
    LambdaProcessor other("other", append_temp);
    std::array<FunctionTargetProcessor*, 2> passes{&append, &other};
    ASSERT_TRUE(run_pipeline(m_holder, m_f.qualified_id(), passes).has_value());

    auto target = target_with_formatters(m_holder, m_f.qualified_id(), passes);
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->annotation_formatters().size(), 2U);

    // Only the latest pass's live-var payload is in the final snapshot.
    auto text = target->annotation_formatters().front()(*target, 0);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, std::optional<std::string>("live vars: $t3"));

    auto missing = target_with_formatters(m_holder, m_g.qualified_id(), passes);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "TargetNotFound");
}

TEST_F(HolderTest, TargetsFromHolderAreIndependentViews)
{
    add_f_target();
    auto first = m_holder.target(m_f.qualified_id());
    ASSERT_TRUE(first.has_value());
    first->register_annotation_formatter(format_lifetime_annotation);

    auto second = m_holder.target(m_f.qualified_id());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->annotation_formatters().empty());
    EXPECT_EQ(first->data_ptr(), second->data_ptr());
}

}  // namespace stackless::pipeline::test
