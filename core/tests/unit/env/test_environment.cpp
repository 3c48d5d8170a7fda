// tests/unit/env/test_environment.cpp - Unit tests for declaration resolution
//
#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "tscore/env/environment.hpp"

using namespace tscore;

namespace
{

/// Binder stand-in that builds `{ id: number }` for every id it is asked about.
class CountingProvider : public DefinitionProvider
{
public:
  std::optional<DefinitionInfo> provide(DefId def, TypeInterner & interner) override
  {
    ++calls;
    if (def.value % 2 == 0) return std::nullopt;

    ObjectShape shape;
    shape.properties.push_back(PropertyInfo{"id", k_number, k_number});
    DefinitionInfo info;
    info.kind = DefKind::Interface;
    info.name = "Provided";
    info.body = interner.object(std::move(shape));
    return info;
  }

  std::atomic<int> calls{0};
};

DefinitionInfo alias_info(TypeId body)
{
  DefinitionInfo info;
  info.kind = DefKind::TypeAlias;
  info.name = "A";
  info.body = body;
  return info;
}

}  // namespace

TEST(EnvEnvironment, DeclareAndResolve)
{
  TypeInterner interner;
  Environment env(interner);
  const DefId def = env.declare(alias_info(k_string));

  const ResolutionStack stack;
  const Resolution r = env.resolve(def, stack, nullptr);
  EXPECT_TRUE(r.resolved());
  EXPECT_EQ(r.type, k_string);
  ASSERT_NE(r.info, nullptr);
  EXPECT_EQ(r.info->name, "A");
  EXPECT_TRUE(r.info->is_transparent());
}

TEST(EnvEnvironment, FirstDefinitionWins)
{
  TypeInterner interner;
  Environment env(interner);
  const DefId def = env.allocate_def();
  EXPECT_TRUE(env.define(def, alias_info(k_string)));
  EXPECT_FALSE(env.define(def, alias_info(k_number)));
  EXPECT_EQ(env.find(def)->body, k_string);
}

TEST(EnvEnvironment, MissingDefinitionIsUnresolvedSentinel)
{
  TypeInterner interner;
  Environment env(interner);
  DiagnosticBag diags;

  const ResolutionStack stack;
  const Resolution r = env.resolve(env.allocate_def(), stack, &diags);
  EXPECT_EQ(r.status, ResolveStatus::Missing);
  EXPECT_EQ(r.type, k_unresolved);
  EXPECT_TRUE(diags.has_code("W0010"));
  EXPECT_FALSE(diags.has_errors());
}

TEST(EnvEnvironment, MissingDefinitionWarnsOncePerDeclaration)
{
  TypeInterner interner;
  Environment env(interner);
  DiagnosticBag diags;

  const ResolutionStack stack;
  const DefId first = env.allocate_def();
  const DefId second = env.allocate_def();
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(env.resolve(first, stack, &diags).status, ResolveStatus::Missing);
  }
  EXPECT_EQ(diags.size(), 1u);

  EXPECT_EQ(env.resolve(second, stack, &diags).status, ResolveStatus::Missing);
  EXPECT_EQ(diags.size(), 2u);

  // A separate bag gets its own warning.
  DiagnosticBag other;
  EXPECT_EQ(env.resolve(first, stack, &other).status, ResolveStatus::Missing);
  EXPECT_TRUE(other.has_code("W0010"));
}

TEST(EnvEnvironment, RecursiveReferenceIsInProgress)
{
  TypeInterner interner;
  Environment env(interner);
  const DefId def = env.declare(alias_info(k_string));

  ResolutionStack stack;
  ResolutionStack::Scope scope(stack, def);
  const Resolution r = env.resolve(def, stack, nullptr);
  EXPECT_EQ(r.status, ResolveStatus::InProgress);
  EXPECT_EQ(r.type, interner.lazy(def));
  EXPECT_NE(r.info, nullptr);
}

TEST(EnvEnvironment, ProviderIsConsultedOnMiss)
{
  TypeInterner interner;
  CountingProvider provider;
  Environment env(interner, &provider);

  DefId odd = env.allocate_def();
  if (odd.value % 2 == 0) odd = env.allocate_def();

  const ResolutionStack stack;
  const Resolution first = env.resolve(odd, stack, nullptr);
  ASSERT_TRUE(first.resolved());
  EXPECT_EQ(first.info->name, "Provided");

  // Stored after the first call.
  const Resolution second = env.resolve(odd, stack, nullptr);
  EXPECT_EQ(second.type, first.type);
  EXPECT_EQ(provider.calls.load(), 1);
}

TEST(EnvEnvironment, TypeParameterConstraint)
{
  TypeInterner interner;
  Environment env(interner);
  DefinitionInfo param;
  param.kind = DefKind::TypeParameter;
  param.name = "T";
  param.body = k_string;
  const DefId def = env.declare(std::move(param));

  EXPECT_EQ(env.type_param_constraint(def), k_string);
  EXPECT_FALSE(env.type_param_constraint(env.declare(alias_info(k_number))).is_valid());
}

TEST(EnvEnvironment, LibrarySlots)
{
  TypeInterner interner;
  Environment env(interner);
  EXPECT_FALSE(env.root_object().is_valid());

  const TypeId root = interner.object(ObjectShape{});
  env.set_root_object(root);
  env.set_primitive_interface(IntrinsicKind::String, root);
  EXPECT_EQ(env.root_object(), root);
  EXPECT_EQ(env.primitive_interface(IntrinsicKind::String), root);
  EXPECT_FALSE(env.primitive_interface(IntrinsicKind::Number).is_valid());
}

TEST(EnvEnvironment, ConcurrentResolutionAgrees)
{
  TypeInterner interner;
  CountingProvider provider;
  Environment env(interner, &provider);

  std::vector<DefId> defs;
  for (int i = 0; i < 64; ++i) defs.push_back(env.allocate_def());

  std::vector<std::vector<TypeId>> seen(4);
  std::vector<std::thread> workers;
  for (size_t t = 0; t < seen.size(); ++t) {
    workers.emplace_back([&, t] {
      const ResolutionStack stack;
      for (DefId d : defs) seen[t].push_back(env.resolve(d, stack, nullptr).type);
    });
  }
  for (auto & w : workers) w.join();

  for (size_t t = 1; t < seen.size(); ++t) EXPECT_EQ(seen[t], seen[0]);
}
