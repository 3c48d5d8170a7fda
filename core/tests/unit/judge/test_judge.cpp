// tests/unit/judge/test_judge.cpp - Unit tests for the structural relation engine
//
#include <gtest/gtest.h>

#include <vector>

#include "tscore/test_support/type_builders.hpp"

using namespace tscore;
using tscore::test_support::TypeWorld;

// ============================================================================
// Lattice Laws
// ============================================================================

TEST(JudgeLaws, Reflexivity)
{
  TypeWorld w;
  const std::vector<TypeId> samples = {
    k_string,
    w.str("a"),
    w.un({k_string, k_number}),
    w.obj({{"a", k_number}, {"b", w.arr(k_string), true}}),
    w.fn({k_string}, k_void),
    w.tup({k_string, k_number}),
    w.interface("Box", w.obj({{"v", k_number}})),
  };
  for (TypeId t : samples) EXPECT_TRUE(w.subtype(t, t)) << w.show(t);
}

TEST(JudgeLaws, Transitivity)
{
  TypeWorld w;
  const TypeId a = w.str("a");
  const TypeId wide = w.un({k_string, k_number});
  EXPECT_TRUE(w.subtype(a, k_string));
  EXPECT_TRUE(w.subtype(k_string, wide));
  EXPECT_TRUE(w.subtype(a, wide));
}

TEST(JudgeLaws, TopAndBottom)
{
  TypeWorld w;
  EXPECT_TRUE(w.subtype(k_never, k_string));
  EXPECT_TRUE(w.subtype(k_string, k_unknown));
  EXPECT_TRUE(w.subtype(k_string, k_any));
  EXPECT_FALSE(w.subtype(k_string, k_never));
  // Strict subtyping gives any no special source powers.
  EXPECT_FALSE(w.subtype(k_any, k_number));
  EXPECT_FALSE(w.subtype(k_unknown, k_number));
}

TEST(JudgeLaws, UnionSourceNeedsEveryMember)
{
  TypeWorld w;
  const TypeId target = w.un({k_string, k_number});
  EXPECT_TRUE(w.subtype(w.un({w.str("a"), w.num(1)}), target));
  EXPECT_FALSE(w.subtype(w.un({k_string, k_boolean}), target));
}

TEST(JudgeLaws, IntersectionTargetNeedsEveryMember)
{
  TypeWorld w;
  const TypeId both = w.inter({w.obj({{"a", k_number}}), w.obj({{"b", k_string}})});
  EXPECT_TRUE(w.subtype(w.obj({{"a", k_number}, {"b", k_string}}), both));
  EXPECT_FALSE(w.subtype(w.obj({{"a", k_number}}), both));
}

TEST(JudgeLaws, IntersectionSourceMergesObjects)
{
  TypeWorld w;
  const TypeId src = w.inter({w.obj({{"a", k_number}}), w.obj({{"b", k_string}})});
  EXPECT_TRUE(w.subtype(src, w.obj({{"a", k_number}, {"b", k_string}})));
  EXPECT_TRUE(w.subtype(src, w.obj({{"a", k_number}})));
}

TEST(JudgeLaws, LiteralsWidenToTheirPrimitive)
{
  TypeWorld w;
  EXPECT_TRUE(w.subtype(w.num(1), k_number));
  EXPECT_TRUE(w.subtype(w.boolean(true), k_boolean));
  EXPECT_FALSE(w.subtype(k_string, w.str("a")));
  EXPECT_FALSE(w.subtype(w.str("a"), w.str("b")));
  EXPECT_TRUE(w.subtype(k_undefined, k_void));
}

// ============================================================================
// Objects
// ============================================================================

TEST(JudgeObjects, WidthSubtyping)
{
  TypeWorld w;
  const TypeId point = w.obj({{"x", k_number}, {"y", k_number}});
  EXPECT_TRUE(w.subtype(point, w.obj({{"x", k_number}})));
  EXPECT_FALSE(w.subtype(w.obj({{"x", k_number}}), point));
}

TEST(JudgeObjects, OptionalMembers)
{
  TypeWorld w;
  const TypeId opt = w.obj({{"a", k_number, true}});
  EXPECT_TRUE(w.subtype(w.obj({}), opt));
  EXPECT_TRUE(w.subtype(w.obj({{"a", k_number}}), opt));
  EXPECT_FALSE(w.subtype(opt, w.obj({{"a", k_number}})));
  EXPECT_FALSE(w.subtype(w.obj({{"a", k_string}}), opt));
}

TEST(JudgeObjects, ReadonlyToMutableIsStrict)
{
  TypeWorld w;
  const TypeId ro = w.obj({{"a", k_number, false, true}});
  const TypeId rw = w.obj({{"a", k_number}});
  EXPECT_TRUE(w.subtype(rw, ro));
  EXPECT_FALSE(w.subtype(ro, rw));
}

TEST(JudgeObjects, AccessorReadSideIsCovariant)
{
  TypeWorld w;
  const TypeId wide = w.un({k_string, k_number});
  // get: string, set: string | number
  const TypeId narrow_getter = w.obj({{"x", k_string, false, false, false, wide}});
  EXPECT_TRUE(w.subtype(narrow_getter, w.obj({{"x", wide}})));

  // get: string | number, set: string
  const TypeId wide_getter = w.obj({{"x", wide, false, false, false, k_string}});
  EXPECT_FALSE(w.subtype(wide_getter, w.obj({{"x", k_string}})));
}

TEST(JudgeObjects, AccessorWriteSideIsContravariant)
{
  TypeWorld w;
  const TypeId wide = w.un({k_string, k_number});
  const TypeId split_target = w.obj({{"x", k_string, false, false, false, wide}});
  EXPECT_FALSE(w.subtype(w.obj({{"x", k_string}}), split_target));
  EXPECT_TRUE(w.subtype(w.obj({{"x", k_string, false, false, false, wide}}), split_target));

  // The source setter must accept everything the target may write.
  const TypeId number_setter = w.obj({{"x", k_string, false, false, false, k_number}});
  EXPECT_FALSE(w.subtype(number_setter, w.obj({{"x", k_string}})));
}

TEST(JudgeObjects, ReadonlyTargetSkipsWriteSide)
{
  TypeWorld w;
  const TypeId wide = w.un({k_string, k_number});
  const TypeId readonly_split = w.obj({{"x", k_string, false, true, false, wide}});
  EXPECT_TRUE(w.subtype(w.obj({{"x", k_string}}), readonly_split));
  EXPECT_FALSE(w.subtype(w.obj({{"x", k_number}}), readonly_split));
}

TEST(JudgeObjects, StringIndexSignatureCoversProperties)
{
  TypeWorld w;
  ObjectShape dict;
  dict.string_index = IndexSignature{k_string, k_number, false};
  const TypeId target = w.interner.object(std::move(dict));

  EXPECT_TRUE(w.subtype(w.obj({{"a", w.num(1)}, {"b", k_number}}), target));
  EXPECT_FALSE(w.subtype(w.obj({{"a", k_string}}), target));
}

TEST(JudgeObjects, ObjectIntrinsicAcceptsNonPrimitives)
{
  TypeWorld w;
  EXPECT_TRUE(w.subtype(w.obj({{"a", k_number}}), k_object));
  EXPECT_TRUE(w.subtype(w.arr(k_number), k_object));
  EXPECT_TRUE(w.subtype(w.fn({}, k_void), k_function));
  EXPECT_FALSE(w.subtype(k_string, k_object));
}

// ============================================================================
// Arrays, Tuples, Functions
// ============================================================================

TEST(JudgeArrays, ElementCovariance)
{
  TypeWorld w;
  EXPECT_TRUE(w.subtype(w.arr(w.str("a")), w.arr(k_string)));
  EXPECT_FALSE(w.subtype(w.arr(k_string), w.arr(k_number)));
  EXPECT_TRUE(w.subtype(w.arr(k_string), w.interner.readonly_array_of(k_string)));
  EXPECT_FALSE(w.subtype(w.interner.readonly_array_of(k_string), w.arr(k_string)));
}

TEST(JudgeArrays, TuplesAgainstArraysAndTuples)
{
  TypeWorld w;
  const TypeId pair = w.tup({k_string, k_number});
  EXPECT_TRUE(w.subtype(pair, w.arr(w.un({k_string, k_number}))));
  EXPECT_FALSE(w.subtype(pair, w.arr(k_string)));
  EXPECT_FALSE(w.subtype(w.arr(k_string), w.tup({k_string})));
  EXPECT_FALSE(w.subtype(pair, w.tup({k_string})));
  EXPECT_FALSE(w.subtype(w.tup({k_string}), pair));
}

TEST(JudgeArrays, RestSourceDoesNotCoverRequiredTargetElements)
{
  TypeWorld w;
  const TypeId strings = w.arr(k_string);
  // [string, ...string[]]
  const TypeId one_or_more = w.interner.tuple(
    {TupleElement{k_string, "", false, false}, TupleElement{strings, "", false, true}});
  // [string, string, ...string[]]
  const TypeId two_or_more = w.interner.tuple(
    {TupleElement{k_string, "", false, false}, TupleElement{k_string, "", false, false},
     TupleElement{strings, "", false, true}});
  // [string, string?, ...string[]]
  const TypeId second_optional = w.interner.tuple(
    {TupleElement{k_string, "", false, false}, TupleElement{k_string, "", true, false},
     TupleElement{strings, "", false, true}});

  EXPECT_FALSE(w.subtype(one_or_more, two_or_more));
  EXPECT_TRUE(w.subtype(two_or_more, one_or_more));
  EXPECT_TRUE(w.subtype(one_or_more, second_optional));
}

TEST(JudgeFunctions, ParametersAreContravariant)
{
  TypeWorld w;
  const TypeId wide = w.fn({w.un({k_string, k_number})}, k_void);
  const TypeId narrow = w.fn({k_string}, k_void);
  EXPECT_TRUE(w.subtype(wide, narrow));
  EXPECT_FALSE(w.subtype(narrow, wide));
}

TEST(JudgeFunctions, ReturnsAreCovariant)
{
  TypeWorld w;
  EXPECT_TRUE(w.subtype(w.fn({}, w.str("a")), w.fn({}, k_string)));
  EXPECT_FALSE(w.subtype(w.fn({}, k_string), w.fn({}, w.str("a"))));
}

TEST(JudgeFunctions, ArityMismatch)
{
  TypeWorld w;
  const TypeId two = w.fn({k_string, k_string}, k_void);
  const TypeId one = w.fn({k_string}, k_void);
  EXPECT_TRUE(w.subtype(one, two));
  EXPECT_FALSE(w.subtype(two, one));

  auto ctx = w.solver->new_query();
  const auto why = w.solver->judge().explain(two, one, *ctx);
  ASSERT_TRUE(why.has_value());
  EXPECT_EQ(why->kind, FailureKind::ArityMismatch);
}

// ============================================================================
// References and Recursion
// ============================================================================

TEST(JudgeReferences, UnresolvedRelatesOnlyToAny)
{
  TypeWorld w;
  const TypeId missing = w.interner.lazy(w.reserve());
  EXPECT_FALSE(w.subtype(missing, k_string));
  EXPECT_FALSE(w.subtype(k_string, missing));
  EXPECT_TRUE(w.subtype(missing, k_any));

  auto ctx = w.solver->new_query();
  const auto why = w.solver->judge().explain(missing, k_string, *ctx);
  ASSERT_TRUE(why.has_value());
  EXPECT_EQ(why->kind, FailureKind::UnresolvedReference);
}

TEST(JudgeReferences, AliasesAreTransparent)
{
  TypeWorld w;
  const TypeId name = w.alias("Name", k_string);
  EXPECT_TRUE(w.subtype(name, k_string));
  EXPECT_TRUE(w.subtype(k_string, name));
  EXPECT_TRUE(w.solver->identical(name, k_string).ok);
}

TEST(JudgeReferences, StructurallyEqualRecursiveInterfaces)
{
  TypeWorld w;
  const DefId list_id = w.reserve();
  const TypeId list = w.define_interface(
    list_id, "List", w.obj({{"value", k_number}, {"next", w.interner.lazy(list_id), true}}));
  const DefId chain_id = w.reserve();
  const TypeId chain = w.define_interface(
    chain_id, "Chain", w.obj({{"value", k_number}, {"next", w.interner.lazy(chain_id), true}}));

  EXPECT_TRUE(w.subtype(list, chain));
  EXPECT_TRUE(w.subtype(chain, list));
  EXPECT_TRUE(w.solver->identical(list, chain).ok);
}

TEST(JudgeReferences, RecursiveGenericAliasTerminates)
{
  TypeWorld w;
  const auto x = w.type_param("X");
  const DefId node_id = w.reserve();
  const TypeId node_ref = w.interner.lazy(node_id);
  const TypeId node = w.define_alias(
    node_id, "Node",
    w.obj({{"value", w.param_type(x)}, {"next", w.app(node_ref, {w.param_type(x)})}}), {x});

  EXPECT_TRUE(w.subtype(w.app(node, {w.str("a")}), w.app(node, {k_string})));
  EXPECT_FALSE(w.subtype(w.app(node, {k_string}), w.app(node, {k_number})));
}

TEST(JudgeReferences, IdenticalIsMutualSubtype)
{
  TypeWorld w;
  const TypeId a = w.obj({{"a", k_number}});
  EXPECT_TRUE(w.solver->identical(a, w.obj({{"a", k_number}})).ok);
  EXPECT_FALSE(w.solver->identical(a, w.obj({{"a", k_number}, {"b", k_string}})).ok);
  EXPECT_FALSE(w.solver->identical(w.str("a"), k_string).ok);
}

// ============================================================================
// Explanations
// ============================================================================

TEST(JudgeExplain, NestedPropertyChain)
{
  TypeWorld w;
  const TypeId src = w.obj({{"inner", w.obj({{"a", k_string}})}});
  const TypeId dst = w.obj({{"inner", w.obj({{"a", k_number}})}});

  auto ctx = w.solver->new_query();
  const auto why = w.solver->judge().explain(src, dst, *ctx);
  ASSERT_TRUE(why.has_value());
  EXPECT_EQ(why->kind, FailureKind::PropertyTypeMismatch);
  EXPECT_EQ(why->member, "inner");
  EXPECT_EQ(why->chain_length(), 3u);
  EXPECT_EQ(why->innermost().kind, FailureKind::TypeMismatch);
  EXPECT_EQ(why->innermost().source, k_string);
  EXPECT_EQ(why->innermost().target, k_number);
}

TEST(JudgeExplain, MissingPropertyNamesTheMember)
{
  TypeWorld w;
  auto ctx = w.solver->new_query();
  const auto why = w.solver->judge().explain(w.obj({}), w.obj({{"id", k_number}}), *ctx);
  ASSERT_TRUE(why.has_value());
  EXPECT_EQ(why->kind, FailureKind::PropertyMissing);
  EXPECT_EQ(why->member, "id");
}

TEST(JudgeExplain, HoldingRelationHasNoReason)
{
  TypeWorld w;
  auto ctx = w.solver->new_query();
  EXPECT_FALSE(w.solver->judge().explain(w.str("a"), k_string, *ctx).has_value());
}

// ============================================================================
// Budgets and Memoization
// ============================================================================

TEST(JudgeBudgets, TruncatedPairIsNotCachedAsFailure)
{
  SolverConfig config;
  config.limits.max_subtype_depth = 2;
  TypeWorld w(config);

  const TypeId inner = w.obj({{"b", w.obj({{"c", k_string}})}});
  const TypeId wider_inner = w.obj({{"b", w.obj({{"c", w.un({k_string, k_number})}})}});
  const TypeId deep = w.obj({{"a", inner}});
  const TypeId wide = w.obj({{"a", wider_inner}});

  auto ctx = w.solver->new_query();
  EXPECT_FALSE(w.solver->judge().subtype(deep, wide, *ctx));
  EXPECT_TRUE(ctx->truncated());
  EXPECT_EQ(ctx->relations.count(RelationKey{deep, wide, RelationKind::Subtype}), 0u);
  EXPECT_EQ(ctx->relations.count(RelationKey{inner, wider_inner, RelationKind::Subtype}), 0u);

  // The same pair without a budget hit holds.
  TypeWorld roomy;
  EXPECT_TRUE(roomy.subtype(
    roomy.obj({{"a", roomy.obj({{"b", roomy.obj({{"c", k_string}})}})}}),
    roomy.obj({{"a", roomy.obj({{"b", roomy.obj({{"c", roomy.un({k_string, k_number})}})}})}})));
}

TEST(JudgeBudgets, ProvenFailureIsCached)
{
  TypeWorld w;
  const TypeId src = w.obj({{"x", k_string}});
  const TypeId dst = w.obj({{"x", k_number}});

  auto ctx = w.solver->new_query();
  EXPECT_FALSE(w.solver->judge().subtype(src, dst, *ctx));
  EXPECT_FALSE(ctx->truncated());
  const auto it = ctx->relations.find(RelationKey{src, dst, RelationKind::Subtype});
  ASSERT_NE(it, ctx->relations.end());
  EXPECT_EQ(it->second.state, MemoState::Fails);
}
