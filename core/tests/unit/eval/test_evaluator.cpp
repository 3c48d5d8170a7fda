// tests/unit/eval/test_evaluator.cpp - Unit tests for derived type evaluation
//
#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "tscore/test_support/type_builders.hpp"

using namespace tscore;
using tscore::test_support::TypeWorld;

namespace
{

/// `type Exclude<T, U> = T extends U ? never : T`
TypeId declare_exclude(TypeWorld & w)
{
  const auto t = w.type_param("T");
  const auto u = w.type_param("U");
  const TypeId body = w.interner.conditional(w.param_type(t), w.param_type(u), k_never, w.param_type(t));
  return w.alias("Exclude", body, {t, u});
}

/// `{ [P in keyof T]<modifiers>: T[P] }` as a generic alias over T.
TypeId declare_homomorphic(
  TypeWorld & w, const char * name, MappedModifier readonly_mod, MappedModifier optional_mod)
{
  const auto t = w.type_param("T");
  const auto p = w.type_param("P");
  MappedKey key;
  key.param = p;
  key.constraint = w.interner.keyof(w.param_type(t));
  key.name_type = k_invalid_type;
  key.template_type = w.interner.index_access(w.param_type(t), w.param_type(p));
  key.readonly_modifier = readonly_mod;
  key.optional_modifier = optional_mod;
  return w.alias(name, w.interner.mapped(std::move(key)), {t});
}

/// `type ReturnType<F> = F extends (...args: any) => infer R ? R : any`
TypeId declare_return_type(TypeWorld & w)
{
  const auto f = w.type_param("F");
  const auto r = w.type_param("R");
  SignatureSpec any_args;
  any_args.params.push_back(ParamInfo{"args", k_any, false, true});
  any_args.return_type = w.interner.infer(r);
  const TypeId body = w.interner.conditional(
    w.param_type(f), w.interner.function(std::move(any_args)), w.param_type(r), k_any);
  return w.alias("ReturnType", body, {f});
}

bool contains(const std::vector<TypeId> & members, TypeId id)
{
  return std::find(members.begin(), members.end(), id) != members.end();
}

}  // namespace

// ============================================================================
// Conditional Types
// ============================================================================

TEST(EvalConditional, ExcludeDistributesOverUnion)
{
  TypeWorld w;
  const TypeId exclude = declare_exclude(w);
  const TypeId abc = w.un({w.str("a"), w.str("b"), w.str("c")});

  EXPECT_EQ(w.eval(w.app(exclude, {abc, w.str("a")})), w.un({w.str("b"), w.str("c")}));
  EXPECT_EQ(w.eval(w.app(exclude, {abc, k_string})), k_never);
}

TEST(EvalConditional, TupleWrappedCheckDoesNotDistribute)
{
  TypeWorld w;
  const auto t = w.type_param("T");
  const TypeId body = w.interner.conditional(
    w.tup({w.param_type(t)}), w.tup({k_never}), w.boolean(true), w.boolean(false));
  const TypeId is_never = w.alias("IsNever", body, {t});

  EXPECT_EQ(w.eval(w.app(is_never, {w.un({w.str("a"), w.str("b")})})), w.boolean(false));
  EXPECT_EQ(w.eval(w.app(is_never, {k_never})), w.boolean(true));
}

TEST(EvalConditional, NakedCheckOverNeverIsNever)
{
  TypeWorld w;
  const auto t = w.type_param("T");
  const TypeId body =
    w.interner.conditional(w.param_type(t), k_never, w.boolean(true), w.boolean(false));
  const TypeId naive = w.alias("NaiveIsNever", body, {t});

  EXPECT_EQ(w.eval(w.app(naive, {k_never})), k_never);
  EXPECT_EQ(w.eval(w.app(naive, {k_string})), w.boolean(false));
}

TEST(EvalConditional, GenericCheckStaysDeferred)
{
  TypeWorld w;
  const TypeId exclude = declare_exclude(w);
  const auto v = w.type_param("V");
  const TypeId deferred = w.app(exclude, {w.param_type(v), k_string});
  EXPECT_EQ(w.eval(deferred), deferred);
}

TEST(EvalConditional, InferCapturesArrayElement)
{
  TypeWorld w;
  const auto t = w.type_param("T");
  const auto e = w.type_param("E");
  const TypeId body = w.interner.conditional(
    w.param_type(t), w.arr(w.interner.infer(e)), w.param_type(e), k_never);
  const TypeId element_of = w.alias("ElementOf", body, {t});

  EXPECT_EQ(w.eval(w.app(element_of, {w.arr(k_string)})), k_string);
  EXPECT_EQ(w.eval(w.app(element_of, {k_number})), k_never);
}

TEST(EvalConditional, InferCapturesReturnType)
{
  TypeWorld w;
  const auto f = w.type_param("F");
  const auto r = w.type_param("R");
  const TypeId body = w.interner.conditional(
    w.param_type(f), w.fn({k_never}, w.interner.infer(r)), w.param_type(r), k_never);
  const TypeId return_of = w.alias("ReturnOf", body, {f});

  EXPECT_EQ(w.eval(w.app(return_of, {w.fn({k_number}, k_string)})), k_string);
}

TEST(EvalConditional, ReturnTypeOverAnyRestParameters)
{
  TypeWorld w;
  const TypeId return_type = declare_return_type(w);

  EXPECT_EQ(w.eval(w.app(return_type, {w.fn({k_number}, k_string)})), k_string);
  EXPECT_EQ(w.eval(w.app(return_type, {w.fn({k_number, k_boolean}, k_void)})), k_void);
  EXPECT_EQ(w.eval(w.app(return_type, {w.fn({}, k_number)})), k_number);
  EXPECT_EQ(w.eval(w.app(return_type, {k_string})), k_any);
}

TEST(EvalConditional, PrimitivesExtendObjectPatterns)
{
  TypeWorld w;
  // type IsNonNullish<T> = T extends {} ? true : false
  const auto t = w.type_param("T");
  const TypeId body =
    w.interner.conditional(w.param_type(t), w.obj({}), w.boolean(true), w.boolean(false));
  const TypeId non_nullish = w.alias("IsNonNullish", body, {t});

  EXPECT_EQ(w.eval(w.app(non_nullish, {k_string})), w.boolean(true));
  EXPECT_EQ(w.eval(w.app(non_nullish, {w.num(0)})), w.boolean(true));
  EXPECT_EQ(w.eval(w.app(non_nullish, {k_null})), w.boolean(false));
  EXPECT_EQ(w.eval(w.app(non_nullish, {k_undefined})), w.boolean(false));

  // Members come from the apparent interface; `length` is readonly there.
  const TypeId has_length = w.obj({{"length", k_number}});
  EXPECT_EQ(
    w.eval(w.interner.conditional(w.str("abc"), has_length, w.boolean(true), w.boolean(false))),
    w.boolean(true));
  EXPECT_EQ(
    w.eval(w.interner.conditional(k_number, has_length, w.boolean(true), w.boolean(false))),
    w.boolean(false));
}

TEST(EvalConditional, AnyMatchesAtEveryDepth)
{
  TypeWorld w;
  const TypeId check = w.obj({{"a", k_any}});
  const TypeId pattern = w.obj({{"a", k_string}});
  EXPECT_EQ(
    w.eval(w.interner.conditional(check, pattern, w.boolean(true), w.boolean(false))),
    w.boolean(true));
  EXPECT_EQ(
    w.eval(w.interner.conditional(
      w.fn({k_string}, k_any), w.fn({k_string}, k_number), w.boolean(true), w.boolean(false))),
    w.boolean(true));
}

// ============================================================================
// Mapped Types
// ============================================================================

TEST(EvalMapped, PartialAddsOptional)
{
  TypeWorld w;
  const TypeId partial =
    declare_homomorphic(w, "Partial", MappedModifier::Preserve, MappedModifier::Add);
  const TypeId src = w.obj({{"a", k_number}, {"b", k_string}});

  EXPECT_EQ(
    w.eval(w.app(partial, {src})), w.obj({{"a", k_number, true}, {"b", k_string, true}}));
}

TEST(EvalMapped, ReadonlyAddsReadonly)
{
  TypeWorld w;
  const TypeId ro = declare_homomorphic(w, "Readonly", MappedModifier::Add, MappedModifier::Preserve);
  EXPECT_EQ(
    w.eval(w.app(ro, {w.obj({{"a", k_number}})})), w.obj({{"a", k_number, false, true}}));
}

TEST(EvalMapped, RequiredStripsUndefined)
{
  TypeWorld w;
  const TypeId required =
    declare_homomorphic(w, "Required", MappedModifier::Preserve, MappedModifier::Remove);
  EXPECT_EQ(w.eval(w.app(required, {w.obj({{"a", k_number, true}})})), w.obj({{"a", k_number}}));
}

TEST(EvalMapped, HomomorphicPreservesModifiers)
{
  TypeWorld w;
  const TypeId copy = declare_homomorphic(w, "Copy", MappedModifier::Preserve, MappedModifier::Preserve);
  const TypeId src = w.obj({{"a", k_number, true, true}});
  const TypeId out = w.eval(w.app(copy, {src}));
  // Optional members read as `number | undefined` through T[P].
  EXPECT_EQ(out, w.obj({{"a", w.un({k_number, k_undefined}), true, true}}));
}

TEST(EvalMapped, PrimitiveSourceMapsApparentShape)
{
  TypeWorld w;
  const TypeId partial =
    declare_homomorphic(w, "Partial", MappedModifier::Preserve, MappedModifier::Add);
  const TypeId out = w.eval(w.app(partial, {k_string}));

  const ObjectShape * shape = object_shape_of(w.interner, out);
  ASSERT_NE(shape, nullptr);

  const PropertyInfo * length = shape->find("length");
  ASSERT_NE(length, nullptr);
  EXPECT_EQ(length->read_type, k_number);
  EXPECT_TRUE(length->optional);
  EXPECT_TRUE(length->readonly);

  const PropertyInfo * char_at = shape->find("charAt");
  ASSERT_NE(char_at, nullptr);
  EXPECT_TRUE(char_at->optional);
  EXPECT_TRUE(char_at->is_method);

  ASSERT_TRUE(shape->number_index.has_value());
  EXPECT_EQ(shape->number_index->value_type, k_string);
}

TEST(EvalMapped, ArraysMapElementwise)
{
  TypeWorld w;
  const TypeId ro = declare_homomorphic(w, "Readonly", MappedModifier::Add, MappedModifier::Preserve);
  EXPECT_EQ(w.eval(w.app(ro, {w.arr(k_string)})), w.interner.readonly_array_of(k_string));
}

TEST(EvalMapped, KeyUnionWithoutSource)
{
  TypeWorld w;
  const auto p = w.type_param("P");
  MappedKey key;
  key.param = p;
  key.constraint = w.un({w.str("x"), w.str("y")});
  key.name_type = k_invalid_type;
  key.template_type = k_boolean;
  const TypeId record = w.interner.mapped(std::move(key));

  EXPECT_EQ(w.eval(record), w.obj({{"x", k_boolean}, {"y", k_boolean}}));
}

// ============================================================================
// Template Literals
// ============================================================================

TEST(EvalTemplate, ExpandsCrossProduct)
{
  TypeWorld w;
  const TypeId tl = w.interner.template_literal({
    TemplateSpan{"", w.un({w.str("a"), w.str("b")})},
    TemplateSpan{"-", k_invalid_type},
    TemplateSpan{"", w.un({w.num(1), w.num(2)})},
  });

  EXPECT_EQ(
    w.eval(tl), w.un({w.str("a-1"), w.str("a-2"), w.str("b-1"), w.str("b-2")}));
}

TEST(EvalTemplate, BooleanExpandsToBothLiterals)
{
  TypeWorld w;
  const TypeId tl = w.interner.template_literal({
    TemplateSpan{"is-", k_invalid_type},
    TemplateSpan{"", k_boolean},
  });
  EXPECT_EQ(w.eval(tl), w.un({w.str("is-false"), w.str("is-true")}));
}

TEST(EvalTemplate, ExpansionBudgetYieldsString)
{
  SolverConfig config;
  config.limits.template_expansion_limit = 3;
  TypeWorld w(config);
  const TypeId tl = w.interner.template_literal({
    TemplateSpan{"", w.un({w.str("a"), w.str("b")})},
    TemplateSpan{"", w.un({w.str("c"), w.str("d")})},
  });

  DiagnosticBag diags;
  const Evaluation result = w.solver->evaluate(tl, &diags);
  EXPECT_EQ(result.type, k_string);
  EXPECT_TRUE(result.truncated);
  EXPECT_TRUE(diags.has_code("W0004"));
}

TEST(EvalTemplate, InterpolatedAnyWidensToString)
{
  TypeWorld w;
  const TypeId tl = w.interner.template_literal({
    TemplateSpan{"id-", k_invalid_type},
    TemplateSpan{"", w.un({w.str("a"), w.str("b")})},
    TemplateSpan{"-", k_invalid_type},
    TemplateSpan{"", k_any},
  });
  EXPECT_EQ(w.eval(tl), k_string);
}

TEST(EvalTemplate, NumberLiteralsUseScriptFormatting)
{
  TypeWorld w;
  const TypeId tl = w.interner.template_literal({
    TemplateSpan{"n=", k_invalid_type},
    TemplateSpan{"", w.un({w.num(1e21), w.num(1e-7), w.num(0.5)})},
  });
  EXPECT_EQ(w.eval(tl), w.un({w.str("n=1e+21"), w.str("n=1e-7"), w.str("n=0.5")}));
}

TEST(EvalTemplate, StringIntrinsics)
{
  TypeWorld w;
  EXPECT_EQ(
    w.eval(w.interner.string_intrinsic(StringIntrinsicKind::Uppercase, w.str("abc"))),
    w.str("ABC"));
  EXPECT_EQ(
    w.eval(w.interner.string_intrinsic(
      StringIntrinsicKind::Capitalize, w.un({w.str("x"), w.str("yz")}))),
    w.un({w.str("X"), w.str("Yz")}));
}

// ============================================================================
// keyof and Indexed Access
// ============================================================================

TEST(EvalOperators, KeyofObject)
{
  TypeWorld w;
  const TypeId src = w.obj({{"a", k_number}, {"b", k_string}});
  EXPECT_EQ(w.eval(w.interner.keyof(src)), w.un({w.str("a"), w.str("b")}));
  EXPECT_EQ(w.eval(w.interner.keyof(k_unknown)), k_never);
}

TEST(EvalOperators, KeyofPrimitiveUsesApparentMembers)
{
  TypeWorld w;
  const auto keys = w.interner.union_members(w.eval(w.interner.keyof(k_string)));
  EXPECT_TRUE(contains(keys, w.str("length")));
  EXPECT_TRUE(contains(keys, w.str("charAt")));
  EXPECT_TRUE(contains(keys, w.str("toUpperCase")));
  EXPECT_TRUE(contains(keys, k_number));
  EXPECT_FALSE(contains(keys, k_string));

  const auto number_keys = w.interner.union_members(w.eval(w.interner.keyof(k_number)));
  EXPECT_TRUE(contains(number_keys, w.str("toFixed")));
  EXPECT_FALSE(contains(number_keys, k_number));
}

TEST(EvalOperators, KeyofUnionIsCommonKeys)
{
  TypeWorld w;
  const TypeId u = w.un({w.obj({{"a", k_number}, {"b", k_number}}), w.obj({{"a", k_string}})});
  EXPECT_EQ(w.eval(w.interner.keyof(u)), w.str("a"));
}

TEST(EvalOperators, IndexAccess)
{
  TypeWorld w;
  const TypeId src = w.obj({{"a", k_number}, {"b", k_string, true}});
  EXPECT_EQ(w.eval(w.interner.index_access(src, w.str("a"))), k_number);
  EXPECT_EQ(
    w.eval(w.interner.index_access(src, w.str("b"))), w.un({k_string, k_undefined}));
  EXPECT_EQ(
    w.eval(w.interner.index_access(src, w.un({w.str("a"), w.str("b")}))),
    w.un({k_number, k_string, k_undefined}));
}

TEST(EvalOperators, IndexAccessOnTuplesAndArrays)
{
  TypeWorld w;
  const TypeId pair = w.tup({k_string, k_number});
  EXPECT_EQ(w.eval(w.interner.index_access(pair, w.num(0))), k_string);
  EXPECT_EQ(w.eval(w.interner.index_access(pair, w.str("length"))), w.num(2));
  EXPECT_EQ(w.eval(w.interner.index_access(pair, k_number)), w.un({k_string, k_number}));
  EXPECT_EQ(w.eval(w.interner.index_access(w.arr(k_boolean), k_number)), k_boolean);
}

TEST(EvalOperators, ApparentTypeOfString)
{
  TypeWorld w;
  const TypeId apparent = w.solver->apparent_type(k_string);
  EXPECT_EQ(w.eval(w.interner.index_access(apparent, w.str("length"))), k_number);
  EXPECT_EQ(w.eval(w.interner.index_access(k_string, w.str("length"))), k_number);
}

// ============================================================================
// Instantiation and Budgets
// ============================================================================

TEST(EvalInstantiation, EvaluationIsIdempotent)
{
  TypeWorld w;
  const TypeId partial =
    declare_homomorphic(w, "Partial", MappedModifier::Preserve, MappedModifier::Add);
  const TypeId once = w.eval(w.app(partial, {w.obj({{"a", k_number}})}));
  EXPECT_EQ(w.eval(once), once);
  EXPECT_EQ(w.eval(k_string), k_string);
}

TEST(EvalInstantiation, MissingArgumentsTakeDefaults)
{
  TypeWorld w;
  auto t = w.type_param("T");
  t.default_type = k_string;
  const TypeId box = w.alias("Box", w.obj({{"v", w.param_type(t)}}), {t});

  const std::vector<TypeId> none;
  const Evaluation result = w.solver->instantiate(box, none);
  EXPECT_EQ(result.type, w.obj({{"v", k_string}}));
  EXPECT_FALSE(result.truncated);
}

TEST(EvalInstantiation, InterfacesKeepTheirIdentity)
{
  TypeWorld w;
  const TypeId point = w.interface("Point", w.obj({{"x", k_number}}));
  EXPECT_EQ(w.eval(point), point);
}

TEST(EvalInstantiation, InfiniteExpansionTruncates)
{
  SolverConfig config;
  config.limits.max_instantiation_depth = 10;
  TypeWorld w(config);

  // type Loop<X> = Loop<[X]>
  const auto x = w.type_param("X");
  const DefId loop_id = w.reserve();
  const TypeId loop = w.define_alias(
    loop_id, "Loop", w.app(w.interner.lazy(loop_id), {w.tup({w.param_type(x)})}), {x});

  DiagnosticBag diags;
  const Evaluation result = w.solver->evaluate(w.app(loop, {k_string}), &diags);
  EXPECT_EQ(result.type, k_unknown);
  EXPECT_TRUE(result.truncated);
  EXPECT_TRUE(diags.has_code("W0003"));
  EXPECT_FALSE(diags.has_errors());
}

// ============================================================================
// Genericity
// ============================================================================

TEST(EvalGeneric, ParameterBoundInSignatureThenFree)
{
  TypeWorld w;
  const auto t = w.type_param("T");

  // <T>(x: T) => T
  SignatureSpec identity;
  identity.type_params.push_back(t);
  identity.params.push_back(ParamInfo{"x", w.param_type(t)});
  identity.return_type = w.param_type(t);
  const TypeId generic_fn = w.interner.function(std::move(identity));

  const Evaluator & evaluator = w.solver->evaluator();
  EXPECT_FALSE(evaluator.is_generic(generic_fn));

  // [<T>(x: T) => T, T]: the second element is free.
  const TypeId pair = w.tup({generic_fn, w.param_type(t)});
  EXPECT_TRUE(evaluator.is_generic(pair));
}

TEST(EvalGeneric, ParameterBoundInMappedTypeThenFree)
{
  TypeWorld w;
  const auto p = w.type_param("P");
  MappedKey key;
  key.param = p;
  key.constraint = w.un({w.str("x"), w.str("y")});
  key.name_type = k_invalid_type;
  key.template_type = w.arr(w.param_type(p));
  const TypeId record = w.interner.mapped(std::move(key));

  const Evaluator & evaluator = w.solver->evaluator();
  EXPECT_FALSE(evaluator.is_generic(record));
  EXPECT_TRUE(evaluator.is_generic(w.tup({record, w.arr(w.param_type(p))})));
}
