// tscore/eval/apparent.cpp - Apparent member types of non-object types
//
// A primitive is compared against, and mapped over, the interface of its
// wrapper object. When the library supplies those interfaces through the
// Environment they win; otherwise a built-in table of ES members is used.
//
#include <string>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/eval/evaluator.hpp"

namespace tscore
{

namespace
{

struct MemberEntry
{
  const char * name;
  bool is_method;
  TypeId type;  ///< property type, or the method's return type
};

// clang-format off
const MemberEntry k_string_members[] = {
  {"length", false, k_number},
  {"at", true, k_string},
  {"charAt", true, k_string},
  {"charCodeAt", true, k_number},
  {"codePointAt", true, k_number},
  {"concat", true, k_string},
  {"endsWith", true, k_boolean},
  {"includes", true, k_boolean},
  {"indexOf", true, k_number},
  {"lastIndexOf", true, k_number},
  {"localeCompare", true, k_number},
  {"normalize", true, k_string},
  {"padEnd", true, k_string},
  {"padStart", true, k_string},
  {"repeat", true, k_string},
  {"replace", true, k_string},
  {"slice", true, k_string},
  {"startsWith", true, k_boolean},
  {"substring", true, k_string},
  {"toLocaleLowerCase", true, k_string},
  {"toLocaleUpperCase", true, k_string},
  {"toLowerCase", true, k_string},
  {"toString", true, k_string},
  {"toUpperCase", true, k_string},
  {"trim", true, k_string},
  {"trimEnd", true, k_string},
  {"trimStart", true, k_string},
  {"valueOf", true, k_string},
};

const MemberEntry k_number_members[] = {
  {"toExponential", true, k_string},
  {"toFixed", true, k_string},
  {"toLocaleString", true, k_string},
  {"toPrecision", true, k_string},
  {"toString", true, k_string},
  {"valueOf", true, k_number},
};

const MemberEntry k_boolean_members[] = {
  {"valueOf", true, k_boolean},
};

const MemberEntry k_bigint_members[] = {
  {"toLocaleString", true, k_string},
  {"toString", true, k_string},
  {"valueOf", true, k_bigint},
};

const MemberEntry k_symbol_members[] = {
  {"description", false, k_string},
  {"toString", true, k_string},
  {"valueOf", true, k_symbol},
};
// clang-format on

}  // namespace

TypeId Evaluator::primitive_apparent(IntrinsicKind kind)
{
  gsl::span<const MemberEntry> table;
  switch (kind) {
    case IntrinsicKind::String:
      table = k_string_members;
      break;
    case IntrinsicKind::Number:
      table = k_number_members;
      break;
    case IntrinsicKind::Boolean:
      table = k_boolean_members;
      break;
    case IntrinsicKind::BigInt:
      table = k_bigint_members;
      break;
    case IntrinsicKind::Symbol:
      table = k_symbol_members;
      break;
    default:
      return intrinsic_type_id(kind);
  }

  // Methods are typed loosely as `(...args: any[]) => R`.
  const TypeId any_args = interner_.array_of(k_any);
  ObjectShape shape;
  for (const auto & entry : table) {
    PropertyInfo p;
    p.name = entry.name;
    if (entry.is_method) {
      SignatureSpec sig;
      sig.params.push_back(ParamInfo{"args", any_args, false, true});
      sig.return_type = entry.type;
      sig.is_method = true;
      p.read_type = interner_.function(std::move(sig));
      p.is_method = true;
    } else {
      p.read_type = entry.type;
      p.readonly = true;
    }
    if (kind == IntrinsicKind::Symbol && p.name == "description") {
      p.read_type = interner_.union_of({k_string, k_undefined});
    }
    p.write_type = p.read_type;
    shape.properties.push_back(std::move(p));
  }
  if (kind == IntrinsicKind::String) shape.number_index = IndexSignature{k_number, k_string, true};
  return interner_.object(std::move(shape));
}

TypeId Evaluator::array_apparent(TypeId element, bool readonly, QueryContext & ctx)
{
  const DefId array_def = env_.global_array();
  if (array_def.is_valid()) {
    const TypeId args[] = {element};
    return instantiate(interner_.lazy(array_def), args, ctx);
  }

  ObjectShape shape;
  PropertyInfo length;
  length.name = "length";
  length.read_type = k_number;
  length.write_type = k_number;
  length.readonly = readonly;
  shape.properties.push_back(std::move(length));
  shape.number_index = IndexSignature{k_number, element, readonly};
  return interner_.object(std::move(shape));
}

TypeId Evaluator::apparent_type(TypeId id, QueryContext & ctx)
{
  QueryGuard::DepthScope depth(ctx.guard, BudgetKind::EvaluationDepth);
  if (!depth.ok()) return id;

  const TypeId s = judge_.normalize(id, ctx);
  if (!s.is_valid()) return id;
  const TypeKey & key = interner_.lookup(s);

  if (const auto * intr = dyn_cast<IntrinsicKey>(key)) {
    if (is_primitive_kind(intr->kind)) {
      const TypeId library = env_.primitive_interface(intr->kind);
      return library.is_valid() ? library : primitive_apparent(intr->kind);
    }
    if (intr->kind == IntrinsicKind::Function) {
      const TypeId fn = env_.global_function();
      return fn.is_valid() ? fn : s;
    }
    if (intr->kind == IntrinsicKind::Object) {
      const TypeId root = env_.root_object();
      return root.is_valid() ? root : interner_.object(ObjectShape{});
    }
    return s;
  }

  if (isa<LiteralKey>(key)) return apparent_type(interner_.widen_literal(s), ctx);
  if (isa<TemplateLiteralKey>(key) || isa<StringIntrinsicKey>(key)) {
    return apparent_type(k_string, ctx);
  }

  if (const auto * e = dyn_cast<EnumKey>(key)) {
    std::vector<TypeId> bases;
    for (TypeId m : interner_.type_list(e->members)) bases.push_back(interner_.widen_literal(m));
    const TypeId base = interner_.union_of(std::move(bases));
    return base.is_intrinsic() ? apparent_type(base, ctx) : s;
  }

  if (const auto * arr = dyn_cast<ArrayKey>(key)) return array_apparent(arr->element, false, ctx);
  if (const auto * arr = dyn_cast<ReadonlyArrayKey>(key)) {
    return array_apparent(arr->element, true, ctx);
  }

  if (const auto * tup = dyn_cast<TupleKey>(key)) {
    const auto elements = interner_.tuple_list(tup->elements);
    std::vector<TypeId> members;
    for (const auto & e : elements) members.push_back(e.type);
    const TypeId base = judge_.normalize(
      array_apparent(interner_.union_of(std::move(members)), false, ctx), ctx);
    const ObjectShape * base_shape = object_shape_of(interner_, base);
    if (!base_shape) return base;

    // Positional members and a literal `length` on top of the array interface.
    ObjectShape shape = *base_shape;
    bool variable = false;
    for (size_t i = 0; i < elements.size(); ++i) {
      if (elements[i].rest) {
        variable = true;
        continue;
      }
      variable = variable || elements[i].optional;
      PropertyInfo p;
      p.name = std::to_string(i);
      p.read_type = elements[i].type;
      p.write_type = elements[i].type;
      p.optional = elements[i].optional;
      shape.properties.push_back(std::move(p));
    }
    if (!variable) {
      for (auto & p : shape.properties) {
        if (p.name != "length") continue;
        p.read_type = interner_.literal_number(static_cast<double>(elements.size()));
        p.write_type = p.read_type;
      }
    }
    return interner_.object(std::move(shape));
  }

  if (isa<FunctionKey>(key) || isa<ConstructorKey>(key)) {
    const TypeId fn = env_.global_function();
    return fn.is_valid() ? fn : s;
  }

  if (const auto * tp = dyn_cast<TypeParameterKey>(key)) {
    TypeId constraint = tp->info.constraint;
    if (!constraint.is_valid()) constraint = env_.type_param_constraint(tp->info.def);
    if (constraint.is_valid()) return apparent_type(constraint, ctx);
    return interner_.object(ObjectShape{});
  }

  return s;
}

}  // namespace tscore
