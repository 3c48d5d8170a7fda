// tscore/test_support/type_builders.hpp - helpers for unit tests
//
// A TypeWorld owns one interner / environment / solver triple and offers
// short constructors for the shapes tests need, standing in for the binder.
//
#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tscore/env/environment.hpp"
#include "tscore/solver.hpp"
#include "tscore/types/interner.hpp"
#include "tscore/types/type_printer.hpp"

namespace tscore::test_support
{

struct Prop
{
  std::string name;
  TypeId type;
  bool optional = false;
  bool readonly = false;
  bool is_method = false;
  TypeId write_type = k_invalid_type;  ///< setter type when it differs from the getter
};

struct EnumDecl
{
  TypeId type;                  ///< Lazy reference to the enum
  std::vector<TypeId> members;  ///< Lazy references to each member
};

struct TypeWorld
{
  TypeInterner interner;
  Environment env{interner};
  std::unique_ptr<Solver> solver;

  explicit TypeWorld(SolverConfig config = SolverConfig{})
  : solver(std::make_unique<Solver>(env, std::move(config)))
  {
  }

  // --------------------------------------------------------------------------
  // Leaves
  // --------------------------------------------------------------------------

  TypeId str(std::string text) { return interner.literal_string(std::move(text)); }
  TypeId num(double value) { return interner.literal_number(value); }
  TypeId boolean(bool value) { return interner.literal_boolean(value); }

  TypeId un(std::vector<TypeId> members) { return interner.union_of(std::move(members)); }
  TypeId inter(std::vector<TypeId> members) { return interner.intersection_of(std::move(members)); }
  TypeId arr(TypeId element) { return interner.array_of(element); }

  TypeId tup(std::initializer_list<TypeId> elements)
  {
    std::vector<TupleElement> out;
    for (TypeId e : elements) out.push_back(TupleElement{e, "", false, false});
    return interner.tuple(std::move(out));
  }

  // --------------------------------------------------------------------------
  // Objects and signatures
  // --------------------------------------------------------------------------

  TypeId obj(std::initializer_list<Prop> props, bool fresh = false)
  {
    ObjectShape shape;
    for (const auto & p : props) {
      PropertyInfo info;
      info.name = p.name;
      info.read_type = p.type;
      info.write_type = p.write_type.is_valid() ? p.write_type : p.type;
      info.optional = p.optional;
      info.readonly = p.readonly;
      info.is_method = p.is_method;
      shape.properties.push_back(std::move(info));
    }
    shape.is_fresh = fresh;
    return interner.object(std::move(shape));
  }

  /// Type of an object literal expression.
  TypeId literal_obj(std::initializer_list<Prop> props) { return obj(props, true); }

  TypeId fn(std::initializer_list<TypeId> params, TypeId ret, bool is_method = false)
  {
    SignatureSpec sig;
    int i = 0;
    for (TypeId p : params) sig.params.push_back(ParamInfo{"p" + std::to_string(i++), p});
    sig.return_type = ret;
    sig.is_method = is_method;
    return interner.function(std::move(sig));
  }

  // --------------------------------------------------------------------------
  // Declarations
  // --------------------------------------------------------------------------

  /// Declare a type parameter; returns its info (use `param_type` for the type).
  TypeParamInfo type_param(std::string name, TypeId constraint = k_invalid_type)
  {
    DefinitionInfo def;
    def.kind = DefKind::TypeParameter;
    def.name = name;
    def.body = constraint;
    TypeParamInfo info;
    info.def = env.declare(std::move(def));
    info.name = std::move(name);
    info.constraint = constraint;
    return info;
  }

  TypeId param_type(const TypeParamInfo & info) { return interner.type_parameter(info); }

  /// Declare `type name<params> = body`; returns the Lazy reference.
  TypeId alias(std::string name, TypeId body, std::vector<TypeParamInfo> params = {})
  {
    DefinitionInfo def;
    def.kind = DefKind::TypeAlias;
    def.name = std::move(name);
    def.type_params = std::move(params);
    def.body = body;
    return interner.lazy(env.declare(std::move(def)));
  }

  /// Reserve a declaration id so a body can refer to it before it is defined.
  DefId reserve() { return env.allocate_def(); }

  TypeId define_alias(DefId id, std::string name, TypeId body, std::vector<TypeParamInfo> params = {})
  {
    DefinitionInfo def;
    def.kind = DefKind::TypeAlias;
    def.name = std::move(name);
    def.type_params = std::move(params);
    def.body = body;
    env.define(id, std::move(def));
    return interner.lazy(id);
  }

  TypeId define_interface(DefId id, std::string name, TypeId body, std::vector<TypeParamInfo> params = {})
  {
    DefinitionInfo def;
    def.kind = DefKind::Interface;
    def.name = std::move(name);
    def.type_params = std::move(params);
    def.body = body;
    env.define(id, std::move(def));
    return interner.lazy(id);
  }

  TypeId interface(std::string name, TypeId body, std::vector<TypeParamInfo> params = {})
  {
    return define_interface(reserve(), std::move(name), body, std::move(params));
  }

  TypeId app(TypeId base, std::vector<TypeId> args)
  {
    return interner.application(base, std::move(args));
  }

  /// Declare an enum whose members have the given literal values.
  EnumDecl enumeration(std::string name, EnumKind kind, std::vector<TypeId> values)
  {
    const DefId enum_id = reserve();
    EnumDecl out;
    int i = 0;
    for (TypeId value : values) {
      DefinitionInfo member;
      member.kind = DefKind::EnumMember;
      member.name = name + ".M" + std::to_string(i++);
      member.parent = enum_id;
      member.enum_kind = kind;
      const DefId member_id = reserve();
      member.body = interner.enum_type(member_id, {value}, kind);
      env.define(member_id, std::move(member));
      out.members.push_back(interner.lazy(member_id));
    }

    DefinitionInfo def;
    def.kind = DefKind::Enum;
    def.name = std::move(name);
    def.enum_kind = kind;
    def.body = interner.enum_type(enum_id, values, kind);
    env.define(enum_id, std::move(def));
    out.type = interner.lazy(enum_id);
    return out;
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  bool assignable(TypeId s, TypeId t) { return solver->assignable(s, t).ok; }
  bool subtype(TypeId s, TypeId t) { return solver->subtype(s, t).ok; }
  TypeId eval(TypeId id) { return solver->evaluate(id).type; }
  std::string show(TypeId id) { return to_string(interner, id, &env); }
};

}  // namespace tscore::test_support
