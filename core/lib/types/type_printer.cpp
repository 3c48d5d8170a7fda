// tscore/types/type_printer.cpp - Source-syntax rendering of types
//
#include "tscore/types/type_printer.hpp"

#include <sstream>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"
#include "tscore/env/environment.hpp"
#include "tscore/types/interner.hpp"

namespace tscore
{

namespace
{

class TypePrinter
{
public:
  TypePrinter(const TypeInterner & interner, const Environment * env)
  : interner_(interner), env_(env)
  {
  }

  void print(TypeId id)
  {
    if (!id.is_valid()) {
      out_ << "<invalid>";
      return;
    }
    std::visit([&](const auto & key) { print_key(id, key); }, interner_.lookup(id));
  }

  std::string str() const { return out_.str(); }

private:
  const TypeInterner & interner_;
  const Environment * env_;
  std::ostringstream out_;

  // Operand positions where a union, intersection, function or conditional needs parentheses.
  void print_operand(TypeId id)
  {
    const TypeKey & key = interner_.lookup(id);
    const bool wrap = isa<UnionKey>(key) || isa<IntersectionKey>(key) || isa<FunctionKey>(key) ||
                      isa<ConstructorKey>(key) || isa<ConditionalKey>(key);
    if (wrap) out_ << '(';
    print(id);
    if (wrap) out_ << ')';
  }

  void print_def(DefId def)
  {
    const DefinitionInfo * info = env_ ? env_->find(def) : nullptr;
    if (info && !info->name.empty()) {
      out_ << info->name;
    } else {
      out_ << '#' << def.value;
    }
  }

  void print_string_literal(const std::string & text)
  {
    out_ << '"';
    for (char c : text) {
      if (c == '"' || c == '\\') out_ << '\\';
      out_ << c;
    }
    out_ << '"';
  }

  void print_type_params(const std::vector<TypeParamInfo> & params)
  {
    if (params.empty()) return;
    out_ << '<';
    for (size_t i = 0; i < params.size(); ++i) {
      if (i > 0) out_ << ", ";
      out_ << params[i].name;
      if (params[i].constraint.is_valid()) {
        out_ << " extends ";
        print(params[i].constraint);
      }
      if (params[i].default_type.is_valid()) {
        out_ << " = ";
        print(params[i].default_type);
      }
    }
    out_ << '>';
  }

  void print_signature(const FunctionShape & shape, bool is_constructor)
  {
    if (is_constructor) out_ << "new ";
    print_type_params(shape.type_params);
    out_ << '(';
    bool first = true;
    if (shape.this_type.is_valid()) {
      out_ << "this: ";
      print(shape.this_type);
      first = false;
    }
    size_t index = 0;
    for (const auto & p : interner_.param_list(shape.params)) {
      if (!first) out_ << ", ";
      first = false;
      if (p.rest) out_ << "...";
      if (p.name.empty()) {
        out_ << "arg" << index;
      } else {
        out_ << p.name;
      }
      if (p.optional) out_ << '?';
      out_ << ": ";
      print(p.type);
      ++index;
    }
    out_ << ") => ";
    print(shape.return_type);
  }

  void print_joined(gsl::span<const TypeId> members, const char * sep)
  {
    bool first = true;
    for (TypeId m : members) {
      if (!first) out_ << sep;
      first = false;
      print_operand(m);
    }
  }

  // ---------------------------------------------------------------------------

  void print_key(TypeId, const IntrinsicKey & k) { out_ << intrinsic_name(k.kind); }

  void print_key(TypeId, const LiteralKey & k)
  {
    switch (k.value.kind) {
      case LiteralKind::String:
        print_string_literal(k.value.text);
        break;
      case LiteralKind::Number:
        out_ << format_number(k.value.number);
        break;
      case LiteralKind::BigInt:
        out_ << k.value.text << 'n';
        break;
      case LiteralKind::Boolean:
        out_ << (k.value.boolean ? "true" : "false");
        break;
    }
  }

  void print_key(TypeId, const ObjectKey & k)
  {
    const ObjectShape & shape = interner_.object_shape(k.shape);
    if (shape.empty()) {
      out_ << "{}";
      return;
    }
    out_ << "{ ";
    for (const auto & p : shape.properties) {
      if (p.readonly) out_ << "readonly ";
      out_ << p.name;
      if (p.optional) out_ << '?';
      out_ << ": ";
      print(p.read_type);
      out_ << "; ";
    }
    if (shape.string_index) {
      if (shape.string_index->readonly) out_ << "readonly ";
      out_ << "[key: string]: ";
      print(shape.string_index->value_type);
      out_ << "; ";
    }
    if (shape.number_index) {
      if (shape.number_index->readonly) out_ << "readonly ";
      out_ << "[index: number]: ";
      print(shape.number_index->value_type);
      out_ << "; ";
    }
    out_ << '}';
  }

  void print_key(TypeId, const ArrayKey & k)
  {
    print_operand(k.element);
    out_ << "[]";
  }

  void print_key(TypeId, const ReadonlyArrayKey & k)
  {
    out_ << "readonly ";
    print_operand(k.element);
    out_ << "[]";
  }

  void print_key(TypeId, const TupleKey & k)
  {
    out_ << '[';
    bool first = true;
    for (const auto & e : interner_.tuple_list(k.elements)) {
      if (!first) out_ << ", ";
      first = false;
      if (e.rest) out_ << "...";
      if (!e.label.empty()) {
        out_ << e.label;
        if (e.optional) out_ << '?';
        out_ << ": ";
        print(e.type);
      } else {
        print(e.type);
        if (e.optional) out_ << '?';
      }
    }
    out_ << ']';
  }

  void print_key(TypeId, const UnionKey & k) { print_joined(interner_.type_list(k.members), " | "); }

  void print_key(TypeId, const IntersectionKey & k)
  {
    print_joined(interner_.type_list(k.members), " & ");
  }

  void print_key(TypeId, const FunctionKey & k)
  {
    print_signature(interner_.function_shape(k.shape), false);
  }

  void print_key(TypeId, const ConstructorKey & k)
  {
    print_signature(interner_.function_shape(k.shape), true);
  }

  void print_key(TypeId, const TypeParameterKey & k) { out_ << k.info.name; }

  void print_key(TypeId, const InferKey & k) { out_ << "infer " << k.info.name; }

  void print_key(TypeId, const ApplicationKey & k)
  {
    print(k.base);
    out_ << '<';
    bool first = true;
    for (TypeId a : interner_.type_list(k.args)) {
      if (!first) out_ << ", ";
      first = false;
      print(a);
    }
    out_ << '>';
  }

  void print_key(TypeId, const ConditionalKey & k)
  {
    print_operand(k.check);
    out_ << " extends ";
    print_operand(k.extends);
    out_ << " ? ";
    print(k.true_type);
    out_ << " : ";
    print(k.false_type);
  }

  void print_key(TypeId, const MappedKey & k)
  {
    out_ << "{ ";
    if (k.readonly_modifier == MappedModifier::Add) out_ << "readonly ";
    if (k.readonly_modifier == MappedModifier::Remove) out_ << "-readonly ";
    out_ << '[' << k.param.name << " in ";
    print(k.constraint);
    if (k.name_type.is_valid()) {
      out_ << " as ";
      print(k.name_type);
    }
    out_ << ']';
    if (k.optional_modifier == MappedModifier::Add) out_ << '?';
    if (k.optional_modifier == MappedModifier::Remove) out_ << "-?";
    out_ << ": ";
    print(k.template_type);
    out_ << " }";
  }

  void print_key(TypeId, const TemplateLiteralKey & k)
  {
    out_ << '`';
    for (const auto & span : interner_.span_list(k.spans)) {
      if (span.is_text()) {
        out_ << span.text;
      } else {
        out_ << "${";
        print(span.type);
        out_ << '}';
      }
    }
    out_ << '`';
  }

  void print_key(TypeId, const EnumKey & k) { print_def(k.def); }

  void print_key(TypeId, const LazyKey & k) { print_def(k.def); }

  void print_key(TypeId, const TypeQueryKey & k)
  {
    out_ << "typeof ";
    print_def(k.def);
  }

  void print_key(TypeId, const KeyOfKey & k)
  {
    out_ << "keyof ";
    print_operand(k.operand);
  }

  void print_key(TypeId, const IndexAccessKey & k)
  {
    print_operand(k.object);
    out_ << '[';
    print(k.index);
    out_ << ']';
  }

  void print_key(TypeId, const ThisTypeKey &) { out_ << "this"; }

  void print_key(TypeId, const StringIntrinsicKey & k)
  {
    switch (k.kind) {
      case StringIntrinsicKind::Uppercase:
        out_ << "Uppercase<";
        break;
      case StringIntrinsicKind::Lowercase:
        out_ << "Lowercase<";
        break;
      case StringIntrinsicKind::Capitalize:
        out_ << "Capitalize<";
        break;
      case StringIntrinsicKind::Uncapitalize:
        out_ << "Uncapitalize<";
        break;
    }
    print(k.operand);
    out_ << '>';
  }
};

}  // namespace

std::string to_string(const TypeInterner & interner, TypeId id, const Environment * env)
{
  TypePrinter printer(interner, env);
  printer.print(id);
  return printer.str();
}

}  // namespace tscore
