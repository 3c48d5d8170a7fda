// tscore/types/type_json.cpp - JSON dump of interned types
//
#include "tscore/types/type_json.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"
#include "tscore/types/interner.hpp"

namespace tscore
{
namespace
{

using nlohmann::json;

const char * modifier_name(MappedModifier m)
{
  switch (m) {
    case MappedModifier::Preserve:
      return "preserve";
    case MappedModifier::Add:
      return "add";
    case MappedModifier::Remove:
      return "remove";
  }
  return "preserve";
}

const char * enum_kind_name(EnumKind k)
{
  switch (k) {
    case EnumKind::Numeric:
      return "numeric";
    case EnumKind::String:
      return "string";
    case EnumKind::Heterogeneous:
      return "heterogeneous";
  }
  return "numeric";
}

const char * string_intrinsic_name(StringIntrinsicKind k)
{
  switch (k) {
    case StringIntrinsicKind::Uppercase:
      return "Uppercase";
    case StringIntrinsicKind::Lowercase:
      return "Lowercase";
    case StringIntrinsicKind::Capitalize:
      return "Capitalize";
    case StringIntrinsicKind::Uncapitalize:
      return "Uncapitalize";
  }
  return "Uppercase";
}

class JsonDumper
{
public:
  explicit JsonDumper(const TypeInterner & interner) : interner_(interner) {}

  json dump(TypeId id, int depth)
  {
    if (!id.is_valid()) return nullptr;
    if (depth <= 0) return json{{"ref", id.value}};

    const TypeKey & key = interner_.lookup(id);
    json j{{"kind", key_kind_name(key)}, {"id", id.value}};
    std::visit([&](const auto & k) { fill(j, k, depth - 1); }, key);
    return j;
  }

private:
  const TypeInterner & interner_;

  json list(gsl::span<const TypeId> ids, int depth)
  {
    json arr = json::array();
    for (TypeId t : ids) arr.push_back(dump(t, depth));
    return arr;
  }

  json type_param(const TypeParamInfo & p, int depth)
  {
    return json{
      {"name", p.name},
      {"def", p.def.value},
      {"constraint", dump(p.constraint, depth)},
      {"default", dump(p.default_type, depth)}};
  }

  json signature(const FunctionShape & shape, int depth)
  {
    json params = json::array();
    for (const auto & p : interner_.param_list(shape.params)) {
      params.push_back(json{
        {"name", p.name}, {"type", dump(p.type, depth)}, {"optional", p.optional}, {"rest", p.rest}});
    }
    json tps = json::array();
    for (const auto & tp : shape.type_params) tps.push_back(type_param(tp, depth));
    return json{
      {"type_params", tps},
      {"params", params},
      {"this", dump(shape.this_type, depth)},
      {"return", dump(shape.return_type, depth)},
      {"method", shape.is_method}};
  }

  json index_sig(const std::optional<IndexSignature> & sig, int depth)
  {
    if (!sig) return nullptr;
    return json{{"value", dump(sig->value_type, depth)}, {"readonly", sig->readonly}};
  }

  void fill(json & j, const IntrinsicKey & k, int) { j["name"] = intrinsic_name(k.kind); }

  void fill(json & j, const LiteralKey & k, int)
  {
    switch (k.value.kind) {
      case LiteralKind::String:
        j["value"] = k.value.text;
        break;
      case LiteralKind::Number:
        j["value"] = format_number(k.value.number);
        j["number"] = true;
        break;
      case LiteralKind::BigInt:
        j["value"] = k.value.text;
        j["bigint"] = true;
        break;
      case LiteralKind::Boolean:
        j["value"] = k.value.boolean;
        break;
    }
  }

  void fill(json & j, const ObjectKey & k, int depth)
  {
    const ObjectShape & shape = interner_.object_shape(k.shape);
    json props = json::array();
    for (const auto & p : shape.properties) {
      json pj{
        {"name", p.name},
        {"type", dump(p.read_type, depth)},
        {"optional", p.optional},
        {"readonly", p.readonly}};
      if (p.has_split_accessors()) pj["write_type"] = dump(p.write_type, depth);
      if (p.is_method) pj["method"] = true;
      props.push_back(std::move(pj));
    }
    j["properties"] = std::move(props);
    j["string_index"] = index_sig(shape.string_index, depth);
    j["number_index"] = index_sig(shape.number_index, depth);
    j["fresh"] = shape.is_fresh;
  }

  void fill(json & j, const ArrayKey & k, int depth) { j["element"] = dump(k.element, depth); }

  void fill(json & j, const ReadonlyArrayKey & k, int depth)
  {
    j["element"] = dump(k.element, depth);
  }

  void fill(json & j, const TupleKey & k, int depth)
  {
    json elems = json::array();
    for (const auto & e : interner_.tuple_list(k.elements)) {
      json ej{{"type", dump(e.type, depth)}, {"optional", e.optional}, {"rest", e.rest}};
      if (!e.label.empty()) ej["label"] = e.label;
      elems.push_back(std::move(ej));
    }
    j["elements"] = std::move(elems);
  }

  void fill(json & j, const UnionKey & k, int depth)
  {
    j["members"] = list(interner_.type_list(k.members), depth);
  }

  void fill(json & j, const IntersectionKey & k, int depth)
  {
    j["members"] = list(interner_.type_list(k.members), depth);
  }

  void fill(json & j, const FunctionKey & k, int depth)
  {
    j["signature"] = signature(interner_.function_shape(k.shape), depth);
  }

  void fill(json & j, const ConstructorKey & k, int depth)
  {
    j["signature"] = signature(interner_.function_shape(k.shape), depth);
  }

  void fill(json & j, const TypeParameterKey & k, int depth) { j["param"] = type_param(k.info, depth); }

  void fill(json & j, const InferKey & k, int depth) { j["param"] = type_param(k.info, depth); }

  void fill(json & j, const ApplicationKey & k, int depth)
  {
    j["base"] = dump(k.base, depth);
    j["args"] = list(interner_.type_list(k.args), depth);
  }

  void fill(json & j, const ConditionalKey & k, int depth)
  {
    j["check"] = dump(k.check, depth);
    j["extends"] = dump(k.extends, depth);
    j["true"] = dump(k.true_type, depth);
    j["false"] = dump(k.false_type, depth);
    j["distributive"] = k.distributive;
  }

  void fill(json & j, const MappedKey & k, int depth)
  {
    j["param"] = type_param(k.param, depth);
    j["constraint"] = dump(k.constraint, depth);
    j["name_type"] = dump(k.name_type, depth);
    j["template"] = dump(k.template_type, depth);
    j["readonly"] = modifier_name(k.readonly_modifier);
    j["optional"] = modifier_name(k.optional_modifier);
  }

  void fill(json & j, const TemplateLiteralKey & k, int depth)
  {
    json spans = json::array();
    for (const auto & s : interner_.span_list(k.spans)) {
      if (s.is_text()) {
        spans.push_back(json{{"text", s.text}});
      } else {
        spans.push_back(json{{"type", dump(s.type, depth)}});
      }
    }
    j["spans"] = std::move(spans);
  }

  void fill(json & j, const EnumKey & k, int depth)
  {
    j["def"] = k.def.value;
    j["enum_kind"] = enum_kind_name(k.kind);
    j["members"] = list(interner_.type_list(k.members), depth);
  }

  void fill(json & j, const LazyKey & k, int) { j["def"] = k.def.value; }

  void fill(json & j, const TypeQueryKey & k, int) { j["def"] = k.def.value; }

  void fill(json & j, const KeyOfKey & k, int depth) { j["operand"] = dump(k.operand, depth); }

  void fill(json & j, const IndexAccessKey & k, int depth)
  {
    j["object"] = dump(k.object, depth);
    j["index"] = dump(k.index, depth);
  }

  void fill(json &, const ThisTypeKey &, int) {}

  void fill(json & j, const StringIntrinsicKey & k, int depth)
  {
    j["intrinsic"] = string_intrinsic_name(k.kind);
    j["operand"] = dump(k.operand, depth);
  }
};

}  // namespace

nlohmann::json to_json(const TypeInterner & interner, TypeId id, int max_depth)
{
  JsonDumper dumper(interner);
  return dumper.dump(id, max_depth);
}

}  // namespace tscore
