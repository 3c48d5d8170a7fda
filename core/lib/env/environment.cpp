// tscore/env/environment.cpp - Environment implementation
//
#include "tscore/env/environment.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

#include "tscore/basic/hash.hpp"

namespace tscore
{

const char * def_kind_name(DefKind kind) noexcept
{
  switch (kind) {
    case DefKind::Interface:
      return "interface";
    case DefKind::Class:
      return "class";
    case DefKind::TypeAlias:
      return "type alias";
    case DefKind::Enum:
      return "enum";
    case DefKind::EnumMember:
      return "enum member";
    case DefKind::Function:
      return "function";
    case DefKind::Variable:
      return "variable";
    case DefKind::TypeParameter:
      return "type parameter";
  }
  return "declaration";
}

Environment::Environment(TypeInterner & interner, DefinitionProvider * provider)
: interner_(interner), provider_(provider)
{
  for (auto & slot : primitive_interfaces_) {
    slot.store(0, std::memory_order_relaxed);
  }
}

Environment::Shard & Environment::shard_for(DefId def) noexcept
{
  return shards_[hash_mix(def.value) % k_shard_count];
}

const Environment::Shard & Environment::shard_for(DefId def) const noexcept
{
  return shards_[hash_mix(def.value) % k_shard_count];
}

// ============================================================================
// Definitions
// ============================================================================

DefId Environment::allocate_def()
{
  return DefId{next_def_.fetch_add(1, std::memory_order_relaxed)};
}

bool Environment::define(DefId def, DefinitionInfo info)
{
  Shard & shard = shard_for(def);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  auto [it, inserted] = shard.defs.try_emplace(def, nullptr);
  if (!inserted) return false;
  it->second = std::make_unique<const DefinitionInfo>(std::move(info));
  return true;
}

DefId Environment::declare(DefinitionInfo info)
{
  const DefId def = allocate_def();
  define(def, std::move(info));
  return def;
}

const DefinitionInfo * Environment::find(DefId def) const
{
  const Shard & shard = shard_for(def);
  std::shared_lock<std::shared_mutex> lock(shard.mutex);
  auto it = shard.defs.find(def);
  return it == shard.defs.end() ? nullptr : it->second.get();
}

Resolution Environment::resolve(DefId def, const ResolutionStack & stack, DiagnosticBag * diags)
{
  Resolution result;

  const DefinitionInfo * info = find(def);
  if (!info && provider_) {
    // Two workers may build the same definition; the first one stored wins.
    if (auto provided = provider_->provide(def, interner_)) {
      define(def, std::move(*provided));
      info = find(def);
    }
  }

  if (!info) {
    if (diags) {
      std::string message = "unresolved reference to declaration #" + std::to_string(def.value);
      // One warning per missing declaration in a bag.
      const bool reported =
        std::any_of(diags->begin(), diags->end(), [&message](const Diagnostic & d) {
          return d.code == "W0010" && d.message == message;
        });
      if (!reported) {
        diags->report_warning(std::move(message))
          .with_code("W0010")
          .with_help("the binder produced no definition for this id");
      }
    }
    result.status = ResolveStatus::Missing;
    result.type = k_unresolved;
    return result;
  }

  result.info = info;
  if (stack.contains(def)) {
    result.status = ResolveStatus::InProgress;
    result.type = interner_.lazy(def);
    return result;
  }

  result.status = ResolveStatus::Resolved;
  result.type = info->body.is_valid() ? info->body : k_unresolved;
  return result;
}

TypeId Environment::type_param_constraint(DefId param) const
{
  const DefinitionInfo * info = find(param);
  if (!info || info->kind != DefKind::TypeParameter) return k_invalid_type;
  return info->body;
}

// ============================================================================
// Global Library Slots
// ============================================================================

void Environment::set_root_object(TypeId type) noexcept
{
  root_object_.store(type.value, std::memory_order_release);
}

TypeId Environment::root_object() const noexcept
{
  return TypeId{root_object_.load(std::memory_order_acquire)};
}

void Environment::set_global_function(TypeId type) noexcept
{
  global_function_.store(type.value, std::memory_order_release);
}

TypeId Environment::global_function() const noexcept
{
  return TypeId{global_function_.load(std::memory_order_acquire)};
}

void Environment::set_global_array(DefId def) noexcept
{
  global_array_.store(def.value, std::memory_order_release);
}

DefId Environment::global_array() const noexcept
{
  return DefId{global_array_.load(std::memory_order_acquire)};
}

void Environment::set_primitive_interface(IntrinsicKind kind, TypeId type)
{
  primitive_interfaces_[static_cast<size_t>(kind)].store(type.value, std::memory_order_release);
}

TypeId Environment::primitive_interface(IntrinsicKind kind) const noexcept
{
  return TypeId{primitive_interfaces_[static_cast<size_t>(kind)].load(std::memory_order_acquire)};
}

}  // namespace tscore
