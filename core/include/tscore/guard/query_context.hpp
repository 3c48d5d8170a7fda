// tscore/guard/query_context.hpp - State owned by one top-level query
//
// Everything that would otherwise be ambient (memo tables, the resolution
// stack, the active policy) lives here and is passed by reference through
// every call. A context is never shared between threads.
//
#pragma once

#include <cstdint>
#include <limits>
#include <unordered_map>

#include "tscore/basic/diagnostic.hpp"
#include "tscore/basic/hash.hpp"
#include "tscore/env/resolution_stack.hpp"
#include "tscore/guard/guard_limits.hpp"
#include "tscore/guard/query_guard.hpp"
#include "tscore/types/type_id.hpp"
#include "tscore/types/type_key.hpp"

namespace tscore
{

class RelationHooks;
class TypeReducer;
struct CompatProfile;

enum class RelationKind : uint8_t {
  Subtype,     ///< strict Judge relation
  Assignable,  ///< Judge with policy hooks attached
  Extends,     ///< conditional type `extends` check
};

struct RelationKey
{
  TypeId source;
  TypeId target;
  RelationKind kind = RelationKind::Subtype;

  friend bool operator==(const RelationKey & a, const RelationKey & b) noexcept
  {
    return a.source == b.source && a.target == b.target && a.kind == b.kind;
  }
};

struct RelationKeyHash
{
  size_t operator()(const RelationKey & k) const noexcept
  {
    size_t seed = static_cast<size_t>(k.kind);
    hash_field(seed, k.source);
    hash_field(seed, k.target);
    return seed;
  }
};

enum class MemoState : uint8_t {
  InProgress,
  Holds,
  Fails,
};

struct RelationMemoEntry
{
  MemoState state = MemoState::InProgress;
  uint32_t depth = 0;  ///< relation depth at which the pair was entered
};

struct InstantiationKey
{
  TypeId generic;
  TypeListId args;

  friend bool operator==(const InstantiationKey & a, const InstantiationKey & b) noexcept
  {
    return a.generic == b.generic && a.args == b.args;
  }
};

struct InstantiationKeyHash
{
  size_t operator()(const InstantiationKey & k) const noexcept
  {
    size_t seed = 0;
    hash_field(seed, k.generic);
    hash_field(seed, k.args.value);
    return seed;
  }
};

/**
 * Per-query state.
 *
 * Memo tables only live as long as the query; a new query starts clean, so
 * concurrent queries never observe each other.
 */
struct QueryContext
{
  explicit QueryContext(const GuardLimits & limits, DiagnosticBag * diags = nullptr)
  : guard(limits, diags)
  {
  }

  QueryContext(const QueryContext &) = delete;
  QueryContext & operator=(const QueryContext &) = delete;

  QueryGuard guard;
  ResolutionStack resolution;

  // Relation memo (coinductive: an InProgress pair is assumed to hold).
  std::unordered_map<RelationKey, RelationMemoEntry, RelationKeyHash> relations;
  uint32_t relation_depth = 0;
  uint32_t in_progress = 0;
  /// Shallowest depth of an InProgress pair relied upon; results deeper than it are provisional.
  uint32_t assumption_floor = std::numeric_limits<uint32_t>::max();

  std::unordered_map<InstantiationKey, TypeId, InstantiationKeyHash> instantiations;
  std::unordered_map<TypeId, TypeId> evaluations;

  const CompatProfile * profile = nullptr;
  RelationHooks * hooks = nullptr;
  TypeReducer * reducer = nullptr;

  /// Set while re-walking a failed relation to build its FailureReason chain.
  bool explaining = false;

  /**
   * Set while deciding a conditional type's `extends` clause. `any` is then
   * both top and bottom at every depth, an `any` / `unknown` rest parameter
   * accepts every parameter list, and primitives meet object targets
   * through their apparent type.
   */
  bool extends_check = false;

  [[nodiscard]] DiagnosticBag * diagnostics() const noexcept { return guard.diagnostics(); }
  [[nodiscard]] bool truncated() const noexcept { return guard.truncated(); }
  [[nodiscard]] RelationKind relation_kind() const noexcept
  {
    if (extends_check) return RelationKind::Extends;
    return hooks ? RelationKind::Assignable : RelationKind::Subtype;
  }
};

/// Temporarily detach the policy hooks (strict sub-relation inside a policy rule).
class StrictScope
{
public:
  explicit StrictScope(QueryContext & ctx)
  : ctx_(ctx), saved_hooks_(ctx.hooks), saved_extends_(ctx.extends_check)
  {
    ctx_.hooks = nullptr;
    ctx_.extends_check = false;
  }
  ~StrictScope()
  {
    ctx_.hooks = saved_hooks_;
    ctx_.extends_check = saved_extends_;
  }

  StrictScope(const StrictScope &) = delete;
  StrictScope & operator=(const StrictScope &) = delete;

private:
  QueryContext & ctx_;
  RelationHooks * saved_hooks_;
  bool saved_extends_;
};

/// Switch the query to the conditional `extends` relation; policy hooks are detached.
class ExtendsScope
{
public:
  explicit ExtendsScope(QueryContext & ctx)
  : ctx_(ctx), saved_hooks_(ctx.hooks), saved_extends_(ctx.extends_check)
  {
    ctx_.hooks = nullptr;
    ctx_.extends_check = true;
  }
  ~ExtendsScope()
  {
    ctx_.hooks = saved_hooks_;
    ctx_.extends_check = saved_extends_;
  }

  ExtendsScope(const ExtendsScope &) = delete;
  ExtendsScope & operator=(const ExtendsScope &) = delete;

private:
  QueryContext & ctx_;
  RelationHooks * saved_hooks_;
  bool saved_extends_;
};

}  // namespace tscore
