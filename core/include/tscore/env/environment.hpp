// tscore/env/environment.hpp - DefId -> declaration mapping for one session
//
// The Environment is shared between workers. Definitions follow the same
// insert-if-absent discipline as the interner: once stored, a definition is
// never replaced or mutated.
//
#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "tscore/basic/diagnostic.hpp"
#include "tscore/env/definition.hpp"
#include "tscore/env/resolution_stack.hpp"
#include "tscore/types/interner.hpp"

namespace tscore
{

enum class ResolveStatus : uint8_t {
  Resolved,
  InProgress,  ///< already being expanded by this query (recursive reference)
  Missing,     ///< no definition and the provider had none either
};

struct Resolution
{
  ResolveStatus status = ResolveStatus::Missing;
  TypeId type = k_unresolved;
  const DefinitionInfo * info = nullptr;

  [[nodiscard]] bool resolved() const noexcept { return status == ResolveStatus::Resolved; }
};

class Environment
{
public:
  explicit Environment(TypeInterner & interner, DefinitionProvider * provider = nullptr);

  Environment(const Environment &) = delete;
  Environment & operator=(const Environment &) = delete;

  [[nodiscard]] TypeInterner & interner() noexcept { return interner_; }
  [[nodiscard]] const TypeInterner & interner() const noexcept { return interner_; }

  // ===========================================================================
  // Definitions
  // ===========================================================================

  /// Fresh DefId, unique within this Environment.
  DefId allocate_def();

  /**
   * Store a definition unless one already exists.
   *
   * @return true if `info` was stored, false if an earlier definition was kept
   */
  bool define(DefId def, DefinitionInfo info);

  /// allocate_def() + define().
  DefId declare(DefinitionInfo info);

  /// Stored definition, nullptr if none (the provider is not consulted).
  [[nodiscard]] const DefinitionInfo * find(DefId def) const;

  /**
   * Resolve a declaration for one query.
   *
   * Consults the DefinitionProvider on a miss. A DefId already on `stack`
   * reports InProgress, which is transient, not an error. A missing
   * definition yields the `unresolved` sentinel and a W0010 diagnostic.
   */
  Resolution resolve(DefId def, const ResolutionStack & stack, DiagnosticBag * diags);

  /// Declared constraint of a type parameter, k_invalid_type if none.
  [[nodiscard]] TypeId type_param_constraint(DefId param) const;

  // ===========================================================================
  // Global Library Slots
  // ===========================================================================

  /// The global `Object` interface every non-nullish value reaches through its prototype.
  void set_root_object(TypeId type) noexcept;
  [[nodiscard]] TypeId root_object() const noexcept;

  /// The global `Function` interface.
  void set_global_function(TypeId type) noexcept;
  [[nodiscard]] TypeId global_function() const noexcept;

  /// The generic `Array<T>` interface used for array apparent members.
  void set_global_array(DefId def) noexcept;
  [[nodiscard]] DefId global_array() const noexcept;

  /// Apparent interfaces of primitives ("String", "Number", ...), when provided by a library.
  void set_primitive_interface(IntrinsicKind kind, TypeId type);
  [[nodiscard]] TypeId primitive_interface(IntrinsicKind kind) const noexcept;

private:
  static constexpr uint32_t k_shard_count = 64;

  struct Shard
  {
    mutable std::shared_mutex mutex;
    std::unordered_map<DefId, std::unique_ptr<const DefinitionInfo>> defs;
  };

  TypeInterner & interner_;
  DefinitionProvider * provider_;

  std::array<Shard, k_shard_count> shards_;
  std::atomic<uint32_t> next_def_{1};

  std::atomic<uint32_t> root_object_{0};
  std::atomic<uint32_t> global_function_{0};
  std::atomic<uint32_t> global_array_{0};
  std::array<std::atomic<uint32_t>, k_intrinsic_count> primitive_interfaces_{};

  [[nodiscard]] Shard & shard_for(DefId def) noexcept;
  [[nodiscard]] const Shard & shard_for(DefId def) const noexcept;
};

}  // namespace tscore
