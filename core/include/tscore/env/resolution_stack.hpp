// tscore/env/resolution_stack.hpp - Per-query set of declarations being expanded
//
#pragma once

#include <algorithm>
#include <vector>

#include "tscore/types/type_id.hpp"

namespace tscore
{

/**
 * Declarations whose body is currently being expanded by one query.
 *
 * Seeing a DefId that is already on the stack means a recursive reference;
 * the caller keeps it as an unexpanded Lazy type instead of recursing.
 */
class ResolutionStack
{
public:
  /// RAII push/pop of one declaration.
  class Scope
  {
  public:
    Scope(ResolutionStack & stack, DefId def) : stack_(stack) { stack_.defs_.push_back(def); }
    ~Scope() { stack_.defs_.pop_back(); }

    Scope(const Scope &) = delete;
    Scope & operator=(const Scope &) = delete;

  private:
    ResolutionStack & stack_;
  };

  [[nodiscard]] bool contains(DefId def) const
  {
    return std::find(defs_.begin(), defs_.end(), def) != defs_.end();
  }

  [[nodiscard]] size_t depth() const noexcept { return defs_.size(); }

private:
  std::vector<DefId> defs_;
};

}  // namespace tscore
