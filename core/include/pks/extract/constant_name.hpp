// pks/extract/constant_name.hpp - Static resolution of constant paths
#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "pks/basic/source_manager.hpp"
#include "pks/syntax/ts_ll.hpp"

namespace pks
{

/**
 * Result of resolving a constant path such as `A::B` or `::Foo`.
 *
 * A path is Dynamic when any segment of it is not itself a constant
 * (`described_class::Foo`, `self::Bar`, `@klass::Baz`, `foo(1)::Qux`); such
 * names can only be known by running the program.
 */
class ConstantName
{
public:
  enum class Kind : uint8_t {
    Resolved,
    Dynamic,
  };

  static ConstantName resolved(std::string name)
  {
    ConstantName n;
    n.kind_ = Kind::Resolved;
    n.name_ = std::move(name);
    return n;
  }

  static ConstantName dynamic()
  {
    ConstantName n;
    n.kind_ = Kind::Dynamic;
    return n;
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_resolved() const noexcept { return kind_ == Kind::Resolved; }
  [[nodiscard]] bool is_dynamic() const noexcept { return kind_ == Kind::Dynamic; }

  /// Resolved name; empty for Dynamic
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  ConstantName() = default;

  Kind kind_ = Kind::Dynamic;
  std::string name_;
};

/// True for the node kinds that spell a constant path (`constant`, `scope_resolution`)
[[nodiscard]] bool is_constant_path(ts_ll::Node node) noexcept;

/**
 * Resolve a constant path node to its written name.
 *
 * - `Foo`          -> "Foo"
 * - `Foo::Bar`     -> "Foo::Bar" (parent resolved recursively)
 * - `::Foo`        -> "::Foo"    (top-level scope resolves to "")
 * - anything else  -> Dynamic
 */
[[nodiscard]] ConstantName resolve_constant_name(ts_ll::Node node, const SourceFile & file);

}  // namespace pks
