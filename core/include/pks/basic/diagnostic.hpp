// pks/basic/diagnostic.hpp - Diagnostic and fatal error types
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pks
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * A non-fatal, user-facing problem found while loading the project
 * (e.g. a package.yml naming a dependency that does not exist).
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;             // e.g., "P001"
  std::string message;
  std::filesystem::path file;   // file the problem was found in (may be empty)
  std::optional<std::string> help_message;
};

/**
 * An unrecoverable condition. Fatal errors are returned as values up to the
 * runner, which prints them and terminates the run without partial output.
 */
struct FatalError
{
  std::string message;
  std::optional<std::string> help;

  static FatalError make(std::string msg, std::optional<std::string> help_msg = std::nullopt)
  {
    FatalError e;
    e.message = std::move(msg);
    e.help = std::move(help_msg);
    return e;
  }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it in the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::filesystem::path file, std::string message);
  DiagnosticBuilder report_warning(std::filesystem::path file, std::string message);

  // Add
  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace pks
