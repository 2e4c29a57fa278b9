#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace foundry {

struct MenuRequest {
  std::string title;
  std::vector<std::string> labels;
  std::set<size_t> defaults;
  bool require_one = false;
};

struct SelectionResult {
  enum class Kind { Accepted, Back, Quit } kind = Kind::Accepted;
  std::set<size_t> selected;
};

// One line of menu input applied to the current selection.
struct MenuStep {
  enum class Kind { Continue, Accepted, Back, Quit, NeedsSelection } kind = Kind::Continue;
  std::set<size_t> selected;
};

// Numbers (1-based, space separated) toggle items, an empty line accepts,
// "b"/"back" and "q"/"quit" navigate. Out-of-range and non-numeric tokens
// are ignored. current is never modified.
MenuStep apply_menu_input(const std::string& line,
                          size_t item_count,
                          const std::set<size_t>& current,
                          bool require_one);

class ISelectionResolver {
 public:
  virtual ~ISelectionResolver() = default;
  virtual bool Interactive() const = 0;
  virtual SelectionResult Select(const MenuRequest& request) = 0;
  virtual bool Confirm(const std::string& message, bool default_yes) = 0;
  // Uppercased first letter of the answer, or fallback on empty input.
  virtual char Choose(const std::string& message, const std::string& options, char fallback) = 0;
};

// Accepts every default; confirmations answer with a fixed policy.
class DefaultsResolver : public ISelectionResolver {
 public:
  explicit DefaultsResolver(bool confirm_answer = false, char choice = 'Q');
  bool Interactive() const override { return false; }
  SelectionResult Select(const MenuRequest& request) override;
  bool Confirm(const std::string& message, bool default_yes) override;
  char Choose(const std::string& message, const std::string& options, char fallback) override;

 private:
  bool confirm_answer_ = false;
  char choice_ = 'Q';
};

class ConsoleResolver : public ISelectionResolver {
 public:
  ConsoleResolver(std::istream& in, std::ostream& out);
  bool Interactive() const override { return true; }
  SelectionResult Select(const MenuRequest& request) override;
  bool Confirm(const std::string& message, bool default_yes) override;
  char Choose(const std::string& message, const std::string& options, char fallback) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

// Non-interactive resolver that still prompts for confirmations on the
// console (used by --force in batch mode).
class ConfirmingDefaultsResolver : public ISelectionResolver {
 public:
  ConfirmingDefaultsResolver(std::istream& in, std::ostream& out);
  bool Interactive() const override { return false; }
  SelectionResult Select(const MenuRequest& request) override;
  bool Confirm(const std::string& message, bool default_yes) override;
  char Choose(const std::string& message, const std::string& options, char fallback) override;

 private:
  ConsoleResolver console_;
};

} // namespace foundry
