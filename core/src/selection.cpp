#include "foundry/selection.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace foundry {

namespace {
std::string trim_lower(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  std::string out = text.substr(first, last - first + 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool parse_index(const std::string& token, size_t& out) {
  if (token.empty() || token.size() > 9) return false;
  for (const char c : token) {
    if (c < '0' || c > '9') return false;
  }
  out = static_cast<size_t>(std::stoul(token));
  return true;
}
} // namespace

MenuStep apply_menu_input(const std::string& line,
                          size_t item_count,
                          const std::set<size_t>& current,
                          bool require_one) {
  MenuStep step;
  step.selected = current;
  const auto cmd = trim_lower(line);
  if (cmd.empty()) {
    step.kind = (require_one && current.empty()) ? MenuStep::Kind::NeedsSelection : MenuStep::Kind::Accepted;
    return step;
  }
  if (cmd == "b" || cmd == "back") {
    step.kind = MenuStep::Kind::Back;
    return step;
  }
  if (cmd == "q" || cmd == "quit") {
    step.kind = MenuStep::Kind::Quit;
    return step;
  }

  std::istringstream tokens(cmd);
  std::string token;
  while (tokens >> token) {
    size_t number = 0;
    if (!parse_index(token, number) || number == 0 || number > item_count) continue;
    const size_t idx = number - 1;
    if (step.selected.count(idx) > 0) {
      step.selected.erase(idx);
    } else {
      step.selected.insert(idx);
    }
  }
  step.kind = MenuStep::Kind::Continue;
  return step;
}

DefaultsResolver::DefaultsResolver(bool confirm_answer, char choice)
    : confirm_answer_(confirm_answer), choice_(choice) {}

SelectionResult DefaultsResolver::Select(const MenuRequest& request) {
  SelectionResult result;
  result.selected = request.defaults;
  return result;
}

bool DefaultsResolver::Confirm(const std::string&, bool) {
  return confirm_answer_;
}

char DefaultsResolver::Choose(const std::string&, const std::string&, char) {
  return choice_;
}

ConsoleResolver::ConsoleResolver(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

SelectionResult ConsoleResolver::Select(const MenuRequest& request) {
  std::set<size_t> selected = request.defaults;
  while (true) {
    out_ << "\n=== " << request.title << " ===\n";
    for (size_t i = 0; i < request.labels.size(); ++i) {
      out_ << "  [" << (selected.count(i) ? "X" : " ") << "] " << (i + 1) << ". " << request.labels[i] << "\n";
    }
    out_ << "Toggle (space-separated numbers, Enter to confirm, b=back, q=quit): ";
    out_.flush();
    std::string line;
    if (!std::getline(in_, line)) {
      // Closed input accepts what is selected.
      line.clear();
    }
    auto step = apply_menu_input(line, request.labels.size(), selected, request.require_one);
    switch (step.kind) {
      case MenuStep::Kind::Accepted:
        return {SelectionResult::Kind::Accepted, step.selected};
      case MenuStep::Kind::Back:
        return {SelectionResult::Kind::Back, selected};
      case MenuStep::Kind::Quit:
        return {SelectionResult::Kind::Quit, selected};
      case MenuStep::Kind::NeedsSelection:
        out_ << "  At least one selection required.\n";
        if (!in_) return {SelectionResult::Kind::Quit, selected};
        break;
      case MenuStep::Kind::Continue:
        selected = std::move(step.selected);
        break;
    }
  }
}

bool ConsoleResolver::Confirm(const std::string& message, bool default_yes) {
  out_ << message << (default_yes ? " [Y/n] " : " [y/N] ");
  out_.flush();
  std::string line;
  std::getline(in_, line);
  const auto answer = trim_lower(line);
  if (answer.empty()) return default_yes;
  return answer == "y" || answer == "yes";
}

char ConsoleResolver::Choose(const std::string& message, const std::string& options, char fallback) {
  out_ << message << " [" << options << "]: ";
  out_.flush();
  std::string line;
  std::getline(in_, line);
  const auto answer = trim_lower(line);
  if (answer.empty()) return fallback;
  return static_cast<char>(std::toupper(static_cast<unsigned char>(answer[0])));
}

ConfirmingDefaultsResolver::ConfirmingDefaultsResolver(std::istream& in, std::ostream& out)
    : console_(in, out) {}

SelectionResult ConfirmingDefaultsResolver::Select(const MenuRequest& request) {
  SelectionResult result;
  result.selected = request.defaults;
  return result;
}

bool ConfirmingDefaultsResolver::Confirm(const std::string& message, bool default_yes) {
  return console_.Confirm(message, default_yes);
}

char ConfirmingDefaultsResolver::Choose(const std::string& message, const std::string& options, char fallback) {
  return console_.Choose(message, options, fallback);
}

} // namespace foundry
