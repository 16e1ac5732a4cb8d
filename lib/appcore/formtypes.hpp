/**
 * @file formtypes.hpp
 * @brief Declarative description of dialog and wizard forms
 *
 * Forms are plain data so they can be built by background tasks (for
 * example after loading the current configuration of a resource) and
 * handed to the UI thread inside a message.
 */

#ifndef FORMTYPES_HPP
#define FORMTYPES_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

/** @brief Field values keyed by FieldSpec::key; toggles are "true"/"false" */
using FormValues = std::map<std::string, std::string>;

enum class FieldKind {
  Text,
  Secret,      ///< text shown as asterisks
  Toggle,      ///< "true" / "false", flipped with space
  Choice,      ///< one of options, cycled with left/right
  MultiChoice, ///< comma-separated subset of options
  ReadOnly     ///< shown, never edited
};

struct FieldSpec {
  std::string key;
  std::string label;
  FieldKind kind = FieldKind::Text;
  std::string value;
  std::vector<std::string> options;
  bool required = false;
  /** @brief Only shown when field @c first currently holds one of @c second */
  std::pair<std::string, std::vector<std::string>> showIf;
};

struct WizardStep {
  std::string title;
  std::vector<FieldSpec> fields;
};

struct WizardSpec {
  std::string title;
  std::vector<WizardStep> steps;
};

/** @brief Splits a MultiChoice value ("a,b,c") into its entries */
std::vector<std::string> splitList(const std::string &value);

/** @brief Inverse of splitList() */
std::string joinList(const std::vector<std::string> &items);

inline bool isTrue(const FormValues &values, const std::string &key) {
  auto it = values.find(key);
  return it != values.end() && it->second == "true";
}

inline std::string valueOf(const FormValues &values, const std::string &key) {
  auto it = values.find(key);
  return it == values.end() ? std::string() : it->second;
}

#endif // FORMTYPES_HPP
