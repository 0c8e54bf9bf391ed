#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpdock {

enum class SchemaType {
  kString,
  kNumber,
  kInteger,
  kBoolean,
  kArray,
  kObject,
  kNull,
  // Declared but not a JSON Schema primitive; the name is kept verbatim.
  kOpaque,
};

SchemaType SchemaTypeFromName(const std::string& name);
const char* SchemaTypeName(SchemaType type);

struct SchemaProperty {
  SchemaType type = SchemaType::kString;
  std::string type_name = "string";
  // Arrays only.
  std::optional<std::string> item_type;
  std::string description;
};

SchemaProperty ParseSchemaProperty(const nlohmann::json& raw);

struct ToolArgument {
  std::string name;
  std::string type;
  std::optional<std::string> items;
  std::string description;
  bool optional = false;
};

struct ToolAnnotations {
  std::string title;
  std::optional<bool> read_only_hint;
  std::optional<bool> destructive_hint;
  std::optional<bool> idempotent_hint;
  std::optional<bool> open_world_hint;
};

struct Tool {
  std::string name;
  std::string description;
  std::vector<ToolArgument> arguments;
  std::optional<ToolAnnotations> annotations;
};

struct PromptArgument {
  std::string name;
  std::string description;
  bool required = false;
};

struct Prompt {
  std::string name;
  std::string description;
  std::vector<PromptArgument> arguments;
};

// Tools sorted by name; arguments required-first, each group alphabetical.
std::vector<Tool> NormalizeTools(const nlohmann::json& raw_tools);
std::vector<Prompt> NormalizePrompts(const nlohmann::json& raw_prompts);

// Text after "<name>:" on the first matching line of a free-text description.
std::string ExtractArgumentDescription(const std::string& tool_description, const std::string& name);
// Cuts the description at its "Args:" line.
std::string RemoveArgsBlock(const std::string& description);

nlohmann::json ToJson(const Tool& tool);
nlohmann::json ToJson(const std::vector<Tool>& tools);
nlohmann::json ToJson(const Prompt& prompt);
nlohmann::json ToJson(const std::vector<Prompt>& prompts);

}  // namespace mcpdock
