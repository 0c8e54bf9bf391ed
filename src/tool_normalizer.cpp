#include "tool_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mcpdock {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) out.push_back(line);
  return out;
}

static std::string GetString(const nlohmann::json& obj, const char* key) {
  if (obj.is_object() && obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
  return {};
}

// "type" may be a name or a list of names; a list resolves to its first
// non-null entry. Anything else falls back to string.
static std::string ResolveTypeName(const nlohmann::json& schema) {
  if (!schema.is_object() || !schema.contains("type")) return "string";
  const auto& t = schema["type"];
  if (t.is_string()) {
    auto name = t.get<std::string>();
    return name.empty() ? "string" : name;
  }
  if (t.is_array()) {
    for (const auto& v : t) {
      if (v.is_string() && !v.get<std::string>().empty() && v.get<std::string>() != "null") return v.get<std::string>();
    }
  }
  return "string";
}

static std::string ScalarText(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_null()) return {};
  if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
  return v.dump();
}

// Only a set hint is kept; false and absent read the same.
static std::optional<bool> GetHint(const nlohmann::json& obj, const char* key) {
  if (obj.contains(key) && obj[key].is_boolean() && obj[key].get<bool>()) return true;
  return std::nullopt;
}

static std::optional<ToolAnnotations> ParseAnnotations(const nlohmann::json& tool) {
  if (!tool.contains("annotations") || !tool["annotations"].is_object()) return std::nullopt;
  const auto& a = tool["annotations"];
  ToolAnnotations out;
  out.title = GetString(a, "title");
  out.read_only_hint = GetHint(a, "readOnlyHint");
  out.destructive_hint = GetHint(a, "destructiveHint");
  out.idempotent_hint = GetHint(a, "idempotentHint");
  out.open_world_hint = GetHint(a, "openWorldHint");
  if (out.title.empty() && !out.read_only_hint && !out.destructive_hint && !out.idempotent_hint &&
      !out.open_world_hint) {
    return std::nullopt;
  }
  return out;
}

static Tool NormalizeTool(const nlohmann::json& raw) {
  Tool tool;
  tool.name = GetString(raw, "name");
  const std::string raw_description = GetString(raw, "description");

  nlohmann::json properties = nlohmann::json::object();
  std::set<std::string> required;
  if (raw.contains("inputSchema") && raw["inputSchema"].is_object()) {
    const auto& schema = raw["inputSchema"];
    if (schema.contains("properties") && schema["properties"].is_object()) properties = schema["properties"];
    if (schema.contains("required") && schema["required"].is_array()) {
      for (const auto& r : schema["required"]) {
        if (r.is_string()) required.insert(r.get<std::string>());
      }
    }
  }

  std::vector<std::string> required_names;
  std::vector<std::string> optional_names;
  for (auto it = properties.begin(); it != properties.end(); ++it) {
    if (required.count(it.key())) {
      required_names.push_back(it.key());
    } else {
      optional_names.push_back(it.key());
    }
  }
  std::sort(required_names.begin(), required_names.end());
  std::sort(optional_names.begin(), optional_names.end());

  auto add = [&](const std::string& name, bool optional) {
    auto prop = ParseSchemaProperty(properties[name]);
    ToolArgument arg;
    arg.name = name;
    arg.type = prop.type_name;
    arg.items = prop.item_type;
    arg.optional = optional;
    arg.description = prop.description.empty() ? ExtractArgumentDescription(raw_description, name) : prop.description;
    tool.arguments.push_back(std::move(arg));
  };
  for (const auto& name : required_names) add(name, false);
  for (const auto& name : optional_names) add(name, true);

  tool.annotations = ParseAnnotations(raw);
  tool.description = RemoveArgsBlock(raw_description);
  return tool;
}

}  // namespace

SchemaType SchemaTypeFromName(const std::string& name) {
  if (name == "string") return SchemaType::kString;
  if (name == "number") return SchemaType::kNumber;
  if (name == "integer") return SchemaType::kInteger;
  if (name == "boolean") return SchemaType::kBoolean;
  if (name == "array") return SchemaType::kArray;
  if (name == "object") return SchemaType::kObject;
  if (name == "null") return SchemaType::kNull;
  return SchemaType::kOpaque;
}

const char* SchemaTypeName(SchemaType type) {
  switch (type) {
    case SchemaType::kString:
      return "string";
    case SchemaType::kNumber:
      return "number";
    case SchemaType::kInteger:
      return "integer";
    case SchemaType::kBoolean:
      return "boolean";
    case SchemaType::kArray:
      return "array";
    case SchemaType::kObject:
      return "object";
    case SchemaType::kNull:
      return "null";
    case SchemaType::kOpaque:
      return "opaque";
  }
  return "opaque";
}

SchemaProperty ParseSchemaProperty(const nlohmann::json& raw) {
  SchemaProperty prop;
  prop.type_name = ResolveTypeName(raw);
  prop.type = SchemaTypeFromName(prop.type_name);
  if (prop.type == SchemaType::kArray) {
    std::string item_type = "string";
    if (raw.contains("items") && raw["items"].is_object()) item_type = ResolveTypeName(raw["items"]);
    prop.item_type = item_type;
  }
  if (raw.is_object() && raw.contains("description")) prop.description = ScalarText(raw["description"]);
  return prop;
}

std::string ExtractArgumentDescription(const std::string& tool_description, const std::string& name) {
  if (name.empty()) return {};
  const std::string prefix = ToLower(name) + ":";
  for (const auto& raw_line : SplitLines(tool_description)) {
    auto line = Trim(raw_line);
    if (StartsWith(ToLower(line), prefix)) return Trim(line.substr(prefix.size()));
  }
  return {};
}

std::string RemoveArgsBlock(const std::string& description) {
  std::string out;
  bool first = true;
  for (const auto& line : SplitLines(description)) {
    auto trimmed = Trim(line);
    if (StartsWith(ToLower(trimmed), "args:")) break;
    if (!first) out.push_back('\n');
    first = false;
    if (!trimmed.empty()) out += line;
  }
  return Trim(out);
}

std::vector<Tool> NormalizeTools(const nlohmann::json& raw_tools) {
  std::vector<Tool> out;
  if (!raw_tools.is_array()) return out;
  for (const auto& raw : raw_tools) {
    if (!raw.is_object() || GetString(raw, "name").empty()) continue;
    out.push_back(NormalizeTool(raw));
  }
  std::stable_sort(out.begin(), out.end(), [](const Tool& a, const Tool& b) { return a.name < b.name; });
  return out;
}

std::vector<Prompt> NormalizePrompts(const nlohmann::json& raw_prompts) {
  std::vector<Prompt> out;
  if (!raw_prompts.is_array()) return out;
  for (const auto& raw : raw_prompts) {
    if (!raw.is_object()) continue;
    Prompt p;
    p.name = GetString(raw, "name");
    if (p.name.empty()) continue;
    p.description = GetString(raw, "description");
    if (raw.contains("arguments") && raw["arguments"].is_array()) {
      for (const auto& a : raw["arguments"]) {
        if (!a.is_object()) continue;
        PromptArgument arg;
        arg.name = GetString(a, "name");
        if (arg.name.empty()) continue;
        arg.description = GetString(a, "description");
        arg.required = a.contains("required") && a["required"].is_boolean() && a["required"].get<bool>();
        p.arguments.push_back(std::move(arg));
      }
    }
    std::sort(p.arguments.begin(), p.arguments.end(), [](const PromptArgument& a, const PromptArgument& b) {
      if (a.required != b.required) return a.required;
      return a.name < b.name;
    });
    out.push_back(std::move(p));
  }
  std::stable_sort(out.begin(), out.end(), [](const Prompt& a, const Prompt& b) { return a.name < b.name; });
  return out;
}

nlohmann::json ToJson(const Tool& tool) {
  nlohmann::json j;
  j["name"] = tool.name;
  if (!tool.description.empty()) j["description"] = tool.description;
  if (!tool.arguments.empty()) {
    j["arguments"] = nlohmann::json::array();
    for (const auto& a : tool.arguments) {
      nlohmann::json ja;
      ja["name"] = a.name;
      ja["type"] = a.type;
      if (a.items) ja["items"] = {{"type", *a.items}};
      ja["desc"] = a.description;
      if (a.optional) ja["optional"] = true;
      j["arguments"].push_back(std::move(ja));
    }
  }
  if (tool.annotations) {
    const auto& an = *tool.annotations;
    nlohmann::json ja = nlohmann::json::object();
    if (!an.title.empty()) ja["title"] = an.title;
    if (an.read_only_hint) ja["readOnlyHint"] = *an.read_only_hint;
    if (an.destructive_hint) ja["destructiveHint"] = *an.destructive_hint;
    if (an.idempotent_hint) ja["idempotentHint"] = *an.idempotent_hint;
    if (an.open_world_hint) ja["openWorldHint"] = *an.open_world_hint;
    j["annotations"] = std::move(ja);
  }
  return j;
}

nlohmann::json ToJson(const std::vector<Tool>& tools) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools) out.push_back(ToJson(t));
  return out;
}

nlohmann::json ToJson(const Prompt& prompt) {
  nlohmann::json j;
  j["name"] = prompt.name;
  if (!prompt.description.empty()) j["description"] = prompt.description;
  if (!prompt.arguments.empty()) {
    j["arguments"] = nlohmann::json::array();
    for (const auto& a : prompt.arguments) {
      nlohmann::json ja;
      ja["name"] = a.name;
      if (!a.description.empty()) ja["desc"] = a.description;
      if (!a.required) ja["optional"] = true;
      j["arguments"].push_back(std::move(ja));
    }
  }
  return j;
}

nlohmann::json ToJson(const std::vector<Prompt>& prompts) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& p : prompts) out.push_back(ToJson(p));
  return out;
}

}  // namespace mcpdock
