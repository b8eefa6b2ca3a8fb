//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Vellum/Base/Logging.h>
#include <Vellum/Path/PathErrors.h>
#include <Vellum/Publish/Internal/PipelineConfig_schema.h>
#include <Vellum/Publish/PipelineConfig.h>

namespace vellum::publish {

namespace {

  using nlohmann::json;
  using nlohmann::json_schema::error_handler;
  using nlohmann::json_schema::json_validator;

  class CollectingErrorHandler final : public error_handler {
  public:
    void error(const json::json_pointer& ptr, const json& instance,
      const std::string& message) override
    {
      std::ostringstream out;
      const auto path = ptr.to_string();
      out << (path.empty() ? "<root>" : path) << ": " << message;
      if (!instance.is_discarded()) {
        out << " (value=" << instance.dump() << ")";
      }
      errors_.push_back(out.str());
    }

    [[nodiscard]] auto HasErrors() const noexcept -> bool
    {
      return !errors_.empty();
    }

    [[nodiscard]] auto ToString() const -> std::string
    {
      std::ostringstream out;
      for (const auto& error : errors_) {
        out << "- " << error << "\n";
      }
      return out.str();
    }

  private:
    std::vector<std::string> errors_;
  };

  class SchemaValidator {
  public:
    SchemaValidator()
    {
      auto schema_json = json::parse(detail::kPipelineConfigSchema);
      validator_.set_root_schema(schema_json);
    }

    auto Validate(const json& instance) const -> std::optional<std::string>
    {
      try {
        CollectingErrorHandler handler;
        [[maybe_unused]] auto _ = validator_.validate(instance, handler);
        if (handler.HasErrors()) {
          return handler.ToString();
        }
        return std::nullopt;
      } catch (const std::exception& e) {
        return std::string(e.what());
      }
    }

    static auto Instance() -> const SchemaValidator&
    {
      static SchemaValidator instance;
      return instance;
    }

  private:
    mutable json_validator validator_;
  };

  //! Scalar JSON value as text; integers are written in decimal.
  auto ScalarText(const json& value) -> std::string
  {
    if (value.is_string()) {
      return value.get<std::string>();
    }
    return value.dump();
  }

  auto MakeKeyDefinition(const std::string& name, const json& entry)
    -> path::KeyDefinition
  {
    path::KeyDefinition definition { .name = name };
    if (entry.at("type").get<std::string>() == "int") {
      definition.type = path::KeyType::kInteger;
    } else if (entry.value("filter_by", std::string {}) == "alphanumeric") {
      definition.type = path::KeyType::kAlphanumeric;
    }
    if (entry.contains("format_spec")) {
      definition.zero_pad = static_cast<uint8_t>(
        std::stoi(entry["format_spec"].get<std::string>().substr(1)));
    }
    if (entry.contains("alias")) {
      definition.alias = entry["alias"].get<std::string>();
    }
    if (entry.contains("choices")) {
      for (const auto& choice : entry["choices"]) {
        definition.choices.push_back(ScalarText(choice));
      }
    }
    if (entry.contains("default")) {
      definition.default_value = ScalarText(entry["default"]);
    }
    return definition;
  }

  auto BuildTemplates(const json& config)
    -> std::shared_ptr<const path::TemplateRegistry>
  {
    path::TemplateRegistry::Builder builder;
    for (const auto& [name, entry] : config["keys"].items()) {
      builder.RegisterKey(MakeKeyDefinition(name, entry));
    }
    for (const auto& [name, entry] : config["paths"].items()) {
      if (entry.is_string()) {
        builder.RegisterTemplate(name, entry.get<std::string>());
        continue;
      }
      std::optional<std::string> base;
      if (entry.contains("base")) {
        base = entry["base"].get<std::string>();
      }
      builder.RegisterTemplate(
        name, entry["definition"].get<std::string>(), std::move(base));
    }
    return builder.Build();
  }

  template <typename Target, std::size_t N>
  auto ApplyNames(const json& section,
    const std::array<std::pair<const char*, std::string Target::*>, N>& members,
    Target& target, const char* section_name, std::ostream& errors) -> bool
  {
    for (const auto& [name, value] : section.items()) {
      const auto it = std::ranges::find_if(
        members, [&](const auto& member) { return name == member.first; });
      if (it == members.end()) {
        errors << "ERROR: unknown entry '" << name << "' in publish."
               << section_name << "\n";
        return false;
      }
      target.*(it->second) = value.template get<std::string>();
    }
    return true;
  }

  auto ReadPublishSettings(
    const json& config, PublishSettings& settings, std::ostream& errors) -> bool
  {
    if (config.contains("path_mappings")) {
      for (const auto& mapping : config["path_mappings"]) {
        settings.path_mappings.push_back(path::PathMapping {
          .unc_prefix = mapping["unc_prefix"].get<std::string>(),
          .mapped_drive_prefix
          = mapping["mapped_drive_prefix"].get<std::string>(),
        });
      }
    }
    if (!config.contains("publish")) {
      return true;
    }
    const auto& publish = config["publish"];

    static constexpr std::array kTemplateMembers {
      std::pair { "project_work", &PublishTemplates::project_work },
      std::pair { "project_publish", &PublishTemplates::project_publish },
      std::pair {
        "texture_export_area", &PublishTemplates::texture_export_area },
      std::pair { "texture_publish", &PublishTemplates::texture_publish },
      std::pair {
        "texture_publish_udim", &PublishTemplates::texture_publish_udim },
      std::pair { "texture_set_folder", &PublishTemplates::texture_set_folder },
    };
    static constexpr std::array kFieldMembers {
      std::pair { "asset", &PublishFieldNames::asset },
      std::pair { "task", &PublishFieldNames::task },
      std::pair { "name", &PublishFieldNames::name },
      std::pair { "texture_set", &PublishFieldNames::texture_set },
      std::pair { "texture_map", &PublishFieldNames::texture_map },
      std::pair { "color_space", &PublishFieldNames::color_space },
      std::pair { "udim", &PublishFieldNames::udim },
      std::pair { "extension", &PublishFieldNames::extension },
      std::pair { "version", &PublishFieldNames::version },
    };
    static constexpr std::array kTypeMembers {
      std::pair { "project", &PublishTypes::project },
      std::pair { "texture", &PublishTypes::texture },
      std::pair { "texture_set", &PublishTypes::texture_set },
    };

    if (publish.contains("templates")
      && !ApplyNames(publish["templates"], kTemplateMembers,
        settings.templates, "templates", errors)) {
      return false;
    }
    if (publish.contains("fields")
      && !ApplyNames(
        publish["fields"], kFieldMembers, settings.fields, "fields", errors)) {
      return false;
    }
    if (publish.contains("publish_types")
      && !ApplyNames(publish["publish_types"], kTypeMembers,
        settings.publish_types, "publish_types", errors)) {
      return false;
    }

    settings.preset_prefix
      = publish.value("preset_prefix", settings.preset_prefix);
    if (publish.contains("io_timeout_ms")) {
      settings.io_timeout
        = std::chrono::milliseconds(publish["io_timeout_ms"].get<int64_t>());
    }
    settings.copy_workers
      = publish.value("copy_workers", settings.copy_workers);
    settings.single_slot_per_map
      = publish.value("single_slot_per_map", settings.single_slot_per_map);
    return true;
  }

  //! Every publish template must exist in the registry.
  auto CheckPublishTemplates(const path::TemplateRegistry& templates,
    const PublishTemplates& names, std::ostream& errors) -> bool
  {
    bool ok = true;
    for (const auto* name :
      { &names.project_work, &names.project_publish,
        &names.texture_export_area, &names.texture_publish,
        &names.texture_publish_udim, &names.texture_set_folder }) {
      if (!templates.HasTemplate(*name)) {
        errors << "ERROR: publish template '" << *name
               << "' is not defined in paths\n";
        ok = false;
      }
    }
    return ok;
  }

  auto FromJson(const json& config, std::ostream& error_stream)
    -> std::optional<PipelineConfig>
  {
    if (const auto error = SchemaValidator::Instance().Validate(config);
      error.has_value()) {
      error_stream << "ERROR: configuration schema validation failed:\n"
                   << *error;
      if (!error->empty() && error->back() != '\n') {
        error_stream << "\n";
      }
      return std::nullopt;
    }

    PipelineConfig result;
    try {
      result.templates = BuildTemplates(config);
    } catch (const path::PathError& e) {
      error_stream << "ERROR: invalid path configuration: " << e.what()
                   << "\n";
      return std::nullopt;
    }

    if (!ReadPublishSettings(config, result.publish, error_stream)) {
      return std::nullopt;
    }
    if (config.contains("publish")
      && !CheckPublishTemplates(
        *result.templates, result.publish.templates, error_stream)) {
      return std::nullopt;
    }
    LOG_F(INFO, "pipeline configuration loaded: {} template(s), {} mapping(s)",
      result.templates->TemplateNames().size(),
      result.publish.path_mappings.size());
    return result;
  }

} // namespace

auto PipelineConfig::Parse(const std::string_view json_text,
  std::ostream& error_stream) -> std::optional<PipelineConfig>
{
  json parsed;
  try {
    parsed = json::parse(json_text);
  } catch (const std::exception& e) {
    error_stream << "ERROR: invalid configuration JSON: " << e.what() << "\n";
    return std::nullopt;
  }
  return FromJson(parsed, error_stream);
}

auto PipelineConfig::Load(const std::filesystem::path& config_path,
  std::ostream& error_stream) -> std::optional<PipelineConfig>
{
  std::ifstream input(config_path);
  if (!input) {
    error_stream << "ERROR: failed to open configuration: "
                 << config_path.string() << "\n";
    return std::nullopt;
  }

  json parsed;
  try {
    input >> parsed;
  } catch (const std::exception& e) {
    error_stream << "ERROR: invalid configuration JSON: " << e.what() << "\n";
    return std::nullopt;
  }
  return FromJson(parsed, error_stream);
}

} // namespace vellum::publish
