//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <exception>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Path/PathErrors.h>
#include <Vellum/Publish/FilenamePattern.h>
#include <Vellum/Publish/PublishErrors.h>
#include <Vellum/Publish/PublishOrchestrator.h>
#include <Vellum/Publish/TextureSetAggregator.h>

namespace fs = std::filesystem;

using vellum::path::Fields;
using vellum::publish::PendingRegistration;
using vellum::publish::PublishIdentity;
using vellum::publish::PublishResult;
using vellum::publish::PublishState;
using vellum::publish::StateObserver;

namespace {

auto FieldText(const Fields& fields, const std::string& name)
  -> std::optional<std::string>
{
  const auto it = fields.find(name);
  if (it == fields.end()) {
    return std::nullopt;
  }
  auto text = vellum::path::to_string(it->second);
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

//! Publish state tracking for one request, logged and forwarded.
class StateTracker {
public:
  StateTracker(const StateObserver& observer, std::string label)
    : observer_(observer)
    , label_(std::move(label))
  {
  }

  auto Enter(const PublishState state) -> void
  {
    state_ = state;
    LOG_F(INFO, "[{}] {}", label_, to_string(state));
    if (observer_) {
      observer_(state);
    }
  }

  auto Fail(const std::exception& ex) -> void
  {
    LOG_F(ERROR, "[{}] failed in {}: {}", label_, to_string(state_),
      ex.what());
    state_ = PublishState::kFailed;
    if (observer_) {
      observer_(PublishState::kFailed);
    }
  }

  auto SetLabel(std::string label) -> void { label_ = std::move(label); }

private:
  const StateObserver& observer_;
  std::string label_;
  PublishState state_ = PublishState::kValidate;
};

auto ThrowIfStopped(const std::stop_token& stop,
  const std::optional<PublishIdentity>& identity) -> void
{
  if (stop.stop_requested()) {
    throw vellum::publish::PublishCancelledError(identity);
  }
}

auto ToResult(const PendingRegistration& pending) -> PublishResult
{
  PublishResult result {
    .identity = pending.identity,
    .version = pending.version,
    .files = pending.copied,
  };
  for (std::size_t i = 0; i < pending.created.size(); ++i) {
    result.records.push_back(vellum::publish::PublishedRecord {
      .id = pending.created[i],
      .request = pending.records[i],
    });
  }
  return result;
}

} // namespace

namespace vellum::publish {

auto to_string(const PublishState value) -> const char*
{
  switch (value) {
  case PublishState::kValidate:
    return "Validate";
  case PublishState::kExportScan:
    return "ExportScan";
  case PublishState::kStage:
    return "Stage";
  case PublishState::kCommit:
    return "Commit";
  case PublishState::kRegister:
    return "Register";
  case PublishState::kDone:
    return "Done";
  case PublishState::kFailed:
    return "Failed";
  }

  return "__NotSupported__";
}

struct PublishOrchestrator::StagedTextureSet {
  std::vector<CopyItem> items;
  std::vector<RecordRequest> records;
};

PublishOrchestrator::PublishOrchestrator(
  std::shared_ptr<const path::TemplateRegistry> templates,
  PublishSettings settings, std::shared_ptr<IRegistryClient> registry,
  std::shared_ptr<IExportTrigger> exporter,
  std::shared_ptr<IFileSystem> file_system)
  : templates_(std::move(templates))
  , settings_(std::move(settings))
  , registry_(std::move(registry))
  , exporter_(std::move(exporter))
  , file_system_(std::move(file_system))
  , path_mapper_(settings_.path_mappings)
  , versions_(templates_, registry_)
  , committer_(file_system_,
      FileCommitter::Options {
        .workers = settings_.copy_workers,
        .timeout = settings_.io_timeout,
      })
{
  CHECK_NOTNULL_F(templates_.get());
  CHECK_NOTNULL_F(registry_.get());
  CHECK_NOTNULL_F(exporter_.get());
}

//=== Project ===-------------------------------------------------------------//

auto PublishOrchestrator::PublishProject(const ProjectPublishRequest& request)
  -> PublishResult
{
  StateTracker tracker(request.observer, request.work_file.string());
  std::optional<PublishIdentity> identity;
  try {
    tracker.Enter(PublishState::kValidate);
    const auto& names = settings_.fields;
    std::error_code ec;
    if (!fs::is_regular_file(request.work_file, ec)) {
      throw ValidationError(fmt::format(
        "work file '{}' does not exist", request.work_file.string()));
    }
    const auto& work = templates_->GetTemplate(settings_.templates.project_work);
    auto fields = work.TryExtract(request.work_file.generic_string());
    if (!fields) {
      throw ValidationError(
        fmt::format("work file '{}' does not match template '{}' ({})",
          request.work_file.string(), work.Name(), work.Pattern()));
    }
    for (const auto& [name, value] : request.context) {
      fields->emplace(name, value);
    }
    const auto asset = FieldText(*fields, names.asset);
    const auto task = FieldText(*fields, names.task);
    if (!asset || !task) {
      throw ValidationError(fmt::format(
        "work file '{}' does not determine the '{}' and '{}' fields",
        request.work_file.string(), names.asset, names.task));
    }
    identity = PublishIdentity {
      .asset = *asset,
      .task = *task,
      .base_name = FieldText(*fields, names.name).value_or(*asset),
      .family = TemplateFamily::kProject,
    };
    tracker.SetLabel(to_string(*identity));
    ThrowIfStopped(request.stop, identity);

    PendingRegistration pending { .identity = *identity };
    {
      auto guard = locks_.Acquire(*identity, settings_.io_timeout);

      tracker.Enter(PublishState::kStage);
      fields->erase(names.version);
      pending.version = versions_.NextVersion(VersionQuery {
        .identity = *identity,
        .template_name = settings_.templates.project_publish,
        .fields = *fields,
        .version_field = names.version,
        .timeout = settings_.io_timeout,
      });
      (*fields)[names.version] = std::int64_t { pending.version };
      const auto destination
        = templates_->Resolve(settings_.templates.project_publish, *fields);
      ThrowIfStopped(request.stop, identity);

      tracker.Enter(PublishState::kCommit);
      pending.copied = committer_.Commit(
        { CopyItem { .source = request.work_file, .destination = destination } },
        request.stop, identity);

      pending.records.push_back(RecordRequest {
        .family = TemplateFamily::kProject,
        .publish_type = settings_.publish_types.project,
        .name = fs::path(destination).filename().string(),
        .path = destination,
        .version = pending.version,
        .comment = request.comment,
        .identity = *identity,
      });
    }

    tracker.Enter(PublishState::kRegister);
    Register(pending);
    tracker.Enter(PublishState::kDone);
    LOG_F(INFO, "published {} v{:03}", to_string(*identity), pending.version);
    return ToResult(pending);
  } catch (const path::PathError& ex) {
    const ValidationError error(
      fmt::format("cannot resolve publish paths: {}", ex.what()), identity);
    tracker.Fail(error);
    throw error;
  } catch (const std::exception& ex) {
    tracker.Fail(ex);
    throw;
  }
}

//=== Texture set ===---------------------------------------------------------//

auto PublishOrchestrator::ExportAndScan(const TextureSetPublishRequest& request,
  const PublishIdentity& identity) const -> TextureSet
{
  auto area_fields = request.context;
  area_fields[settings_.fields.texture_set]
    = TextureSetPublishName(request.texture_set);
  const auto export_area = path_mapper_.ToMappedDrive(templates_->Resolve(
    settings_.templates.texture_export_area, area_fields));

  const ExportRequest export_request {
    .preset_name = request.preset.name,
    .preset_url = request.preset.url,
    .output_directory = export_area,
    .texture_set = request.texture_set,
    .root_paths = ExportRootPaths(request.texture_set, request.stacks),
  };
  ExportResult result;
  try {
    result = exporter_->Export(export_request);
  } catch (const std::exception& ex) {
    throw ExportError(fmt::format("export of '{}' failed: {}",
                        request.texture_set, ex.what()),
      identity);
  }
  if (!result.success) {
    throw ExportError(fmt::format("export of '{}' failed: {}",
                        request.texture_set, result.message),
      identity);
  }

  auto known = request.known_texture_sets;
  known.push_back(request.texture_set);
  const FilenamePatternMatcher matcher(
    FilenamePatternMatcher::Options { .known_texture_sets = std::move(known) });

  std::vector<fs::path> reported;
  for (const auto& [stack, files] : result.textures_by_stack) {
    DLOG_F(1, "stack '{}': {} file(s)", stack, files.size());
    reported.insert(reported.end(), files.begin(), files.end());
  }
  auto scan = reported.empty()
    ? matcher.ScanExportArea(export_area, settings_.io_timeout)
    : matcher.MatchAll(reported);
  if (!scan.Clean()) {
    for (const auto& mismatch : scan.mismatched) {
      LOG_F(ERROR, "misnamed export '{}': {}", mismatch.path.string(),
        mismatch.reason);
    }
    throw PatternMismatchError(std::move(scan.mismatched), identity);
  }

  std::erase_if(scan.matched, [&](const ExportedFile& file) {
    return file.texture_set != request.texture_set;
  });
  if (scan.matched.empty()) {
    throw ExportError(
      fmt::format("export produced no file for texture set '{}' in '{}'",
        request.texture_set, export_area),
      identity);
  }

  const TextureSetAggregator aggregator(TextureSetAggregator::Options {
    .single_slot_per_map = settings_.single_slot_per_map,
  });
  auto sets = aggregator.Aggregate(scan.matched);
  CHECK_EQ_F(sets.size(), 1U);
  return std::move(sets.front());
}

auto PublishOrchestrator::StageTextureSet(
  const TextureSetPublishRequest& request, const TextureSet& texture_set,
  const int version) const -> StagedTextureSet
{
  const auto& names = settings_.fields;
  const auto asset = *FieldText(request.context, names.asset);
  const auto task = *FieldText(request.context, names.task);
  const auto upstream = request.project_publish
    ? std::optional<RecordId>(request.project_publish->id)
    : std::nullopt;

  auto set_fields = request.context;
  set_fields[names.texture_set] = texture_set.publish_name;
  set_fields[names.version] = std::int64_t { version };

  StagedTextureSet staged;
  for (const auto& map : texture_set.maps) {
    const auto& template_name = map.IsTiled()
      ? settings_.templates.texture_publish_udim
      : settings_.templates.texture_publish;
    auto fields = set_fields;
    fields[names.texture_map] = map.name;
    fields[names.color_space] = map.color_space;
    fields[names.extension] = map.extension;

    for (const auto& file : map.files) {
      if (file.udim) {
        fields[names.udim] = std::int64_t { *file.udim };
      }
      staged.items.push_back(CopyItem {
        .source = file.path,
        .destination = templates_->Resolve(template_name, fields),
      });
    }
    fields.erase(names.udim);

    const auto slot = settings_.single_slot_per_map
      ? map.name
      : fmt::format("{}_{}", map.name, map.color_space);
    staged.records.push_back(RecordRequest {
      .family = TemplateFamily::kTextureMap,
      .publish_type = settings_.publish_types.texture,
      .name = fmt::format(
        "{}_{}_{}_{}", asset, task, texture_set.publish_name, slot),
      .path = templates_->Resolve(template_name, fields),
      .version = version,
      .comment = request.comment,
      .upstream = upstream,
      .identity = PublishIdentity {
        .asset = asset,
        .task = task,
        .base_name = fmt::format("{}_{}", texture_set.publish_name, slot),
        .family = TemplateFamily::kTextureMap,
      },
    });
  }

  staged.records.push_back(RecordRequest {
    .family = TemplateFamily::kTextureSet,
    .publish_type = settings_.publish_types.texture_set,
    .name = fmt::format("{}_{}_{}", asset, task, texture_set.publish_name),
    .path = templates_->Resolve(settings_.templates.texture_set_folder,
      set_fields),
    .version = version,
    .comment = request.comment,
    .upstream = upstream,
    .identity = PublishIdentity {
      .asset = asset,
      .task = task,
      .base_name = texture_set.publish_name,
      .family = TemplateFamily::kTextureSet,
    },
    .links_previous = true,
  });
  return staged;
}

auto PublishOrchestrator::PublishTextureSet(
  const TextureSetPublishRequest& request) -> PublishResult
{
  StateTracker tracker(request.observer, request.texture_set);
  std::optional<PublishIdentity> identity;
  try {
    tracker.Enter(PublishState::kValidate);
    const auto& names = settings_.fields;
    ValidateExportPreset(request.preset, settings_.preset_prefix);
    const auto asset = FieldText(request.context, names.asset);
    const auto task = FieldText(request.context, names.task);
    if (!asset || !task) {
      throw ValidationError(
        fmt::format("context must provide the '{}' and '{}' fields",
          names.asset, names.task));
    }
    const auto publish_name = TextureSetPublishName(request.texture_set);
    if (publish_name.empty()) {
      throw ValidationError(fmt::format(
        "'{}' is not a usable texture set name", request.texture_set));
    }
    identity = PublishIdentity {
      .asset = *asset,
      .task = *task,
      .base_name = publish_name,
      .family = TemplateFamily::kTextureSet,
    };
    tracker.SetLabel(to_string(*identity));
    ThrowIfStopped(request.stop, identity);

    tracker.Enter(PublishState::kExportScan);
    auto texture_set = ExportAndScan(request, *identity);
    ThrowIfStopped(request.stop, identity);

    PendingRegistration pending { .identity = *identity };
    {
      auto guard = locks_.Acquire(*identity, settings_.io_timeout);

      tracker.Enter(PublishState::kStage);
      if (request.project_publish && request.project_publish->request.version > 0) {
        texture_set.version = request.project_publish->request.version;
        LOG_F(INFO, "[{}] using version {} of project publish #{}",
          to_string(*identity), texture_set.version,
          request.project_publish->id);
      } else {
        auto fields = request.context;
        fields[names.texture_set] = texture_set.publish_name;
        fields.erase(names.version);
        texture_set.version = versions_.NextVersion(VersionQuery {
          .identity = *identity,
          .template_name = settings_.templates.texture_set_folder,
          .fields = std::move(fields),
          .version_field = names.version,
          .timeout = settings_.io_timeout,
        });
      }
      pending.version = texture_set.version;
      auto staged = StageTextureSet(request, texture_set, texture_set.version);
      pending.records = std::move(staged.records);
      ThrowIfStopped(request.stop, identity);

      tracker.Enter(PublishState::kCommit);
      pending.copied = committer_.Commit(staged.items, request.stop, identity);
    }

    tracker.Enter(PublishState::kRegister);
    Register(pending);
    tracker.Enter(PublishState::kDone);
    LOG_F(INFO, "published {} v{:03}: {} map(s), {} file(s)",
      to_string(*identity), pending.version, texture_set.maps.size(),
      pending.copied.size());
    return ToResult(pending);
  } catch (const path::PathError& ex) {
    const ValidationError error(
      fmt::format("cannot resolve publish paths: {}", ex.what()), identity);
    tracker.Fail(error);
    throw error;
  } catch (const std::exception& ex) {
    tracker.Fail(ex);
    throw;
  }
}

//=== Registration ===--------------------------------------------------------//

auto PublishOrchestrator::Register(PendingRegistration& pending) const -> void
{
  while (!pending.IsComplete()) {
    auto& record = pending.records[pending.created.size()];
    if (record.links_previous) {
      record.children = pending.created;
    }
    RecordId id = 0;
    try {
      id = registry_->CreateRecord(record);
    } catch (const std::exception& ex) {
      LOG_F(ERROR, "registration of '{}' failed: {}", record.name, ex.what());
      throw RegistrationError(ex.what(), pending);
    }
    DLOG_F(1, "registered '{}' as #{}", record.name, id);
    pending.created.push_back(id);
  }
}

auto PublishOrchestrator::RetryRegistration(PendingRegistration pending)
  -> PublishResult
{
  LOG_F(INFO, "resuming registration of {} v{:03} at record {}/{}",
    to_string(pending.identity), pending.version, pending.created.size() + 1,
    pending.records.size());
  Register(pending);
  return ToResult(pending);
}

} // namespace vellum::publish
