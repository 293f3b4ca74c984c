#include "Workspace.h"

#include <wx/log.h>

#include "CommandFactory.h"

namespace mosaic {

Workspace::Workspace(StorageBackend& backend, DialogService& dialogs, Scheduler& scheduler,
                     CoreSettings settings)
    : settings_(std::move(settings)),
      backend_(backend),
      dialogs_(dialogs),
      store_(settings_.defaultLayout, settings_.defaultPath),
      notifications_(scheduler, settings_),
      loader_(store_, backend_),
      batches_(notifications_, scheduler),
      transfers_(store_, notifications_, loader_, batches_, backend_, settings_),
      services_{
          .store = store_,
          .notifications = notifications_,
          .loader = loader_,
          .transfers = transfers_,
          .batches = batches_,
          .backend = backend_,
          .dialogs = dialogs_,
          .settings = settings_,
      },
      registry_(std::make_unique<CommandRegistry>(MakeAllCommands(services_), store_, notifications_)) {
  wxLogDebug("Workspace ready: %s, %zu commands", store_.Layout().name, registry_->All().size());
}

void Workspace::Dispatch(const std::string& commandId, const CommandOptions& options, Completion done) {
  registry_->Dispatch(commandId, options, std::move(done));
}

void Workspace::LoadAllPanels(const std::string& path) {
  LoadPanels({path.empty() ? settings_.defaultPath : path});
}

void Workspace::LoadPanels(const std::vector<std::string>& paths) {
  const auto order = store_.PanelOrder();
  for (size_t i = 0; i < order.size(); i++) {
    std::string target = settings_.defaultPath;
    if (!paths.empty()) target = i < paths.size() ? paths[i] : paths.back();
    if (target.empty()) target = settings_.defaultPath;
    loader_.Load(order[i], target);
  }
}

bool Workspace::IsBusy() const {
  return registry_->PendingDispatches() > 0 || loader_.InFlight() > 0 || batches_.RunningCount() > 0;
}

}  // namespace mosaic
