#include "DirectoryLoader.h"

#include <wx/log.h>

namespace mosaic {

DirectoryLoader::DirectoryLoader(PanelStore& store, StorageBackend& backend)
    : store_(store), backend_(backend) {}

unsigned DirectoryLoader::NextTicket(const std::string& panelId) { return ++tickets_[panelId]; }

unsigned DirectoryLoader::CurrentTicket(const std::string& panelId) const {
  const auto it = tickets_.find(panelId);
  return it == tickets_.end() ? 0 : it->second;
}

bool DirectoryLoader::IsCurrent(const std::string& panelId, unsigned ticket) const {
  return store_.GetPanel(panelId) && CurrentTicket(panelId) == ticket;
}

void DirectoryLoader::Load(const std::string& panelId, const std::string& input, Completion done) {
  if (!store_.GetPanel(panelId)) {
    if (done) done(ErrorResult(ErrorKind::NotFound, wxString::Format("Panel %s not found", panelId)));
    return;
  }

  const auto ticket = NextTicket(panelId);
  store_.SetLoading(panelId, true);
  inFlight_++;

  backend_.ResolvePath(input, [this, panelId, input, ticket, done](const OpResult& res,
                                                                   std::string resolved) {
    if (!IsCurrent(panelId, ticket)) {
      inFlight_--;
      if (done) done(SkippedResult("Superseded by a newer navigation"));
      return;
    }
    if (!res.ok()) {
      inFlight_--;
      wxLogWarning("Unable to resolve '%s': %s", input, res.message);
      store_.SetError(panelId, res.message.ToStdString());
      if (done) done(res);
      return;
    }

    backend_.List(resolved, [this, panelId, resolved, ticket, done](const OpResult& listRes,
                                                                    std::vector<FileInfo> files) {
      inFlight_--;
      if (!IsCurrent(panelId, ticket)) {
        if (done) done(SkippedResult("Superseded by a newer navigation"));
        return;
      }
      if (!listRes.ok()) {
        wxLogWarning("Unable to list %s: %s", resolved, listRes.message);
        store_.SetError(panelId, listRes.message.ToStdString());
        if (done) done(listRes);
        return;
      }
      store_.NavigateToPath(panelId, resolved);
      store_.SetFiles(panelId, std::move(files));
      wxLogDebug("%s now shows %s", panelId, resolved);
      if (done) done(OkResult());
    });
  });
}

void DirectoryLoader::Refresh(const std::string& panelId, Completion done) {
  const auto* panel = store_.GetPanel(panelId);
  if (!panel) {
    if (done) done(ErrorResult(ErrorKind::NotFound, wxString::Format("Panel %s not found", panelId)));
    return;
  }

  // A refresh never supersedes a pending navigation; it only applies if no
  // load started meanwhile.
  const auto path = panel->currentPath;
  const auto ticket = CurrentTicket(panelId);
  inFlight_++;

  backend_.List(path, [this, panelId, path, ticket, done](const OpResult& res,
                                                         std::vector<FileInfo> files) {
    inFlight_--;
    const auto* p = store_.GetPanel(panelId);
    if (!IsCurrent(panelId, ticket) || !p || p->currentPath != path) {
      if (done) done(SkippedResult("Panel moved on before the refresh finished"));
      return;
    }
    if (!res.ok()) {
      wxLogWarning("Unable to refresh %s: %s", path, res.message);
      store_.SetError(panelId, res.message.ToStdString());
      if (done) done(res);
      return;
    }
    store_.SetFiles(panelId, std::move(files));
    if (done) done(OkResult());
  });
}

void DirectoryLoader::RefreshPanelsShowing(const std::string& dir) {
  const auto target = NormalizeDir(dir);
  for (const auto& id : store_.PanelOrder()) {
    const auto* p = store_.GetPanel(id);
    if (p && NormalizeDir(p->currentPath) == target) Refresh(id);
  }
}

}  // namespace mosaic
