#ifndef __PT_PROJECT_CATALOG__
#define __PT_PROJECT_CATALOG__

#include "Headers.hpp"
#include "RelayMessage.hpp"

namespace pt {
/** @brief Read-only view of the host's projects, reported in status updates. */
class ProjectCatalog {
 public:
  virtual ~ProjectCatalog() {}

  virtual vector<ProjectInfo> getAllProjects() = 0;
  virtual optional<string> getActiveProjectId() = 0;
};

/** @brief Catalog held in memory, filled by the host. */
class StaticProjectCatalog : public ProjectCatalog {
 public:
  StaticProjectCatalog() {}

  virtual vector<ProjectInfo> getAllProjects() {
    lock_guard<mutex> guard(catalogMutex);
    return projects;
  }

  virtual optional<string> getActiveProjectId() {
    lock_guard<mutex> guard(catalogMutex);
    return activeProjectId;
  }

  void setProjects(const vector<ProjectInfo>& _projects) {
    lock_guard<mutex> guard(catalogMutex);
    projects = _projects;
  }

  void setActiveProjectId(const optional<string>& _activeProjectId) {
    lock_guard<mutex> guard(catalogMutex);
    activeProjectId = _activeProjectId;
  }

 protected:
  mutex catalogMutex;
  vector<ProjectInfo> projects;
  optional<string> activeProjectId;
};
}  // namespace pt

#endif  // __PT_PROJECT_CATALOG__
