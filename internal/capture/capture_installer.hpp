#pragma once

#include "internal/model/columns.hpp"
#include "internal/model/naming.hpp"

namespace pgshadow::capture {

/*
  CaptureInstaller

  Records every row mutation of the source into the change log.

  Install is idempotent: a resumed run re-issues it and ends up with the same
  single set of triggers. Uninstall and DropLog are no-ops on missing
  objects, including a missing table.
*/
class CaptureInstaller {
 public:
  virtual ~CaptureInstaller() = default;

  virtual void Install(const model::TableName& source, const model::PrimaryKey& key, const model::ArtifactNames& names) = 0;

  // `triggers_on` is the source before cutover and the archived table after.
  virtual void Uninstall(const model::TableName& triggers_on, const model::ArtifactNames& names) = 0;

  virtual void DropLog(const model::ArtifactNames& names) = 0;
};

} // namespace pgshadow::capture
