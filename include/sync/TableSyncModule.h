#ifndef TABLE_SYNC_MODULE_H
#define TABLE_SYNC_MODULE_H

#include "sync/SyncModule.h"
#include <string>

// A sync module described entirely by configuration: one table, one integer
// id column and an optional base filter. A full sync configuration that is
// a list of ids (or an object with an "ids" list) narrows the scope to
// those records; any other configuration selects the whole filter.
class TableSyncModule : public SyncModule {
  std::string name_;
  std::string table_;
  std::string idField_;
  std::string baseWhere_;

public:
  TableSyncModule(std::string name, std::string table,
                  std::string idField = "id", std::string baseWhere = "1=1");

  // {"name": "posts", "table": "wp_posts", "id_field": "ID",
  //  "where": "post_status <> 'auto-draft'"}
  static TableSyncModule fromJson(const json &entry);

  std::string name() const override { return name_; }
  std::string idField() const override { return idField_; }
  std::string tableName() const override { return table_; }
  std::string whereClause(const json &config) const override;
};

#endif
